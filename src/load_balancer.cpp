#include "load_balancer.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace clb {

namespace {

std::unexpected<Error> invalid(const std::string& client, const std::string& message) {
    return std::unexpected(Error{ErrorCode::InvalidConfiguration,
        fmt::format("client '{}': {}", client, message)});
}

} // namespace

std::expected<std::unique_ptr<LoadBalancer>, Error> LoadBalancer::create(
    ClientConfig config, LoadBalancerComponents components) {
    if (config.name.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidConfiguration, "client name is empty"});
    }
    if (config.refresh_interval.count() <= 0) {
        return invalid(config.name, "refresh_interval_ms must be positive");
    }
    if (config.refresh_timeout.count() <= 0) {
        return invalid(config.name, "refresh_timeout_ms must be positive");
    }
    if (!components.source || !components.probe || !components.filter || !components.rule) {
        return invalid(config.name, "source, probe, filter and rule are all required");
    }

    std::unique_ptr<LoadBalancer> balancer(new LoadBalancer(std::move(config), std::move(components)));
    auto initial = balancer->refresh_now();

    Logger::info(Logger::Component::Balancer,
        fmt::format("Client {}: initialized with {} servers", balancer->config_.name, initial->size()));

    return balancer;
}

std::expected<std::unique_ptr<LoadBalancer>, Error> LoadBalancer::create(
    ClientConfig config, std::shared_ptr<ServerSource> source) {
    auto filter = make_filter(config.filter);
    if (!filter.has_value()) {
        return invalid(config.name, filter.error().message);
    }
    auto probe = make_health_probe(config.probe);
    if (!probe.has_value()) {
        return invalid(config.name, probe.error().message);
    }
    auto rule = make_rule(config.rule);
    if (!rule.has_value()) {
        return invalid(config.name, rule.error().message);
    }

    LoadBalancerComponents components{std::move(source), std::move(probe.value()),
                                      std::move(filter.value()), std::move(rule.value())};
    return create(std::move(config), std::move(components));
}

LoadBalancer::LoadBalancer(ClientConfig config, LoadBalancerComponents components)
    : config_(std::move(config)),
      registry_(config_.name, std::move(components.source), config_.refresh_timeout),
      probe_(std::move(components.probe)),
      filter_(std::move(components.filter)),
      rule_(std::move(components.rule)) {}

LoadBalancer::~LoadBalancer() {
    stop();
}

std::expected<Server, Error> LoadBalancer::choose() {
    return choose(SelectionContext{});
}

std::expected<Server, Error> LoadBalancer::choose(const SelectionContext& context) {
    Snapshot snapshot = registry_.snapshot();
    if (snapshot->empty()) {
        return std::unexpected(Error{ErrorCode::NoAvailableServer,
            fmt::format("No servers available for client {}", config_.name)});
    }

    ServerList filtered = filter_->apply(*snapshot, context);
    if (filtered.empty()) {
        return std::unexpected(Error{ErrorCode::NoAvailableServer,
            fmt::format("Filter left no candidates out of {} servers for client {}",
                snapshot->size(), config_.name)});
    }

    CandidateSet candidates;
    candidates.servers.reserve(filtered.size());
    for (auto& server : filtered) {
        auto& stats = candidates.zones[server.zone()];
        ++stats.total;
        if (probe_->is_reachable(server)) {
            ++stats.reachable;
            candidates.servers.push_back(std::move(server));
        }
    }

    if (candidates.servers.empty()) {
        return std::unexpected(Error{ErrorCode::NoAvailableServer,
            fmt::format("All {} candidate servers unreachable for client {}",
                filtered.size(), config_.name)});
    }

    auto chosen = rule_->choose(candidates);
    if (chosen.has_value()) {
        Logger::debug(Logger::Component::Balancer,
            fmt::format("Client {}: selected {} ({} of {} candidates reachable)",
                config_.name, chosen->id(), candidates.servers.size(), filtered.size()));
    }
    return chosen;
}

void LoadBalancer::start() {
    if (refresh_thread_.joinable()) {
        return;
    }
    refresh_thread_ = std::jthread([this](std::stop_token stop_token) {
        refresh_loop(stop_token);
    });
}

void LoadBalancer::stop() {
    if (refresh_thread_.joinable()) {
        refresh_thread_.request_stop();
        refresh_thread_.join();
    }
}

Snapshot LoadBalancer::refresh_now() {
    Snapshot snapshot = registry_.refresh();
    probe_->prime(*snapshot);
    return snapshot;
}

void LoadBalancer::refresh_loop(std::stop_token stop_token) {
    Logger::info(Logger::Component::Balancer,
        fmt::format("Client {}: refresh thread started ({}ms interval)",
            config_.name, config_.refresh_interval.count()));

    while (!stop_token.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex_);
            if (wake_.wait_for(lock, stop_token, config_.refresh_interval,
                               [&stop_token] { return stop_token.stop_requested(); })) {
                break;
            }
        }
        refresh_now();
    }

    Logger::info(Logger::Component::Balancer,
        fmt::format("Client {}: refresh thread stopped", config_.name));
}

} // namespace clb
