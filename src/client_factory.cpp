#include "client_factory.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace clb {

ClientFactory::ClientFactory(std::map<std::string, ClientConfig> configs,
                             SourceProvider source_provider)
    : configs_(std::move(configs)), source_provider_(std::move(source_provider)) {
    if (!source_provider_) {
        source_provider_ = [](const ClientConfig& config) {
            return std::make_shared<StaticServerSource>(config.servers);
        };
    }
}

ClientFactory::~ClientFactory() {
    shutdown();
}

ClientFactory::BuildResult ClientFactory::load_balancer(const std::string& client_name) {
    std::promise<BuildResult> promise;
    std::shared_future<BuildResult> in_progress;
    const ClientConfig* config = nullptr;
    {
        std::lock_guard lock(mutex_);

        if (shut_down_) {
            return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                fmt::format("client factory is shut down, cannot build '{}'", client_name)});
        }

        auto existing = balancers_.find(client_name);
        if (existing != balancers_.end()) {
            return existing->second;
        }

        auto found = configs_.find(client_name);
        if (found == configs_.end()) {
            return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                fmt::format("no configuration for client '{}'", client_name)});
        }

        auto building = building_.find(client_name);
        if (building != building_.end()) {
            in_progress = building->second;
        } else {
            building_.emplace(client_name, promise.get_future().share());
            config = &found->second;
        }
    }

    // Another caller is building this client
    if (in_progress.valid()) {
        return in_progress.get();
    }

    BuildResult result = build(client_name, *config);
    promise.set_value(result);
    return result;
}

ClientFactory::BuildResult ClientFactory::build(const std::string& client_name,
                                                const ClientConfig& config) {
    BuildResult created;
    try {
        auto balancer = LoadBalancer::create(config, source_provider_(config));
        if (balancer.has_value()) {
            created = std::shared_ptr<LoadBalancer>(std::move(balancer.value()));
        } else {
            created = std::unexpected(balancer.error());
        }
    } catch (const std::exception& e) {
        created = std::unexpected(Error{ErrorCode::InvalidConfiguration,
            fmt::format("client '{}': {}", client_name, e.what())});
    }

    std::lock_guard lock(mutex_);
    building_.erase(client_name);

    if (!created.has_value()) {
        Logger::error(Logger::Component::Factory, created.error().message);
        return created;
    }
    if (shut_down_) {
        return std::unexpected(Error{ErrorCode::InvalidConfiguration,
            fmt::format("client factory shut down while building '{}'", client_name)});
    }

    auto balancer = created.value();
    balancer->start();
    balancers_.emplace(client_name, balancer);

    Logger::info(Logger::Component::Factory,
        fmt::format("Created load balancer for client {}", client_name));

    return balancer;
}

std::expected<Request, Error> ClientFactory::route(const Request& request) {
    auto balancer = load_balancer(request.uri.host);
    if (!balancer.has_value()) {
        return std::unexpected(balancer.error());
    }
    return RequestRouter::route(request, *balancer.value());
}

std::vector<std::string> ClientFactory::client_names() const {
    std::vector<std::string> names;
    names.reserve(configs_.size());
    for (const auto& [name, config] : configs_) {
        names.push_back(name);
    }
    return names;
}

size_t ClientFactory::active_count() const {
    std::lock_guard lock(mutex_);
    return balancers_.size();
}

void ClientFactory::shutdown() {
    std::map<std::string, std::shared_ptr<LoadBalancer>> balancers;
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        balancers.swap(balancers_);
    }

    for (auto& [name, balancer] : balancers) {
        balancer->stop();
        Logger::info(Logger::Component::Factory,
            fmt::format("Stopped load balancer for client {}", name));
    }
}

} // namespace clb
