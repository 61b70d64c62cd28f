#include "health_probe.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace clb {

CachingHealthProbe::CachingHealthProbe(PingFn ping, std::chrono::milliseconds timeout,
                                       std::chrono::milliseconds cache_ttl)
    : state_(std::make_shared<State>()) {
    state_->ping = std::move(ping);
    state_->timeout = timeout;
    state_->cache_ttl = cache_ttl;
}

bool CachingHealthProbe::is_reachable(const Server& server) {
    std::optional<Entry> cached;
    {
        std::shared_lock lock(state_->mutex);
        auto it = state_->cache.find(server.id());
        if (it != state_->cache.end()) {
            cached = it->second;
        }
    }

    if (cached.has_value()) {
        if (Clock::now() - cached->checked_at >= state_->cache_ttl) {
            start_ping(server);
        }
        return cached->reachable;
    }

    auto result = start_ping(server);
    if (result.wait_for(state_->timeout) != std::future_status::ready) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("Server {}: {} after {}ms", server.id(),
                to_string(ErrorCode::ProbeTimeout), state_->timeout.count()));
        return false;
    }
    return result.get();
}

void CachingHealthProbe::prime(const ServerList& servers) {
    std::unordered_set<std::string> live;
    std::vector<std::shared_future<bool>> pending;
    pending.reserve(servers.size());
    for (const auto& server : servers) {
        live.insert(server.id());
        pending.push_back(start_ping(server));
    }

    auto deadline = Clock::now() + state_->timeout;
    size_t unanswered = 0;
    for (const auto& result : pending) {
        if (result.wait_until(deadline) != std::future_status::ready) {
            ++unanswered;
        }
    }
    if (unanswered > 0) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("{} of {} probes still running after {}ms",
                unanswered, pending.size(), state_->timeout.count()));
    }

    // Drop servers that left the snapshot
    std::unique_lock lock(state_->mutex);
    for (auto it = state_->cache.begin(); it != state_->cache.end();) {
        if (live.count(it->first) == 0) {
            it = state_->cache.erase(it);
        } else {
            ++it;
        }
    }
}

size_t CachingHealthProbe::cached_count() const {
    std::shared_lock lock(state_->mutex);
    return state_->cache.size();
}

std::shared_future<bool> CachingHealthProbe::start_ping(const Server& server) {
    std::unique_lock lock(state_->mutex);
    auto it = state_->in_flight.find(server.id());
    if (it != state_->in_flight.end()) {
        return it->second;
    }

    auto task = std::make_shared<std::packaged_task<bool()>>(
        [state = state_, server]() { return run_ping(state, server); });
    auto result = task->get_future().share();

    try {
        std::thread([task]() { (*task)(); }).detach();
    } catch (const std::system_error& e) {
        Logger::warn(Logger::Component::Probe,
            fmt::format("Server {}: cannot start probe: {}", server.id(), e.what()));
        std::promise<bool> failed;
        failed.set_value(false);
        return failed.get_future().share();
    }

    state_->in_flight.emplace(server.id(), result);
    return result;
}

bool CachingHealthProbe::run_ping(const std::shared_ptr<State>& state, const Server& server) {
    auto start = Clock::now();
    bool reachable = false;

    if (state->ping) {
        try {
            reachable = state->ping(server, state->timeout);
        } catch (const std::exception& e) {
            Logger::debug(Logger::Component::Probe,
                fmt::format("Server {} probe exception: {}", server.id(), e.what()));
        } catch (...) {
            Logger::debug(Logger::Component::Probe,
                fmt::format("Server {} probe exception: unknown", server.id()));
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    if (reachable && elapsed > state->timeout) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("Server {}: {} after {}ms (limit {}ms)", server.id(),
                to_string(ErrorCode::ProbeTimeout), elapsed.count(), state->timeout.count()));
        reachable = false;
    }

    bool was_reachable = true;
    {
        std::unique_lock lock(state->mutex);
        auto it = state->cache.find(server.id());
        if (it != state->cache.end()) {
            was_reachable = it->second.reachable;
        }
        state->cache[server.id()] = Entry{reachable, Clock::now()};
        state->in_flight.erase(server.id());
    }

    if (was_reachable && !reachable) {
        Logger::warn(Logger::Component::Probe,
            fmt::format("Server {}: state changed REACHABLE → UNREACHABLE", server.id()));
    } else if (!was_reachable && reachable) {
        Logger::info(Logger::Component::Probe,
            fmt::format("Server {}: state changed UNREACHABLE → REACHABLE", server.id()));
    }

    return reachable;
}

CachingHealthProbe::PingFn make_http_ping(const ProbeConfig& config) {
    std::string path = config.path;
    bool secure = config.secure;

    return [path, secure](const Server& server, std::chrono::milliseconds timeout) {
        httplib::Client client(fmt::format("{}://{}:{}",
            secure ? "https" : "http", server.host(), server.port()));
        if (!client.is_valid()) {
            return false;
        }

        const auto sec = static_cast<time_t>(timeout.count() / 1000);
        const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        client.set_connection_timeout(sec, usec);
        client.set_read_timeout(sec, usec);

        auto res = client.Get(path);
        return res && res->status == 200;
    };
}

std::expected<std::shared_ptr<HealthProbe>, Error> make_health_probe(const ProbeConfig& config) {
    if (config.type == "noop") {
        return std::make_shared<NoOpHealthProbe>();
    }

    if (config.type == "url") {
        if (config.timeout.count() <= 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                "probe.timeout_ms must be positive"});
        }
        if (config.cache_ttl.count() < 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                "probe.cache_ttl_ms must not be negative"});
        }
        return std::make_shared<CachingHealthProbe>(
            make_http_ping(config), config.timeout, config.cache_ttl);
    }

    return std::unexpected(Error{ErrorCode::InvalidConfiguration,
        fmt::format("unknown probe type '{}'", config.type)});
}

} // namespace clb
