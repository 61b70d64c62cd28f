#pragma once

#include "client_config.hpp"
#include "error.hpp"
#include "server.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace clb {

class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual bool is_reachable(const Server& server) = 0;

    // Called from the balancer's refresh task with each new snapshot so that
    // probes which do I/O can run off the selection path.
    virtual void prime(const ServerList&) {}
};

// Health is left to the discovery backend.
class NoOpHealthProbe : public HealthProbe {
public:
    bool is_reachable(const Server&) override { return true; }
};

// Caches the outcome of a ping for a bounded interval. Pings run on worker
// threads, at most one per server at a time, so is_reachable() returns within
// the configured timeout even when a ping hangs:
//  - fresh entry: returned as is
//  - expired entry: last result returned, a re-ping is started in the background
//  - no entry: waits up to the timeout for a ping, unreachable if it has not answered
// A ping that answers after the timeout also counts as unreachable.
class CachingHealthProbe : public HealthProbe {
public:
    using Clock = std::chrono::steady_clock;
    using PingFn = std::function<bool(const Server&, std::chrono::milliseconds timeout)>;

    CachingHealthProbe(PingFn ping, std::chrono::milliseconds timeout,
                       std::chrono::milliseconds cache_ttl);

    bool is_reachable(const Server& server) override;

    // Re-pings every server concurrently and waits at most one timeout.
    void prime(const ServerList& servers) override;

    size_t cached_count() const;

private:
    struct Entry {
        bool reachable;
        Clock::time_point checked_at;
    };

    // Shared with ping workers, which can outlive the probe.
    struct State {
        PingFn ping;
        std::chrono::milliseconds timeout;
        std::chrono::milliseconds cache_ttl;

        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Entry> cache;
        std::unordered_map<std::string, std::shared_future<bool>> in_flight;
    };

    static bool run_ping(const std::shared_ptr<State>& state, const Server& server);
    std::shared_future<bool> start_ping(const Server& server);

    std::shared_ptr<State> state_;
};

// HTTP GET on the configured health path; 200 means reachable.
CachingHealthProbe::PingFn make_http_ping(const ProbeConfig& config);

std::expected<std::shared_ptr<HealthProbe>, Error> make_health_probe(const ProbeConfig& config);

} // namespace clb
