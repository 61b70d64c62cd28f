#pragma once

#include "client_config.hpp"
#include "error.hpp"
#include "health_probe.hpp"
#include "selection_filter.hpp"
#include "selection_rule.hpp"
#include "server_registry.hpp"
#include "server_source.hpp"
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace clb {

// The four substitution points of a balancer.
struct LoadBalancerComponents {
    std::shared_ptr<ServerSource> source;
    std::shared_ptr<HealthProbe> probe;
    std::shared_ptr<SelectionFilter> filter;
    std::shared_ptr<SelectionRule> rule;
};

class LoadBalancer {
public:
    // Validates the configuration and performs one synchronous refresh.
    static std::expected<std::unique_ptr<LoadBalancer>, Error> create(
        ClientConfig config, LoadBalancerComponents components);

    // Builds filter, probe and rule from the configuration.
    static std::expected<std::unique_ptr<LoadBalancer>, Error> create(
        ClientConfig config, std::shared_ptr<ServerSource> source);

    ~LoadBalancer();

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    // snapshot -> filter -> drop unreachable -> rule. Works on the last
    // completed snapshot and never waits for a refresh.
    std::expected<Server, Error> choose();
    std::expected<Server, Error> choose(const SelectionContext& context);

    // Start periodic refresh in a background thread
    void start();

    // Stop periodic refresh; returns once the thread has exited
    void stop();

    bool running() const { return refresh_thread_.joinable(); }

    Snapshot refresh_now();

    Snapshot snapshot() const { return registry_.snapshot(); }
    bool is_stale() const { return registry_.is_stale(); }
    const ServerRegistry& registry() const { return registry_; }
    const ClientConfig& config() const { return config_; }

private:
    LoadBalancer(ClientConfig config, LoadBalancerComponents components);

    void refresh_loop(std::stop_token stop_token);

    ClientConfig config_;
    ServerRegistry registry_;
    std::shared_ptr<HealthProbe> probe_;
    std::shared_ptr<SelectionFilter> filter_;
    std::shared_ptr<SelectionRule> rule_;

    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    std::jthread refresh_thread_;
};

} // namespace clb
