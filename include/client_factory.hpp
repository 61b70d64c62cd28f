#pragma once

#include "client_config.hpp"
#include "error.hpp"
#include "load_balancer.hpp"
#include "request_router.hpp"
#include "server_source.hpp"
#include <expected>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clb {

// One LoadBalancer per logical client name. Balancers are built and started
// on first use and stopped by shutdown(). A build runs outside the factory
// lock: callers for other clients are not held up, and concurrent first
// calls for the same client wait on a single build.
class ClientFactory {
public:
    using SourceProvider = std::function<std::shared_ptr<ServerSource>(const ClientConfig&)>;

    explicit ClientFactory(std::map<std::string, ClientConfig> configs,
                           SourceProvider source_provider = {});
    ~ClientFactory();

    ClientFactory(const ClientFactory&) = delete;
    ClientFactory& operator=(const ClientFactory&) = delete;

    using BuildResult = std::expected<std::shared_ptr<LoadBalancer>, Error>;

    BuildResult load_balancer(const std::string& client_name);

    // The request URI host names the client.
    std::expected<Request, Error> route(const Request& request);

    std::vector<std::string> client_names() const;
    size_t active_count() const;

    void shutdown();

private:
    BuildResult build(const std::string& client_name, const ClientConfig& config);

    std::map<std::string, ClientConfig> configs_;
    SourceProvider source_provider_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<LoadBalancer>> balancers_;
    std::map<std::string, std::shared_future<BuildResult>> building_;
    bool shut_down_ = false;
};

} // namespace clb
