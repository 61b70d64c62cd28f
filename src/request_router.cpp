#include "request_router.hpp"
#include "logger.hpp"
#include <type_traits>
#include <spdlog/fmt/fmt.h>

namespace clb {

std::expected<Request, Error> RequestRouter::route(const Request& request, LoadBalancer& load_balancer) {
    auto server = load_balancer.choose();
    if (!server.has_value()) {
        Logger::error(Logger::Component::Router,
            fmt::format("{} {}: {}", request.method, request.uri.to_string(), server.error().message));
        return std::unexpected(server.error());
    }

    Request routed = request;
    routed.uri = reconstruct_uri(server.value(), request.uri);

    Logger::debug(Logger::Component::Router,
        fmt::format("{} {} → {}", request.method, request.uri.to_string(), routed.uri.to_string()));

    return routed;
}

Uri RequestRouter::reconstruct_uri(const Server& server, const Uri& original) {
    Uri uri = original;
    if (!is_secure_scheme(uri.scheme) && is_secure(server)) {
        uri.scheme = secure_variant(uri.scheme);
    }
    uri.host = server.host();
    uri.port = server.port();
    return uri;
}

bool RequestRouter::is_secure(const Server& server) {
    return std::visit([](const auto& details) -> bool {
        using T = std::decay_t<decltype(details)>;
        if constexpr (std::is_same_v<T, DiscoveryEnabledServer>) {
            return details.secure_port_enabled;
        } else {
            return std::to_string(details.port).ends_with("443");
        }
    }, server.details());
}

bool RequestRouter::is_secure_scheme(const std::string& scheme) {
    return scheme == "https" || scheme == "wss";
}

std::string RequestRouter::secure_variant(const std::string& scheme) {
    if (scheme == "ws") {
        return "wss";
    }
    return "https";
}

} // namespace clb
