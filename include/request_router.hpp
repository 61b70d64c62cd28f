#pragma once

#include "error.hpp"
#include "load_balancer.hpp"
#include "server.hpp"
#include "uri.hpp"
#include <expected>
#include <map>
#include <string>

namespace clb {

// Outgoing request whose URI host is a logical client name.
struct Request {
    std::string method = "GET";
    Uri uri;
    std::map<std::string, std::string> headers;
};

class RequestRouter {
public:
    // Retarget the request at a server chosen by the balancer. Failures from
    // choose() are returned unchanged.
    static std::expected<Request, Error> route(const Request& request, LoadBalancer& load_balancer);

    // Replace host and port with the server's, upgrading a plain scheme when
    // the server has a secure port. Path, query and fragment are kept.
    static Uri reconstruct_uri(const Server& server, const Uri& original);

    // Discovery-enabled servers report their secure port flag. For other
    // servers this falls back to "port number ends in 443", which is a
    // guess and not a security guarantee.
    static bool is_secure(const Server& server);

    static bool is_secure_scheme(const std::string& scheme);

private:
    static std::string secure_variant(const std::string& scheme);
};

} // namespace clb
