#include "uri.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <spdlog/fmt/fmt.h>

namespace clb {

namespace {

std::unexpected<Error> bad_uri(std::string_view text, const char* reason) {
    return std::unexpected(Error{ErrorCode::InvalidRequest,
        fmt::format("invalid URI '{}': {}", text, reason)});
}

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

} // namespace

std::expected<Uri, Error> Uri::parse(std::string_view text) {
    Uri uri;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos) {
        return bad_uri(text, "missing scheme");
    }
    std::string_view scheme = text.substr(0, scheme_end);
    if (!valid_scheme(scheme)) {
        return bad_uri(text, "malformed scheme");
    }
    uri.scheme.resize(scheme.size());
    std::transform(scheme.begin(), scheme.end(), uri.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string_view rest = text.substr(scheme_end + 3);

    // Split off fragment, then query, then path
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        uri.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != std::string_view::npos) {
        uri.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }
    std::string_view authority = rest;
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        uri.path = std::string(rest.substr(slash));
        authority = rest.substr(0, slash);
    }

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        uri.userinfo = std::string(authority.substr(0, at));
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return bad_uri(text, "unterminated IPv6 literal");
        }
        host = authority.substr(1, close - 1);
        std::string_view tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return bad_uri(text, "unexpected characters after IPv6 literal");
            }
            port = tail.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) {
        return bad_uri(text, "missing host");
    }
    uri.host = std::string(host);

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value > 65535) {
            return bad_uri(text, "invalid port");
        }
        uri.port = static_cast<uint16_t>(value);
    }

    return uri;
}

std::string Uri::authority() const {
    std::string result;
    if (!userinfo.empty()) {
        result += userinfo;
        result += '@';
    }
    if (host.find(':') != std::string::npos) {
        result += '[';
        result += host;
        result += ']';
    } else {
        result += host;
    }
    if (port.has_value()) {
        result += fmt::format(":{}", *port);
    }
    return result;
}

std::string Uri::to_string() const {
    std::string result = fmt::format("{}://{}{}", scheme, authority(), path);
    if (query.has_value()) {
        result += '?';
        result += *query;
    }
    if (fragment.has_value()) {
        result += '#';
        result += *fragment;
    }
    return result;
}

} // namespace clb
