#pragma once

#include "error.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace clb {

// Absolute URI: scheme://[userinfo@]host[:port][path][?query][#fragment]
struct Uri {
    std::string scheme;
    std::string userinfo;
    std::string host;            // IPv6 literals are stored without brackets
    std::optional<uint16_t> port;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    static std::expected<Uri, Error> parse(std::string_view text);

    std::string authority() const;
    std::string to_string() const;
};

} // namespace clb
