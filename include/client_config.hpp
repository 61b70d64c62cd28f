#pragma once

#include "server.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clb {

struct FilterConfig {
    std::string type = "zone-preference";
    std::string preferred_zone;
};

struct RuleConfig {
    std::string policy = "zone-avoidance";
    // Required by zone-avoidance: a zone is dropped when its score falls
    // below availability_threshold * best zone score.
    std::optional<double> availability_threshold;
    std::map<std::string, double> zone_weights;
    std::optional<uint64_t> seed;
};

struct ProbeConfig {
    std::string type = "noop";
    std::string path = "/health";
    std::chrono::milliseconds timeout{1000};
    std::chrono::milliseconds cache_ttl{10000};
    bool secure = false;
};

struct ClientConfig {
    std::string name;
    std::chrono::milliseconds refresh_interval{30000};
    std::chrono::milliseconds refresh_timeout{5000};
    std::vector<Server> servers;
    FilterConfig filter;
    RuleConfig rule;
    ProbeConfig probe;
};

} // namespace clb
