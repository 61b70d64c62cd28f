#include "selection_rule.hpp"
#include "logger.hpp"
#include <algorithm>
#include <random>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace clb {

namespace {

std::unexpected<Error> no_candidates() {
    return std::unexpected(Error{ErrorCode::NoAvailableServer, "No reachable servers to choose from"});
}

} // namespace

CandidateSet CandidateSet::from(const ServerList& servers) {
    CandidateSet set;
    set.servers = servers;
    for (const auto& server : servers) {
        auto& stats = set.zones[server.zone()];
        ++stats.total;
        ++stats.reachable;
    }
    return set;
}

RandomSource::RandomSource(std::optional<uint64_t> seed)
    : seed_(seed ? *seed : (static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}()) {}

uint64_t RandomSource::next() {
    uint64_t z = seed_ + counter_.fetch_add(1, std::memory_order_relaxed) * 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

size_t RandomSource::below(size_t bound) {
    return bound == 0 ? 0 : static_cast<size_t>(next() % bound);
}

std::expected<Server, Error> RoundRobinRule::choose(const CandidateSet& candidates) {
    const auto& servers = candidates.servers;
    if (servers.empty()) {
        return no_candidates();
    }

    // Get current index and increment atomically
    size_t index = counter_.fetch_add(1, std::memory_order_relaxed) % servers.size();
    return servers[index];
}

std::expected<Server, Error> RandomRule::choose(const CandidateSet& candidates) {
    const auto& servers = candidates.servers;
    if (servers.empty()) {
        return no_candidates();
    }
    return servers[random_.below(servers.size())];
}

ZoneAvoidanceRule::ZoneAvoidanceRule(double availability_threshold,
                                     std::map<std::string, double> zone_weights,
                                     std::optional<uint64_t> seed)
    : availability_threshold_(availability_threshold),
      zone_weights_(std::move(zone_weights)),
      random_(seed) {}

double ZoneAvoidanceRule::zone_weight(const std::string& zone) const {
    auto it = zone_weights_.find(zone);
    return it != zone_weights_.end() ? it->second : 1.0;
}

std::expected<Server, Error> ZoneAvoidanceRule::choose(const CandidateSet& candidates) {
    const auto& servers = candidates.servers;
    if (servers.empty()) {
        return no_candidates();
    }

    std::map<std::string, size_t> members;
    for (const auto& server : servers) {
        ++members[server.zone()];
    }

    if (members.size() == 1) {
        return servers[random_.below(servers.size())];
    }

    std::map<std::string, double> scores;
    double best = 0.0;
    for (const auto& [zone, count] : members) {
        ZoneStats stats{count, count};
        auto it = candidates.zones.find(zone);
        if (it != candidates.zones.end()) {
            stats.reachable = std::max(it->second.reachable, count);
            stats.total = std::max(it->second.total, stats.reachable);
        }

        double score = static_cast<double>(stats.reachable) / static_cast<double>(stats.total)
                       * zone_weight(zone);
        scores[zone] = score;
        best = std::max(best, score);
    }

    // Every zone blacked out: nothing to prefer
    if (best <= 0.0) {
        return servers[random_.below(servers.size())];
    }

    const double cutoff = best * availability_threshold_;
    std::vector<const Server*> eligible;
    eligible.reserve(servers.size());
    for (const auto& server : servers) {
        double score = scores[server.zone()];
        if (score > 0.0 && score >= cutoff) {
            eligible.push_back(&server);
        }
    }

    if (Logger::debug_enabled() && eligible.size() != servers.size()) {
        for (const auto& [zone, score] : scores) {
            if (score <= 0.0 || score < cutoff) {
                Logger::debug(Logger::Component::Rule,
                    fmt::format("Avoiding zone {} (score {:.3f}, cutoff {:.3f})", zone, score, cutoff));
            }
        }
    }

    return *eligible[random_.below(eligible.size())];
}

std::expected<std::shared_ptr<SelectionRule>, Error> make_rule(const RuleConfig& config) {
    if (config.policy == "round-robin") {
        return std::make_shared<RoundRobinRule>();
    }

    if (config.policy == "random") {
        return std::make_shared<RandomRule>(config.seed);
    }

    if (config.policy == "zone-avoidance") {
        if (!config.availability_threshold.has_value()) {
            return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                "zone-avoidance requires rule.availability_threshold"});
        }
        double threshold = *config.availability_threshold;
        if (!(threshold > 0.0 && threshold <= 1.0)) {
            return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                fmt::format("rule.availability_threshold must be in (0, 1], got {}", threshold)});
        }
        for (const auto& [zone, weight] : config.zone_weights) {
            if (!(weight >= 0.0)) {
                return std::unexpected(Error{ErrorCode::InvalidConfiguration,
                    fmt::format("rule.zone_weights[{}] must not be negative", zone)});
            }
        }
        return std::make_shared<ZoneAvoidanceRule>(threshold, config.zone_weights, config.seed);
    }

    return std::unexpected(Error{ErrorCode::InvalidConfiguration,
        fmt::format("unknown rule policy '{}'", config.policy)});
}

} // namespace clb
