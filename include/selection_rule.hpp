#pragma once

#include "client_config.hpp"
#include "error.hpp"
#include "server.hpp"
#include <atomic>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace clb {

struct ZoneStats {
    size_t total = 0;
    size_t reachable = 0;
};

// Health-annotated candidates handed to a rule.
struct CandidateSet {
    // Reachable servers, in filter order.
    ServerList servers;
    // Per-zone counts over the filtered list before unreachable servers were
    // dropped. Zones missing here are scored as fully reachable.
    std::map<std::string, ZoneStats> zones;

    // Treats every server as reachable.
    static CandidateSet from(const ServerList& servers);
};

// Counter-based generator (SplitMix64 over a sequence number). Draws are
// lock-free and the sequence is fixed for a given seed.
class RandomSource {
public:
    explicit RandomSource(std::optional<uint64_t> seed = std::nullopt);

    uint64_t next();
    size_t below(size_t bound);

private:
    uint64_t seed_;
    std::atomic<uint64_t> counter_{0};
};

class SelectionRule {
public:
    virtual ~SelectionRule() = default;

    // Returns a member of candidates.servers, or NoAvailableServer when it
    // is empty.
    virtual std::expected<Server, Error> choose(const CandidateSet& candidates) = 0;
};

class RoundRobinRule : public SelectionRule {
public:
    RoundRobinRule() : counter_(0) {}

    std::expected<Server, Error> choose(const CandidateSet& candidates) override;

    void reset() {
        counter_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<size_t> counter_;
};

class RandomRule : public SelectionRule {
public:
    explicit RandomRule(std::optional<uint64_t> seed = std::nullopt) : random_(seed) {}

    std::expected<Server, Error> choose(const CandidateSet& candidates) override;

private:
    RandomSource random_;
};

// Scores each zone as reachable/total * weight, drops zones scoring zero or
// below availability_threshold * best score, then picks uniformly among the
// servers of the zones left.
class ZoneAvoidanceRule : public SelectionRule {
public:
    ZoneAvoidanceRule(double availability_threshold,
                      std::map<std::string, double> zone_weights = {},
                      std::optional<uint64_t> seed = std::nullopt);

    std::expected<Server, Error> choose(const CandidateSet& candidates) override;

    double availability_threshold() const { return availability_threshold_; }

private:
    double zone_weight(const std::string& zone) const;

    double availability_threshold_;
    std::map<std::string, double> zone_weights_;
    RandomSource random_;
};

std::expected<std::shared_ptr<SelectionRule>, Error> make_rule(const RuleConfig& config);

} // namespace clb
