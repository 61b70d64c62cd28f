#pragma once

#include "client_config.hpp"
#include "error.hpp"
#include "server.hpp"
#include <expected>
#include <memory>
#include <string>

namespace clb {

// Per-call selection input.
struct SelectionContext {
    // Overrides the configured preferred zone when non-empty.
    std::string preferred_zone;
};

// Narrows a candidate list before selection. Implementations return a
// subsequence of their input in input order and never add servers.
class SelectionFilter {
public:
    virtual ~SelectionFilter() = default;

    virtual ServerList apply(const ServerList& candidates, const SelectionContext& context) const = 0;
};

class PassThroughFilter : public SelectionFilter {
public:
    ServerList apply(const ServerList& candidates, const SelectionContext&) const override {
        return candidates;
    }
};

// Keeps servers in the preferred zone. Falls back to the whole input when no
// zone is set or none of the candidates is in it.
class ZonePreferenceFilter : public SelectionFilter {
public:
    explicit ZonePreferenceFilter(std::string preferred_zone = {});

    ServerList apply(const ServerList& candidates, const SelectionContext& context) const override;

    const std::string& preferred_zone() const { return preferred_zone_; }

private:
    std::string preferred_zone_;
};

std::expected<std::shared_ptr<SelectionFilter>, Error> make_filter(const FilterConfig& config);

} // namespace clb
