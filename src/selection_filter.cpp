#include "selection_filter.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <spdlog/fmt/fmt.h>

namespace clb {

namespace {

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

ZonePreferenceFilter::ZonePreferenceFilter(std::string preferred_zone)
    : preferred_zone_(std::move(preferred_zone)) {}

ServerList ZonePreferenceFilter::apply(const ServerList& candidates,
                                       const SelectionContext& context) const {
    const std::string& zone = context.preferred_zone.empty()
                              ? preferred_zone_
                              : context.preferred_zone;
    if (zone.empty()) {
        return candidates;
    }

    ServerList filtered;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(filtered),
        [&zone](const Server& server) { return equals_ignore_case(server.zone(), zone); });

    if (filtered.empty()) {
        if (!candidates.empty()) {
            Logger::debug(Logger::Component::Filter,
                fmt::format("No server in zone {}, using all {} candidates",
                    zone, candidates.size()));
        }
        return candidates;
    }

    return filtered;
}

std::expected<std::shared_ptr<SelectionFilter>, Error> make_filter(const FilterConfig& config) {
    if (config.type == "pass-through") {
        return std::make_shared<PassThroughFilter>();
    }
    if (config.type == "zone-preference") {
        return std::make_shared<ZonePreferenceFilter>(config.preferred_zone);
    }
    return std::unexpected(Error{ErrorCode::InvalidConfiguration,
        fmt::format("unknown filter type '{}'", config.type)});
}

} // namespace clb
