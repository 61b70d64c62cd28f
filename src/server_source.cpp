#include "server_source.hpp"

namespace clb {

StaticServerSource::StaticServerSource(ServerList servers)
    : servers_(std::move(servers)) {}

std::expected<ServerList, Error> StaticServerSource::fetch(const std::string&) {
    return servers_;
}

FunctionServerSource::FunctionServerSource(FetchFn fetch)
    : fetch_(std::move(fetch)) {}

std::expected<ServerList, Error> FunctionServerSource::fetch(const std::string& client_name) {
    if (!fetch_) {
        return std::unexpected(Error{ErrorCode::DiscoveryUnavailable,
                                     "No discovery callback installed"});
    }
    return fetch_(client_name);
}

} // namespace clb
