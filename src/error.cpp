#include "error.hpp"

namespace clb {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DiscoveryUnavailable: return "DiscoveryUnavailable";
        case ErrorCode::NoAvailableServer: return "NoAvailableServer";
        case ErrorCode::ProbeTimeout: return "ProbeTimeout";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        default: return "Unknown";
    }
}

} // namespace clb
