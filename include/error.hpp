#pragma once

#include <string>

namespace clb {

enum class ErrorCode {
    DiscoveryUnavailable,
    NoAvailableServer,
    ProbeTimeout,
    InvalidConfiguration,
    InvalidRequest
};

struct Error {
    ErrorCode code;
    std::string message;
};

const char* to_string(ErrorCode code);

} // namespace clb
