#pragma once

#include "error.hpp"
#include "server.hpp"
#include <expected>
#include <functional>
#include <string>

namespace clb {

// Pull interface onto the discovery backend. fetch() returns the complete
// current member list for a logical client name.
class ServerSource {
public:
    virtual ~ServerSource() = default;

    virtual std::expected<ServerList, Error> fetch(const std::string& client_name) = 0;
};

// Fixed member list taken from configuration.
class StaticServerSource : public ServerSource {
public:
    explicit StaticServerSource(ServerList servers);

    std::expected<ServerList, Error> fetch(const std::string& client_name) override;

private:
    ServerList servers_;
};

// Adapts a discovery client callback.
class FunctionServerSource : public ServerSource {
public:
    using FetchFn = std::function<std::expected<ServerList, Error>(const std::string&)>;

    explicit FunctionServerSource(FetchFn fetch);

    std::expected<ServerList, Error> fetch(const std::string& client_name) override;

private:
    FetchFn fetch_;
};

} // namespace clb
