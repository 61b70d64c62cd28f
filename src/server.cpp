#include "server.hpp"
#include <spdlog/fmt/fmt.h>

namespace clb {

namespace {

template<typename T>
std::string make_id(const T& details) {
    return fmt::format("{}:{}", details.host, details.port);
}

} // namespace

Server::Server(BasicServer details)
    : details_(std::move(details)),
      id_(make_id(std::get<BasicServer>(details_))) {}

Server::Server(DiscoveryEnabledServer details)
    : details_(std::move(details)),
      id_(make_id(std::get<DiscoveryEnabledServer>(details_))) {}

Server::Server(std::string host, uint16_t port, std::string zone)
    : Server(BasicServer{std::move(host), port, std::move(zone), {}}) {}

const std::string& Server::host() const {
    return std::visit([](const auto& d) -> const std::string& { return d.host; }, details_);
}

uint16_t Server::port() const {
    return std::visit([](const auto& d) { return d.port; }, details_);
}

const std::string& Server::zone() const {
    return std::visit([](const auto& d) -> const std::string& { return d.zone; }, details_);
}

const Metadata& Server::metadata() const {
    return std::visit([](const auto& d) -> const Metadata& { return d.metadata; }, details_);
}

} // namespace clb
