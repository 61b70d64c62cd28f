#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace clb {

inline constexpr const char* kUnknownZone = "UNKNOWN";

using Metadata = std::map<std::string, std::string>;

// Server known only by its address.
struct BasicServer {
    std::string host;
    uint16_t port = 0;
    std::string zone = kUnknownZone;
    Metadata metadata;
};

// Server reported by the discovery backend together with its instance record.
// secure_port_enabled only decides the scheme upgrade; requests keep going to
// `port`. secure_port, instance_id and app_name are carried for callers that
// inspect the record through Server::details().
struct DiscoveryEnabledServer {
    std::string host;
    uint16_t port = 0;
    std::string zone = kUnknownZone;
    Metadata metadata;
    bool secure_port_enabled = false;
    uint16_t secure_port = 0;
    std::string instance_id;
    std::string app_name;
};

class Server {
public:
    using Details = std::variant<BasicServer, DiscoveryEnabledServer>;

    Server(BasicServer details);
    Server(DiscoveryEnabledServer details);
    Server(std::string host, uint16_t port, std::string zone = kUnknownZone);

    const std::string& host() const;
    uint16_t port() const;
    const std::string& zone() const;
    const Metadata& metadata() const;

    // "host:port"
    const std::string& id() const { return id_; }

    const Details& details() const { return details_; }

    bool operator==(const Server& other) const { return id_ == other.id_; }

private:
    Details details_;
    std::string id_;
};

using ServerList = std::vector<Server>;
using Snapshot = std::shared_ptr<const ServerList>;

} // namespace clb
