#include "config_loader.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <vector>
#include <spdlog/fmt/fmt.h>


using json = nlohmann::json;

namespace clb {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    return parse_config(content);
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        if (j.contains("logging")) {
            auto& logging = j["logging"];
            config.logging.log_file = logging.value("log_file", config.logging.log_file);
            config.logging.log_level = logging.value("log_level", config.logging.log_level);
        }

        if (!j.contains("clients") || !j["clients"].is_object()) {
            return std::unexpected("Missing 'clients' section");
        }
        for (const auto& item : j["clients"].items()) {
            auto client = parse_client(item.key(), item.value());
            if (!client.has_value()) {
                return std::unexpected(client.error());
            }
            config.clients.emplace(item.key(), std::move(client.value()));
        }

        if (!validate_config(config)) {
            return std::unexpected("Configuration validation failed");
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<ClientConfig, std::string> ConfigLoader::parse_client(const std::string& name,
                                                                    const json& j) {
    ClientConfig client;
    client.name = name;
    client.refresh_interval = std::chrono::milliseconds(
        j.value("refresh_interval_ms", client.refresh_interval.count()));
    client.refresh_timeout = std::chrono::milliseconds(
        j.value("refresh_timeout_ms", client.refresh_timeout.count()));

    if (j.contains("servers")) {
        for (const auto& server_json : j["servers"]) {
            auto server = parse_server(name, server_json);
            if (!server.has_value()) {
                return std::unexpected(server.error());
            }
            client.servers.push_back(std::move(server.value()));
        }
    }

    if (j.contains("filter")) {
        auto& filter = j["filter"];
        client.filter.type = filter.value("type", client.filter.type);
        client.filter.preferred_zone = filter.value("preferred_zone", client.filter.preferred_zone);
    }

    if (j.contains("rule")) {
        auto& rule = j["rule"];
        client.rule.policy = rule.value("policy", client.rule.policy);
        if (rule.contains("availability_threshold")) {
            client.rule.availability_threshold = rule["availability_threshold"].get<double>();
        }
        if (rule.contains("zone_weights")) {
            client.rule.zone_weights = rule["zone_weights"].get<std::map<std::string, double>>();
        }
        if (rule.contains("seed")) {
            client.rule.seed = rule["seed"].get<uint64_t>();
        }
    }

    if (j.contains("probe")) {
        auto& probe = j["probe"];
        client.probe.type = probe.value("type", client.probe.type);
        client.probe.path = probe.value("path", client.probe.path);
        client.probe.timeout = std::chrono::milliseconds(
            probe.value("timeout_ms", client.probe.timeout.count()));
        client.probe.cache_ttl = std::chrono::milliseconds(
            probe.value("cache_ttl_ms", client.probe.cache_ttl.count()));
        client.probe.secure = probe.value("secure", client.probe.secure);
    }

    return client;
}

std::expected<Server, std::string> ConfigLoader::parse_server(const std::string& client_name,
                                                              const json& j) {
    std::string host = j.value("host", "");
    int64_t port = j.value("port", int64_t{0});
    if (host.empty()) {
        return std::unexpected(fmt::format("Client '{}': server without host", client_name));
    }
    if (port <= 0 || port > 65535) {
        return std::unexpected(fmt::format("Client '{}': server {} has invalid port {}",
            client_name, host, port));
    }

    std::string zone = j.value("zone", std::string(kUnknownZone));
    Metadata metadata;
    if (j.contains("metadata")) {
        metadata = j["metadata"].get<Metadata>();
    }

    // Members carrying an instance record came from discovery
    if (j.contains("instance_id") || j.contains("secure_port_enabled")) {
        DiscoveryEnabledServer server;
        server.host = host;
        server.port = static_cast<uint16_t>(port);
        server.zone = zone;
        server.metadata = std::move(metadata);
        int64_t secure_port = j.value("secure_port", int64_t{0});
        if (secure_port < 0 || secure_port > 65535) {
            return std::unexpected(fmt::format("Client '{}': server {} has invalid secure_port {}",
                client_name, host, secure_port));
        }
        server.secure_port_enabled = j.value("secure_port_enabled", false);
        server.secure_port = static_cast<uint16_t>(secure_port);
        server.instance_id = j.value("instance_id", "");
        server.app_name = j.value("app_name", client_name);
        return Server(std::move(server));
    }

    return Server(BasicServer{host, static_cast<uint16_t>(port), zone, std::move(metadata)});
}

bool ConfigLoader::validate_config(const Config& config) {
    if (config.clients.empty()) {
        return false;
    }

    for (const auto& [name, client] : config.clients) {
        if (client.refresh_interval.count() <= 0 || client.refresh_timeout.count() <= 0) {
            return false;
        }
    }

    return true;
}

} // namespace clb
