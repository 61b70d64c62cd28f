#pragma once

#include "client_config.hpp"
#include <string>
#include <map>
#include <expected>
#include <nlohmann/json_fwd.hpp>

namespace clb {

struct LoggingConfig {
    std::string log_file = "clientlb.log";
    std::string log_level = "INFO";
};

struct Config {
    LoggingConfig logging;
    std::map<std::string, ClientConfig> clients;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

private:
    static std::expected<Config, std::string> parse_config(const std::string& content);
    static std::expected<ClientConfig, std::string> parse_client(const std::string& name,
                                                                 const nlohmann::json& j);
    static std::expected<Server, std::string> parse_server(const std::string& client_name,
                                                           const nlohmann::json& j);
    static bool validate_config(const Config& config);
};

} // namespace clb
