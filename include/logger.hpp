#pragma once

#include <string>
#include <memory>
#include <spdlog/spdlog.h>

namespace clb {

class Logger {
public:
    enum class Component {
        Config,
        Registry,
        Probe,
        Filter,
        Rule,
        Balancer,
        Router,
        Factory
    };

    static void init(const std::string& log_file, const std::string& log_level);

    static void shutdown();

    // Logging methods with component
    static void info(Component component, const std::string& message);
    static void warn(Component component, const std::string& message);
    static void error(Component component, const std::string& message);
    static void debug(Component component, const std::string& message);

    static bool debug_enabled();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::string component_to_string(Component component);
    static spdlog::level::level_enum string_to_level(const std::string& level);
};

} // namespace clb
