#include "client_factory.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include "request_router.hpp"
#include "uri.hpp"
#include <spdlog/fmt/fmt.h>
#include <iostream>

using namespace clb;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <uri>..." << std::endl;
        return 1;
    }

    // Load configuration
    auto config_result = ConfigLoader::load(argv[1]);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    // Initialize logger
    Logger::init(config.logging.log_file, config.logging.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} client configurations", config.clients.size()));

    ClientFactory factory(std::move(config.clients));

    int failures = 0;
    for (int i = 2; i < argc; ++i) {
        auto uri = Uri::parse(argv[i]);
        if (!uri.has_value()) {
            std::cerr << argv[i] << ": " << uri.error().message << std::endl;
            ++failures;
            continue;
        }

        Request request;
        request.uri = uri.value();

        auto routed = factory.route(request);
        if (!routed.has_value()) {
            std::cerr << argv[i] << ": " << to_string(routed.error().code) << ": "
                      << routed.error().message << std::endl;
            ++failures;
            continue;
        }

        std::cout << fmt::format("{} -> {}\n", argv[i], routed->uri.to_string());
    }

    factory.shutdown();
    Logger::shutdown();

    return failures == 0 ? 0 : 1;
}
