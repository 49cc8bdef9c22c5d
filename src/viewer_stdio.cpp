#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <json/json.h>
#include "Logging.hpp"
#include "ViewerConfig.hpp"
#include "ViewerService.hpp"

namespace {

std::mutex outputMutex;

void writeLine(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::lock_guard lock(outputMutex);
    std::cout << Json::writeString(writer, message) << std::endl;
}

// --config <path>, else ./config.json if present, else defaults.
ViewerConfig resolveConfig(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return load_config(argv[i + 1]);
        }
    }
    if (std::filesystem::exists("config.json")) {
        return load_config("config.json");
    }
    return ViewerConfig();
}

}  // namespace

int main(int argc, char* argv[]) {
    ViewerConfig config;
    try {
        config = resolveConfig(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    auto logger = make_logger("streamview", config.logLevel);
    ViewerService service(config, logger);
    service.notifications().subscribe([](const Json::Value& notification) { writeLine(notification); });
    logger->info("stdio server started ({} allowed path(s))", config.allowedPaths.size());

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        Json::Value response = service.handleMessage(line);
        if (!response.isNull()) {
            writeLine(response);
        }
    }
    logger->info("stdin closed, shutting down");
    return 0;
}
