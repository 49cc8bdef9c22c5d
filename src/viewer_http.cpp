#include <drogon/drogon.h>
#include <json/json.h>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include "Logging.hpp"
#include "ViewerConfig.hpp"
#include "ViewerService.hpp"

namespace {

// Notifications kept for GET /events.
constexpr size_t kRecentEventLimit = 256;

std::unique_ptr<ViewerService> service;
std::mutex serviceMutex;  // the service is single-writer
std::deque<std::string> recentEvents;
std::mutex eventsMutex;

void recordEvent(const Json::Value& notification) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::string event = "event: " + notification["method"].asString() + "\ndata: " +
                        Json::writeString(writer, notification) + "\n\n";
    std::lock_guard lock(eventsMutex);
    recentEvents.push_back(std::move(event));
    while (recentEvents.size() > kRecentEventLimit) {
        recentEvents.pop_front();
    }
}

void handleRpc(const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    Json::Value response;
    {
        std::lock_guard lock(serviceMutex);
        response = service->handleMessage(std::string(req->body()));
    }
    if (response.isNull()) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
        return;
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(response);
    if (response.isMember("error") && response["error"]["code"].asInt() == -32700) {
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
    }
    callback(resp);
}

// Replays the retained notifications as a text/event-stream body.
void handleEvents(const drogon::HttpRequestPtr&,
                  std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    std::string body = "event: connected\ndata: {}\n\n";
    {
        std::lock_guard lock(eventsMutex);
        for (const auto& event : recentEvents) {
            body += event;
        }
    }
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setContentTypeString("text/event-stream");
    resp->addHeader("Cache-Control", "no-cache");
    resp->setBody(std::move(body));
    callback(resp);
}

ViewerConfig resolveConfig(int argc, char* argv[], std::string& configPath) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            configPath = argv[i + 1];
            return load_config(configPath);
        }
    }
    if (std::filesystem::exists("config.json")) {
        configPath = "config.json";
        return load_config(configPath);
    }
    return ViewerConfig();
}

bool hasListeners(const std::string& configPath) {
    if (configPath.empty()) return false;
    std::ifstream in(configPath);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) return false;
    return root["listeners"].isArray() && !root["listeners"].empty();
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace drogon;

    ViewerConfig config;
    std::string configPath;
    try {
        config = resolveConfig(argc, argv, configPath);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }
    auto logger = make_logger("streamview", config.logLevel);
    service = std::make_unique<ViewerService>(config, logger);
    service->notifications().subscribe(recordEvent);

    // Drogon reads its own sections (listeners, ...) from the same file.
    if (!configPath.empty()) {
        app().loadConfigFile(configPath);
    }
    if (!hasListeners(configPath)) {
        app().addListener("127.0.0.1", 8080);
    }

    app().registerHandler("/rpc",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleRpc(req, std::move(callback));
        },
        {Post});
    app().registerHandler("/events",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleEvents(req, std::move(callback));
        },
        {Get});

    logger->info("HTTP server starting: POST /rpc, GET /events");
    app().run();
    service.reset();
    return 0;
}
