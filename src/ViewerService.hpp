#pragma once
#include <json/json.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <spdlog/logger.h>
#include "DocumentRegistry.hpp"
#include "EventBroadcaster.hpp"
#include "PerformanceMetrics.hpp"
#include "Result.hpp"
#include "ViewerConfig.hpp"

// JSON-RPC error code for a core error kind.
int rpc_error_code(ErrorKind kind);

// JSON-RPC 2.0 front for the viewer core: one "viewer" tool with open,
// read_segment, search, viewport, close and metrics operations. Not
// thread-safe; front ends serialize calls.
class ViewerService {
public:
    ViewerService(ViewerConfig config, std::shared_ptr<spdlog::logger> logger);
    ~ViewerService();

    ViewerService(const ViewerService&) = delete;
    ViewerService& operator=(const ViewerService&) = delete;

    // Returns the response, or a null value when the request is a notification.
    Json::Value handleRequest(const Json::Value& request);
    // Parses 'text' first; malformed JSON gives a -32700 error response.
    Json::Value handleMessage(const std::string& text);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    Json::Value initialize() const;
    Json::Value listTools() const;
    Json::Value listResources() const;

    // Result of a tools/call. Failures carry "__error__" (message) and
    // "__code__" (JSON-RPC code) instead of content.
    Json::Value callTool(const Json::Value& params);

    // Every notification the service emits, as complete JSON-RPC messages.
    EventBroadcaster<Json::Value>& notifications() { return notifications_; }
    const PerformanceMetrics& metrics() const { return *metrics_; }
    DocumentRegistry& registry() { return registry_; }

private:
    struct Session;

    Json::Value openDocument(const Json::Value& arguments);
    Json::Value readSegment(const Json::Value& arguments);
    Json::Value searchDocument(const Json::Value& arguments);
    Json::Value driveViewport(const Json::Value& arguments);
    Json::Value closeDocument(const Json::Value& arguments);
    Json::Value metricsSnapshot() const;

    Session& sessionFor(const std::shared_ptr<Document>& document);
    void notify(const std::string& method, const Json::Value& params);

    ViewerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    DocumentRegistry registry_;
    EventBroadcaster<Json::Value> notifications_;
    std::unordered_map<std::string, std::unique_ptr<Session>> sessions_;
};
