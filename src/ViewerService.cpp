#include "ViewerService.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <limits>
#include <sstream>
#include "Collaborators.hpp"
#include "LineUtils.hpp"
#include "VirtualViewportController.hpp"

namespace {

using Notify = std::function<void(const std::string&, const Json::Value&)>;

class JsonDisplaySurface : public DisplaySurface {
public:
    JsonDisplaySurface(std::string handle, Notify notify) : handle_(std::move(handle)), notify_(std::move(notify)) {}

    void setVisibleContent(const std::string& text) override {
        Json::Value params;
        params["handle"] = handle_;
        params["text"] = text;
        notify_("notifications/display", params);
    }

    EventBroadcaster<DisplayEvent>& events() override { return events_; }

private:
    std::string handle_;
    Notify notify_;
    EventBroadcaster<DisplayEvent> events_;
};

class NotifyingStatusSink : public StatusSink {
public:
    NotifyingStatusSink(std::string handle, Notify notify) : handle_(std::move(handle)), notify_(std::move(notify)) {}

    void reportProgress(int percent, const std::string& label) override {
        Json::Value params;
        params["handle"] = handle_;
        params["progress"] = percent;
        params["label"] = label;
        notify_("notifications/progress", params);
    }

private:
    std::string handle_;
    Notify notify_;
};

// Nobody is there to click Retry: report the error and carry on.
class NotifyingErrorDialog : public ErrorDialog {
public:
    NotifyingErrorDialog(std::string handle, Notify notify) : handle_(std::move(handle)), notify_(std::move(notify)) {}

    void present(const RecoverableError& error, std::function<void(ErrorChoice)> respond) override {
        Json::Value params;
        params["handle"] = handle_;
        params["kind"] = to_string(error.error.kind);
        params["title"] = error.title;
        params["message"] = error.message;
        params["can_retry"] = error.canRetry;
        params["suggested_actions"] = Json::Value(Json::arrayValue);
        for (const auto& action : error.suggestedActions) {
            params["suggested_actions"].append(action);
        }
        notify_("notifications/error", params);
        respond(ErrorChoice::Ignore);
    }

private:
    std::string handle_;
    Notify notify_;
};

Json::Value error_result(const Error& error) {
    Json::Value result;
    result["__error__"] = error.message;
    result["__code__"] = rpc_error_code(error.kind);
    return result;
}

Json::Value invalid_argument(const std::string& message) {
    return error_result(make_error(ErrorKind::InvalidArgument, message));
}

// steps * stepLines, saturated to the int64_t range.
int64_t wheel_lines(int64_t steps, uint64_t stepLines) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    if (steps == 0 || stepLines == 0) return 0;
    if (stepLines > static_cast<uint64_t>(max)) stepLines = static_cast<uint64_t>(max);
    int64_t step = static_cast<int64_t>(stepLines);
    int64_t limit = max / step;
    if (steps > limit) return max;
    if (steps < -limit) return -max;
    return steps * step;
}

Json::Value text_content(const std::string& text) {
    Json::Value content(Json::arrayValue);
    Json::Value item;
    item["type"] = "text";
    item["text"] = text;
    content.append(item);
    return content;
}

std::string to_compact_string(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

Json::Value info_to_json(const std::string& handle, const FileStreamInfo& info) {
    Json::Value out;
    out["handle"] = handle;
    out["size"] = Json::UInt64(info.size);
    out["requires_streaming"] = info.requiresStreaming;
    out["estimated_line_count"] = Json::UInt64(info.estimatedLineCount);
    out["encoding"] = encoding_name(info.encoding);
    out["size_category"] = to_string(info.sizeCategory);
    out["loading_recommendation"] = to_string(info.loadingRecommendation);
    out["warning"] = info.warning;
    return out;
}

}  // namespace

int rpc_error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return -32004;
        case ErrorKind::Access: return -32003;
        case ErrorKind::OutOfRange: return -32602;
        case ErrorKind::IO: return -32010;
        case ErrorKind::MemoryPressure: return -32011;
        case ErrorKind::Cancelled: return -32800;
        case ErrorKind::InvalidArgument: return -32602;
    }
    return -32603;
}

struct ViewerService::Session {
    Session(std::shared_ptr<Document> doc, const ViewerConfig& config, std::shared_ptr<spdlog::logger> logger,
            std::shared_ptr<PerformanceMetrics> metrics, const Notify& notify)
        : document(std::move(doc)),
          display(document->handle, notify),
          status(document->handle, notify),
          dialog(document->handle, notify),
          controller(std::make_unique<VirtualViewportController>(document->info, document->loader, display, &status,
                                                                 &dialog, config, std::move(logger),
                                                                 std::move(metrics))) {}

    std::shared_ptr<Document> document;
    JsonDisplaySurface display;
    NotifyingStatusSink status;
    NotifyingErrorDialog dialog;
    // Declared last so it is disposed while the collaborators above still exist.
    std::unique_ptr<VirtualViewportController> controller;
};

ViewerService::ViewerService(ViewerConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      metrics_(std::make_shared<PerformanceMetrics>()),
      registry_(config_, logger_, metrics_) {}

ViewerService::~ViewerService() = default;

Json::Value ViewerService::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value ViewerService::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

void ViewerService::notify(const std::string& method, const Json::Value& params) {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    notifications_.broadcast(notification);
}

Json::Value ViewerService::handleMessage(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        logger_->warn("JSON parse error: {}", errs);
        return createError(Json::Value::null, -32700, "Parse error");
    }
    return handleRequest(request);
}

Json::Value ViewerService::handleRequest(const Json::Value& request) {
    if (!request.isObject() || !request["method"].isString()) {
        return createError(request.isObject() ? request["id"] : Json::Value::null, -32600, "Invalid Request");
    }
    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];
    logger_->debug("Request {}", method);

    if (method == "initialize") {
        return createResponse(id, initialize());
    } else if (method == "tools/list") {
        return createResponse(id, listTools());
    } else if (method == "resources/list") {
        return createResponse(id, listResources());
    } else if (method == "tools/call") {
        Json::Value result;
        try {
            result = callTool(params);
        } catch (const std::exception& e) {
            logger_->error("tools/call failed: {}", e.what());
            return createError(id, -32603, std::string("Internal error: ") + e.what());
        }
        if (result.isMember("__error__")) {
            return createError(id, result["__code__"].asInt(), result["__error__"].asString());
        }
        bool listChanged = result.get("resourceListChanged", false).asBool();
        result.removeMember("resourceListChanged");
        Json::Value response = createResponse(id, result);
        if (listChanged) {
            notify("notifications/resources/list_changed", Json::Value());
        }
        return response;
    } else if (method == "notifications/initialized") {
        // No response needed for notifications
        return Json::Value();
    }
    if (!request.isMember("id")) {
        return Json::Value();
    }
    return createError(id, -32601, "Method not found: " + method);
}

Json::Value ViewerService::initialize() const {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = true;
    result["serverInfo"]["name"] = "streamview";
    result["serverInfo"]["version"] = "1.0.0";
    return result;
}

Json::Value ViewerService::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value viewerTool;
    viewerTool["name"] = "viewer";
    viewerTool["description"] = "Streaming viewer for large text files: open, read decoded segments, search, drive a viewport, close and report metrics";
    Json::Value& schema = viewerTool["inputSchema"];
    schema["type"] = "object";
    Json::Value& props = schema["properties"];

    props["operation"]["type"] = "string";
    props["operation"]["description"] = "Operation to perform";
    for (const char* op : {"open", "read_segment", "search", "viewport", "close", "metrics"}) {
        props["operation"]["enum"].append(op);
    }

    props["path"]["type"] = "string";
    props["path"]["description"] = "File to open (required for 'open')";

    props["handle"]["type"] = "string";
    props["handle"]["description"] = "Handle returned by 'open' (required for every operation except 'open' and 'metrics')";

    props["offset"]["type"] = "number";
    props["offset"]["description"] = "For 'read_segment': byte offset, or zero-based line index with format 'lines'";
    props["size"]["type"] = "number";
    props["size"]["description"] = "For 'read_segment': byte count, or line count with format 'lines'";
    props["format"]["type"] = "string";
    props["format"]["enum"].append("text");
    props["format"]["enum"].append("lines");
    props["format"]["default"] = "text";
    props["format"]["description"] = "With 'lines', lines are counted within the first max_segment_bytes of the file";

    props["term"]["type"] = "string";
    props["term"]["description"] = "Text to search for (required for 'search')";
    props["case_sensitive"]["type"] = "boolean";
    props["case_sensitive"]["default"] = false;
    props["max_results"]["type"] = "number";

    props["action"]["type"] = "string";
    props["action"]["description"] = "Viewport action (required for 'viewport')";
    for (const char* action : {"set", "goto", "resize", "scroll", "refresh"}) {
        props["action"]["enum"].append(action);
    }
    props["top_line"]["type"] = "number";
    props["visible_lines"]["type"] = "number";
    props["line"]["type"] = "number";
    props["delta"]["type"] = "number";
    props["delta"]["description"] = "For 'scroll': lines to move (negative moves up)";
    props["steps"]["type"] = "number";
    props["steps"]["description"] = "For 'scroll': wheel notches, scroll_step_lines each";

    schema["required"].append("operation");

    tools.append(viewerTool);
    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value ViewerService::listResources() const {
    Json::Value resources(Json::arrayValue);
    for (const auto& handle : registry_.listHandles()) {
        auto document = registry_.get(handle);
        if (!document) continue;
        Json::Value resource;
        resource["uri"] = "file://" + handle;
        resource["name"] = std::filesystem::path(handle).filename().string();
        resource["description"] = "Text file (" + std::to_string(document->info.size) + " bytes, " +
                                  encoding_name(document->info.encoding) + ")";
        resource["mimeType"] = "text/plain";
        resources.append(resource);
    }
    Json::Value result;
    result["resources"] = resources;
    return result;
}

Json::Value ViewerService::callTool(const Json::Value& params) {
    std::string toolName = params["name"].asString();
    if (toolName != "viewer") {
        return invalid_argument("Unknown tool: " + toolName);
    }
    const Json::Value& arguments = params["arguments"];
    std::string operation = arguments["operation"].asString();

    if (operation == "open") {
        return openDocument(arguments);
    } else if (operation == "read_segment") {
        return readSegment(arguments);
    } else if (operation == "search") {
        return searchDocument(arguments);
    } else if (operation == "viewport") {
        return driveViewport(arguments);
    } else if (operation == "close") {
        return closeDocument(arguments);
    } else if (operation == "metrics") {
        Json::Value result;
        Json::Value snapshot = metricsSnapshot();
        result["content"] = text_content(to_compact_string(snapshot));
        result["structuredContent"] = snapshot;
        return result;
    }
    return invalid_argument("Unknown operation: " + operation);
}

Json::Value ViewerService::openDocument(const Json::Value& arguments) {
    if (!arguments["path"].isString()) {
        return invalid_argument("'path' must be a string");
    }
    auto opened = registry_.open(arguments["path"].asString());
    if (!opened) {
        return error_result(opened.error());
    }
    const auto& document = opened.value();
    Json::Value info = info_to_json(document->handle, document->info);

    std::string text = "File opened successfully.\n\nHandle: " + document->handle +
                       "\nSize: " + std::to_string(document->info.size) + " bytes" +
                       "\nEncoding: " + encoding_name(document->info.encoding) +
                       "\nEstimated lines: " + std::to_string(document->info.estimatedLineCount);
    if (!document->info.warning.empty()) {
        text += "\nWarning: " + document->info.warning;
    }
    Json::Value result;
    result["content"] = text_content(text);
    result["structuredContent"] = info;
    result["resourceListChanged"] = true;
    return result;
}

Json::Value ViewerService::readSegment(const Json::Value& arguments) {
    auto document = registry_.get(arguments["handle"].asString());
    if (!document) {
        return error_result(make_error(ErrorKind::NotFound, "Invalid handle: " + arguments["handle"].asString()));
    }
    if (!arguments["offset"].isIntegral() || !arguments["size"].isIntegral()) {
        return invalid_argument("'offset' and 'size' must be integers");
    }
    std::string format = arguments.get("format", "text").asString();
    Json::Value result;

    if (format == "text") {
        auto loaded = document->loader->load(arguments["offset"].asInt64(), arguments["size"].asInt64(), CancelToken());
        if (!loaded) {
            return error_result(loaded.error());
        }
        if (!loaded.value()) {
            return error_result(make_error(ErrorKind::Cancelled, "Read cancelled"));
        }
        const TextSegment& segment = *loaded.value();
        result["content"] = text_content(segment.content);
        result["structuredContent"]["start_position"] = Json::Int64(segment.startPosition);
        result["structuredContent"]["length"] = Json::Int64(segment.length);
        return result;
    } else if (format == "lines") {
        if (arguments["offset"].asInt64() < 0 || arguments["size"].asInt64() < 0) {
            return invalid_argument("'offset' and 'size' must not be negative");
        }
        if (document->info.size == 0) {
            return error_result(make_error(ErrorKind::OutOfRange, "Read out of bounds (lines): file is empty"));
        }
        auto loaded = document->loader->load(0, static_cast<int64_t>(config_.maxSegmentBytes), CancelToken());
        if (!loaded) {
            return error_result(loaded.error());
        }
        if (!loaded.value()) {
            return error_result(make_error(ErrorKind::Cancelled, "Read cancelled"));
        }
        const std::string& text = loaded.value()->content;
        size_t start_byte = 0;
        size_t bytes_len = 0;
        size_t start_line = arguments["offset"].asUInt64();
        size_t max_lines = arguments["size"].asUInt64();
        if (!compute_line_byte_range(text.data(), text.size(), start_line, max_lines, start_byte, bytes_len)) {
            return error_result(make_error(ErrorKind::OutOfRange, "Read out of bounds (lines): " + document->handle));
        }
        result["content"] = text_content(text.substr(start_byte, bytes_len));
        result["structuredContent"]["start_line"] = Json::UInt64(start_line);
        result["structuredContent"]["lines"] = Json::UInt64(count_lines(text.data() + start_byte, bytes_len));
        return result;
    }
    return invalid_argument("Invalid format: " + format);
}

Json::Value ViewerService::searchDocument(const Json::Value& arguments) {
    auto document = registry_.get(arguments["handle"].asString());
    if (!document) {
        return error_result(make_error(ErrorKind::NotFound, "Invalid handle: " + arguments["handle"].asString()));
    }
    if (!arguments["term"].isString()) {
        return invalid_argument("'term' must be a string");
    }
    bool caseSensitive = arguments.get("case_sensitive", false).asBool();
    size_t limit = static_cast<size_t>(arguments.get("max_results", Json::UInt64(config_.maxSearchResults)).asUInt64());

    NotifyingStatusSink progress(document->handle, [this](const std::string& method, const Json::Value& p) { notify(method, p); });
    auto found = document->search->findAll(arguments["term"].asString(), caseSensitive, CancelToken(), limit, &progress);
    if (!found) {
        return error_result(found.error());
    }

    Json::Value matches(Json::arrayValue);
    for (const auto& match : found.value()) {
        Json::Value item;
        item["position"] = Json::UInt64(match.position);
        item["length"] = Json::UInt64(match.length);
        item["line"] = Json::UInt64(match.lineNumber);
        matches.append(item);
    }
    Json::Value result;
    result["content"] = text_content("Found " + std::to_string(matches.size()) + " match(es)");
    result["structuredContent"]["matches"] = matches;
    return result;
}

ViewerService::Session& ViewerService::sessionFor(const std::shared_ptr<Document>& document) {
    auto it = sessions_.find(document->handle);
    if (it != sessions_.end()) {
        return *it->second;
    }
    Notify notify = [this](const std::string& method, const Json::Value& params) { this->notify(method, params); };
    auto session = std::make_unique<Session>(document, config_, logger_, metrics_, notify);
    Session& ref = *session;
    sessions_.emplace(document->handle, std::move(session));
    return ref;
}

Json::Value ViewerService::driveViewport(const Json::Value& arguments) {
    auto document = registry_.get(arguments["handle"].asString());
    if (!document) {
        return error_result(make_error(ErrorKind::NotFound, "Invalid handle: " + arguments["handle"].asString()));
    }
    Session& session = sessionFor(document);
    VirtualViewportController& controller = *session.controller;
    const ViewportState& state = controller.state();

    std::string action = arguments["action"].asString();
    if (action == "set") {
        controller.setViewport(arguments.get("top_line", Json::UInt64(state.topLine)).asUInt64(),
                               arguments.get("visible_lines", Json::UInt64(state.visibleLineCount)).asUInt64());
    } else if (action == "goto") {
        if (!arguments["line"].isIntegral()) return invalid_argument("'line' must be an integer");
        controller.goToLine(arguments["line"].asUInt64());
    } else if (action == "resize") {
        if (!arguments["visible_lines"].isIntegral()) return invalid_argument("'visible_lines' must be an integer");
        controller.resize(arguments["visible_lines"].asUInt64());
    } else if (action == "scroll") {
        // 'steps' are wheel notches of scroll_step_lines each; 'delta' is in lines.
        if (arguments["steps"].isIntegral()) {
            if (!arguments["steps"].isInt64()) return invalid_argument("'steps' is out of range");
            controller.scrollBy(wheel_lines(arguments["steps"].asInt64(), config_.scrollStepLines));
        } else if (arguments["delta"].isIntegral()) {
            if (!arguments["delta"].isInt64()) return invalid_argument("'delta' is out of range");
            controller.scrollBy(arguments["delta"].asInt64());
        } else {
            return invalid_argument("'delta' or 'steps' must be an integer");
        }
    } else if (action == "refresh") {
        controller.refresh();
    } else {
        return invalid_argument("Unknown viewport action: " + action);
    }

    bool settled = controller.waitUntilSettled(std::chrono::milliseconds(config_.loadTimeoutMs));

    Json::Value view;
    view["state"] = to_string(controller.status());
    view["top_line"] = Json::UInt64(state.topLine);
    view["visible_lines"] = Json::UInt64(state.visibleLineCount);
    view["total_lines"] = Json::UInt64(state.totalLines);
    std::string text;
    if (!settled) {
        text = "Still loading, try again shortly";
        view["message"] = text;
    } else {
        text = controller.visibleContent();
        view["content"] = text;
        if (controller.lastError()) {
            view["error"]["title"] = controller.lastError()->title;
            view["error"]["message"] = controller.lastError()->message;
        }
    }
    Json::Value result;
    result["content"] = text_content(text);
    result["structuredContent"] = view;
    return result;
}

Json::Value ViewerService::closeDocument(const Json::Value& arguments) {
    std::string handle = arguments["handle"].asString();
    auto closed = registry_.close(handle);
    if (!closed) {
        return error_result(closed.error());
    }
    if (closed.value() == 0) {
        sessions_.erase(handle);
    }
    Json::Value result;
    result["content"] = text_content("Handle closed successfully: " + handle);
    result["structuredContent"]["references"] = closed.value();
    result["resourceListChanged"] = true;
    return result;
}

Json::Value ViewerService::metricsSnapshot() const {
    Json::Value snapshot = metrics_->toJson();
    snapshot["open_documents"] = Json::UInt64(registry_.listHandles().size());
    Json::Value viewports(Json::arrayValue);
    for (const auto& [handle, session] : sessions_) {
        Json::Value item;
        item["handle"] = handle;
        item["state"] = to_string(session->controller->status());
        item["cached_lines"] = Json::UInt64(session->controller->cache().size());
        viewports.append(item);
    }
    snapshot["viewports"] = viewports;
    return snapshot;
}
