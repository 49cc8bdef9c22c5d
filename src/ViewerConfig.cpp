#include "ViewerConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace {

void read_uint(const Json::Value& section, const char* key, uint64_t& out) {
    if (!section.isMember(key)) return;
    const Json::Value& v = section[key];
    if (!v.isUInt64()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a non-negative integer");
    }
    out = v.asUInt64();
}

void read_bool(const Json::Value& section, const char* key, bool& out) {
    if (!section.isMember(key)) return;
    const Json::Value& v = section[key];
    if (!v.isBool()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a boolean");
    }
    out = v.asBool();
}

void read_string(const Json::Value& section, const char* key, std::string& out) {
    if (!section.isMember(key)) return;
    const Json::Value& v = section[key];
    if (!v.isString()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a string");
    }
    out = v.asString();
}

}  // namespace

ViewerConfig config_from_json(const Json::Value& root) {
    ViewerConfig config;
    if (!root.isObject() || !root.isMember("viewer")) {
        return config;
    }
    const Json::Value& viewer = root["viewer"];
    if (!viewer.isObject()) {
        throw std::runtime_error("config: 'viewer' must be an object");
    }

    read_uint(viewer, "stream_threshold_bytes", config.streamThresholdBytes);
    read_uint(viewer, "large_file_warning_bytes", config.largeFileWarningBytes);
    read_uint(viewer, "extreme_file_bytes", config.extremeFileBytes);
    read_uint(viewer, "memory_budget_bytes", config.memoryBudgetBytes);
    read_uint(viewer, "max_segment_bytes", config.maxSegmentBytes);
    read_uint(viewer, "fallback_segment_bytes", config.fallbackSegmentBytes);
    read_uint(viewer, "read_chunk_bytes", config.readChunkBytes);
    read_uint(viewer, "sample_bytes", config.sampleBytes);
    read_uint(viewer, "search_segment_bytes", config.searchSegmentBytes);
    read_bool(viewer, "normalize_line_endings", config.normalizeLineEndings);
    read_uint(viewer, "max_cached_lines", config.maxCachedLines);
    read_uint(viewer, "buffer_lines", config.bufferLines);
    read_uint(viewer, "default_visible_lines", config.defaultVisibleLines);
    read_uint(viewer, "scroll_step_lines", config.scrollStepLines);
    read_uint(viewer, "max_concurrent_reads", config.maxConcurrentReads);
    read_uint(viewer, "worker_threads", config.workerThreads);
    read_uint(viewer, "load_timeout_ms", config.loadTimeoutMs);
    read_uint(viewer, "max_search_results", config.maxSearchResults);
    read_string(viewer, "log_level", config.logLevel);

    if (viewer.isMember("allowed_paths")) {
        const Json::Value& paths = viewer["allowed_paths"];
        if (!paths.isArray()) {
            throw std::runtime_error("config: 'allowed_paths' must be an array");
        }
        for (const auto& path : paths) {
            if (!path.isString()) {
                throw std::runtime_error("config: 'allowed_paths' entries must be strings");
            }
            config.allowedPaths.push_back(path.asString());
        }
    }

    // Zero would stall the gate, the pool or the segment walk.
    if (config.maxConcurrentReads == 0) config.maxConcurrentReads = 1;
    if (config.workerThreads == 0) config.workerThreads = 1;
    if (config.searchSegmentBytes == 0) config.searchSegmentBytes = 8192;
    if (config.readChunkBytes == 0) config.readChunkBytes = 64 * 1024;
    if (config.maxSegmentBytes == 0) config.maxSegmentBytes = 1;
    if (config.defaultVisibleLines == 0) config.defaultVisibleLines = 1;
    return config;
}

ViewerConfig load_config(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile) {
        throw std::runtime_error("config: cannot open " + path);
    }
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        throw std::runtime_error("config: failed to parse " + path + ": " + errs);
    }
    return config_from_json(root);
}

Json::Value config_to_json(const ViewerConfig& config) {
    Json::Value viewer;
    viewer["stream_threshold_bytes"] = (Json::UInt64)config.streamThresholdBytes;
    viewer["large_file_warning_bytes"] = (Json::UInt64)config.largeFileWarningBytes;
    viewer["extreme_file_bytes"] = (Json::UInt64)config.extremeFileBytes;
    viewer["memory_budget_bytes"] = (Json::UInt64)config.memoryBudgetBytes;
    viewer["max_segment_bytes"] = (Json::UInt64)config.maxSegmentBytes;
    viewer["fallback_segment_bytes"] = (Json::UInt64)config.fallbackSegmentBytes;
    viewer["read_chunk_bytes"] = (Json::UInt64)config.readChunkBytes;
    viewer["sample_bytes"] = (Json::UInt64)config.sampleBytes;
    viewer["search_segment_bytes"] = (Json::UInt64)config.searchSegmentBytes;
    viewer["normalize_line_endings"] = config.normalizeLineEndings;
    viewer["max_cached_lines"] = (Json::UInt64)config.maxCachedLines;
    viewer["buffer_lines"] = (Json::UInt64)config.bufferLines;
    viewer["default_visible_lines"] = (Json::UInt64)config.defaultVisibleLines;
    viewer["scroll_step_lines"] = (Json::UInt64)config.scrollStepLines;
    viewer["max_concurrent_reads"] = (Json::UInt64)config.maxConcurrentReads;
    viewer["worker_threads"] = (Json::UInt64)config.workerThreads;
    viewer["load_timeout_ms"] = (Json::UInt64)config.loadTimeoutMs;
    viewer["max_search_results"] = (Json::UInt64)config.maxSearchResults;
    viewer["log_level"] = config.logLevel;
    viewer["allowed_paths"] = Json::Value(Json::arrayValue);
    for (const auto& path : config.allowedPaths) {
        viewer["allowed_paths"].append(path);
    }
    Json::Value root;
    root["viewer"] = viewer;
    return root;
}
