#pragma once
#include <json/json.h>
#include <cstdint>
#include <string>
#include <vector>

struct ViewerConfig {
    // File classification
    uint64_t streamThresholdBytes = 50ull * 1024 * 1024;
    uint64_t largeFileWarningBytes = 10ull * 1024 * 1024;
    uint64_t extremeFileBytes = 500ull * 1024 * 1024;
    uint64_t memoryBudgetBytes = 200ull * 1024 * 1024;

    // Segment loading
    uint64_t maxSegmentBytes = 10ull * 1024 * 1024;
    uint64_t fallbackSegmentBytes = 1024 * 1024;
    uint64_t readChunkBytes = 64 * 1024;
    uint64_t sampleBytes = 8192;
    uint64_t searchSegmentBytes = 8192;
    bool normalizeLineEndings = true;

    // Viewport
    uint64_t maxCachedLines = 1000;
    uint64_t bufferLines = 50;
    uint64_t defaultVisibleLines = 25;
    uint64_t scrollStepLines = 3;

    // Concurrency and front ends
    uint64_t maxConcurrentReads = 2;
    uint64_t workerThreads = 2;
    uint64_t loadTimeoutMs = 5000;
    uint64_t maxSearchResults = 10000;

    std::vector<std::string> allowedPaths;
    std::string logLevel = "info";
};

// Reads the "viewer" section of a parsed config document. Missing keys keep
// their defaults; a key of the wrong type throws std::runtime_error.
ViewerConfig config_from_json(const Json::Value& root);

// Loads config from a JSON file. Throws std::runtime_error if the file cannot
// be opened or parsed.
ViewerConfig load_config(const std::string& path);

Json::Value config_to_json(const ViewerConfig& config);
