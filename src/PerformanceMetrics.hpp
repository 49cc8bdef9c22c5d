#pragma once
#include <json/json.h>
#include <atomic>
#include <chrono>
#include <cstdint>

// Counters shared by the components of one service instance. Created by the
// front end and handed to each component; all methods are thread-safe.
class PerformanceMetrics {
public:
    void recordSegmentLoad(uint64_t bytes, std::chrono::microseconds duration);
    void recordLoadFailure();
    void recordFallback();
    void recordClamp();
    void recordCancelledLoad();

    void recordCacheHit();
    void recordCacheMiss();
    void recordCacheEvictions(uint64_t count);

    void recordSearch();
    void recordSearchBytes(uint64_t bytes);
    void recordSearchMatch();

    uint64_t segmentsLoaded() const { return segmentsLoaded_.load(); }
    uint64_t bytesLoaded() const { return bytesLoaded_.load(); }
    uint64_t loadFailures() const { return loadFailures_.load(); }
    uint64_t fallbacksUsed() const { return fallbacksUsed_.load(); }
    uint64_t clampWarnings() const { return clampWarnings_.load(); }
    uint64_t cancelledLoads() const { return cancelledLoads_.load(); }
    uint64_t cacheHits() const { return cacheHits_.load(); }
    uint64_t cacheMisses() const { return cacheMisses_.load(); }
    uint64_t cacheEvictions() const { return cacheEvictions_.load(); }
    uint64_t searchesRun() const { return searchesRun_.load(); }
    uint64_t searchBytesScanned() const { return searchBytesScanned_.load(); }
    uint64_t searchMatches() const { return searchMatches_.load(); }

    Json::Value toJson() const;

private:
    std::atomic<uint64_t> segmentsLoaded_{0};
    std::atomic<uint64_t> bytesLoaded_{0};
    std::atomic<uint64_t> lastLoadMicros_{0};
    std::atomic<uint64_t> loadFailures_{0};
    std::atomic<uint64_t> fallbacksUsed_{0};
    std::atomic<uint64_t> clampWarnings_{0};
    std::atomic<uint64_t> cancelledLoads_{0};
    std::atomic<uint64_t> cacheHits_{0};
    std::atomic<uint64_t> cacheMisses_{0};
    std::atomic<uint64_t> cacheEvictions_{0};
    std::atomic<uint64_t> searchesRun_{0};
    std::atomic<uint64_t> searchBytesScanned_{0};
    std::atomic<uint64_t> searchMatches_{0};
};
