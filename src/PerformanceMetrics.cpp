#include "PerformanceMetrics.hpp"

void PerformanceMetrics::recordSegmentLoad(uint64_t bytes, std::chrono::microseconds duration) {
    segmentsLoaded_++;
    bytesLoaded_ += bytes;
    lastLoadMicros_ = static_cast<uint64_t>(duration.count());
}

void PerformanceMetrics::recordLoadFailure() { loadFailures_++; }
void PerformanceMetrics::recordFallback() { fallbacksUsed_++; }
void PerformanceMetrics::recordClamp() { clampWarnings_++; }
void PerformanceMetrics::recordCancelledLoad() { cancelledLoads_++; }

void PerformanceMetrics::recordCacheHit() { cacheHits_++; }
void PerformanceMetrics::recordCacheMiss() { cacheMisses_++; }
void PerformanceMetrics::recordCacheEvictions(uint64_t count) { cacheEvictions_ += count; }

void PerformanceMetrics::recordSearch() { searchesRun_++; }
void PerformanceMetrics::recordSearchBytes(uint64_t bytes) { searchBytesScanned_ += bytes; }
void PerformanceMetrics::recordSearchMatch() { searchMatches_++; }

Json::Value PerformanceMetrics::toJson() const {
    Json::Value out;
    Json::Value loads;
    loads["segments"] = Json::UInt64(segmentsLoaded_.load());
    loads["bytes"] = Json::UInt64(bytesLoaded_.load());
    loads["last_duration_us"] = Json::UInt64(lastLoadMicros_.load());
    loads["failures"] = Json::UInt64(loadFailures_.load());
    loads["fallbacks"] = Json::UInt64(fallbacksUsed_.load());
    loads["clamped"] = Json::UInt64(clampWarnings_.load());
    loads["cancelled"] = Json::UInt64(cancelledLoads_.load());
    out["loads"] = loads;

    Json::Value cache;
    cache["hits"] = Json::UInt64(cacheHits_.load());
    cache["misses"] = Json::UInt64(cacheMisses_.load());
    cache["evictions"] = Json::UInt64(cacheEvictions_.load());
    uint64_t lookups = cacheHits_.load() + cacheMisses_.load();
    cache["hit_ratio"] = lookups == 0 ? 0.0 : static_cast<double>(cacheHits_.load()) / lookups;
    out["cache"] = cache;

    Json::Value search;
    search["runs"] = Json::UInt64(searchesRun_.load());
    search["bytes_scanned"] = Json::UInt64(searchBytesScanned_.load());
    search["matches"] = Json::UInt64(searchMatches_.load());
    out["search"] = search;
    return out;
}
