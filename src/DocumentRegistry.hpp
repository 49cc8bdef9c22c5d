#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/logger.h>
#include "FileAnalyzer.hpp"
#include "MappedFile.hpp"
#include "PerformanceMetrics.hpp"
#include "ReadGate.hpp"
#include "Result.hpp"
#include "SearchEngine.hpp"
#include "SegmentLoader.hpp"
#include "ViewerConfig.hpp"

// An open file: what analysis found plus the readers built on its mapping.
struct Document {
    std::string handle;
    FileStreamInfo info;
    std::shared_ptr<MappedFile> file;
    std::shared_ptr<SegmentLoader> loader;
    std::shared_ptr<SearchEngine> search;
    int refcount = 1;
};

// Open documents keyed by canonical path. Opening a path that is already
// open hands out the same document with one more reference.
class DocumentRegistry {
public:
    DocumentRegistry(ViewerConfig config, std::shared_ptr<spdlog::logger> logger,
                     std::shared_ptr<PerformanceMetrics> metrics);

    Result<std::shared_ptr<Document>> open(const std::string& path);
    std::shared_ptr<Document> get(const std::string& handle) const;
    // Drops one reference. Returns the references left; NotFound for an unknown handle.
    Result<int> close(const std::string& handle);
    std::vector<std::string> listHandles() const;
    void setAllowedPaths(const std::vector<std::string>& paths);
    bool isPathAllowed(const std::string& path) const;

private:
    bool isPathAllowedLocked(const std::string& canonical) const;

    ViewerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    std::shared_ptr<ReadGate> gate_;
    FileAnalyzer analyzer_;
    std::unordered_map<std::string, std::shared_ptr<Document>> documents_;
    std::vector<std::string> allowedPaths;
    mutable std::shared_mutex mutex;
};
