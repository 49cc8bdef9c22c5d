#include "DocumentRegistry.hpp"
#include <filesystem>
#include <mutex>
#include <boost/interprocess/exceptions.hpp>

DocumentRegistry::DocumentRegistry(ViewerConfig config, std::shared_ptr<spdlog::logger> logger,
                                   std::shared_ptr<PerformanceMetrics> metrics)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      metrics_(std::move(metrics)),
      gate_(std::make_shared<ReadGate>(static_cast<size_t>(config_.maxConcurrentReads))),
      analyzer_(config_, logger_) {
    setAllowedPaths(config_.allowedPaths);
}

void DocumentRegistry::setAllowedPaths(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex);
    allowedPaths.clear();
    for (const auto& path : paths) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(path, ec);
        if (ec) {
            logger_->warn("Ignoring allowed path {}: {}", path, ec.message());
            continue;
        }
        allowedPaths.push_back(canonical.string());
    }
}

bool DocumentRegistry::isPathAllowed(const std::string& path) const {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) return false;
    std::shared_lock lock(mutex);
    return isPathAllowedLocked(canonical.string());
}

bool DocumentRegistry::isPathAllowedLocked(const std::string& canonical) const {
    if (allowedPaths.empty()) {
        return true;  // no restrictions configured
    }
    // Check if path is under any allowed path
    for (const auto& allowed : allowedPaths) {
        if (canonical == allowed ||
            canonical.compare(0, allowed.length() + 1, allowed + "/") == 0) {
            return true;
        }
    }
    return false;
}

Result<std::shared_ptr<Document>> DocumentRegistry::open(const std::string& path) {
    std::error_code ec;
    auto canonicalPath = std::filesystem::canonical(path, ec);
    if (ec) {
        // Let the analyzer classify the failure (missing, permission, ...).
        auto probe = analyzer_.analyze(path);
        if (!probe) return probe.error();
        return make_error(ErrorKind::IO, "Cannot resolve " + path + ": " + ec.message());
    }
    std::string handle = canonicalPath.string();

    std::unique_lock lock(mutex);
    if (!isPathAllowedLocked(handle)) {
        return make_error(ErrorKind::Access, "Access denied: path not in allowed list");
    }
    auto it = documents_.find(handle);
    if (it != documents_.end()) {
        it->second->refcount++;
        return it->second;
    }

    auto info = analyzer_.analyze(handle);
    if (!info) {
        return info.error();
    }

    auto document = std::make_shared<Document>();
    document->handle = handle;
    document->info = info.take();
    try {
        document->file = std::make_shared<MappedFile>(handle);
    } catch (const boost::interprocess::interprocess_exception& e) {
        return make_error(ErrorKind::Access, "Cannot map " + handle + ": " + e.what());
    }
    document->loader = std::make_shared<SegmentLoader>(document->file, document->info.encoding, config_,
                                                       logger_, metrics_, gate_);
    document->search = std::make_shared<SearchEngine>(document->loader, config_, logger_, metrics_);
    documents_[handle] = document;
    logger_->info("Opened {}", handle);
    return document;
}

std::shared_ptr<Document> DocumentRegistry::get(const std::string& handle) const {
    std::shared_lock lock(mutex);
    auto it = documents_.find(handle);
    if (it != documents_.end()) {
        return it->second;
    }
    return nullptr;
}

Result<int> DocumentRegistry::close(const std::string& handle) {
    std::unique_lock lock(mutex);
    auto it = documents_.find(handle);
    if (it == documents_.end()) {
        return make_error(ErrorKind::NotFound, "Invalid handle: " + handle);
    }
    int remaining = --it->second->refcount;
    if (remaining <= 0) {
        documents_.erase(it);
        logger_->info("Closed {}", handle);
        return 0;
    }
    return remaining;
}

std::vector<std::string> DocumentRegistry::listHandles() const {
    std::shared_lock lock(mutex);
    std::vector<std::string> handles;
    handles.reserve(documents_.size());
    for (const auto& [handle, document] : documents_) {
        handles.push_back(handle);
    }
    return handles;
}
