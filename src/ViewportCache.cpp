#include "ViewportCache.hpp"
#ifdef __linux__
#include <malloc.h>
#endif

void reclaim_memory() {
#ifdef __linux__
    malloc_trim(0);
#endif
}

ViewportCache::ViewportCache(size_t capacity, std::shared_ptr<PerformanceMetrics> metrics)
    : capacity_(capacity == 0 ? 1 : capacity), metrics_(std::move(metrics)) {}

ViewportCache::~ViewportCache() {
    clear();
}

const std::string* ViewportCache::get(uint64_t line) {
    auto it = entries_.find(line);
    if (it == entries_.end()) {
        if (metrics_) metrics_->recordCacheMiss();
        return nullptr;
    }
    touch(line);
    if (metrics_) metrics_->recordCacheHit();
    return &it->second.content;
}

void ViewportCache::put(uint64_t line, std::string content, uint64_t anchor) {
    entries_[line] = Entry{std::move(content), anchor};
    touch(line);
    evictIfNeeded();
}

bool ViewportCache::contains(uint64_t line) const {
    return entries_.count(line) > 0;
}

std::optional<uint64_t> ViewportCache::anchorOf(uint64_t line) const {
    auto it = entries_.find(line);
    if (it == entries_.end()) return std::nullopt;
    return it->second.anchor;
}

void ViewportCache::clear() {
    {
        std::unordered_map<uint64_t, Entry> empty;
        entries_.swap(empty);
    }
    order_.clear();
    {
        std::unordered_map<uint64_t, std::list<uint64_t>::iterator> empty;
        positions_.swap(empty);
    }
}

void ViewportCache::clearAndTrim() {
    clear();
    reclaim_memory();
}

void ViewportCache::touch(uint64_t line) {
    auto it = positions_.find(line);
    if (it != positions_.end()) {
        order_.erase(it->second);
    }
    order_.push_front(line);
    positions_[line] = order_.begin();
}

void ViewportCache::evictIfNeeded() {
    uint64_t evicted = 0;
    while (entries_.size() > capacity_ && !order_.empty()) {
        uint64_t oldest = order_.back();
        order_.pop_back();
        positions_.erase(oldest);
        entries_.erase(oldest);
        ++evicted;
    }
    if (evicted > 0) {
        evictions_ += evicted;
        if (metrics_) metrics_->recordCacheEvictions(evicted);
    }
}
