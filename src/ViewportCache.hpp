#pragma once
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "PerformanceMetrics.hpp"

// Line number -> line content, bounded to 'capacity' entries. Lookups and
// inserts refresh recency; inserts past capacity evict the least recently
// touched lines. Each line also remembers the byte offset of the segment it
// was split from, since line numbers of segments read at different offsets
// are only estimates relative to each other. Not synchronized: only the
// viewport controller's owning context may use it.
class ViewportCache {
public:
    explicit ViewportCache(size_t capacity, std::shared_ptr<PerformanceMetrics> metrics = nullptr);
    ~ViewportCache();

    ViewportCache(const ViewportCache&) = delete;
    ViewportCache& operator=(const ViewportCache&) = delete;

    // nullptr on a miss. The pointer is valid until the next put or clear.
    const std::string* get(uint64_t line);
    void put(uint64_t line, std::string content, uint64_t anchor = 0);

    // Presence check that does not touch recency.
    bool contains(uint64_t line) const;
    // Segment offset the line was cached from; does not touch recency.
    std::optional<uint64_t> anchorOf(uint64_t line) const;

    void clear();
    // clear() and hand freed pages back to the OS.
    void clearAndTrim();

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t evictions() const { return evictions_; }

private:
    void touch(uint64_t line);
    void evictIfNeeded();

    size_t capacity_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    struct Entry {
        std::string content;
        uint64_t anchor;
    };

    std::unordered_map<uint64_t, Entry> entries_;
    std::list<uint64_t> order_;  // most recent at the front
    std::unordered_map<uint64_t, std::list<uint64_t>::iterator> positions_;
    uint64_t evictions_ = 0;
};

// Releases free heap pages back to the OS where the allocator supports it.
void reclaim_memory();
