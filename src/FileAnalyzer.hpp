#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/logger.h>
#include "Result.hpp"
#include "TextEncoding.hpp"
#include "ViewerConfig.hpp"

enum class SizeCategory {
    Normal,
    Large,
    VeryLarge,
    Extreme
};

enum class LoadingRecommendation {
    Normal,
    Streaming,
    NotRecommended
};

const char* to_string(SizeCategory category);
const char* to_string(LoadingRecommendation recommendation);

struct FileStreamInfo {
    std::string path;
    uint64_t size = 0;
    bool requiresStreaming = false;
    // Extrapolated from a prefix sample; exact only when the sample covers the file.
    uint64_t estimatedLineCount = 0;
    Encoding encoding = Encoding::Utf8;
    SizeCategory sizeCategory = SizeCategory::Normal;
    LoadingRecommendation loadingRecommendation = LoadingRecommendation::Normal;
    std::string warning;
};

class FileAnalyzer {
public:
    FileAnalyzer(ViewerConfig config, std::shared_ptr<spdlog::logger> logger);

    // NotFound when 'path' does not exist; Access when it is not a readable
    // regular file; IO when the sample read fails.
    Result<FileStreamInfo> analyze(const std::string& path) const;

    SizeCategory classify(uint64_t size) const;

    // Line count extrapolated from 'sample', the first 'sampleSize' bytes of a
    // file of 'fileSize' bytes (already decoded to UTF-8).
    static uint64_t estimate_line_count(const std::string& sample, uint64_t sampleSize, uint64_t fileSize);

private:
    ViewerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};
