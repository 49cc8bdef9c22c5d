#include "FileAnalyzer.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <vector>
#include "LineUtils.hpp"

namespace fs = std::filesystem;

const char* to_string(SizeCategory category) {
    switch (category) {
        case SizeCategory::Normal: return "normal";
        case SizeCategory::Large: return "large";
        case SizeCategory::VeryLarge: return "very_large";
        case SizeCategory::Extreme: return "extreme";
    }
    return "normal";
}

const char* to_string(LoadingRecommendation recommendation) {
    switch (recommendation) {
        case LoadingRecommendation::Normal: return "normal";
        case LoadingRecommendation::Streaming: return "streaming";
        case LoadingRecommendation::NotRecommended: return "not_recommended";
    }
    return "normal";
}

FileAnalyzer::FileAnalyzer(ViewerConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)), logger_(std::move(logger)) {}

SizeCategory FileAnalyzer::classify(uint64_t size) const {
    if (size < config_.largeFileWarningBytes) return SizeCategory::Normal;
    if (size < config_.streamThresholdBytes) return SizeCategory::Large;
    if (size < config_.extremeFileBytes) return SizeCategory::VeryLarge;
    return SizeCategory::Extreme;
}

uint64_t FileAnalyzer::estimate_line_count(const std::string& sample, uint64_t sampleSize, uint64_t fileSize) {
    if (fileSize == 0 || sample.empty()) return 0;
    if (sampleSize >= fileSize) {
        return count_lines(sample.data(), sample.size());
    }
    size_t breaks = count_line_breaks(sample.data(), sample.size());
    if (breaks == 0) return 1;
    double ratio = static_cast<double>(fileSize) / static_cast<double>(sampleSize);
    return static_cast<uint64_t>(std::llround(static_cast<double>(breaks) * ratio));
}

Result<FileStreamInfo> FileAnalyzer::analyze(const std::string& path) const {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return make_error(ErrorKind::NotFound, "File not found: " + path);
    }
    if (ec) {
        if (ec == std::errc::permission_denied) {
            return make_error(ErrorKind::Access, "Permission denied: " + path);
        }
        return make_error(ErrorKind::IO, "Cannot stat " + path + ": " + ec.message());
    }
    if (!fs::is_regular_file(status)) {
        return make_error(ErrorKind::Access, "Not a regular file: " + path);
    }

    FileStreamInfo info;
    info.path = path;
    info.size = fs::file_size(path, ec);
    if (ec) {
        return make_error(ErrorKind::IO, "Cannot read size of " + path + ": " + ec.message());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error(ErrorKind::Access, "Cannot open file: " + path);
    }
    size_t want = static_cast<size_t>(std::min<uint64_t>(config_.sampleBytes, info.size));
    std::vector<char> sample(want);
    if (want > 0) {
        in.read(sample.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want) {
            return make_error(ErrorKind::IO, "Short read while sampling " + path);
        }
    }

    info.encoding = detect_encoding(sample.data(), sample.size());
    size_t bom = std::min(bom_length(info.encoding), sample.size());
    ByteWindow window = adjust_to_char_boundaries(info.encoding, sample.data(), sample.size(), 0, bom, sample.size());
    std::string decoded;
    try {
        decoded = decode_to_utf8(info.encoding, sample.data() + window.begin, window.end - window.begin);
    } catch (const std::exception& e) {
        return make_error(ErrorKind::IO, std::string("Cannot decode sample: ") + e.what());
    }
    info.estimatedLineCount = estimate_line_count(decoded, want, info.size);

    info.requiresStreaming = info.size > config_.streamThresholdBytes;
    info.sizeCategory = classify(info.size);
    switch (info.sizeCategory) {
        case SizeCategory::Normal:
            info.loadingRecommendation = LoadingRecommendation::Normal;
            break;
        case SizeCategory::Large:
            info.loadingRecommendation = LoadingRecommendation::Normal;
            info.warning = "This is a large file. Loading may take some time and use significant memory.";
            break;
        case SizeCategory::VeryLarge:
            info.loadingRecommendation = LoadingRecommendation::Streaming;
            info.warning = "This is a very large file. Streaming mode is recommended for better performance.";
            break;
        case SizeCategory::Extreme:
            info.loadingRecommendation = LoadingRecommendation::NotRecommended;
            info.warning = "This file is extremely large and may cause performance issues or system instability.";
            break;
    }

    logger_->info("Analyzed {}: {} bytes, encoding {}, ~{} lines, streaming={}",
                  path, info.size, encoding_name(info.encoding), info.estimatedLineCount, info.requiresStreaming);
    if (!info.warning.empty()) {
        logger_->warn("{}: {}", path, info.warning);
    }
    if (info.size > 2 * config_.memoryBudgetBytes) {
        logger_->warn("{} is larger than twice the memory budget ({} bytes); only segments will be resident",
                      path, config_.memoryBudgetBytes);
    }
    return info;
}
