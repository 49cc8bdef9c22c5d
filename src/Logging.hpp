#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

// Creates a logger writing to stderr. stdout is reserved for protocol output.
// Unknown level names fall back to "info".
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const std::string& level);

// Logger that drops everything; used when a caller does not care about logs.
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name);
