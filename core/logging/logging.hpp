#pragma once

#include "dag/dag_error.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace dagstore {

/// Logger configuration. Applied with configureLogging().
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

/// The library-wide "dagstore" logger, created on first use.
std::shared_ptr<spdlog::logger> logger();

void configureLogging(const LogConfig& config);

/// Apply levels from the SPDLOG_LEVEL environment variable,
/// e.g. SPDLOG_LEVEL=dagstore=debug.
void configureLoggingFromEnv();

namespace detail {

// Called from the Dag template so that it does not format caller ids.
void logMutation(const char* operation, size_t node_count, size_t edge_count);
void logRejected(const char* operation, DagErrorKind kind);

} // namespace detail

} // namespace dagstore
