#include "logging/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace dagstore {

namespace {

constexpr const char* kLoggerName = "dagstore";

std::shared_ptr<spdlog::logger> createLogger() {
    auto log = spdlog::get(kLoggerName);
    if (log) return log;
    try {
        log = spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread.
        log = spdlog::get(kLoggerName);
    }
    LogConfig defaults;
    log->set_level(defaults.level);
    log->set_pattern(defaults.pattern);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = createLogger(); });
    return instance;
}

void configureLogging(const LogConfig& config) {
    auto log = logger();
    log->set_level(config.level);
    log->set_pattern(config.pattern);
}

void configureLoggingFromEnv() {
    logger();
    spdlog::cfg::load_env_levels();
}

namespace detail {

void logMutation(const char* operation, size_t node_count, size_t edge_count) {
    logger()->debug("[{}] ok nodes={} edges={}", operation, node_count, edge_count);
}

void logRejected(const char* operation, DagErrorKind kind) {
    logger()->debug("[{}] rejected: {}", operation, toString(kind));
}

} // namespace detail

} // namespace dagstore
