#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace ibangen::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Whether to log to file in addition to stderr
     */
    static void init(const std::string& level = "warn", bool log_to_file = false);

    /**
     * Get the logger instance
     * Lock-free once a logger is installed; falls back to a default "warn"
     * logger when init() has not run.
     */
    static spdlog::logger* get();

private:
    static void install(std::shared_ptr<spdlog::logger> logger);

    static std::atomic<spdlog::logger*> current_;
};

} // namespace ibangen::utils

// Convenience macros
#define IBANGEN_LOG_TRACE(...)    ibangen::utils::Logger::get()->trace(__VA_ARGS__)
#define IBANGEN_LOG_DEBUG(...)    ibangen::utils::Logger::get()->debug(__VA_ARGS__)
#define IBANGEN_LOG_INFO(...)     ibangen::utils::Logger::get()->info(__VA_ARGS__)
#define IBANGEN_LOG_WARN(...)     ibangen::utils::Logger::get()->warn(__VA_ARGS__)
#define IBANGEN_LOG_ERROR(...)    ibangen::utils::Logger::get()->error(__VA_ARGS__)
#define IBANGEN_LOG_CRITICAL(...) ibangen::utils::Logger::get()->critical(__VA_ARGS__)
