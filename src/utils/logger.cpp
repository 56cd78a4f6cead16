#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace ibangen::utils {

std::atomic<spdlog::logger*> Logger::current_{nullptr};

namespace {
    std::mutex logger_mutex;

    // Every installed logger; replaced ones stay alive for readers still using them
    std::vector<std::shared_ptr<spdlog::logger>> installed_loggers;

    spdlog::level::level_enum parse_level(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::warn;
    }

    std::shared_ptr<spdlog::logger> make_logger(const std::string& level, bool log_to_file) {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (stderr, stdout carries generated IBANs)
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        // File sink (optional)
        if (log_to_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                "ibangen.log",
                1024 * 1024 * 10,  // 10MB
                3                   // 3 rotating files
            );
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("ibangen", sinks.begin(), sinks.end());
        logger->set_level(parse_level(level));

        // Flush on error or higher
        logger->flush_on(spdlog::level::err);
        return logger;
    }
}

void Logger::init(const std::string& level, bool log_to_file) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    install(make_logger(level, log_to_file));
}

spdlog::logger* Logger::get() {
    spdlog::logger* logger = current_.load(std::memory_order_acquire);
    if (logger != nullptr) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(logger_mutex);
    logger = current_.load(std::memory_order_acquire);
    if (logger == nullptr) {
        install(make_logger("warn", false));
        logger = current_.load(std::memory_order_acquire);
    }
    return logger;
}

// Caller holds logger_mutex
void Logger::install(std::shared_ptr<spdlog::logger> logger) {
    spdlog::set_default_logger(logger);
    installed_loggers.push_back(logger);
    current_.store(logger.get(), std::memory_order_release);
}

} // namespace ibangen::utils
