#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace brightchain::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Whether to log to brightchain.log in addition to console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Change the level of an initialized logger
     */
    static void set_level(const std::string& level);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static spdlog::level::level_enum parse_level(const std::string& level);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace brightchain::utils

// Convenience macros
#define BRIGHTCHAIN_LOG_TRACE(...)    brightchain::utils::Logger::get()->trace(__VA_ARGS__)
#define BRIGHTCHAIN_LOG_DEBUG(...)    brightchain::utils::Logger::get()->debug(__VA_ARGS__)
#define BRIGHTCHAIN_LOG_INFO(...)     brightchain::utils::Logger::get()->info(__VA_ARGS__)
#define BRIGHTCHAIN_LOG_WARN(...)     brightchain::utils::Logger::get()->warn(__VA_ARGS__)
#define BRIGHTCHAIN_LOG_ERROR(...)    brightchain::utils::Logger::get()->error(__VA_ARGS__)
#define BRIGHTCHAIN_LOG_CRITICAL(...) brightchain::utils::Logger::get()->critical(__VA_ARGS__)
