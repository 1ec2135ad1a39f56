#pragma once

#include <memory>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "msgtrace/core/logging/config.hpp"

namespace msgtrace::core {

namespace config {
class Configuration;
}

namespace logging {

/**
 * @brief Named logger delegating to spdlog.
 *
 * Components hold a std::shared_ptr<Logger> and tolerate a null one.
 * Format strings follow fmt syntax: logger->info("dropped {} spans", n).
 */
class Logger {
public:
    explicit Logger(std::string name);
    Logger(std::string name, const LogConfig& config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;
    [[nodiscard]] bool should_log(Level level) const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

    void log(Level level, const std::string& message);
    void flush();

    template <typename... Args>
    void log(Level level, fmt::format_string<Args...> format, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        log(level, fmt::format(format, std::forward<Args>(args)...));
    }

    void trace(const std::string& message) { log(Level::trace, message); }
    void debug(const std::string& message) { log(Level::debug, message); }
    void info(const std::string& message) { log(Level::info, message); }
    void warn(const std::string& message) { log(Level::warn, message); }
    void error(const std::string& message) { log(Level::error, message); }

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::error, format, std::forward<Args>(args)...);
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using LoggerPtr = std::shared_ptr<Logger>;

LoggerPtr create_logger(const std::string& name);
LoggerPtr create_logger(const std::string& name, const LogConfig& config);

// Installs the process default spdlog logger; later calls are no-ops until shutdown_logging().
void initialize_logging(const LogConfig& config);
void initialize_logging(const config::Configuration& config);

// Flushes and drops all spdlog loggers.
void shutdown_logging();

}  // namespace logging
}  // namespace msgtrace::core
