#include "msgtrace/core/logging/logger.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "msgtrace/core/config/configuration.hpp"

namespace msgtrace::core::logging {
namespace {

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::trace:    return spdlog::level::trace;
        case Level::debug:    return spdlog::level::debug;
        case Level::info:     return spdlog::level::info;
        case Level::warn:     return spdlog::level::warn;
        case Level::error:    return spdlog::level::err;
        case Level::critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

Level from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return Level::trace;
        case spdlog::level::debug:    return Level::debug;
        case spdlog::level::info:     return Level::info;
        case spdlog::level::warn:     return Level::warn;
        case spdlog::level::err:      return Level::error;
        case spdlog::level::critical: return Level::critical;
        default:                      return Level::info;
    }
}

std::shared_ptr<spdlog::sinks::sink> create_spdlog_sink(const SinkConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }

    std::shared_ptr<spdlog::sinks::sink> sink;
    switch (config.type) {
        case SinkType::Console:
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            break;
        case SinkType::File:
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path.string(), false);
            break;
        case SinkType::RotatingFile:
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.path.string(), config.max_size, config.max_files);
            break;
    }

    sink->set_level(to_spdlog_level(config.level));
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

std::vector<std::shared_ptr<spdlog::sinks::sink>> create_sinks(const LogConfig& config) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    for (const auto& sink_config : config.sinks) {
        if (auto sink = create_spdlog_sink(sink_config)) {
            sinks.push_back(std::move(sink));
        }
    }
    return sinks;
}

std::shared_ptr<spdlog::logger> build_spdlog_logger(const std::string& name, const LogConfig& config) {
    auto sinks = create_sinks(config);
    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        static std::mutex thread_pool_mutex;
        {
            std::lock_guard<std::mutex> lock(thread_pool_mutex);
            if (!spdlog::thread_pool()) {
                spdlog::init_thread_pool(config.queue_size, 1);
            }
        }
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::mutex g_init_mutex;
bool g_logging_initialized = false;

}  // namespace

class Logger::Impl {
public:
    explicit Impl(const std::string& name) : name_(name) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        spdlog_logger_ = std::make_shared<spdlog::logger>(name, std::move(console_sink));
        spdlog_logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v");
        spdlog_logger_->set_level(spdlog::level::info);
    }

    Impl(const std::string& name, const LogConfig& config)
        : name_(name), spdlog_logger_(build_spdlog_logger(name, config)) {}

    void set_level(Level level) { spdlog_logger_->set_level(to_spdlog_level(level)); }
    Level level() const { return from_spdlog_level(spdlog_logger_->level()); }
    bool should_log(Level level) const { return spdlog_logger_->should_log(to_spdlog_level(level)); }
    const std::string& name() const { return name_; }
    void log(Level level, const std::string& message) { spdlog_logger_->log(to_spdlog_level(level), message); }
    void flush() { spdlog_logger_->flush(); }

private:
    std::string name_;
    std::shared_ptr<spdlog::logger> spdlog_logger_;
};

Logger::Logger(std::string name)
    : impl_(std::make_unique<Impl>(name)) {
}

Logger::Logger(std::string name, const LogConfig& config)
    : impl_(std::make_unique<Impl>(name, config)) {
}

Logger::~Logger() = default;
Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

void Logger::set_level(Level level) noexcept {
    impl_->set_level(level);
}

Level Logger::level() const noexcept {
    return impl_->level();
}

bool Logger::should_log(Level level) const noexcept {
    return impl_->should_log(level);
}

const std::string& Logger::name() const noexcept {
    return impl_->name();
}

void Logger::log(Level level, const std::string& message) {
    impl_->log(level, message);
}

void Logger::flush() {
    impl_->flush();
}

LoggerPtr create_logger(const std::string& name) {
    return std::make_shared<Logger>(name);
}

LoggerPtr create_logger(const std::string& name, const LogConfig& config) {
    return std::make_shared<Logger>(name, config);
}

void initialize_logging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logging_initialized) {
        return;
    }
    if (!config.validate()) {
        throw std::runtime_error("Invalid logging configuration");
    }

    spdlog::set_default_logger(build_spdlog_logger("msgtrace", config));
    if (config.async) {
        spdlog::flush_every(config.flush_interval);
    }
    g_logging_initialized = true;
}

void initialize_logging(const config::Configuration& config) {
    initialize_logging(LogConfig::from_config(config));
}

void shutdown_logging() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    spdlog::shutdown();
    g_logging_initialized = false;
}

}  // namespace msgtrace::core::logging
