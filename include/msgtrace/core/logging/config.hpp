#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace msgtrace::core {
namespace config {
class Configuration;
}
}

namespace msgtrace::core::logging {

// Log levels
enum class Level {
    trace = 0,
    debug,
    info,
    warn,
    error,
    critical
};

// Sink types
enum class SinkType {
    Console,
    File,
    RotatingFile
};

struct SinkConfig {
    SinkType type{SinkType::Console};
    bool enabled{true};
    Level level{Level::info};

    // File-specific options
    std::filesystem::path path;
    std::size_t max_size{10 * 1024 * 1024};  // 10MB
    std::size_t max_files{5};

    std::string pattern;
};

struct LogConfig {
    Level level{Level::info};
    std::string pattern{"%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v"};

    // Async logging keeps the dispatch path free of sink I/O
    bool async{false};
    std::size_t queue_size{8192};
    std::chrono::seconds flush_interval{3};

    std::vector<SinkConfig> sinks;

    static LogConfig default_config();
    static LogConfig from_config(const config::Configuration& config);

    bool validate() const;

private:
    void add_default_sinks();
};

Level level_from_string(const std::string& str);
std::string level_to_string(Level level);

}  // namespace msgtrace::core::logging
