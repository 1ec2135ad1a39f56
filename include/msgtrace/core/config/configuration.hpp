#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace msgtrace::core::config {

/**
 * @brief Flat view over a TOML-style file: "[section]" headers become key
 * prefixes ("tracing.sample_rate"), "[[array]]" headers are numbered
 * ("exporters[0].type").
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration load_from_file(const std::filesystem::path& path);
    static Configuration load_from_string(std::string_view text);

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key, std::string default_value = "") const;
    [[nodiscard]] bool get_bool(std::string_view key, bool default_value = false) const;
    [[nodiscard]] int get_int(std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view key, double default_value = 0.0) const;
    [[nodiscard]] std::optional<double> find_double(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> get_list(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] std::vector<std::string> get_keys() const;

    void set(std::string key, std::string value);

    static std::string trim(std::string_view text);
    static std::string strip_quotes(std::string_view text);

private:
    using Table = std::unordered_map<std::string, std::string>;

    void parse(std::istream& input);

    Table values_{};
    std::filesystem::path source_path_{};
};

}  // namespace msgtrace::core::config
