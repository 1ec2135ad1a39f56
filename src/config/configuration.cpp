#include "msgtrace/core/config/configuration.hpp"

#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

#include "msgtrace/core/errors.hpp"

namespace msgtrace::core::config {
namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

// Both integers and doubles go through from_chars; partial matches are rejected.
template <typename T>
std::optional<T> parse_number(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        auto a = lhs[i] >= 'A' && lhs[i] <= 'Z' ? static_cast<char>(lhs[i] - 'A' + 'a') : lhs[i];
        if (a != rhs[i]) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Single pass over the text, one line at a time.
 *
 * Tracks the active table name and how many times each "[[name]]" array
 * table has been opened so far.
 */
class TableReader {
public:
    explicit TableReader(std::unordered_map<std::string, std::string>& values) : values_(values) {}

    void read(std::istream& input) {
        std::string line;
        while (std::getline(input, line)) {
            ++line_number_;
            auto content = Configuration::trim(without_comment(line));
            if (content.empty()) {
                continue;
            }
            if (content.front() == '[') {
                open_table(content);
            } else {
                assign(content);
            }
        }
    }

private:
    // '#' starts a comment unless it sits inside a double-quoted string.
    static std::string_view without_comment(std::string_view line) {
        bool quoted = false;
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                return line.substr(0, i);
            }
        }
        return line;
    }

    void open_table(std::string_view header) {
        if (header.size() >= 4 && header.substr(0, 2) == "[[" && header.substr(header.size() - 2) == "]]") {
            auto name = Configuration::trim(header.substr(2, header.size() - 4));
            auto ordinal = array_counts_[name]++;
            table_ = name + "[" + std::to_string(ordinal) + "]";
            return;
        }
        if (header.size() < 2 || header.back() != ']') {
            fail("unterminated table header '" + std::string{header} + "'");
        }
        table_ = Configuration::trim(header.substr(1, header.size() - 2));
    }

    void assign(std::string_view line) {
        auto equals = line.find('=');
        if (equals == std::string_view::npos) {
            fail("expected 'key = value'");
        }
        auto key = Configuration::trim(line.substr(0, equals));
        if (key.empty()) {
            fail("missing key before '='");
        }
        auto full_key = table_.empty() ? key : table_ + "." + key;
        values_[std::move(full_key)] = Configuration::trim(line.substr(equals + 1));
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw ConfigurationError("line " + std::to_string(line_number_) + ": " + reason);
    }

    std::unordered_map<std::string, std::string>& values_;
    std::map<std::string, int> array_counts_;
    std::string table_;
    std::size_t line_number_{0};
};

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
        return items;
    }

    auto flush = [&items](std::string_view element) {
        auto item = Configuration::trim(element);
        if (!item.empty()) {
            items.push_back(Configuration::strip_quotes(item));
        }
    };

    auto body = raw.substr(1, raw.size() - 2);
    std::size_t start = 0;
    bool quoted = false;
    for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '"') {
            quoted = !quoted;
        } else if (body[i] == ',' && !quoted) {
            flush(body.substr(start, i - start));
            start = i + 1;
        }
    }
    flush(body.substr(start));
    return items;
}

}  // namespace

Configuration Configuration::load_from_file(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        throw ConfigurationError("cannot open configuration file " + path.string());
    }

    Configuration config;
    config.source_path_ = path;
    config.parse(input);
    return config;
}

Configuration Configuration::load_from_string(std::string_view text) {
    std::istringstream input{std::string{text}};
    Configuration config;
    config.parse(input);
    return config;
}

void Configuration::parse(std::istream& input) {
    TableReader{values_}.read(input);
}

bool Configuration::contains(std::string_view key) const {
    return values_.count(std::string{key}) != 0;
}

std::string Configuration::get_string(std::string_view key, std::string default_value) const {
    if (auto it = values_.find(std::string{key}); it != values_.end()) {
        return strip_quotes(it->second);
    }
    return default_value;
}

bool Configuration::get_bool(std::string_view key, bool default_value) const {
    if (!contains(key)) {
        return default_value;
    }
    auto text = get_string(key);
    if (text == "1" || equals_ignore_case(text, "true")) {
        return true;
    }
    if (text == "0" || equals_ignore_case(text, "false")) {
        return false;
    }
    return default_value;
}

int Configuration::get_int(std::string_view key, int default_value) const {
    return parse_number<int>(get_string(key)).value_or(default_value);
}

std::optional<double> Configuration::find_double(std::string_view key) const {
    if (!contains(key)) {
        return std::nullopt;
    }
    return parse_number<double>(get_string(key));
}

double Configuration::get_double(std::string_view key, double default_value) const {
    return find_double(key).value_or(default_value);
}

std::vector<std::string> Configuration::get_list(std::string_view key) const {
    auto it = values_.find(std::string{key});
    return it == values_.end() ? std::vector<std::string>{} : split_list(it->second);
}

std::vector<std::string> Configuration::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& entry : values_) {
        keys.push_back(entry.first);
    }
    return keys;
}

void Configuration::set(std::string key, std::string value) {
    values_.insert_or_assign(std::move(key), std::move(value));
}

std::string Configuration::trim(std::string_view text) {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kWhitespace);
    return std::string{text.substr(first, last - first + 1)};
}

std::string Configuration::strip_quotes(std::string_view text) {
    const bool quoted = text.size() >= 2 && text.front() == text.back() &&
                        (text.front() == '"' || text.front() == '\'');
    return std::string{quoted ? text.substr(1, text.size() - 2) : text};
}

}  // namespace msgtrace::core::config
