#include "util/config_file.hpp"

#include "util/read_file.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <string_view>
#include <type_traits>
#include <sys/stat.h>

using namespace revdiff;

namespace {

std::string_view
trim(std::string_view s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool
is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool
is_identifier(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (const char c : s) {
        if (!is_key_char(c)) {
            return false;
        }
    }
    return true;
}

// Strip a trailing comment outside quotes.
std::string_view
strip_comment(std::string_view s) {
    char quote = 0;
    for (std::size_t i = 0; i < s.size(); i++) {
        const char c = s[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return s.substr(0, i);
        }
    }
    return s;
}

std::optional<ConfigValue>
parse_value(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    if (text.front() == '\'' || text.front() == '"') {
        if (text.size() < 2 || text.back() != text.front()) {
            return std::nullopt;
        }
        return ConfigValue{std::string(text.substr(1, text.size() - 2))};
    }

    if (text == "true") {
        return ConfigValue{true};
    }
    if (text == "false") {
        return ConfigValue{false};
    }

    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        return ConfigValue{number};
    }

    return ConfigValue{std::string(text)};
}

void
set_error(ConfigParseResult& result, ConfigParseErrorKind kind, std::size_t line, const std::string& message) {
    result.kind = kind;
    result.line = line;
    result.error = fmt::format("line {}: {}", line, message);
}

std::pair<std::string, std::string>
split_path(const std::string& path) {
    const auto dot = path.find('.');
    if (dot == std::string::npos) {
        return {"", path};
    }
    return {path.substr(0, dot), path.substr(dot + 1)};
}

}  // namespace

ConfigSection&
ConfigTable::section(const std::string& name) {
    for (auto& s : sections) {
        if (s.name == name) {
            return s;
        }
    }
    sections.push_back({name, {}, {}});
    return sections.back();
}

std::optional<std::reference_wrapper<const ConfigValue>>
ConfigTable::lookup_value_by_path(const std::string& path) const {
    const auto [section_name, key] = split_path(path);
    for (const auto& s : sections) {
        if (s.name != section_name) {
            continue;
        }
        for (const auto& [k, v] : s.entries) {
            if (k == key) {
                return std::cref(v);
            }
        }
    }
    return std::nullopt;
}

bool
ConfigTable::set_value_at(const std::string& path, ConfigValue value) {
    const auto [section_name, key] = split_path(path);
    if (!is_identifier(key)) {
        return false;
    }

    auto& s = section(section_name);
    for (auto& entry : s.entries) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return true;
        }
    }
    s.entries.emplace_back(key, std::move(value));
    return true;
}

bool
revdiff::cfg_parse(const std::string& input, ConfigParseResult& result, ConfigTable& table) {
    result = {};
    table = {};

    ConfigSection* current = &table.section("");

    std::size_t line_number = 0;
    std::size_t start = 0;
    while (start <= input.size()) {
        auto end = input.find('\n', start);
        if (end == std::string::npos) {
            end = input.size();
        }
        line_number++;
        const auto line = trim(strip_comment(std::string_view(input).substr(start, end - start)));
        start = end + 1;

        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']' || !is_identifier(trim(line.substr(1, line.size() - 2)))) {
                set_error(result, ConfigParseErrorKind::Syntax, line_number,
                          fmt::format("invalid section header '{}'", line));
                return false;
            }
            current = &table.section(std::string(trim(line.substr(1, line.size() - 2))));
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            set_error(result, ConfigParseErrorKind::Syntax, line_number, fmt::format("expected 'key = value', got '{}'", line));
            return false;
        }

        const auto key = trim(line.substr(0, eq));
        if (!is_identifier(key)) {
            set_error(result, ConfigParseErrorKind::Syntax, line_number, fmt::format("invalid key '{}'", key));
            return false;
        }

        auto value = parse_value(trim(line.substr(eq + 1)));
        if (!value) {
            set_error(result, ConfigParseErrorKind::Syntax, line_number,
                      fmt::format("invalid value for key '{}'", key));
            return false;
        }

        for (const auto& entry : current->entries) {
            if (entry.first == key) {
                set_error(result, ConfigParseErrorKind::DuplicateKey, line_number,
                          fmt::format("duplicate key '{}'", key));
                return false;
            }
        }
        current->entries.emplace_back(std::string(key), std::move(*value));
    }

    return true;
}

bool
revdiff::cfg_load_file(const std::string& path, ConfigParseResult& result, ConfigTable& table) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        result.kind = ConfigParseErrorKind::File;
        result.error = fmt::format("file does not exist: {}", path);
        return false;
    }

    std::string contents;
    if (!read_file(path, contents)) {
        result.kind = ConfigParseErrorKind::File;
        result.error = fmt::format("failed to read file: {}", path);
        return false;
    }

    return cfg_parse(contents, result, table);
}

std::string
revdiff::repr(const ConfigValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return fmt::format("{}", v);
            } else {
                return fmt::format("'{}'", v);
            }
        },
        value.value);
}

std::string
revdiff::cfg_serialize(const ConfigTable& table) {
    std::string out;
    for (const auto& section : table.sections) {
        if (section.name.empty() && section.entries.empty() && section.comments.empty()) {
            continue;
        }
        for (const auto& comment : section.comments) {
            out += comment;
            if (!comment.empty() && comment.back() != '\n') {
                out += '\n';
            }
        }
        if (!section.name.empty()) {
            out += fmt::format("[{}]\n", section.name);
        }
        for (const auto& [key, value] : section.entries) {
            out += fmt::format("    {} = {}\n", key, repr(value));
        }
        out += '\n';
    }
    return out;
}
