#pragma once

/*
    Configuration file format: INI style sections with typed values.

        # comment
        [general]
        diff_mode = 'unified'   # strings may be quoted with ' or "
        word_diff = true
        overscan = 5

    Values are booleans, integers or strings. Unquoted words that are neither
    a boolean nor an integer are read as strings. Keys are addressed by
    "section.key" paths.
*/

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace revdiff {

struct ConfigValue {
    std::variant<bool, int64_t, std::string> value;

    bool
    is_bool() const {
        return std::holds_alternative<bool>(value);
    }

    bool
    is_int() const {
        return std::holds_alternative<int64_t>(value);
    }

    bool
    is_string() const {
        return std::holds_alternative<std::string>(value);
    }

    bool
    as_bool() const {
        return std::get<bool>(value);
    }

    int64_t
    as_int() const {
        return std::get<int64_t>(value);
    }

    const std::string&
    as_string() const {
        return std::get<std::string>(value);
    }
};

struct ConfigSection {
    std::string name;
    // Comment lines written above the section header when serializing.
    std::vector<std::string> comments;
    // Insertion ordered; serialization keeps the order keys were read in.
    std::vector<std::pair<std::string, ConfigValue>> entries;
};

struct ConfigTable {
    std::vector<ConfigSection> sections;

    std::optional<std::reference_wrapper<const ConfigValue>>
    lookup_value_by_path(const std::string& path) const;

    // Creates the section and key as needed.
    bool
    set_value_at(const std::string& path, ConfigValue value);

    ConfigSection&
    section(const std::string& name);
};

enum class ConfigParseErrorKind {
    None,
    File,
    Syntax,
    DuplicateKey,
};

struct ConfigParseResult {
    ConfigParseErrorKind kind = ConfigParseErrorKind::None;
    std::string error;
    std::size_t line = 0;

    bool
    is_ok() const {
        return kind == ConfigParseErrorKind::None;
    }
};

bool
cfg_parse(const std::string& input, ConfigParseResult& result, ConfigTable& table);

bool
cfg_load_file(const std::string& path, ConfigParseResult& result, ConfigTable& table);

std::string
cfg_serialize(const ConfigTable& table);

std::string
repr(const ConfigValue& value);

}  // namespace revdiff
