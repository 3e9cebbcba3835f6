#include "config/config.hpp"

#include "util/config_file.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

using namespace revdiff;

static std::string config_doc_general = R"foo(# General configuration for `revdiff`
#
# Configure default options. These can be overriden with command-line arguments.
#
#   diff_mode      'unified' or 'side-by-side'
#   word_diff      highlight changed words within paired lines
#   overscan       rows rendered above and below the viewport
#   tab_width      tab stop width used when rendering
#   viewport_rows  rows per screen; 0 uses the terminal height
#)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    String,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

namespace {

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

ConfigLoadResult
config_load_file(const std::string& config_path, ConfigTable& config_table, ConfigParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }
    if (load_result.kind == ConfigParseErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

void
config_save(const std::string& config_root, const std::string& config_name, const ConfigTable& config_table) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "warning: could not create '{}': {}\n", config_root, ec.message());
        return;
    }

    FILE* f = fopen(config_name.c_str(), "wb");
    if (!f) {
        fprintf(stderr, "Failed to open '%s' for writing.\n", config_name.c_str());
        fprintf(stderr, "   errno (%d) = %s\n", errno, strerror(errno));
        return;
    }

    const std::string serialized = cfg_serialize(config_table);
    fwrite(serialized.c_str(), serialized.size(), 1, f);
    fclose(f);
}

void
config_apply_options(ConfigTable& config, const OptionVector& options, const std::string& config_path) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            const ConfigValue& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (value.is_bool()) {
                        *static_cast<bool*>(ptr) = value.as_bool();
                        continue;
                    }
                } break;
                case ConfigVariableType::Int: {
                    if (value.is_int()) {
                        *static_cast<int64_t*>(ptr) = value.as_int();
                        continue;
                    }
                } break;
                case ConfigVariableType::String: {
                    if (value.is_string()) {
                        *static_cast<std::string*>(ptr) = value.as_string();
                        continue;
                    }
                } break;
            }
            fmt::print(stderr, "warning: ignoring '{}' = {} in {}: wrong type\n", path, repr(value), config_path);
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, ConfigValue{*static_cast<bool*>(ptr)});
                } break;
                case ConfigVariableType::Int: {
                    config.set_value_at(path, ConfigValue{*static_cast<int64_t*>(ptr)});
                } break;
                case ConfigVariableType::String: {
                    config.set_value_at(path, ConfigValue{*static_cast<std::string*>(ptr)});
                } break;
            }
        }
    }
}

}  // namespace

DiffMode
revdiff::diff_mode_from_string(const std::string& s) {
    if (s == "u" || s == "unified" || s == "default") {
        return DiffMode::kUnified;
    } else if (s == "s" || s == "sbs" || s == "side-by-side") {
        return DiffMode::kSideBySide;
    }
    return DiffMode::kInvalid;
}

const char*
revdiff::to_string(DiffMode mode) {
    switch (mode) {
        case DiffMode::kUnified:
            return "unified";
        case DiffMode::kSideBySide:
            return "side-by-side";
        case DiffMode::kInvalid:
            break;
    }
    return "invalid";
}

std::string
revdiff::config_get_directory() {
    return fmt::format("{}/revdiff", sago::getConfigHome());
}

void
revdiff::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "revdiff.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ConfigParseResult config_parse_result;
    ConfigTable config_table;
    switch (config_load_file(config_path, config_table, config_parse_result)) {
        case ConfigLoadResult::Ok:
            break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            // Fall back to the built-in defaults.
            config_table = {};
        } break;
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    }

    std::string diff_mode = to_string(program_options.diff_mode);

    // clang-format off
    const OptionVector options = {
       { "general.diff_mode",     ConfigVariableType::String, &diff_mode },
       { "general.word_diff",     ConfigVariableType::Bool,   &program_options.word_diff },
       { "general.overscan",      ConfigVariableType::Int,    &program_options.overscan },
       { "general.tab_width",     ConfigVariableType::Int,    &program_options.tab_width },
       { "general.viewport_rows", ConfigVariableType::Int,    &program_options.viewport_rows },
    };
    // clang-format on

    config_apply_options(config_table, options, config_path);

    if (auto mode = diff_mode_from_string(diff_mode); mode != DiffMode::kInvalid) {
        program_options.diff_mode = mode;
    } else {
        fmt::print(stderr, "warning: unknown diff_mode '{}' in {}\n", diff_mode, config_path);
    }

    if (program_options.overscan < 0) {
        program_options.overscan = 0;
    }
    if (program_options.tab_width < 1) {
        program_options.tab_width = 4;
    }

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_table.section("general").comments.push_back(config_doc_general);
        config_save(config_root, config_path, config_table);
    }
}
