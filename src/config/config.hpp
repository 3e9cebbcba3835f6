#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace revdiff {

enum class DiffMode { kInvalid, kUnified, kSideBySide };

DiffMode
diff_mode_from_string(const std::string& s);

const char*
to_string(DiffMode mode);

struct ProgramOptions {
    bool help = false;

    DiffMode diff_mode = DiffMode::kUnified;
    bool word_diff = true;
    int64_t overscan = 5;
    int64_t tab_width = 4;
    // 0 means use the terminal height.
    int64_t viewport_rows = 0;
    int64_t scroll_offset = 0;

    std::string comments_file;
    std::string comments_path;
    std::string search_query;
    std::vector<std::size_t> folded_hunks;

    bool goto_line_set = false;
    int64_t goto_line = 0;
    bool jump_from_set = false;
    std::size_t jump_from = 0;

    std::vector<std::string> patch_files;
};

std::string
config_get_directory();

// Load `<config home>/revdiff/revdiff.conf` into `program_options`, creating
// the file with defaults when it doesn't exist yet.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace revdiff
