#pragma once

#include "rows/display_row.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace revdiff {

// Row indices whose line content contains `query`, ignoring ASCII case.
// Header and comment rows never match; an empty query matches nothing.
std::vector<std::size_t>
compute_search_matches(const DiffRows& rows, std::string_view query);

// A paired row matches when either of its non-header sides does.
std::vector<std::size_t>
compute_search_matches(const SideBySideRows& rows, std::string_view query);

// A changed file of a review, with its raw patch text (possibly empty).
struct PatchFile {
    std::string filename;
    std::string patch;
};

struct CrossFileMatch {
    std::string filename;
    std::size_t file_index = 0;
    // 0-based line of the patch text, hunk headers included.
    std::size_t line_index = 0;
    // Line without its patch prefix.
    std::string line_content;

    bool
    operator==(const CrossFileMatch& other) const {
        return filename == other.filename && file_index == other.file_index && line_index == other.line_index &&
               line_content == other.line_content;
    }
};

std::vector<CrossFileMatch>
build_cross_file_matches(const std::vector<PatchFile>& files, std::string_view query);

// Number of distinct files among `matches`.
std::size_t
count_matched_files(const std::vector<CrossFileMatch>& matches);

// Case-insensitive substring test over ASCII letters.
bool
contains_ignore_case(std::string_view haystack, std::string_view needle);

}  // namespace revdiff
