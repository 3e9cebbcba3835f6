#pragma once

/*
    Parsed unified diff of a single file.

    Line number invariants (guaranteed by the patch parser, not re-validated):
      - add lines never carry an old line number,
      - del lines never carry a new line number,
      - header lines carry neither.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace revdiff {

using LineNumber = std::optional<int64_t>;

enum class LineKind {
    Header,
    Context,
    Add,
    Del,
};

struct DiffLine {
    LineKind kind = LineKind::Context;
    std::string content;
    LineNumber old_line_number;
    LineNumber new_line_number;

    bool
    is_change() const {
        return kind == LineKind::Add || kind == LineKind::Del;
    }

    bool
    operator==(const DiffLine& other) const {
        return kind == other.kind && content == other.content && old_line_number == other.old_line_number &&
               new_line_number == other.new_line_number;
    }
};

struct Hunk {
    std::string header;
    int64_t old_start = 0;
    int64_t old_count = 0;
    int64_t new_start = 0;
    int64_t new_count = 0;

    std::vector<DiffLine> lines;
};

// The number used for go-to-line: new side for add/context, old side for del,
// nothing for headers.
LineNumber
canonical_line_number(const DiffLine& line);

const char*
to_string(LineKind kind);

// Single character prefix used in unified patches (' ', '+', '-'); headers
// get an empty prefix.
const char*
patch_prefix(LineKind kind);

}  // namespace revdiff
