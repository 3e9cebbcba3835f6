#pragma once

#include "rows/display_row.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace revdiff {

// First changed row of the next hunk (by row order) that is not the hunk
// containing `from`. Wraps around once. When only one hunk has changes its
// first changed row is returned; nothing when there are no changes at all.
std::optional<std::size_t>
find_next_hunk_start(const DiffRows& rows, std::size_t from);

std::optional<std::size_t>
find_next_hunk_start(const SideBySideRows& rows, std::size_t from);

std::optional<std::size_t>
find_prev_hunk_start(const DiffRows& rows, std::size_t from);

std::optional<std::size_t>
find_prev_hunk_start(const SideBySideRows& rows, std::size_t from);

// First line row whose canonical line number is `line_number`.
std::optional<std::size_t>
find_row_by_line_number(const DiffRows& rows, int64_t line_number);

// First paired row whose left new, right new or left old line number (in
// that order of preference) is `line_number`.
std::optional<std::size_t>
find_row_by_line_number(const SideBySideRows& rows, int64_t line_number);

}  // namespace revdiff
