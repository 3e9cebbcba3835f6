#pragma once

#include "rows/display_row.hpp"
#include "util/color.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace revdiff {

struct RowRenderOptions {
    // Emit ANSI styles; otherwise word-diff changes are marked with
    // [-deleted-] and {+inserted+}.
    bool color = false;
    RowTextStyle style;

    std::size_t tab_width = 4;
    // Width of the text part of each side-by-side column.
    std::size_t column_width = 60;
    // Horizontal scroll applied to line text.
    std::size_t offset_x = 0;
};

// One output line per row, except comment rows which produce one line per
// comment. Rows in [start, end) are rendered.
std::vector<std::string>
render_rows(const FoldedDiffRows& rows, std::size_t start, std::size_t end, const RowRenderOptions& options);

std::vector<std::string>
render_rows(const FoldedSideBySideRows& rows, std::size_t start, std::size_t end, const RowRenderOptions& options);

}  // namespace revdiff
