#pragma once

#include "model/comment.hpp"
#include "model/diff.hpp"
#include "rows/display_row.hpp"
#include "rows/unified_rows.hpp"

#include <vector>

namespace revdiff {

// Two column layout. Within each hunk, pending deletions and additions are
// paired positionally whenever a context or header line (or the end of the
// hunk) is reached, so a pair never straddles a header.
SideBySideRows
build_side_by_side_rows(const std::vector<Hunk>& hunks,
                        const CommentMap* comments = nullptr,
                        const RowBuildOptions& options = {});

}  // namespace revdiff
