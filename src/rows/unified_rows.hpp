#pragma once

#include "model/comment.hpp"
#include "model/diff.hpp"
#include "rows/display_row.hpp"

#include <vector>

namespace revdiff {

struct RowBuildOptions {
    bool word_diff = true;
};

// Flatten hunks into one unified row sequence. Comment threads follow the
// line they are keyed on; del/add runs get word-diff annotations.
DiffRows
build_diff_rows(const std::vector<Hunk>& hunks,
                const CommentMap* comments = nullptr,
                const RowBuildOptions& options = {});

// Pair the i-th del of each del run with the i-th add of the add run that
// follows it (comment rows in between are skipped) and attach word diffs.
DiffRows
annotate_word_diffs(DiffRows rows);

}  // namespace revdiff
