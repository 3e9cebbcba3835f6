#include "rows/unified_rows.hpp"

#include <algorithm>
#include <vector>

using namespace revdiff;

namespace {

const LineRow*
as_line_of_kind(const DiffRow& row, LineKind kind) {
    const auto* line_row = std::get_if<LineRow>(&row);
    if (line_row && line_row->line.kind == kind) {
        return line_row;
    }
    return nullptr;
}

// Collect the rows of `kind` starting at `i`, stepping over comment rows
// in between. Leaves `i` on the first row that ends the run.
std::vector<std::size_t>
collect_run(const DiffRows& rows, std::size_t& i, LineKind kind) {
    std::vector<std::size_t> run;
    while (i < rows.size()) {
        if (std::holds_alternative<CommentRow>(rows[i])) {
            i++;
        } else if (as_line_of_kind(rows[i], kind)) {
            run.push_back(i++);
        } else {
            break;
        }
    }
    return run;
}

}  // namespace

DiffRows
revdiff::annotate_word_diffs(DiffRows rows) {
    std::size_t i = 0;
    while (i < rows.size()) {
        const std::size_t run_start = i;
        const auto dels = collect_run(rows, i, LineKind::Del);
        const auto adds = collect_run(rows, i, LineKind::Add);

        const std::size_t pair_count = std::min(dels.size(), adds.size());
        for (std::size_t p = 0; p < pair_count; p++) {
            auto& del_row = std::get<LineRow>(rows[dels[p]]);
            auto& add_row = std::get<LineRow>(rows[adds[p]]);

            auto diff = compute_word_diff(del_row.line.content, add_row.line.content);
            if (has_equal_and_changed(diff)) {
                del_row.word_diff = std::move(diff.old_segments);
                add_row.word_diff = std::move(diff.new_segments);
            }
        }

        // Neither run started here; step over the row.
        if (i == run_start) {
            i++;
        }
    }

    return rows;
}

DiffRows
revdiff::build_diff_rows(const std::vector<Hunk>& hunks, const CommentMap* comments, const RowBuildOptions& options) {
    DiffRows rows;

    for (HunkIndex hunk_index = 0; hunk_index < hunks.size(); hunk_index++) {
        for (const auto& line : hunks[hunk_index].lines) {
            rows.push_back(LineRow{
                line,
                canonical_line_number(line),
                line.old_line_number,
                line.new_line_number,
                hunk_index,
                std::nullopt,
            });

            for (const auto* thread : threads_for_line(line, comments)) {
                rows.push_back(CommentRow{*thread});
            }
        }
    }

    if (!options.word_diff) {
        return rows;
    }
    return annotate_word_diffs(std::move(rows));
}
