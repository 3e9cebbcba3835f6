#pragma once

/*
    Hunk folding is a view filter: the built row sequence is never modified,
    a folded copy is produced for rendering instead.

    Comment rows belong to the hunk of the closest line row above them, so a
    folded hunk hides its comment threads too.
*/

#include "rows/display_row.hpp"

#include <optional>
#include <set>
#include <vector>

namespace revdiff {

using FoldState = std::set<HunkIndex>;

// Copy of `folded` with `hunk_index` added, or removed if it was present.
FoldState
toggle_hunk_fold(const FoldState& folded, HunkIndex hunk_index);

FoldedDiffRows
apply_hunk_folding(const DiffRows& rows, const FoldState& folded);

FoldedSideBySideRows
apply_hunk_folding(const SideBySideRows& rows, const FoldState& folded);

// Works for any row flavor, folded or not. Comment rows and out of range
// indices resolve to nothing.
template <typename Row>
std::optional<HunkIndex>
get_hunk_index_for_row(const std::vector<Row>& rows, std::size_t row_index) {
    if (row_index >= rows.size()) {
        return std::nullopt;
    }
    return own_hunk_index(rows[row_index]);
}

// Hunk a row is displayed under; comment rows resolve to the hunk of the
// closest row above that has one.
template <typename Row>
std::optional<HunkIndex>
get_enclosing_hunk_index(const std::vector<Row>& rows, std::size_t row_index) {
    if (row_index >= rows.size()) {
        return std::nullopt;
    }
    for (std::size_t i = row_index + 1; i-- > 0;) {
        if (auto hunk = own_hunk_index(rows[i])) {
            return hunk;
        }
    }
    return std::nullopt;
}

namespace detail {

template <typename Folded, typename Row>
std::vector<Folded>
fold_rows(const std::vector<Row>& rows, const FoldState& folded) {
    std::vector<Folded> out;
    out.reserve(rows.size());

    std::optional<HunkIndex> current_hunk;
    for (const auto& row : rows) {
        const auto own = own_hunk_index(row);
        if (own) {
            current_hunk = own;
        }

        const auto hunk = own ? own : current_hunk;
        if (!hunk || folded.count(*hunk) == 0) {
            out.push_back(std::visit([](const auto& r) -> Folded { return r; }, row));
            continue;
        }

        auto* marker = out.empty() ? nullptr : std::get_if<FoldedRow>(&out.back());
        if (!marker || marker->hunk_index != *hunk) {
            out.push_back(FoldedRow{*hunk, 0});
            marker = &std::get<FoldedRow>(out.back());
        }
        if (own) {
            marker->folded_line_count++;
        }
    }

    return out;
}

}  // namespace detail

}  // namespace revdiff
