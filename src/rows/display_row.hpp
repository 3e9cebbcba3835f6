#pragma once

/*
    Display rows produced from a file's hunks.

    Both layouts are sum types. Consumers go through std::visit or
    std::get_if, so a comment row can never be read as a line row.

    Rows own copies of their lines and threads; a row sequence stays valid
    after the hunks and comment map it was built from are gone.
*/

#include "model/comment.hpp"
#include "model/diff.hpp"
#include "processing/word_diff.hpp"

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace revdiff {

using HunkIndex = std::size_t;

struct CommentRow {
    CommentThread thread;
};

// Collapsed hunk. `folded_line_count` counts the hunk's line rows (or
// paired/header rows), not its comment rows.
struct FoldedRow {
    HunkIndex hunk_index = 0;
    std::size_t folded_line_count = 0;
};

//
// Unified layout
//

struct LineRow {
    DiffLine line;
    LineNumber line_number;
    LineNumber old_line_number;
    LineNumber new_line_number;
    HunkIndex hunk_index = 0;
    std::optional<WordDiffSegments> word_diff;
};

using DiffRow = std::variant<LineRow, CommentRow>;
using DiffRows = std::vector<DiffRow>;

//
// Side-by-side layout
//

struct PairedRow {
    std::optional<DiffLine> left;
    std::optional<DiffLine> right;
    HunkIndex hunk_index = 0;
    std::optional<WordDiffSegments> left_word_diff;
    std::optional<WordDiffSegments> right_word_diff;
};

struct HeaderRow {
    DiffLine left;
    HunkIndex hunk_index = 0;
};

using SideBySideRow = std::variant<PairedRow, HeaderRow, CommentRow>;
using SideBySideRows = std::vector<SideBySideRow>;

//
// Rows after folding
//

using FoldedDiffRow = std::variant<LineRow, CommentRow, FoldedRow>;
using FoldedDiffRows = std::vector<FoldedDiffRow>;

using FoldedSideBySideRow = std::variant<PairedRow, HeaderRow, CommentRow, FoldedRow>;
using FoldedSideBySideRows = std::vector<FoldedSideBySideRow>;

// Helper for std::visit with a set of lambdas.
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Hunk a row belongs to by itself; comment rows have none.
inline std::optional<HunkIndex>
own_hunk_index(const LineRow& row) {
    return row.hunk_index;
}

inline std::optional<HunkIndex>
own_hunk_index(const PairedRow& row) {
    return row.hunk_index;
}

inline std::optional<HunkIndex>
own_hunk_index(const HeaderRow& row) {
    return row.hunk_index;
}

inline std::optional<HunkIndex>
own_hunk_index(const FoldedRow& row) {
    return row.hunk_index;
}

inline std::optional<HunkIndex>
own_hunk_index(const CommentRow&) {
    return std::nullopt;
}

template <typename... Rows>
std::optional<HunkIndex>
own_hunk_index(const std::variant<Rows...>& row) {
    return std::visit([](const auto& r) { return own_hunk_index(r); }, row);
}

// Rows that carry an add or del line (on either side for paired rows).
inline bool
is_changed_row(const LineRow& row) {
    return row.line.is_change();
}

inline bool
is_changed_row(const PairedRow& row) {
    return (row.left && row.left->is_change()) || (row.right && row.right->is_change());
}

inline bool
is_changed_row(const HeaderRow&) {
    return false;
}

inline bool
is_changed_row(const CommentRow&) {
    return false;
}

inline bool
is_changed_row(const FoldedRow&) {
    return false;
}

template <typename... Rows>
bool
is_changed_row(const std::variant<Rows...>& row) {
    return std::visit([](const auto& r) { return is_changed_row(r); }, row);
}

}  // namespace revdiff
