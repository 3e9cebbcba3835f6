#pragma once

/*
    Word level diff of a changed line pair.

    Both lines are tokenized, the token sequences are diffed, and each side is
    turned into alternating runs of equal and changed text. Concatenating the
    segment texts of a side reproduces that side's input line.
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace revdiff {

enum class SegmentKind {
    Equal,
    Changed,
};

struct WordDiffSegment {
    std::string text;
    SegmentKind kind = SegmentKind::Equal;

    bool
    operator==(const WordDiffSegment& other) const {
        return kind == other.kind && text == other.text;
    }
};

using WordDiffSegments = std::vector<WordDiffSegment>;

struct WordDiff {
    WordDiffSegments old_segments;
    WordDiffSegments new_segments;
};

// Token count per side above which a pair is not diffed word by word.
constexpr std::size_t kMaxWordDiffTokens = 1000;

WordDiff
compute_word_diff(std::string_view old_line, std::string_view new_line);

// Highlighting only makes sense when the pair shares something and differs
// somewhere; identical or wholly rewritten lines are left plain.
bool
has_equal_and_changed(const WordDiff& diff);

// Trim segments to the horizontal window [offset_x, offset_x + width).
WordDiffSegments
slice_word_diff_segments(const WordDiffSegments& segments, std::size_t offset_x, std::size_t width);

// Tab stops are counted from `start_column`.
std::string
expand_tabs(std::string_view text, std::size_t tab_width = 4, std::size_t start_column = 0);

// Expands across segment boundaries so tab stops stay aligned for the line.
WordDiffSegments
expand_tabs(const WordDiffSegments& segments, std::size_t tab_width);

}  // namespace revdiff
