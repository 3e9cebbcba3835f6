#include "processing/word_diff.hpp"

#include "algorithms/myers_linear.hpp"
#include "processing/tokenizer.hpp"

#include <algorithm>

using namespace revdiff;

namespace {

// Token bound to the line it was cut from, so the diff can compare text.
struct TokenRef {
    Token token;
    std::string_view text;

    bool
    operator==(const TokenRef& other) const {
        return token.hash == other.token.hash && text == other.text;
    }
};

std::vector<TokenRef>
token_refs(std::string_view line) {
    std::vector<TokenRef> refs;
    for (const auto& token : tokenize(line)) {
        refs.push_back({token, token.str_from(line)});
    }
    return refs;
}

void
push_segment(WordDiffSegments& segments, std::string_view text, SegmentKind kind) {
    if (text.empty()) {
        return;
    }
    if (!segments.empty() && segments.back().kind == kind) {
        segments.back().text.append(text);
        return;
    }
    segments.push_back({std::string(text), kind});
}

}  // namespace

WordDiff
revdiff::compute_word_diff(std::string_view old_line, std::string_view new_line) {
    WordDiff out;

    const auto a = token_refs(old_line);
    const auto b = token_refs(new_line);

    // Lines past the token limit are reported as wholly changed.
    if (a.size() > kMaxWordDiffTokens || b.size() > kMaxWordDiffTokens) {
        push_segment(out.old_segments, old_line, SegmentKind::Changed);
        push_segment(out.new_segments, new_line, SegmentKind::Changed);
        return out;
    }

    DiffInput<TokenRef> input{a, b};
    MyersLinear<TokenRef> algorithm{input};
    const auto result = algorithm.compute();

    if (result.status == DiffResultStatus::Failed) {
        push_segment(out.old_segments, old_line, SegmentKind::Changed);
        push_segment(out.new_segments, new_line, SegmentKind::Changed);
        return out;
    }

    for (const auto& edit : result.edit_sequence) {
        const auto kind = edit.type == EditType::Common ? SegmentKind::Equal : SegmentKind::Changed;
        if (edit.a_index.valid) {
            push_segment(out.old_segments, a[static_cast<std::size_t>(edit.a_index.value)].text, kind);
        }
        if (edit.b_index.valid) {
            push_segment(out.new_segments, b[static_cast<std::size_t>(edit.b_index.value)].text, kind);
        }
    }

    return out;
}

bool
revdiff::has_equal_and_changed(const WordDiff& diff) {
    const auto& segments = diff.old_segments;
    const bool has_equal = std::any_of(segments.begin(), segments.end(),
                                       [](const auto& s) { return s.kind == SegmentKind::Equal; });
    const bool has_changed = std::any_of(segments.begin(), segments.end(),
                                         [](const auto& s) { return s.kind == SegmentKind::Changed; });
    return has_equal && has_changed;
}

WordDiffSegments
revdiff::slice_word_diff_segments(const WordDiffSegments& segments, std::size_t offset_x, std::size_t width) {
    WordDiffSegments result;
    std::size_t pos = 0;
    const std::size_t end = offset_x + width;

    for (const auto& segment : segments) {
        const std::size_t segment_end = pos + segment.text.size();
        if (segment_end <= offset_x) {
            pos = segment_end;
            continue;
        }
        if (pos >= end) {
            break;
        }

        const std::size_t slice_start = offset_x > pos ? offset_x - pos : 0;
        const std::size_t slice_end = std::min(segment.text.size(), end - pos);
        if (slice_end > slice_start) {
            result.push_back({segment.text.substr(slice_start, slice_end - slice_start), segment.kind});
        }
        pos = segment_end;
    }

    return result;
}

std::string
revdiff::expand_tabs(std::string_view text, std::size_t tab_width, std::size_t start_column) {
    if (text.find('\t') == std::string_view::npos || tab_width == 0) {
        return std::string(text);
    }

    std::string result;
    result.reserve(text.size() + tab_width);
    std::size_t column = start_column;
    for (const char c : text) {
        if (c == '\t') {
            const std::size_t spaces = tab_width - (column % tab_width);
            result.append(spaces, ' ');
            column += spaces;
        } else {
            result.push_back(c);
            column++;
        }
    }
    return result;
}

WordDiffSegments
revdiff::expand_tabs(const WordDiffSegments& segments, std::size_t tab_width) {
    WordDiffSegments out;
    out.reserve(segments.size());
    std::size_t column = 0;
    for (const auto& segment : segments) {
        out.push_back({expand_tabs(segment.text, tab_width, column), segment.kind});
        column += out.back().text.size();
    }
    return out;
}
