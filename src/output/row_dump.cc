#include "output/row_dump.hpp"

#include "processing/word_diff.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace revdiff;

namespace {

const std::size_t kLineNumberWidth = 5;

std::string
format_line_number(const LineNumber& n) {
    if (!n) {
        return fmt::format("{:>{}}", "", kLineNumberWidth);
    }
    return fmt::format("{:>{}}", *n, kLineNumberWidth);
}

class LineFormatter {
   public:
    explicit LineFormatter(const RowRenderOptions& options) : options_(options) {
    }

    const TermStyle*
    line_style(LineKind kind) const {
        switch (kind) {
            case LineKind::Header:
                return &options_.style.header;
            case LineKind::Add:
                return &options_.style.insert_line;
            case LineKind::Del:
                return &options_.style.delete_line;
            case LineKind::Context:
                break;
        }
        return nullptr;
    }

    std::string
    styled(const std::string& text, const TermStyle* style) const {
        if (!options_.color || !style) {
            return text;
        }
        return fmt::format("{}{}{}", style->to_ansi(), text, options_.style.reset.to_ansi());
    }

    // Text of a line, horizontally scrolled. A width of zero means unbounded;
    // otherwise the result is padded to exactly `width` columns.
    std::string
    text(const DiffLine& line, const std::optional<WordDiffSegments>& word_diff, std::size_t width) const {
        WordDiffSegments segments = word_diff ? *word_diff : WordDiffSegments{{line.content, SegmentKind::Equal}};
        segments = expand_tabs(segments, options_.tab_width);

        const std::size_t window = width == 0 ? std::string::npos - options_.offset_x : width;
        segments = slice_word_diff_segments(segments, options_.offset_x, window);

        const auto* base = line_style(line.kind);
        std::string out;
        std::size_t used = 0;
        for (const auto& segment : segments) {
            used += segment.text.size();
            if (segment.kind == SegmentKind::Equal) {
                out += styled(segment.text, base);
            } else if (options_.color) {
                out += styled(segment.text, &options_.style.changed);
                out += base ? base->to_ansi() : "";
            } else if (line.kind == LineKind::Del) {
                out += fmt::format("[-{}-]", segment.text);
            } else {
                out += fmt::format("{{+{}+}}", segment.text);
            }
        }
        if (width > used) {
            out.append(width - used, ' ');
        }
        return out;
    }

    std::vector<std::string>
    comment(const CommentThread& thread, const std::string& indent) const {
        std::vector<std::string> lines;
        std::string status;
        if (thread.is_resolved) {
            status = *thread.is_resolved ? " [resolved]" : " [open]";
        }

        for (std::size_t i = 0; i < thread.comments.size(); i++) {
            const auto& c = thread.comments[i];
            std::string body = c.body;
            std::replace(body.begin(), body.end(), '\n', ' ');
            const auto text = fmt::format("{}{} {}: {}{}", indent, i == 0 ? "┌" : "│", c.author, body,
                                          i == 0 ? status : "");
            lines.push_back(styled(text, &options_.style.comment));
        }
        return lines;
    }

    std::string
    folded(const FoldedRow& row, const std::string& indent) const {
        return styled(fmt::format("{}··· hunk {} folded ({} lines)", indent, row.hunk_index, row.folded_line_count),
                      &options_.style.folded);
    }

    const RowRenderOptions& options_;
};

}  // namespace

std::vector<std::string>
revdiff::render_rows(const FoldedDiffRows& rows, std::size_t start, std::size_t end, const RowRenderOptions& options) {
    std::vector<std::string> out;
    LineFormatter formatter{options};
    const std::string indent(2 * kLineNumberWidth + 2, ' ');

    end = std::min(end, rows.size());
    for (std::size_t i = start; i < end; i++) {
        std::visit(overloaded{
                       [&](const LineRow& row) {
                           if (row.line.kind == LineKind::Header) {
                               out.push_back(formatter.styled(row.line.content, formatter.line_style(LineKind::Header)));
                               return;
                           }
                           out.push_back(fmt::format("{} {} {}{}", format_line_number(row.old_line_number),
                                                     format_line_number(row.new_line_number),
                                                     formatter.styled(patch_prefix(row.line.kind),
                                                                formatter.line_style(row.line.kind)),
                                                     formatter.text(row.line, row.word_diff, 0)));
                       },
                       [&](const CommentRow& row) {
                           auto lines = formatter.comment(row.thread, indent);
                           out.insert(out.end(), lines.begin(), lines.end());
                       },
                       [&](const FoldedRow& row) { out.push_back(formatter.folded(row, "")); },
                   },
                   rows[i]);
    }
    return out;
}

std::vector<std::string>
revdiff::render_rows(const FoldedSideBySideRows& rows,
                     std::size_t start,
                     std::size_t end,
                     const RowRenderOptions& options) {
    std::vector<std::string> out;
    LineFormatter formatter{options};
    const std::size_t column = kLineNumberWidth + 2 + options.column_width;
    const std::string indent(column + 3, ' ');

    auto side = [&](const std::optional<DiffLine>& line, const std::optional<WordDiffSegments>& word_diff,
                    bool left) -> std::string {
        if (!line) {
            return std::string(column, ' ');
        }
        const auto number = left ? line->old_line_number : line->new_line_number;
        return fmt::format("{} {}{}", format_line_number(number),
                           formatter.styled(patch_prefix(line->kind), formatter.line_style(line->kind)),
                           formatter.text(*line, word_diff, options.column_width));
    };

    end = std::min(end, rows.size());
    for (std::size_t i = start; i < end; i++) {
        std::visit(overloaded{
                       [&](const PairedRow& row) {
                           out.push_back(fmt::format("{} │ {}", side(row.left, row.left_word_diff, true),
                                                     side(row.right, row.right_word_diff, false)));
                       },
                       [&](const HeaderRow& row) {
                           out.push_back(formatter.styled(row.left.content, formatter.line_style(LineKind::Header)));
                       },
                       [&](const CommentRow& row) {
                           auto lines = formatter.comment(row.thread, indent);
                           out.insert(out.end(), lines.begin(), lines.end());
                       },
                       [&](const FoldedRow& row) { out.push_back(formatter.folded(row, "")); },
                   },
                   rows[i]);
    }
    return out;
}
