#include "rows/side_by_side_rows.hpp"

#include <algorithm>

using namespace revdiff;

namespace {

class HunkPairer {
   public:
    HunkPairer(SideBySideRows& rows, HunkIndex hunk_index, const CommentMap* comments, const RowBuildOptions& options)
        : rows_(rows), hunk_index_(hunk_index), comments_(comments), options_(options) {
    }

    void
    add_line(const DiffLine& line) {
        switch (line.kind) {
            case LineKind::Del:
                dels_.push_back(&line);
                break;
            case LineKind::Add:
                adds_.push_back(&line);
                break;
            case LineKind::Header:
                flush();
                rows_.push_back(HeaderRow{line, hunk_index_});
                break;
            case LineKind::Context:
                flush();
                rows_.push_back(PairedRow{line, line, hunk_index_, std::nullopt, std::nullopt});
                push_comments(line);
                break;
        }
    }

    void
    flush() {
        const std::size_t count = std::max(dels_.size(), adds_.size());
        for (std::size_t i = 0; i < count; i++) {
            const DiffLine* left = i < dels_.size() ? dels_[i] : nullptr;
            const DiffLine* right = i < adds_.size() ? adds_[i] : nullptr;

            PairedRow row;
            row.hunk_index = hunk_index_;
            if (left) {
                row.left = *left;
            }
            if (right) {
                row.right = *right;
            }

            if (left && right && options_.word_diff) {
                auto diff = compute_word_diff(left->content, right->content);
                if (has_equal_and_changed(diff)) {
                    row.left_word_diff = std::move(diff.old_segments);
                    row.right_word_diff = std::move(diff.new_segments);
                }
            }

            rows_.push_back(std::move(row));

            if (left) {
                push_comments(*left);
            }
            if (right) {
                push_comments(*right);
            }
        }
        dels_.clear();
        adds_.clear();
    }

   private:
    void
    push_comments(const DiffLine& line) {
        for (const auto* thread : threads_for_line(line, comments_)) {
            rows_.push_back(CommentRow{*thread});
        }
    }

    SideBySideRows& rows_;
    HunkIndex hunk_index_;
    const CommentMap* comments_;
    const RowBuildOptions& options_;

    std::vector<const DiffLine*> dels_;
    std::vector<const DiffLine*> adds_;
};

}  // namespace

SideBySideRows
revdiff::build_side_by_side_rows(const std::vector<Hunk>& hunks,
                                 const CommentMap* comments,
                                 const RowBuildOptions& options) {
    SideBySideRows rows;

    for (HunkIndex hunk_index = 0; hunk_index < hunks.size(); hunk_index++) {
        HunkPairer pairer{rows, hunk_index, comments, options};
        for (const auto& line : hunks[hunk_index].lines) {
            pairer.add_line(line);
        }
        pairer.flush();
    }

    return rows;
}
