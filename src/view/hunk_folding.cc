#include "view/hunk_folding.hpp"

using namespace revdiff;

FoldState
revdiff::toggle_hunk_fold(const FoldState& folded, HunkIndex hunk_index) {
    FoldState next = folded;
    if (next.erase(hunk_index) == 0) {
        next.insert(hunk_index);
    }
    return next;
}

FoldedDiffRows
revdiff::apply_hunk_folding(const DiffRows& rows, const FoldState& folded) {
    return detail::fold_rows<FoldedDiffRow>(rows, folded);
}

FoldedSideBySideRows
revdiff::apply_hunk_folding(const SideBySideRows& rows, const FoldState& folded) {
    return detail::fold_rows<FoldedSideBySideRow>(rows, folded);
}
