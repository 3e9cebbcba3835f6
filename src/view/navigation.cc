#include "view/navigation.hpp"

#include "view/hunk_folding.hpp"

#include <vector>

using namespace revdiff;

namespace {

struct HunkStart {
    std::size_t row;
    HunkIndex hunk;
};

template <typename Row>
std::vector<HunkStart>
collect_hunk_starts(const std::vector<Row>& rows) {
    std::vector<HunkStart> starts;
    std::optional<HunkIndex> current_hunk;
    bool found = false;

    for (std::size_t i = 0; i < rows.size(); i++) {
        if (auto own = own_hunk_index(rows[i]); own && own != current_hunk) {
            current_hunk = own;
            found = false;
        }
        if (!found && current_hunk && is_changed_row(rows[i])) {
            starts.push_back({i, *current_hunk});
            found = true;
        }
    }
    return starts;
}

template <typename Row>
std::optional<std::size_t>
next_hunk_start(const std::vector<Row>& rows, std::size_t from) {
    const auto starts = collect_hunk_starts(rows);
    if (starts.empty()) {
        return std::nullopt;
    }
    if (starts.size() == 1) {
        return starts.front().row;
    }

    const auto current = get_enclosing_hunk_index(rows, from);
    for (const auto& start : starts) {
        if (start.row > from && start.hunk != current) {
            return start.row;
        }
    }
    for (const auto& start : starts) {
        if (start.hunk != current) {
            return start.row;
        }
    }
    return starts.front().row;
}

template <typename Row>
std::optional<std::size_t>
prev_hunk_start(const std::vector<Row>& rows, std::size_t from) {
    const auto starts = collect_hunk_starts(rows);
    if (starts.empty()) {
        return std::nullopt;
    }
    if (starts.size() == 1) {
        return starts.front().row;
    }

    const auto current = get_enclosing_hunk_index(rows, from);
    for (auto it = starts.rbegin(); it != starts.rend(); ++it) {
        if (it->row < from && it->hunk != current) {
            return it->row;
        }
    }
    for (auto it = starts.rbegin(); it != starts.rend(); ++it) {
        if (it->hunk != current) {
            return it->row;
        }
    }
    return starts.back().row;
}

LineNumber
side_by_side_line_number(const PairedRow& row) {
    if (row.left && row.left->new_line_number) {
        return row.left->new_line_number;
    }
    if (row.right && row.right->new_line_number) {
        return row.right->new_line_number;
    }
    if (row.left) {
        return row.left->old_line_number;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::size_t>
revdiff::find_next_hunk_start(const DiffRows& rows, std::size_t from) {
    return next_hunk_start(rows, from);
}

std::optional<std::size_t>
revdiff::find_next_hunk_start(const SideBySideRows& rows, std::size_t from) {
    return next_hunk_start(rows, from);
}

std::optional<std::size_t>
revdiff::find_prev_hunk_start(const DiffRows& rows, std::size_t from) {
    return prev_hunk_start(rows, from);
}

std::optional<std::size_t>
revdiff::find_prev_hunk_start(const SideBySideRows& rows, std::size_t from) {
    return prev_hunk_start(rows, from);
}

std::optional<std::size_t>
revdiff::find_row_by_line_number(const DiffRows& rows, int64_t line_number) {
    for (std::size_t i = 0; i < rows.size(); i++) {
        const auto* row = std::get_if<LineRow>(&rows[i]);
        if (row && row->line_number == line_number) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t>
revdiff::find_row_by_line_number(const SideBySideRows& rows, int64_t line_number) {
    for (std::size_t i = 0; i < rows.size(); i++) {
        const auto* row = std::get_if<PairedRow>(&rows[i]);
        if (row && side_by_side_line_number(*row) == line_number) {
            return i;
        }
    }
    return std::nullopt;
}
