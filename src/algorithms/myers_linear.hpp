#pragma once

// Linear space version of Myers difference algorithm.
// O((M+N) D) in time, linear in space.
// https://blog.jcoglan.com/2017/04/25/myers-diff-in-linear-space-implementation/

#include "algorithms/algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <optional>
#include <vector>

namespace revdiff {

template <typename Unit>
struct MyersLinear : public Algorithm<Unit> {
    struct Box {
        int64_t left;
        int64_t top;
        int64_t right;
        int64_t bottom;

        int64_t
        width() const {
            return right - left;
        }
        int64_t
        height() const {
            return bottom - top;
        }
        int64_t
        size() const {
            return width() + height();
        }
        int64_t
        delta() const {
            return width() - height();
        }
    };

    int64_t N;
    int64_t M;

    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    explicit MyersLinear(const DiffInput<Unit>& diff_input)
        : Algorithm<Unit>(diff_input)
        , N(static_cast<int64_t>(diff_input.A.size()))
        , M(static_cast<int64_t>(diff_input.B.size()))
        , A(diff_input.A)
        , B(diff_input.B) {
    }

    ~MyersLinear() override = default;

    static bool
    is_odd(int64_t v) {
        return (v & 1) == 1;
    }

    static bool
    is_between(int64_t v, int64_t low, int64_t high) {
        return v >= low && v <= high;
    }

    // Split the box at the middle snake and recurse on both halves. Appends
    // the path corners to `out`; false when the box is empty.
    bool
    find_path(int64_t left, int64_t top, int64_t right, int64_t bottom, std::vector<Coordinate>& out) {
        Box box{left, top, right, bottom};

        auto snake = midpoint(box);
        if (!snake) {
            return false;
        }

        const auto start = snake->from;
        const auto finish = snake->to;

        const bool head = find_path(box.left, box.top, start.x, start.y, out);
        if (!head) {
            out.push_back(start);
        }
        const bool tail = find_path(finish.x, finish.y, box.right, box.bottom, out);
        if (!tail) {
            out.push_back(finish);
        }

        return true;
    }

    std::optional<Move>
    midpoint(const Box& box) {
        if (box.size() == 0) {
            return std::nullopt;
        }

        const int64_t max = 1 + ((box.size() - 1) / 2);

        BipolarArray<int64_t> vf{-max, max};
        vf[1] = box.left;

        BipolarArray<int64_t> vb{-max, max};
        vb[1] = box.bottom;

        for (int64_t d = 0; d <= max; d++) {
            if (auto m = forwards(box, vf, vb, d)) {
                return m;
            }
            if (auto m = backwards(box, vf, vb, d)) {
                return m;
            }
        }
        return std::nullopt;
    }

    std::optional<Move>
    forwards(const Box& box, BipolarArray<int64_t>& vf, const BipolarArray<int64_t>& vb, int64_t d) {
        int64_t px = 0, py = 0, x = 0, y = 0;
        for (int64_t k = d; k >= -d; k -= 2) {
            const int64_t c = k - box.delta();
            if (k == -d || (k != d && vf[k - 1] < vf[k + 1])) {
                px = vf[k + 1];
                x = px;
            } else {
                px = vf[k - 1];
                x = px + 1;
            }

            y = box.top + (x - box.left) - k;
            py = (d == 0 || x != px) ? y : y - 1;

            while (x < box.right && y < box.bottom && A[x] == B[y]) {
                x++;
                y++;
            }

            vf[k] = x;

            if (is_odd(box.delta()) && is_between(c, -(d - 1), d - 1) && y >= vb[c]) {
                return Move{{px, py}, {x, y}};
            }
        }
        return std::nullopt;
    }

    std::optional<Move>
    backwards(const Box& box, const BipolarArray<int64_t>& vf, BipolarArray<int64_t>& vb, int64_t d) {
        int64_t px = 0, py = 0, x = 0, y = 0;
        for (int64_t c = d; c >= -d; c -= 2) {
            const int64_t k = c + box.delta();

            if (c == -d || (c != d && vb[c - 1] > vb[c + 1])) {
                py = vb[c + 1];
                y = py;
            } else {
                py = vb[c - 1];
                y = py - 1;
            }

            x = box.left + (y - box.top) + k;
            px = (d == 0 || y != py) ? x : x + 1;

            while (x > box.left && y > box.top && A[x - 1] == B[y - 1]) {
                x--;
                y--;
            }

            vb[c] = y;

            if (!is_odd(box.delta()) && is_between(k, -d, d) && x <= vf[k]) {
                return Move{{x, y}, {px, py}};
            }
        }
        return std::nullopt;
    }

    // Follow diagonals from `move.from` towards `move.to`; returns where the
    // walk stopped.
    Coordinate
    walk_diagonal(Move move, std::vector<Move>& moves) {
        while (move.from.x < move.to.x && move.from.y < move.to.y && A[move.from.x] == B[move.from.y]) {
            Coordinate next = {move.from.x + 1, move.from.y + 1};
            moves.push_back({move.from, next});
            move.from = next;
        }
        return move.from;
    }

    // Expand the path corners into unit steps.
    std::vector<Move>
    walk_snakes(const std::vector<Coordinate>& path) {
        std::vector<Move> moves;
        for (size_t i = 0; i + 1 < path.size(); i++) {
            auto from = path[i];
            const auto to = path[i + 1];

            from = walk_diagonal({from, to}, moves);
            const auto xdiff = to.x - from.x;
            const auto ydiff = to.y - from.y;
            if (xdiff < ydiff) {
                moves.push_back({{from.x, from.y}, {from.x, from.y + 1}});
                from.y += 1;
            } else if (xdiff > ydiff) {
                moves.push_back({{from.x, from.y}, {from.x + 1, from.y}});
                from.x += 1;
            }
            walk_diagonal({from, to}, moves);
        }
        return moves;
    }

    static void
    to_edit_sequence(const std::vector<Move>& solution, std::vector<Edit>& edit_sequence) {
        std::transform(solution.cbegin(), solution.cend(), std::back_inserter(edit_sequence),
                       [](const Move& move) -> Edit {
                           const auto& from = move.from;
                           const auto& to = move.to;

                           if (from.x == to.x) {
                               return {EditType::Insert, {}, {from.y}};
                           } else if (from.y == to.y) {
                               return {EditType::Delete, {from.x}, {}};
                           }
                           return {EditType::Common, {from.x}, {from.y}};
                       });
    }

    DiffResult
    diff() override {
        DiffResult result;

        std::vector<Coordinate> path;
        if (!find_path(0, 0, N, M, path)) {
            result.status = DiffResultStatus::Failed;
            return result;
        }

        // Identical input still produces the all-common edit sequence; callers
        // segment both sides from it.
        to_edit_sequence(walk_snakes(path), result.edit_sequence);

        const int64_t common_count =
            std::accumulate(result.edit_sequence.begin(), result.edit_sequence.end(), int64_t{0},
                            [](int64_t acc, const Edit& e) { return e.type == EditType::Common ? acc + 1 : acc; });
        result.status = (N == M && N == common_count) ? DiffResultStatus::NoChanges : DiffResultStatus::OK;
        return result;
    }
};

}  // namespace revdiff
