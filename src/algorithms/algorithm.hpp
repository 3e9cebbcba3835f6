#pragma once

#include <cinttypes>
#include <cstddef>
#include <gsl/span>
#include <vector>

namespace revdiff {

using std::int64_t;
using std::size_t;

struct Coordinate {
    int64_t x;
    int64_t y;
};

struct Move {
    Coordinate from;
    Coordinate to;
};

enum class EditType {
    Delete,
    Insert,
    Common,
};

// Index into one of the two diffed sequences. Deletions carry no `b` index
// and insertions carry no `a` index.
struct EditIndex {
    bool valid;
    int64_t value;

    EditIndex() : valid(false), value(0) {
    }

    EditIndex(int64_t in_value) : valid(true), value(in_value) {
    }

    operator int64_t() const {
        return value;
    }
};

const EditIndex EditIndexInvalid{};

// One step of the edit script turning A into B.
struct Edit {
    EditType type;

    EditIndex a_index;
    EditIndex b_index;
};

enum class DiffResultStatus {
    OK,
    Failed,
    NoChanges,
};

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;
};

struct DiffResult {
    DiffResultStatus status = DiffResultStatus::Failed;
    std::vector<Edit> edit_sequence;
};

template <typename Unit>
class Algorithm {
   public:
    const DiffInput<Unit>& diff_input_;

    explicit Algorithm(const DiffInput<Unit>& diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    virtual DiffResult
    diff() = 0;

    // Handles the trivial cases (either side empty) before running the
    // actual algorithm.
    DiffResult
    compute() {
        DiffResult result;

        const auto N = diff_input_.A.size();
        const auto M = diff_input_.B.size();

        if (N == 0 && M == 0) {
            result.status = DiffResultStatus::NoChanges;
            return result;
        }

        if (N == 0) {
            for (std::size_t i = 0; i < M; i++) {
                result.edit_sequence.push_back(
                    {EditType::Insert, EditIndexInvalid, EditIndex(static_cast<int64_t>(i))});
            }
            result.status = DiffResultStatus::OK;
            return result;
        }

        if (M == 0) {
            for (std::size_t i = 0; i < N; i++) {
                result.edit_sequence.push_back(
                    {EditType::Delete, EditIndex(static_cast<int64_t>(i)), EditIndexInvalid});
            }
            result.status = DiffResultStatus::OK;
            return result;
        }

        return diff();
    }
};

}  // namespace revdiff
