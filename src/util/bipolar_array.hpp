#pragma once

#include <cassert>
#include <cstdint>
#include <memory>

namespace revdiff {

// Array indexed by -min..max. Myers uses it for the furthest reaching x per
// diagonal k, where k ranges over -D..D.
template <typename Type>
struct BipolarArray {
    int64_t min_;
    int64_t max_;
    std::size_t capacity_;
    std::unique_ptr<Type[]> arr_;

    BipolarArray(int64_t min, int64_t max)
        : min_(min), max_(max), capacity_(static_cast<std::size_t>(max - min + 1)) {
        assert(max - min + 1 >= 0);
        arr_ = std::make_unique<Type[]>(capacity_);
    }

    BipolarArray(BipolarArray&&) = default;

    Type&
    operator[](int64_t index) {
        auto offset = index - min_;
        assert(offset >= 0);
        assert(offset < static_cast<int64_t>(capacity_));
        return arr_.get()[offset];
    }

    const Type&
    operator[](int64_t index) const {
        auto offset = index - min_;
        assert(offset >= 0);
        assert(offset < static_cast<int64_t>(capacity_));
        return arr_.get()[offset];
    }

    int64_t
    min() const {
        return min_;
    }

    int64_t
    max() const {
        return max_;
    }
};

}  // namespace revdiff
