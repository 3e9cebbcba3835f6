#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace revdiff {

const int64_t kDefaultOverscan = 5;

struct VirtualWindowInput {
    int64_t total_items = 0;
    int64_t viewport_size = 0;
    int64_t scroll_offset = 0;
    int64_t overscan = kDefaultOverscan;
};

// Slice [start_index, end_index) of the rows to materialize. The paddings
// are the number of rows above and below the slice.
struct VirtualWindow {
    int64_t start_index = 0;
    int64_t end_index = 0;
    int64_t padding_top = 0;
    int64_t padding_bottom = 0;

    int64_t
    size() const {
        return end_index - start_index;
    }

    std::vector<std::size_t>
    visible_range() const;
};

// The scroll offset is clamped to [0, total_items - viewport_size] before
// the overscan is applied on both ends.
VirtualWindow
compute_virtual_window(const VirtualWindowInput& input);

// Smallest change to `scroll_offset` that keeps `selected` inside the
// viewport.
int64_t
scroll_to_reveal(int64_t selected, int64_t scroll_offset, int64_t viewport_size, int64_t total_items);

}  // namespace revdiff
