#include "view/virtual_window.hpp"

#include <algorithm>

using namespace revdiff;

std::vector<std::size_t>
VirtualWindow::visible_range() const {
    std::vector<std::size_t> range;
    for (auto i = start_index; i < end_index; i++) {
        range.push_back(static_cast<std::size_t>(i));
    }
    return range;
}

VirtualWindow
revdiff::compute_virtual_window(const VirtualWindowInput& input) {
    VirtualWindow window;

    const int64_t total = std::max<int64_t>(0, input.total_items);
    if (total == 0) {
        return window;
    }

    const int64_t viewport = std::max<int64_t>(0, input.viewport_size);
    const int64_t overscan = std::max<int64_t>(0, input.overscan);
    const int64_t max_offset = std::max<int64_t>(0, total - viewport);
    const int64_t offset = std::clamp<int64_t>(input.scroll_offset, 0, max_offset);

    window.start_index = std::max<int64_t>(0, offset - overscan);
    window.end_index = std::min<int64_t>(total, offset + viewport + overscan);
    window.padding_top = window.start_index;
    window.padding_bottom = total - window.end_index;
    return window;
}

int64_t
revdiff::scroll_to_reveal(int64_t selected, int64_t scroll_offset, int64_t viewport_size, int64_t total_items) {
    if (total_items <= 0 || viewport_size <= 0) {
        return 0;
    }

    const int64_t max_offset = std::max<int64_t>(0, total_items - viewport_size);
    selected = std::clamp<int64_t>(selected, 0, total_items - 1);

    int64_t offset = scroll_offset;
    if (selected < offset) {
        offset = selected;
    } else if (selected >= offset + viewport_size) {
        offset = selected - viewport_size + 1;
    }
    return std::clamp<int64_t>(offset, 0, max_offset);
}
