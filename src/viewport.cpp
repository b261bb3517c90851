//
//  viewport.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "viewport.hpp"

#include <algorithm>
#include <limits>

namespace taglens {

namespace {

size_t saturating_offset(size_t value, long delta) {
    if (delta < 0) {
        const size_t magnitude = static_cast<size_t>(-(delta + 1)) + 1;
        return value > magnitude ? value - magnitude : 0;
    }
    const size_t magnitude = static_cast<size_t>(delta);
    const size_t max = std::numeric_limits<size_t>::max();
    return max - value < magnitude ? max : value + magnitude;
}

size_t last_row(size_t count) { return count == 0 ? 0 : count - 1; }

}  // namespace

void Viewport::set_visible_rows(size_t count) {
    state_.visible_row_count = count;
    state_.cursor = std::min(state_.cursor, last_row(count));
}

void Viewport::move_cursor(long delta) {
    state_.cursor = std::min(saturating_offset(state_.cursor, delta),
                             last_row(state_.visible_row_count));
}

void Viewport::drag(long delta) {
    state_.scroll_vertical = saturating_offset(state_.scroll_vertical, delta);
    move_cursor(delta);
}

void Viewport::scroll_horizontal(long delta) {
    state_.scroll_horizontal = saturating_offset(state_.scroll_horizontal, delta);
}

void Viewport::follow_cursor(size_t height) {
    height = std::max<size_t>(height, 1);
    auto &s = state_;
    if (s.cursor < s.scroll_vertical) {
        s.scroll_vertical = s.cursor;
    } else if (s.cursor >= s.scroll_vertical + height) {
        s.scroll_vertical = s.cursor - height + 1;
    }
    const size_t margin_limit =
        s.visible_row_count > kScrollBottomMargin ? s.visible_row_count - kScrollBottomMargin : 0;
    s.scroll_vertical = std::min(s.scroll_vertical, margin_limit);
    // The margin must not push the cursor above the window.
    if (s.cursor >= height) {
        s.scroll_vertical = std::max(s.scroll_vertical, s.cursor - height + 1);
    }
}

void Viewport::reset_position() {
    state_.cursor = 0;
    state_.scroll_vertical = 0;
    state_.scroll_horizontal = 0;
}

bool Viewport::next_file(size_t file_count) {
    if (file_count <= 1) {
        return false;
    }
    state_.active_file_index = (state_.active_file_index + 1) % file_count;
    return true;
}

bool Viewport::prev_file(size_t file_count) {
    if (file_count <= 1) {
        return false;
    }
    state_.active_file_index =
        state_.active_file_index == 0 ? file_count - 1 : state_.active_file_index - 1;
    return true;
}

void Viewport::set_active_file(size_t index, size_t file_count) {
    state_.active_file_index = std::min(index, last_row(file_count));
}

void Viewport::on_file_removed(size_t removed_index, size_t remaining_files) {
    auto &active = state_.active_file_index;
    if (active >= removed_index && active > 0) {
        --active;
    }
    active = std::min(active, last_row(remaining_files));
}

}  // namespace taglens
