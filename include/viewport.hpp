//
//  viewport.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <cstddef>

namespace taglens {

// Scrolling never leaves fewer than this many rows below the top of the list, as long as the
// cursor stays visible.
inline constexpr size_t kScrollBottomMargin = 5;

struct ViewportState {
    size_t cursor = 0;
    size_t scroll_vertical = 0;
    size_t scroll_horizontal = 0;
    size_t active_file_index = 0;
    size_t visible_row_count = 0;  ///< last computed length of the displayed sequence
};

/**
 * @brief Cursor and scroll bookkeeping over a list whose length changes every frame.
 *
 * All arithmetic saturates; nothing here fails on an empty list. Invariants after every call:
 * `cursor < visible_row_count` (or 0 when empty) and, after follow_cursor(), the cursor lies
 * within `[scroll_vertical, scroll_vertical + height)`.
 */
class Viewport {
  public:
    const ViewportState &state() const { return state_; }

    // Records the new row count and pulls the cursor back inside it.
    void set_visible_rows(size_t count);

    // Moves the cursor, clamped to [0, visible_row_count - 1].
    void move_cursor(long delta);

    // Moves scroll offset and cursor together (wheel / page keys).
    void drag(long delta);

    // Horizontal offset; unbounded above, the renderer clips.
    void scroll_horizontal(long delta);

    // Scrolls so the cursor is inside a window of `height` rows, then applies the bottom margin.
    void follow_cursor(size_t height);

    // Cursor and both scroll offsets back to zero; active file is kept.
    void reset_position();

    // Wraps modulo file_count. No-op (returns false) unless file_count > 1.
    bool next_file(size_t file_count);
    bool prev_file(size_t file_count);

    void set_active_file(size_t index, size_t file_count);

    // Adjusts the active index after the file at `removed_index` was dropped from the set.
    void on_file_removed(size_t removed_index, size_t remaining_files);

  private:
    ViewportState state_;
};

}  // namespace taglens
