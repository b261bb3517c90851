//
//  text_layout.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>

namespace taglens {

// Terminal columns taken by UTF-8 `text`. Invalid bytes count as one column each.
size_t display_width(const std::string &text);

// Longest prefix of `text` that fits into `width` columns, cut on a character boundary.
std::string fit_columns(const std::string &text, size_t width);

// Appends spaces until `text` fills `width` columns.
std::string pad_cell(std::string text, size_t width);

/**
 * @brief Fits `text` into a cell of `width` columns after skipping `x_offset` columns.
 *
 * Skipped text is shown as a "..." lead-in, truncated text ends in "...". The result is never
 * wider than `width` columns and is only ever cut between UTF-8 characters.
 */
std::string clip_cell(const std::string &text, size_t width, size_t x_offset);

// Keeps the tail of a path so the file name stays visible: "...dir/file.jpg".
std::string clip_path_left(const std::string &path, size_t width);

}  // namespace taglens
