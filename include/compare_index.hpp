//
//  compare_index.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tag_entry.hpp"

namespace taglens {

/**
 * @brief One field joined across all loaded files.
 *
 * `per_file` is index-aligned with the file list; absent slots are nullopt. `representative` is
 * the first present slot and supplies the name/table shown in the tag column.
 */
struct CompareRow {
    TagEntry representative;
    std::vector<std::optional<TagEntry>> per_file;
};

/**
 * @brief Builds the union-keyed comparison table.
 *
 * One row per distinct TagEntryKey. Rows are ordered by first appearance, walking the files in
 * order and each file's entries in extraction order. When a file has two entries with the same
 * key, the later one wins.
 */
std::vector<CompareRow> build_compare_index(const std::vector<FileEntrySet> &files);

// True unless every slot is absent together with slot 0, or equal to slot 0.
bool row_differs(const CompareRow &row);

// Empty filter matches everything; otherwise any present slot must match.
bool row_matches_filter(const CompareRow &row, const std::string &filter);

}  // namespace taglens
