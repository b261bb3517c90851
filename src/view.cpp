//
//  view.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "view.hpp"

namespace taglens {

std::vector<const TagEntry *> filter_entries(const std::vector<TagEntry> &entries,
                                             const std::string &filter) {
    std::vector<const TagEntry *> out;
    out.reserve(entries.size());
    for (const auto &entry : entries) {
        if (filter.empty() || entry.matches_filter(filter)) {
            out.push_back(&entry);
        }
    }
    return out;
}

std::vector<const CompareRow *> filter_compare_rows(const std::vector<CompareRow> &rows,
                                                    const std::string &filter, bool diff_only) {
    std::vector<const CompareRow *> out;
    out.reserve(rows.size());
    for (const auto &row : rows) {
        if (row_matches_filter(row, filter) && (!diff_only || row_differs(row))) {
            out.push_back(&row);
        }
    }
    return out;
}

std::string entry_label(const TagEntry &entry, const DisplayMode &mode) {
    return mode.short_names ? entry.short_name : entry.display_name;
}

std::string entry_cell(const TagEntry &entry, const DisplayMode &mode) {
    if (entry.binary_size_kb) {
        return format_binary_size(*entry.binary_size_kb);
    }
    if (mode.numeric && entry.numeric_value) {
        return entry.numeric_value->to_string();
    }
    return entry.value.to_string();
}

}  // namespace taglens
