//
//  view.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "compare_index.hpp"
#include "tag_entry.hpp"

namespace taglens {

/// Presentation toggles: short vs. descriptive names, readable vs. numeric values.
struct DisplayMode {
    bool short_names = false;
    bool numeric = false;
};

enum class CompareMode { Off, All, DiffOnly };

// Entries passing `filter`, in extraction order. An empty filter passes everything.
std::vector<const TagEntry *> filter_entries(const std::vector<TagEntry> &entries,
                                             const std::string &filter);

// Compare rows passing `filter` and, when `diff_only`, row_differs().
std::vector<const CompareRow *> filter_compare_rows(const std::vector<CompareRow> &rows,
                                                    const std::string &filter, bool diff_only);

// Tag column text.
std::string entry_label(const TagEntry &entry, const DisplayMode &mode);

// Value column text: binary summary, numeric value (when requested and known) or value.
std::string entry_cell(const TagEntry &entry, const DisplayMode &mode);

}  // namespace taglens
