//
//  compare_index.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "compare_index.hpp"

#include <unordered_map>

#include "logging.hpp"

namespace taglens {

namespace {

using KeyMap = std::unordered_map<TagEntryKey, const TagEntry *, TagEntryKeyHash>;

}  // namespace

std::vector<CompareRow> build_compare_index(const std::vector<FileEntrySet> &files) {
    std::vector<KeyMap> per_file_maps;
    per_file_maps.reserve(files.size());
    std::vector<TagEntryKey> key_order;
    std::unordered_map<TagEntryKey, size_t, TagEntryKeyHash> seen;

    for (const auto &file : files) {
        KeyMap map;
        map.reserve(file.entries.size());
        for (const auto &entry : file.entries) {
            auto key = entry.key();
            if (!map.insert_or_assign(key, &entry).second) {
                TL_LOG("compare", "duplicate key " << entry.table_string() << ":"
                                                   << entry.short_name << " in " << file.file
                                                   << "; keeping the later entry");
            }
            if (seen.emplace(key, key_order.size()).second) {
                key_order.push_back(std::move(key));
            }
        }
        per_file_maps.push_back(std::move(map));
    }

    std::vector<CompareRow> rows;
    rows.reserve(key_order.size());
    for (const auto &key : key_order) {
        CompareRow row;
        row.per_file.reserve(files.size());
        const TagEntry *first = nullptr;
        for (const auto &map : per_file_maps) {
            auto it = map.find(key);
            if (it == map.end()) {
                row.per_file.emplace_back(std::nullopt);
                continue;
            }
            if (!first) {
                first = it->second;
            }
            row.per_file.emplace_back(*it->second);
        }
        // Every key came from some file, so a representative always exists.
        row.representative = *first;
        rows.push_back(std::move(row));
    }
    TL_LOG("compare", "built " << rows.size() << " compare rows over " << files.size()
                               << " file(s)");
    return rows;
}

bool row_differs(const CompareRow &row) {
    if (row.per_file.empty()) {
        return false;
    }
    const auto &first = row.per_file.front();
    for (const auto &slot : row.per_file) {
        if (!slot && !first) {
            continue;
        }
        if (slot && first && *slot == *first) {
            continue;
        }
        return true;
    }
    return false;
}

bool row_matches_filter(const CompareRow &row, const std::string &filter) {
    if (filter.empty()) {
        return true;
    }
    for (const auto &slot : row.per_file) {
        if (slot && slot->matches_filter(filter)) {
            return true;
        }
    }
    return false;
}

}  // namespace taglens
