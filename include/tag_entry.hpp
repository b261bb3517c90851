//
//  tag_entry.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tag_value.hpp"

namespace taglens {

/// Tag table ("family") a field belongs to, e.g. {"EXIF", "IFD0"}. Subgroup may be empty.
struct TagTable {
    std::string group;
    std::string subgroup;

    bool operator==(const TagTable &other) const {
        return group == other.group && subgroup == other.subgroup;
    }
    bool operator!=(const TagTable &other) const { return !(*this == other); }
};

/// Structural identity of a field, used to join the same field across files.
struct TagEntryKey {
    std::string short_name;
    TagTable table;

    bool operator==(const TagEntryKey &other) const {
        return short_name == other.short_name && table == other.table;
    }
};

struct TagEntryKeyHash {
    size_t operator()(const TagEntryKey &key) const;
};

/**
 * @brief One metadata field of one file.
 *
 * `binary_size_kb` is set iff the field holds an extractable binary payload; its presence (not
 * its value) gates extraction.
 */
struct TagEntry {
    std::string short_name;                 ///< Machine name, e.g. "ExposureTime"
    std::string instance;                   ///< Instance prefix of the JSON key (may be empty)
    std::string display_name;               ///< Human label, e.g. "Exposure Time"
    std::optional<uint64_t> id;             ///< Numeric tag id when exiftool knows it
    TagTable table;
    TagValue value;
    std::optional<TagValue> numeric_value;  ///< Value as printed with exiftool -n
    std::optional<uint64_t> ordinal_index;  ///< Position within a repeated tag group
    std::optional<float> binary_size_kb;

    TagEntryKey key() const { return TagEntryKey{short_name, table}; }

    // "group" or "group::subgroup".
    std::string table_string() const;

    /**
     * @brief Case-insensitive filter test.
     *
     * `<<X>>` matches entries whose table string contains X. Any other text matches when it is
     * contained in the display name, short name, value or numeric value.
     */
    bool matches_filter(const std::string &filter) const;

    // Numeric value when present, value otherwise.
    const TagValue &numeric_or_value() const { return numeric_value ? *numeric_value : value; }

    // Multi-line summary used for clipboard export.
    std::string render() const;

    // Display name and numeric value do not take part in equality.
    bool operator==(const TagEntry &other) const;
    bool operator!=(const TagEntry &other) const { return !(*this == other); }
};

/// All fields extracted from one input file, in extraction order.
struct FileEntrySet {
    std::filesystem::path file;
    std::vector<TagEntry> entries;
};

// "%.1fKb binary data; Can be extracted" as shown in list cells.
std::string format_binary_size(float size_kb);

// exiftool's tag-name documentation page for the entry's group.
std::string tag_reference_url(const TagEntry &entry);

}  // namespace taglens
