//
//  tag_entry.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "tag_entry.hpp"

#include <cstdio>
#include <sstream>

namespace taglens {

namespace {

constexpr const char *kFamilyOpen = "<<";
constexpr const char *kFamilyClose = ">>";
constexpr size_t kFamilyMarkerLen = 2;

bool is_family_filter(const std::string &filter) {
    return filter.size() >= 2 * kFamilyMarkerLen &&
           filter.compare(0, kFamilyMarkerLen, kFamilyOpen) == 0 &&
           filter.compare(filter.size() - kFamilyMarkerLen, kFamilyMarkerLen, kFamilyClose) == 0;
}

bool lower_contains(const std::string &haystack, const std::string &lowered_needle) {
    return to_lower_copy(haystack).find(lowered_needle) != std::string::npos;
}

}  // namespace

size_t TagEntryKeyHash::operator()(const TagEntryKey &key) const {
    std::hash<std::string> h;
    size_t seed = h(key.short_name);
    for (const auto *part : {&key.table.group, &key.table.subgroup}) {
        seed ^= h(*part) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

std::string TagEntry::table_string() const {
    if (table.subgroup.empty()) {
        return table.group;
    }
    return table.group + "::" + table.subgroup;
}

bool TagEntry::matches_filter(const std::string &filter) const {
    const std::string lowered = to_lower_copy(filter);
    if (is_family_filter(lowered)) {
        const std::string family =
            lowered.substr(kFamilyMarkerLen, lowered.size() - 2 * kFamilyMarkerLen);
        return lower_contains(table_string(), family);
    }
    return lower_contains(display_name, lowered) || lower_contains(short_name, lowered) ||
           value.contains(lowered) || (numeric_value && numeric_value->contains(lowered));
}

std::string TagEntry::render() const {
    std::ostringstream out;
    out << "Name: " << display_name << "\n"
        << "Short name: " << short_name << "\n"
        << "Tag ID: ";
    if (id) {
        out << *id << " (0x" << std::uppercase << std::hex << *id << std::dec
            << std::nouppercase << ")";
    } else {
        out << "Unknown";
    }
    out << "\n"
        << "Tag family: " << table_string() << "\n"
        << "Tag value: " << value.to_string() << "\n"
        << "Tag numerical value: " << numeric_or_value().to_string();
    if (ordinal_index) {
        out << "\nTag index: " << *ordinal_index;
    }
    return out.str();
}

bool TagEntry::operator==(const TagEntry &other) const {
    return short_name == other.short_name && binary_size_kb == other.binary_size_kb &&
           id == other.id && table == other.table && value == other.value &&
           ordinal_index == other.ordinal_index;
}

std::string format_binary_size(float size_kb) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1fKb binary data; Can be extracted",
                  static_cast<double>(size_kb));
    return buf;
}

std::string tag_reference_url(const TagEntry &entry) {
    // exiftool documents the Exif group on a page named EXIF.
    if (entry.table.group == "Exif") {
        return "https://exiftool.org/TagNames/EXIF.html";
    }
    return "https://exiftool.org/TagNames/" + entry.table.group + ".html";
}

}  // namespace taglens
