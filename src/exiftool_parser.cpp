//
//  exiftool_parser.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "exiftool_parser.hpp"

#include <cctype>
#include <cstdlib>

#include <nlohmann/json.hpp>

#include "logging.hpp"

using json = nlohmann::ordered_json;

namespace taglens {

namespace {

constexpr const char *kSourceFileKey = "SourceFile";
constexpr const char *kBytesMarker = "bytes";
constexpr float kBytesPerKb = 1024.0f;

// Numbers and booleans are flattened to their JSON text, arrays become lists.
std::optional<TagValue> to_tag_value(const json &v) {
    if (v.is_string()) {
        return TagValue(v.get<std::string>());
    }
    if (v.is_number() || v.is_boolean()) {
        return TagValue(v.dump());
    }
    if (v.is_array()) {
        TagValue::List items(v.begin(), v.end());
        return TagValue(std::move(items));
    }
    return std::nullopt;
}

std::optional<uint64_t> to_unsigned(const json &v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>();
    }
    if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(v.get<int64_t>());
    }
    return std::nullopt;
}

// Returns false when the record lacks a required member or carries an ill-typed one.
bool read_tag_entry(const std::string &key, const json &obj, TagEntry &entry) {
    auto desc = obj.find("desc");
    auto table = obj.find("table");
    auto val = obj.find("val");
    if (desc == obj.end() || !desc->is_string() || table == obj.end() || !table->is_string() ||
        val == obj.end()) {
        return false;
    }
    auto value = to_tag_value(*val);
    if (!value) {
        return false;
    }

    auto sep = key.find(':');
    if (sep != std::string::npos) {
        entry.instance = key.substr(0, sep);
        entry.short_name = key.substr(sep + 1);
    } else {
        entry.short_name = key;
    }
    entry.display_name = desc->get<std::string>();
    entry.table = split_table(table->get<std::string>());
    entry.value = std::move(*value);

    if (auto id = obj.find("id"); id != obj.end()) {
        // Non-numeric ids (e.g. XMP names) are not tag numbers.
        entry.id = to_unsigned(*id);
    }
    if (auto num = obj.find("num"); num != obj.end() && !num->is_null()) {
        auto numeric = to_tag_value(*num);
        if (!numeric) {
            return false;
        }
        entry.numeric_value = std::move(*numeric);
    }
    if (auto index = obj.find("index"); index != obj.end() && !index->is_null()) {
        auto ordinal = to_unsigned(*index);
        if (!ordinal) {
            return false;
        }
        entry.ordinal_index = ordinal;
    }
    if (entry.value.is_scalar()) {
        entry.binary_size_kb = parse_binary_size_kb(entry.value.scalar());
    }
    return true;
}

}  // namespace

TagTable split_table(const std::string &table) {
    auto sep = table.find("::");
    if (sep == std::string::npos) {
        return TagTable{table, {}};
    }
    return TagTable{table.substr(0, sep), table.substr(sep + 2)};
}

std::optional<float> parse_binary_size_kb(const std::string &value) {
    auto marker = value.find(kBytesMarker);
    if (marker == std::string::npos) {
        return std::nullopt;
    }
    size_t end = marker;
    while (end > 0 && value[end - 1] == ' ') {
        --end;
    }
    size_t begin = end;
    while (begin > 0 && std::isdigit(static_cast<unsigned char>(value[begin - 1]))) {
        --begin;
    }
    if (begin == end) {
        return std::nullopt;
    }
    const unsigned long long bytes = std::strtoull(value.substr(begin, end - begin).c_str(),
                                                   nullptr, 10);
    return static_cast<float>(bytes) / kBytesPerKb;
}

const char *load_code_name(LoadCode code) {
    switch (code) {
        case LoadCode::Ok:
            return "ok";
        case LoadCode::Partial:
            return "partial";
        case LoadCode::ToolFailed:
            return "tool failed";
        case LoadCode::InvalidOutput:
            return "invalid output";
        case LoadCode::NoData:
            return "no data";
    }
    return "unknown";
}

LoadResult parse_exiftool_json(const std::string &text) {
    LoadResult res;
    json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_array()) {
        res.code = LoadCode::InvalidOutput;
        res.message = "exiftool output is not a JSON array";
        TL_LOG("error", res.message << " (" << text.size() << " bytes)");
        return res;
    }

    size_t total_entries = 0;
    for (const auto &file_obj : root) {
        if (!file_obj.is_object()) {
            ++res.malformed_records;
            TL_LOG("warn", "skipping non-object file record");
            continue;
        }
        FileEntrySet set;
        for (auto it = file_obj.begin(); it != file_obj.end(); ++it) {
            const std::string &key = it.key();
            const json &v = it.value();
            if (v.is_string() && key.find(kSourceFileKey) != std::string::npos) {
                set.file = v.get<std::string>();
                continue;
            }
            if (!v.is_object()) {
                continue;
            }
            TagEntry entry;
            if (!read_tag_entry(key, v, entry)) {
                ++res.malformed_records;
                TL_LOG("warn", "skipping malformed field record '" << key << "'");
                continue;
            }
            set.entries.push_back(std::move(entry));
        }
        if (set.file.empty()) {
            TL_LOG("warn", "file record without " << kSourceFileKey << " ("
                                                  << set.entries.size() << " fields)");
        }
        TL_LOG("ingest", "parsed " << set.file << ": " << set.entries.size() << " fields");
        total_entries += set.entries.size();
        res.files.push_back(std::move(set));
    }

    if (res.files.empty() || total_entries == 0) {
        res.code = LoadCode::NoData;
        res.message = "exiftool returned no metadata for any input";
        return res;
    }
    if (res.malformed_records > 0) {
        res.code = LoadCode::Partial;
        res.message = "skipped " + std::to_string(res.malformed_records) + " malformed record(s)";
        return res;
    }
    res.code = LoadCode::Ok;
    return res;
}

}  // namespace taglens
