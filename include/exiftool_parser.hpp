//
//  exiftool_parser.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

#include "metadata_source.hpp"
#include "tag_entry.hpp"

namespace taglens {

// Parses the output of `exiftool -j -G4 -l -D -t` (one JSON object per file) into entry sets.
LoadResult parse_exiftool_json(const std::string &text);

// Extracts N from a "(Binary data N bytes, use -b option to extract)" style value and returns
// N/1024. nullopt when the value carries no "N bytes" marker.
std::optional<float> parse_binary_size_kb(const std::string &value);

// Splits "Group::Subgroup" on the first "::" (no separator: subgroup empty).
TagTable split_table(const std::string &table);

}  // namespace taglens
