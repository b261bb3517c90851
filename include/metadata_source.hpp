//
//  metadata_source.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tag_entry.hpp"

namespace taglens {

enum class LoadCode {
    Ok,             ///< Every record parsed.
    Partial,        ///< Files loaded, some malformed records skipped.
    ToolFailed,     ///< Extraction tool could not be run.
    InvalidOutput,  ///< Output is not the expected JSON shape.
    NoData,         ///< No fields for any input file.
};

struct LoadResult {
    LoadCode code = LoadCode::NoData;
    std::string message;
    std::vector<FileEntrySet> files;
    size_t malformed_records = 0;

    // Ok and Partial are usable; everything else is fatal at startup.
    bool usable() const { return code == LoadCode::Ok || code == LoadCode::Partial; }
};

const char *load_code_name(LoadCode code);

/// Extraction collaborator: produces field sets for files and fetches single binary payloads.
class MetadataSource {
  public:
    virtual ~MetadataSource() = default;

    virtual LoadResult load(const std::vector<std::filesystem::path> &inputs,
                            bool recursive) = 0;

    // Raw payload bytes of one field; nullopt when the field has no payload or the fetch fails.
    virtual std::optional<std::vector<uint8_t>> fetch_binary(const std::filesystem::path &file,
                                                             const std::string &short_name) = 0;
};

}  // namespace taglens
