//
//  exiftool_source.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <string>

#include "metadata_source.hpp"

namespace taglens {

/// MetadataSource backed by the exiftool command line program.
class ExifToolSource : public MetadataSource {
  public:
    explicit ExifToolSource(std::string executable = "exiftool");

    LoadResult load(const std::vector<std::filesystem::path> &inputs, bool recursive) override;

    std::optional<std::vector<uint8_t>> fetch_binary(const std::filesystem::path &file,
                                                     const std::string &short_name) override;

  private:
    std::string executable_;
};

}  // namespace taglens
