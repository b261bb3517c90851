//
//  tag_value.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace taglens {

/// A field value as reported by exiftool: either a single string or a list of JSON primitives.
class TagValue {
  public:
    using List = std::vector<nlohmann::ordered_json>;

    TagValue() = default;
    explicit TagValue(std::string scalar) : data_(std::move(scalar)) {}
    explicit TagValue(List list) : data_(std::move(list)) {}

    bool is_scalar() const { return std::holds_alternative<std::string>(data_); }
    bool is_list() const { return std::holds_alternative<List>(data_); }

    // Only valid when is_scalar() / is_list() respectively.
    const std::string &scalar() const { return std::get<std::string>(data_); }
    const List &list() const { return std::get<List>(data_); }

    // Scalar as-is; list elements serialized as JSON and joined with a single space.
    std::string to_string() const;

    // Case-insensitive substring test. `lowered_filter` must already be lower case.
    bool contains(const std::string &lowered_filter) const;

    bool operator==(const TagValue &other) const { return data_ == other.data_; }
    bool operator!=(const TagValue &other) const { return !(*this == other); }

  private:
    std::variant<std::string, List> data_;
};

// ASCII lower-casing used by every filter comparison.
std::string to_lower_copy(const std::string &s);

}  // namespace taglens
