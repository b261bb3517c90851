//
//  tag_value.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "tag_value.hpp"

#include <cctype>

namespace taglens {

std::string to_lower_copy(const std::string &s) {
    std::string out = s;
    for (auto &c : out) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string TagValue::to_string() const {
    if (is_scalar()) {
        return scalar();
    }
    std::string out;
    const auto &items = list();
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out += ' ';
        }
        out += items[i].dump();
    }
    return out;
}

bool TagValue::contains(const std::string &lowered_filter) const {
    if (is_scalar()) {
        return to_lower_copy(scalar()).find(lowered_filter) != std::string::npos;
    }
    // List elements are lowered too, so "canon" matches ["Canon", ...] like it does a scalar.
    for (const auto &item : list()) {
        if (to_lower_copy(item.dump()).find(lowered_filter) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace taglens
