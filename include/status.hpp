//
//  status.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace taglens {

/**
 * @brief Result object with success flag and optional message.
 *
 * On failure, `message` holds a short, user-presentable description. On success it may carry
 * an informational message (e.g. where a payload was saved), or be empty.
 */
struct Status {
    bool ok{false};
    std::string message;
};

inline Status make_status(bool ok, std::string msg = {}) { return Status{ok, std::move(msg)}; }

}  // namespace taglens
