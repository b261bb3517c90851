//
//  desktop.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <string>

#include "status.hpp"

namespace taglens {

// Pipes text into the first clipboard helper that runs (wl-copy, xclip, xsel, pbcopy).
Status copy_to_clipboard(const std::string &text);

// Opens a URL with xdg-open (or open on macOS) without waiting for it.
Status open_in_browser(const std::string &url);

}  // namespace taglens
