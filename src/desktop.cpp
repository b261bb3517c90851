//
//  desktop.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "desktop.hpp"

#include <vector>

#include "logging.hpp"
#include "process.hpp"

namespace taglens {

Status copy_to_clipboard(const std::string &text) {
    static const std::vector<std::vector<std::string>> kHelpers = {
        {"wl-copy"},
        {"xclip", "-selection", "clipboard"},
        {"xsel", "--clipboard", "--input"},
        {"pbcopy"},
    };
    for (const auto &helper : kHelpers) {
        auto proc = run_process(helper, text, false);
        if (proc.started && proc.exit_code == 0) {
            TL_LOG("desktop", "copied " << text.size() << " bytes via " << helper.front());
            return make_status(true);
        }
    }
    TL_LOG("warn", "no clipboard helper available");
    return make_status(false, "No clipboard helper found (install wl-copy, xclip or xsel)");
}

Status open_in_browser(const std::string &url) {
#ifdef __APPLE__
    const char *opener = "open";
#else
    const char *opener = "xdg-open";
#endif
    if (!launch_detached({opener, url})) {
        return make_status(false, std::string("Failed to run ") + opener);
    }
    return make_status(true, "Opened " + url);
}

}  // namespace taglens
