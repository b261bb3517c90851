//
//  main.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include <iostream>
#include <string>

#include "app.hpp"
#include "config.hpp"
#include "exiftool_source.hpp"
#include "logging.hpp"
#include "taglens_version.hpp"
#include "tui.hpp"

namespace {

int report_load_failure(const taglens::LoadResult &res) {
    std::cerr << "TagLens: " << taglens::load_code_name(res.code);
    if (!res.message.empty()) {
        std::cerr << ": " << res.message;
    }
    std::cerr << "\n";
    return 1;
}

}  // namespace

int main(int argc, char **argv) {
    taglens::ParsedArgs parsed = taglens::parse_args(argc, argv);
    if (parsed.show_version) {
        std::cout << "TagLens " << TAGLENS_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (parsed.show_help) {
        std::cout << taglens::usage_text();
        return 0;
    }
    if (!parsed.status.ok) {
        std::cerr << parsed.status.message << "\n\n" << taglens::usage_text();
        return 2;
    }

    const taglens::Options &options = parsed.options;
    taglens::set_log_verbosity(options.log_level);
    if (!options.log_file.empty() && !taglens::set_log_file(options.log_file)) {
        std::cerr << "Cannot open log file: " << options.log_file << "\n";
        return 2;
    }
    TL_LOG("info", "TagLens " << TAGLENS_VERSION_DISPLAY << " starting with "
                              << options.inputs.size() << " input(s)");

    taglens::ExifToolSource source(options.exiftool);
    taglens::App app(options, source, taglens::system_desktop_actions());

    taglens::LoadResult res = app.start();
    if (!res.usable()) {
        TL_LOG("error", "loading metadata failed: " << res.message);
        return report_load_failure(res);
    }

    taglens::run_tui(app);

    if (app.fatal_load()) {
        TL_LOG("error", "loading metadata failed: " << app.fatal_load()->message);
        return report_load_failure(*app.fatal_load());
    }
    return 0;
}
