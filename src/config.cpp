//
//  config.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "config.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>

#include "taglens_version.hpp"

namespace taglens {

std::optional<std::string> process_env(const char *name) {
    const char *v = std::getenv(name);
    if (!v || !*v) {
        return std::nullopt;
    }
    return std::string(v);
}

std::filesystem::path default_save_dir(EnvLookup env) {
    if (auto xdg = env("XDG_DOWNLOAD_DIR")) {
        return *xdg;
    }
    if (auto home = env("HOME")) {
        return std::filesystem::path(*home) / "Downloads";
    }
    return std::filesystem::path(".");
}

std::string usage_text() {
    std::ostringstream out;
    out << "TagLens " << TAGLENS_VERSION_DISPLAY << "\n"
        << "Copyright (c) 2026 TagLens contributors\n\n"
        << "usage:\n"
        << "  taglens <file|dir>... [options]\n"
        << "Options:\n"
        << "  --recursive         Descend into sub-directories of directory inputs.\n"
        << "  --no-recursive      Never descend; skips the recursion prompt.\n"
        << "  --exiftool PATH     exiftool executable (default: exiftool).\n"
        << "  --save-dir DIR      Where extracted binary data is written\n"
        << "                      (default: $XDG_DOWNLOAD_DIR or ~/Downloads).\n"
        << "  --log-level LEVEL   error|warn|info|debug (default: warn).\n"
        << "  --log-file PATH     Append log lines to PATH instead of stderr.\n"
        << "  --version, -v       Print version and exit.\n"
        << "  --help, -h          Print this text and exit.\n";
    return out.str();
}

ParsedArgs parse_args(int argc, const char *const *argv, EnvLookup env) {
    ParsedArgs res;
    auto fail = [&res](std::string msg) {
        res.status = make_status(false, std::move(msg));
        return res;
    };
    bool save_dir_given = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            res.show_help = true;
        } else if (arg == "--version" || arg == "-v") {
            res.show_version = true;
        } else if (arg == "--recursive" || arg == "-r") {
            res.options.recursive = true;
        } else if (arg == "--no-recursive") {
            res.options.recursive = false;
        } else if (arg == "--exiftool" || arg == "--save-dir" || arg == "--log-level" ||
                   arg == "--log-file") {
            if (i + 1 >= argc) {
                return fail("Missing value for " + arg);
            }
            std::string value = argv[++i];
            if (arg == "--exiftool") {
                res.options.exiftool = value;
            } else if (arg == "--save-dir") {
                res.options.save_dir = value;
                save_dir_given = true;
            } else if (arg == "--log-level") {
                res.options.log_level = parse_log_level(value);
            } else {
                res.options.log_file = value;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return fail("Unknown option: " + arg);
        } else {
            res.options.inputs.emplace_back(arg);
        }
    }
    if (!save_dir_given) {
        res.options.save_dir = default_save_dir(env);
    }
    if (res.show_help || res.show_version) {
        res.status = make_status(true);
        return res;
    }
    if (res.options.inputs.empty()) {
        return fail("No input files given.");
    }
    res.status = make_status(true);
    return res;
}

bool inputs_need_recursion_choice(const std::vector<std::filesystem::path> &inputs) {
    namespace fs = std::filesystem;
    for (const auto &input : inputs) {
        std::error_code ec;
        if (!fs::is_directory(input, ec)) {
            continue;
        }
        for (fs::directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace taglens
