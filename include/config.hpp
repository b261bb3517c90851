//
//  config.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "logging.hpp"
#include "status.hpp"

namespace taglens {

struct Options {
    std::vector<std::filesystem::path> inputs;
    std::optional<bool> recursive;  ///< unset: ask when an input directory has sub-directories
    std::string exiftool = "exiftool";
    std::filesystem::path save_dir;
    LogVerbosity log_level = LogVerbosity::Warn;
    std::string log_file;
};

struct ParsedArgs {
    Status status;
    Options options;
    bool show_help = false;
    bool show_version = false;
};

// `env` looks up environment variables; tests pass a fake.
using EnvLookup = std::optional<std::string> (*)(const char *name);

std::optional<std::string> process_env(const char *name);

// $XDG_DOWNLOAD_DIR, else $HOME/Downloads, else the current directory.
std::filesystem::path default_save_dir(EnvLookup env = process_env);

ParsedArgs parse_args(int argc, const char *const *argv, EnvLookup env = process_env);

std::string usage_text();

// True when any input is a directory that itself contains a directory.
bool inputs_need_recursion_choice(const std::vector<std::filesystem::path> &inputs);

}  // namespace taglens
