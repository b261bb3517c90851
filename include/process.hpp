//
//  process.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace taglens {

struct ProcessResult {
    bool started = false;   ///< false when fork/exec failed (e.g. program not installed)
    int exit_code = -1;     ///< exit status when the child exited normally
    std::vector<uint8_t> output;  ///< everything the child wrote to stdout
};

// Runs argv[0] (PATH lookup, no shell), feeds `input` to its stdin and collects stdout.
// stderr of the child is discarded. Blocks until the child exits.
// With `capture_output` false the child's stdout goes to /dev/null and only the exit status is
// waited for, so a helper that leaves a background process behind cannot hold us up.
ProcessResult run_process(const std::vector<std::string> &argv, const std::string &input = {},
                          bool capture_output = true);

// Starts argv[0] without waiting for it; used for URL openers.
bool launch_detached(const std::vector<std::string> &argv);

}  // namespace taglens
