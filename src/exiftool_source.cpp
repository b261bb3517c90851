//
//  exiftool_source.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "exiftool_source.hpp"

#include <chrono>
#include <utility>

#include "exiftool_parser.hpp"
#include "logging.hpp"
#include "process.hpp"

namespace taglens {

ExifToolSource::ExifToolSource(std::string executable) : executable_(std::move(executable)) {}

LoadResult ExifToolSource::load(const std::vector<std::filesystem::path> &inputs,
                                bool recursive) {
    const auto t0 = std::chrono::steady_clock::now();
    std::vector<std::string> argv{executable_};
    for (const auto &p : inputs) {
        argv.push_back(p.string());
    }
    // JSON, instance family group names, long (desc/id/table/val/num) records, tag ids.
    argv.insert(argv.end(), {"-j", "-G4", "-l", "-D", "-t"});
    if (recursive) {
        argv.push_back("-r");
    }
    TL_LOG("exiftool", "running " << executable_ << " on " << inputs.size()
                                  << " input(s) recursive=" << recursive);

    auto proc = run_process(argv);
    if (!proc.started) {
        LoadResult res;
        res.code = LoadCode::ToolFailed;
        res.message = "could not run " + executable_ + "; is exiftool installed?";
        TL_LOG("error", res.message);
        return res;
    }
    // exiftool exits non-zero when some inputs had no metadata; the JSON still covers the rest.
    if (proc.exit_code != 0) {
        TL_LOG("warn", executable_ << " exited with status " << proc.exit_code);
    }
    if (proc.output.empty()) {
        LoadResult res;
        res.code = LoadCode::NoData;
        res.message = executable_ + " produced no output";
        TL_LOG("error", res.message);
        return res;
    }

    LoadResult res = parse_exiftool_json(std::string(proc.output.begin(), proc.output.end()));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    TL_LOG("info", "loaded " << res.files.size() << " file(s) in " << ms
                             << " ms (" << load_code_name(res.code) << ")");
    return res;
}

std::optional<std::vector<uint8_t>> ExifToolSource::fetch_binary(
    const std::filesystem::path &file, const std::string &short_name) {
    auto proc = run_process({executable_, file.string(), "-" + short_name, "-b"});
    if (!proc.started || proc.exit_code != 0 || proc.output.empty()) {
        TL_LOG("warn", "binary fetch of " << short_name << " from " << file
                                          << " failed (exit=" << proc.exit_code << ")");
        return std::nullopt;
    }
    TL_LOG("exiftool", "fetched " << short_name << ": " << proc.output.size()
                                  << " bytes, head=" << hex_prefix(proc.output));
    return std::move(proc.output);
}

}  // namespace taglens
