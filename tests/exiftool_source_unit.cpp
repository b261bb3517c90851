// Runs ExifToolSource against a stand-in exiftool script and checks subprocess handling.
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "exiftool_source.hpp"
#include "process.hpp"
#include "test_utils.hpp"

using taglens::ExifToolSource;
using taglens::LoadCode;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[exiftool_source_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Writes an executable shell script that records its arguments, answers -b with a fixed payload
// and -j with the given fixture (or nothing when `fixture` is empty).
std::filesystem::path write_fake_exiftool(const std::filesystem::path &dir,
                                          const std::filesystem::path &fixture) {
    const auto script = dir / "fake_exiftool.sh";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "echo \"$@\" > \"" << (dir / "args.txt").string() << "\"\n"
            << "for a in \"$@\"; do\n"
            << "  if [ \"$a\" = \"-b\" ]; then printf 'JPEGDATA'; exit 0; fi\n"
            << "done\n";
        if (!fixture.empty()) {
            out << "cat \"" << fixture.string() << "\"\n";
        }
        out << "exit 1\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);
    return script;
}

std::string recorded_args(const std::filesystem::path &dir) {
    auto text = test_utils::read_text_file(dir / "args.txt");
    return text ? *text : std::string();
}

bool test_process() {
    auto res = taglens::run_process({"/bin/sh", "-c", "cat"}, "hello");
    bool ok = check(res.started && res.exit_code == 0, "cat runs");
    ok &= check(std::string(res.output.begin(), res.output.end()) == "hello", "stdin reaches stdout");

    res = taglens::run_process({"/bin/sh", "-c", "exit 3"});
    ok &= check(res.started && res.exit_code == 3, "exit status reported");

    res = taglens::run_process({"/nonexistent/taglens-helper"});
    ok &= check(!res.started, "missing program is not started");

    res = taglens::run_process({});
    ok &= check(!res.started, "empty argv is not started");
    return ok;
}

bool test_load(const std::filesystem::path &data_dir) {
    test_utils::TempDir dir("taglens_source_unit");
    const auto script = write_fake_exiftool(dir.path(), data_dir / "two_cameras.json");
    ExifToolSource source(script.string());

    auto res = source.load({"photos/r5.jpg", "photos/r6.jpg"}, false);
    bool ok = check(res.code == LoadCode::Ok, "fixture output loads");
    ok &= check(res.files.size() == 2, "two files");
    ok &= check(recorded_args(dir.path()) == "photos/r5.jpg photos/r6.jpg -j -G4 -l -D -t\n",
                "inputs followed by the extraction flags");

    res = source.load({"photos"}, true);
    ok &= check(recorded_args(dir.path()) == "photos -j -G4 -l -D -t -r\n",
                "recursive load adds -r");

    auto payload = source.fetch_binary("photos/r5.jpg", "ThumbnailImage");
    ok &= check(payload && std::string(payload->begin(), payload->end()) == "JPEGDATA",
                "binary payload fetched");
    ok &= check(recorded_args(dir.path()) == "photos/r5.jpg -ThumbnailImage -b\n",
                "fetch asks for one tag in binary form");
    return ok;
}

bool test_failures() {
    test_utils::TempDir dir("taglens_source_fail");
    ExifToolSource missing((dir.path() / "no-such-exiftool").string());
    auto res = missing.load({"a.jpg"}, false);
    bool ok = check(res.code == LoadCode::ToolFailed, "missing tool reported");
    ok &= check(!missing.fetch_binary("a.jpg", "ThumbnailImage"), "fetch fails without tool");

    const auto silent = write_fake_exiftool(dir.path(), {});
    ExifToolSource quiet(silent.string());
    res = quiet.load({"a.jpg"}, false);
    ok &= check(res.code == LoadCode::NoData, "empty output is NoData");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: exiftool_source_unit <TESTDATA_DIR>\n";
        return 2;
    }
    bool ok = true;
    ok &= test_process();
    ok &= test_load(argv[1]);
    ok &= test_failures();
    if (!ok) {
        return 1;
    }
    std::cout << "[exiftool_source_unit] OK\n";
    return 0;
}
