//
//  test_utils.hpp
//  TagLens
//
//  Test-only helpers to build entries, file sets and a scripted metadata source.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "metadata_source.hpp"
#include "tag_entry.hpp"

namespace test_utils {

inline taglens::TagEntry make_entry(const std::string &short_name, const std::string &value,
                                    const std::string &group = "EXIF",
                                    const std::string &subgroup = "IFD0") {
    taglens::TagEntry e;
    e.short_name = short_name;
    e.display_name = short_name;
    e.table = taglens::TagTable{group, subgroup};
    e.value = taglens::TagValue(value);
    return e;
}

inline taglens::TagEntry make_binary_entry(const std::string &short_name, float size_kb) {
    taglens::TagEntry e = make_entry(short_name, "(Binary data 1 bytes, use -b option to extract)");
    e.binary_size_kb = size_kb;
    return e;
}

inline taglens::FileEntrySet make_file(const std::string &path,
                                       std::vector<taglens::TagEntry> entries) {
    return taglens::FileEntrySet{path, std::move(entries)};
}

// File with `count` entries named Tag0..Tag{count-1}.
inline taglens::FileEntrySet make_numbered_file(const std::string &path, size_t count) {
    std::vector<taglens::TagEntry> entries;
    entries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        entries.push_back(make_entry("Tag" + std::to_string(i), std::to_string(i)));
    }
    return make_file(path, std::move(entries));
}

/// Canned MetadataSource: returns a fixed load result and per-field payloads.
class FakeSource : public taglens::MetadataSource {
  public:
    taglens::LoadResult load(const std::vector<std::filesystem::path> &inputs,
                             bool recursive) override {
        ++load_calls;
        last_inputs = inputs;
        last_recursive = recursive;
        return result;
    }

    std::optional<std::vector<uint8_t>> fetch_binary(const std::filesystem::path &file,
                                                     const std::string &short_name) override {
        ++fetch_calls;
        last_fetch_file = file;
        if (on_fetch) {
            on_fetch();
        }
        auto it = payloads.find(short_name);
        if (it == payloads.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    taglens::LoadResult result;
    std::map<std::string, std::vector<uint8_t>> payloads;
    std::function<void()> on_fetch;  ///< runs while the payload is being "extracted"
    int load_calls = 0;
    int fetch_calls = 0;
    std::vector<std::filesystem::path> last_inputs;
    bool last_recursive = false;
    std::filesystem::path last_fetch_file;
};

inline taglens::LoadResult ok_result(std::vector<taglens::FileEntrySet> files) {
    taglens::LoadResult res;
    res.code = taglens::LoadCode::Ok;
    res.files = std::move(files);
    return res;
}

inline std::optional<std::string> read_text_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
  public:
    explicit TempDir(const std::string &prefix) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

  private:
    std::filesystem::path path_;
};

}  // namespace test_utils
