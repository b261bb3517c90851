//
//  session.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "session.hpp"

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <utility>

#include "logging.hpp"

namespace taglens {

namespace {

enum class WriteOutcome { Written, Exists, Failed };

// Creates `p` exclusively and writes `data` to it. A partly written file is removed again.
WriteOutcome write_new_file(const std::filesystem::path &p, const std::vector<uint8_t> &data) {
    if (data.empty()) {
        TL_LOG("error", "refusing to write an empty payload to " << p);
        return WriteOutcome::Failed;
    }
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return WriteOutcome::Exists;
        }
        TL_LOG("error", "open failed for " << p << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return WriteOutcome::Failed;
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        written += static_cast<size_t>(n);
    }
    const int write_errno = errno;
    const bool closed = ::close(fd) == 0;
    if (written < data.size() || !closed) {
        TL_LOG("error", "write failed for " << p << " after " << written << " of " << data.size()
                                            << " bytes errno=" << write_errno << " ("
                                            << std::generic_category().message(write_errno)
                                            << ")");
        std::error_code ec;
        std::filesystem::remove(p, ec);
        return WriteOutcome::Failed;
    }
    return WriteOutcome::Written;
}

}  // namespace

Session::Session(std::vector<FileEntrySet> files) { set_files(std::move(files)); }

LoadResult Session::load(MetadataSource &source,
                         const std::vector<std::filesystem::path> &inputs, bool recursive) {
    LoadResult res = source.load(inputs, recursive);
    if (!res.usable()) {
        TL_LOG("error", "load failed (" << load_code_name(res.code) << "): " << res.message);
        return res;
    }
    if (res.code == LoadCode::Partial) {
        TL_LOG("warn", res.message);
    }
    set_files(std::move(res.files));
    res.files.clear();
    return res;
}

void Session::set_files(std::vector<FileEntrySet> files) {
    files_ = std::move(files);
    compare_rows_ = build_compare_index(files_);
    filter_.clear();
    compare_mode_ = CompareMode::Off;
    viewport_ = Viewport{};
    refresh_rows();
    TL_LOG("session", "session holds " << files_.size() << " file(s), " << compare_rows_.size()
                                       << " distinct fields");
}

const FileEntrySet *Session::active_file() const {
    const size_t index = viewport_.state().active_file_index;
    return index < files_.size() ? &files_[index] : nullptr;
}

void Session::set_filter(std::string filter) {
    filter_ = std::move(filter);
    viewport_.reset_position();
    refresh_rows();
}

void Session::append_filter(char c) {
    filter_.push_back(c);
    refresh_rows();
}

void Session::pop_filter() {
    if (!filter_.empty()) {
        filter_.pop_back();
    }
    refresh_rows();
}

void Session::clear_filter() { set_filter({}); }

bool Session::apply_family_filter() {
    const TagEntry *entry = selected_entry();
    if (!entry) {
        return false;
    }
    set_filter("<<" + entry->table_string() + ">>");
    return true;
}

bool Session::toggle_compare() {
    if (!has_multiple_files()) {
        return false;
    }
    compare_mode_ = compare_active() ? CompareMode::Off : CompareMode::All;
    viewport_.reset_position();
    viewport_.set_active_file(0, files_.size());
    refresh_rows();
    return true;
}

bool Session::toggle_diff_only() {
    if (!compare_active()) {
        return false;
    }
    compare_mode_ =
        compare_mode_ == CompareMode::DiffOnly ? CompareMode::All : CompareMode::DiffOnly;
    viewport_.reset_position();
    refresh_rows();
    return true;
}

bool Session::next_file() {
    const bool moved = viewport_.next_file(files_.size());
    refresh_rows();
    return moved;
}

bool Session::prev_file() {
    const bool moved = viewport_.prev_file(files_.size());
    refresh_rows();
    return moved;
}

bool Session::remove_active_file() {
    if (!has_multiple_files() || compare_active()) {
        return false;
    }
    const size_t removed = viewport_.state().active_file_index;
    TL_LOG("session", "dropping " << files_[removed].file);
    files_.erase(files_.begin() + static_cast<std::ptrdiff_t>(removed));
    compare_rows_ = build_compare_index(files_);
    viewport_.on_file_removed(removed, files_.size());
    refresh_rows();
    return true;
}

void Session::move_cursor(long delta) {
    refresh_rows();
    viewport_.move_cursor(delta);
}

void Session::drag(long delta) {
    refresh_rows();
    viewport_.drag(delta);
}

void Session::scroll_horizontal(long delta) { viewport_.scroll_horizontal(delta); }

std::vector<const TagEntry *> Session::single_view() const {
    const FileEntrySet *file = active_file();
    if (!file) {
        return {};
    }
    return filter_entries(file->entries, filter_);
}

std::vector<const CompareRow *> Session::compare_view() const {
    return filter_compare_rows(compare_rows_, filter_, compare_mode_ == CompareMode::DiffOnly);
}

size_t Session::compute_visible_rows() const {
    return compare_active() ? compare_view().size() : single_view().size();
}

void Session::refresh_rows() { viewport_.set_visible_rows(compute_visible_rows()); }

void Session::begin_frame(size_t viewport_height) {
    refresh_rows();
    viewport_.follow_cursor(viewport_height);
}

const TagEntry *Session::selected_entry() const {
    const size_t cursor = viewport_.state().cursor;
    if (!compare_active()) {
        auto view = single_view();
        return cursor < view.size() ? view[cursor] : nullptr;
    }
    auto view = compare_view();
    if (cursor >= view.size()) {
        return nullptr;
    }
    const auto &slots = view[cursor]->per_file;
    const size_t active = viewport_.state().active_file_index;
    if (active >= slots.size() || !slots[active]) {
        return nullptr;
    }
    return &*slots[active];
}

Status Session::save_binary(const SaveRequest &request, const std::filesystem::path &directory,
                            MetadataSource &source) const {
    if (request.name.empty()) {
        return make_status(false, "Please enter a name.");
    }
    std::string extension = request.extension;
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }
    if (extension.empty()) {
        return make_status(false, "Please enter an extension.");
    }
    const TagEntry *entry = selected_entry();
    const FileEntrySet *file = active_file();
    if (!entry || !entry->binary_size_kb || !file) {
        return make_status(false, "Selected entry does not contain any binary data!");
    }
    const auto path = directory / (request.name + "." + extension);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return make_status(false, "File with this name already exists!");
    }
    auto bytes = source.fetch_binary(file->file, entry->short_name);
    if (!bytes) {
        return make_status(false, "Failed to extract " + entry->short_name + " from " +
                                      file->file.string());
    }
    switch (write_new_file(path, *bytes)) {
        case WriteOutcome::Written:
            break;
        case WriteOutcome::Exists:
            return make_status(false, "File with this name already exists!");
        case WriteOutcome::Failed:
            return make_status(false, "Failed to write " + path.string());
    }
    TL_LOG("info", "saved " << bytes->size() << " bytes of " << entry->short_name << " to "
                            << path);
    return make_status(true, "Successfully saved at " + path.string());
}

std::optional<Status> Session::take_status() {
    auto out = std::move(status_message_);
    status_message_.reset();
    return out;
}

}  // namespace taglens
