//
//  session.hpp
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

#include "compare_index.hpp"
#include "metadata_source.hpp"
#include "status.hpp"
#include "tag_entry.hpp"
#include "view.hpp"
#include "viewport.hpp"

namespace taglens {

/// Name and extension typed into the save dialog.
struct SaveRequest {
    std::string name;
    std::string extension;
};

/**
 * @brief Everything the browser shows: loaded files, compare table, filter, modes and viewport.
 *
 * Owned by the control loop and passed by reference; there is no global instance. The visible
 * row set is never cached: every query filters the current data again.
 */
class Session {
  public:
    Session() = default;
    explicit Session(std::vector<FileEntrySet> files);

    // Runs the extraction and, when the result is usable, replaces all loaded data.
    LoadResult load(MetadataSource &source, const std::vector<std::filesystem::path> &inputs,
                    bool recursive);

    // Replaces all files wholesale, rebuilds the compare table and resets view state.
    void set_files(std::vector<FileEntrySet> files);

    const std::vector<FileEntrySet> &files() const { return files_; }
    const std::vector<CompareRow> &compare_rows() const { return compare_rows_; }
    size_t file_count() const { return files_.size(); }
    bool has_multiple_files() const { return files_.size() > 1; }
    const FileEntrySet *active_file() const;

    const std::string &filter() const { return filter_; }
    void set_filter(std::string filter);
    void append_filter(char c);
    void pop_filter();
    void clear_filter();
    // Restricts the view to the selected entry's table. False when nothing is selected.
    bool apply_family_filter();

    const DisplayMode &display_mode() const { return display_mode_; }
    void toggle_short_names() { display_mode_.short_names = !display_mode_.short_names; }
    void toggle_numeric() { display_mode_.numeric = !display_mode_.numeric; }

    CompareMode compare_mode() const { return compare_mode_; }
    bool compare_active() const { return compare_mode_ != CompareMode::Off; }
    // Needs more than one file. Resets cursor, scroll and the active file.
    bool toggle_compare();
    // Needs compare mode. Resets cursor and scroll.
    bool toggle_diff_only();

    bool next_file();
    bool prev_file();
    // Drops the active file. Only outside compare mode and with more than one file.
    bool remove_active_file();

    const ViewportState &viewport() const { return viewport_.state(); }
    void move_cursor(long delta);
    void drag(long delta);
    void scroll_horizontal(long delta);
    void reset_position() { viewport_.reset_position(); }

    std::vector<const TagEntry *> single_view() const;
    std::vector<const CompareRow *> compare_view() const;
    size_t compute_visible_rows() const;

    // Per-frame recompute: refresh the row count, clamp the cursor, scroll it into view.
    void begin_frame(size_t viewport_height);

    /**
     * @brief Entry under the cursor.
     *
     * Outside compare mode: the cursor-th entry of the filtered active file. In compare mode:
     * the active file's slot of the cursor-th filtered (and diffed) row, which may be absent.
     * Returns nullptr when nothing resolves.
     */
    const TagEntry *selected_entry() const;

    /**
     * @brief Extracts the selected entry's payload into `directory/name.extension`.
     *
     * Refuses empty names or extensions, entries without payload and existing destinations.
     * Never changes session or viewport state.
     */
    Status save_binary(const SaveRequest &request, const std::filesystem::path &directory,
                       MetadataSource &source) const;

    // One-shot message for the hint bar.
    void post_status(Status status) { status_message_ = std::move(status); }
    std::optional<Status> take_status();
    const std::optional<Status> &peek_status() const { return status_message_; }

  private:
    void refresh_rows();

    std::vector<FileEntrySet> files_;
    std::vector<CompareRow> compare_rows_;
    std::string filter_;
    DisplayMode display_mode_;
    CompareMode compare_mode_ = CompareMode::Off;
    Viewport viewport_;
    std::optional<Status> status_message_;
};

}  // namespace taglens
