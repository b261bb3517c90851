//
//  tui.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "tui.hpp"

#include <curses.h>

#include <algorithm>
#include <clocale>
#include <cstdio>
#include <string>
#include <vector>

#include "logging.hpp"
#include "text_layout.hpp"
#include "view.hpp"

namespace taglens {

namespace {

constexpr int kHintRows = 2;
constexpr int kEscDelayMs = 25;
constexpr int kDialogRows = 8;
constexpr size_t kLongValueFactor = 5;
constexpr size_t kLongValueKeep = 3;

enum ColorPair : short {
    kPairWarning = 1,
    kPairError = 2,
    kPairBinary = 3,
    kPairHeader = 4,
    kPairHint = 5,
    kPairActiveColumn = 6,
    kPairOk = 7,
};

/// Owns curses for the lifetime of the UI loop.
class CursesScreen {
  public:
    CursesScreen() {
        set_log_deferred(true);
        std::setlocale(LC_ALL, "");
        initscr();
        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        curs_set(0);
        set_escdelay(kEscDelayMs);
#ifdef BUTTON5_PRESSED
        mousemask(BUTTON4_PRESSED | BUTTON5_PRESSED, nullptr);
#else
        mousemask(BUTTON4_PRESSED, nullptr);
#endif
        has_colors_ = has_colors();
        if (has_colors_) {
            start_color();
            use_default_colors();
            init_pair(kPairWarning, COLOR_YELLOW, -1);
            init_pair(kPairError, COLOR_RED, -1);
            init_pair(kPairBinary, COLOR_GREEN, -1);
            init_pair(kPairHeader, COLOR_BLACK, COLOR_WHITE);
            init_pair(kPairHint, COLOR_CYAN, -1);
            init_pair(kPairActiveColumn, COLOR_BLACK, COLOR_GREEN);
            init_pair(kPairOk, COLOR_GREEN, -1);
        }
    }

    ~CursesScreen() {
        endwin();
        set_log_deferred(false);
    }

    CursesScreen(const CursesScreen &) = delete;
    CursesScreen &operator=(const CursesScreen &) = delete;

    int color(short pair) const { return has_colors_ ? COLOR_PAIR(pair) : 0; }

  private:
    bool has_colors_ = false;
};

// ---------- Curses helpers ----------
void addstr_clip(WINDOW *win, int y, int x, const std::string &text, int attr = 0) {
    int max_y, max_x;
    getmaxyx(win, max_y, max_x);
    if (y < 0 || x < 0 || y >= max_y || x >= max_x) return;
    int n = std::max(0, max_x - x);
    if (n <= 0) return;
    if (attr) wattron(win, attr);
    mvwaddstr(win, y, x, fit_columns(text, static_cast<size_t>(n)).c_str());
    if (attr) wattroff(win, attr);
}

KeyEvent translate_key(int ch) {
    switch (ch) {
        case KEY_UP:
            return {Key::Up, 0};
        case KEY_DOWN:
            return {Key::Down, 0};
        case KEY_LEFT:
            return {Key::Left, 0};
        case KEY_RIGHT:
            return {Key::Right, 0};
        case KEY_PPAGE:
            return {Key::PageUp, 0};
        case KEY_NPAGE:
            return {Key::PageDown, 0};
        case KEY_HOME:
            return {Key::Home, 0};
        case KEY_END:
            return {Key::End, 0};
        case KEY_BTAB:
            return {Key::BackTab, 0};
        case KEY_ENTER:
        case '\n':
        case '\r':
            return {Key::Enter, 0};
        case KEY_BACKSPACE:
        case 127:
        case 8:
            return {Key::Backspace, 0};
        case '\t':
            return {Key::Tab, 0};
        case 27:
            return {Key::Esc, 0};
        case KEY_MOUSE: {
            MEVENT ev;
            if (getmouse(&ev) != OK) {
                return {};
            }
            if (ev.bstate & BUTTON4_PRESSED) {
                return {Key::WheelUp, 0};
            }
#ifdef BUTTON5_PRESSED
            if (ev.bstate & BUTTON5_PRESSED) {
                return {Key::WheelDown, 0};
            }
#endif
            return {};
        }
        default:
            break;
    }
    if (ch >= 32 && ch <= 126) {
        return char_key(static_cast<char>(ch));
    }
    return {};
}

/// Frame renderer; one instance per drawn frame.
class FrameRenderer {
  public:
    FrameRenderer(App &app, const CursesScreen &screen) : app_(app), screen_(screen) {
        getmaxyx(stdscr, rows_, cols_);
    }

    void draw() {
        erase();
        switch (app_.screen()) {
            case Screen::Main:
                draw_main();
                break;
            case Screen::Help:
                draw_help();
                break;
            case Screen::RecursivePrompt:
                draw_prompt();
                break;
        }
        draw_hints();
        refresh();
        if (app_.save_dialog()) {
            draw_save_dialog(*app_.save_dialog());
        }
    }

  private:
    int tag_attr(const TagEntry &entry) const {
        const std::string lowered = to_lower_copy(entry.short_name);
        if (lowered.find("warning") != std::string::npos) {
            return screen_.color(kPairWarning);
        }
        if (lowered.find("error") != std::string::npos) {
            return screen_.color(kPairError);
        }
        return 0;
    }

    void draw_main() {
        Session &s = app_.session();
        int top = 0;
        std::string title;
        if (s.compare_active()) {
            title = "Compare Mode";
        } else if (const FileEntrySet *file = s.active_file()) {
            title = clip_path_left(file->file.string(), static_cast<size_t>(cols_ - 2));
        }
        addstr_clip(stdscr, top, 0, pad_cell(" " + title, static_cast<size_t>(cols_)),
                    A_BOLD | screen_.color(kPairHeader));
        ++top;

        if (s.has_multiple_files() && !s.compare_active()) {
            draw_tabs(top);
            ++top;
        }
        if (!s.filter().empty() || app_.input_mode() == InputMode::Filter) {
            std::string line = " Filter: " + s.filter();
            if (app_.input_mode() == InputMode::Filter) {
                line += "_";
            }
            addstr_clip(stdscr, top, 0, line, A_BOLD);
            ++top;
        }

        const int list_rows = std::max(1, rows_ - kHintRows - top - 1);
        int list_cols = cols_;
        if (app_.show_details()) {
            list_cols = s.compare_active() ? cols_ * 3 / 4 : cols_ * 2 / 3;
        }
        app_.set_page_height(static_cast<size_t>(list_rows));
        s.begin_frame(static_cast<size_t>(list_rows));

        if (s.compare_active()) {
            draw_compare_list(top, list_rows, list_cols);
        } else {
            draw_single_list(top, list_rows, list_cols);
        }
        if (app_.show_details()) {
            draw_details(top, list_cols + 1, cols_ - list_cols - 1, rows_ - kHintRows - top);
        }
    }

    void draw_tabs(int y) {
        const Session &s = app_.session();
        const size_t n = s.file_count();
        const size_t tab_len = static_cast<size_t>(cols_) * 95 / 100 / n;
        if (tab_len < 6) {
            addstr_clip(stdscr, y, 0, "Too many files to show tabs, <TAB> can still be used",
                        screen_.color(kPairWarning));
            return;
        }
        for (size_t i = 0; i < n; ++i) {
            std::string name = clip_path_left(s.files()[i].file.string(), tab_len - 2);
            std::string tab = "|" + pad_cell(name, tab_len - 2) + "|";
            int attr = i == s.viewport().active_file_index ? (A_BOLD | A_REVERSE) : 0;
            addstr_clip(stdscr, y, static_cast<int>(i * tab_len), tab, attr);
        }
    }

    void draw_column_headers(int y, const std::vector<std::pair<std::string, int>> &columns,
                             const std::vector<int> &widths) {
        int x = 0;
        for (size_t i = 0; i < columns.size(); ++i) {
            addstr_clip(stdscr, y, x,
                        pad_cell(clip_cell(columns[i].first, static_cast<size_t>(widths[i]), 0),
                               static_cast<size_t>(widths[i])),
                        A_BOLD | A_UNDERLINE | columns[i].second);
            x += widths[i] + 1;
        }
    }

    std::string row_indicator() const {
        const auto &vp = app_.session().viewport();
        if (vp.visible_row_count == 0) {
            return " 0/0";
        }
        return " " + std::to_string(vp.cursor + 1) + "/" + std::to_string(vp.visible_row_count);
    }

    void draw_single_list(int top, int list_rows, int list_cols) {
        const Session &s = app_.session();
        const DisplayMode &mode = s.display_mode();
        const auto &vp = s.viewport();
        const int key_w = std::max(1, list_cols * 40 / 100);
        const int val_w = std::max(1, list_cols - key_w - 1);
        draw_column_headers(top,
                            {{std::string(mode.short_names ? "Tag [Short]" : "Tag [Detailed]") +
                                  row_indicator(),
                              0},
                             {mode.numeric ? "Value [Numerical]" : "Value [Readable]", 0}},
                            {key_w, val_w});

        auto view = s.single_view();
        for (int r = 0; r < list_rows; ++r) {
            const size_t i = vp.scroll_vertical + static_cast<size_t>(r);
            if (i >= view.size()) {
                break;
            }
            const TagEntry &entry = *view[i];
            int attr = tag_attr(entry);
            if (entry.binary_size_kb) {
                attr = screen_.color(kPairBinary);
            }
            if (i == vp.cursor) {
                attr |= A_REVERSE | A_BOLD;
            }
            const int y = top + 1 + r;
            addstr_clip(stdscr, y, 0,
                        pad_cell(clip_cell(entry_label(entry, mode), static_cast<size_t>(key_w),
                                         vp.scroll_horizontal),
                               static_cast<size_t>(key_w)),
                        attr);
            addstr_clip(stdscr, y, key_w + 1,
                        pad_cell(clip_cell(entry_cell(entry, mode), static_cast<size_t>(val_w),
                                         vp.scroll_horizontal),
                               static_cast<size_t>(val_w)),
                        attr);
        }
    }

    void draw_compare_list(int top, int list_rows, int list_cols) {
        const Session &s = app_.session();
        const DisplayMode &mode = s.display_mode();
        const auto &vp = s.viewport();
        const int n = static_cast<int>(s.file_count());
        // Tag column gets one share, every file column two.
        const int share = std::max(1, list_cols / (1 + 2 * n));
        std::vector<int> widths{share};
        std::vector<std::pair<std::string, int>> headers{
            {std::string(mode.short_names ? "Tag [Short]" : "Tag [Detailed]") + row_indicator(),
             0}};
        for (int f = 0; f < n; ++f) {
            const int w = std::max(1, 2 * share - 1);
            widths.push_back(w);
            const bool active = static_cast<size_t>(f) == vp.active_file_index;
            headers.emplace_back(
                clip_path_left(s.files()[static_cast<size_t>(f)].file.string(),
                               static_cast<size_t>(w)),
                active ? screen_.color(kPairActiveColumn) : 0);
        }
        draw_column_headers(top, headers, widths);

        auto view = s.compare_view();
        for (int r = 0; r < list_rows; ++r) {
            const size_t i = vp.scroll_vertical + static_cast<size_t>(r);
            if (i >= view.size()) {
                break;
            }
            const CompareRow &row = *view[i];
            int attr = tag_attr(row.representative);
            for (const auto &slot : row.per_file) {
                if (slot && slot->binary_size_kb) {
                    attr = screen_.color(kPairBinary);
                }
            }
            if (i == vp.cursor) {
                attr |= A_REVERSE | A_BOLD;
            }
            const int y = top + 1 + r;
            int x = 0;
            addstr_clip(stdscr, y, x,
                        pad_cell(clip_cell(entry_label(row.representative, mode),
                                         static_cast<size_t>(widths[0]), vp.scroll_horizontal),
                               static_cast<size_t>(widths[0])),
                        attr);
            x += widths[0] + 1;
            for (size_t f = 0; f < row.per_file.size(); ++f) {
                const auto &slot = row.per_file[f];
                const size_t w = static_cast<size_t>(widths[f + 1]);
                std::string cell = slot ? entry_cell(*slot, mode) : std::string();
                addstr_clip(stdscr, y, x, pad_cell(clip_cell(cell, w, vp.scroll_horizontal), w),
                            attr);
                x += widths[f + 1] + 1;
            }
        }
    }

    // Wraps `text` into lines of `width`, cutting very long values short.
    static std::vector<std::string> wrap_value(const std::string &label, const std::string &value,
                                               size_t width, const char *copy_key) {
        std::string text = label + value;
        if (width > 0 && display_width(value) > width * kLongValueFactor) {
            text = label + fit_columns(value, width * kLongValueKeep) +
                   "... value too long, press <" + copy_key + "> to copy";
        }
        std::vector<std::string> out;
        while (!text.empty() && width > 0) {
            std::string line = fit_columns(text, width);
            if (line.empty()) {
                // a double-width character in a one-column pane
                line = fit_columns(text, 2);
                if (line.empty()) {
                    break;
                }
            }
            out.push_back(line);
            text.erase(0, line.size());
        }
        return out;
    }

    void draw_details(int top, int x, int width, int height) {
        const TagEntry *entry = app_.session().selected_entry();
        if (!entry || width <= 2 || height <= 0) {
            return;
        }
        const size_t w = static_cast<size_t>(width - 1);
        std::vector<std::pair<std::string, int>> lines;
        auto add = [&](const std::vector<std::string> &parts, int attr) {
            for (const auto &p : parts) {
                lines.emplace_back(p, attr);
            }
        };
        lines.emplace_back(clip_cell("Details [" + entry->short_name + "]", w, 0), A_BOLD);
        add(wrap_value("Detailed name: ", entry->display_name, w, "C"), 0);
        std::string id = "[Unknown]";
        if (entry->id) {
            char hex[32];
            std::snprintf(hex, sizeof(hex), " (0x%llX)",
                          static_cast<unsigned long long>(*entry->id));
            id = std::to_string(*entry->id) + hex;
        }
        add(wrap_value("Tag ID: ", id, w, "C"), 0);
        add(wrap_value("Tag family: ", entry->table_string(), w, "C"), 0);
        lines.emplace_back("<F> - filter by tag family", screen_.color(kPairWarning));
        add(wrap_value("Value: ", entry->value.to_string(), w, "x"), 0);
        add(wrap_value("Numerical value: ", entry->numeric_or_value().to_string(), w, "X"), 0);
        if (entry->ordinal_index) {
            lines.emplace_back("Index: " + std::to_string(*entry->ordinal_index), 0);
        }
        lines.emplace_back("", 0);
        lines.emplace_back("<C> - copy entry to clipboard", screen_.color(kPairWarning));
        if (entry->binary_size_kb) {
            lines.emplace_back("<b> - extract binary data", screen_.color(kPairWarning));
        }
        for (int r = 0; r < height; ++r) {
            addstr_clip(stdscr, top + r, x - 1, "|");
        }
        for (size_t i = 0; i < lines.size() && static_cast<int>(i) < height; ++i) {
            addstr_clip(stdscr, top + static_cast<int>(i), x, lines[i].first, lines[i].second);
        }
    }

    void draw_hints() {
        const int y = rows_ - kHintRows;
        if (auto status = app_.session().take_status()) {
            addstr_clip(stdscr, y, 1, status->message,
                        A_BOLD | screen_.color(status->ok ? kPairOk : kPairError));
            return;
        }
        std::vector<std::string> hints;
        switch (app_.screen()) {
            case Screen::Main:
                if (app_.input_mode() == InputMode::Filter) {
                    hints = {"Filtering by tags and values. <<family>> filters by tag family.",
                             "<ENTER> - apply  <ESC> - discard"};
                } else if (app_.input_mode() == InputMode::SaveDialog) {
                    hints = {"<ENTER> - save  <ESC> - discard  <TAB> - switch focus"};
                } else {
                    hints = {"<UP/DOWN/LEFT/RIGHT/WHEEL> - scroll  <f> - filter  <ENTER> - details",
                             "<h> - help  <q> - quit"};
                }
                break;
            case Screen::Help:
                hints = {"<ENTER/ESC/q> - go back"};
                break;
            case Screen::RecursivePrompt:
                hints = {"<q> - quit"};
                break;
        }
        for (size_t i = 0; i < hints.size(); ++i) {
            addstr_clip(stdscr, y + static_cast<int>(i), 1, hints[i], screen_.color(kPairHint));
        }
    }

    void draw_help() {
        static const std::vector<std::string> kLines = {
            "General controls",
            "<UP/DOWN/LEFT/RIGHT/WHEEL/SPACE> - scroll   <f> - filter by tags/values",
            "<PGUP/PGDN/HOME/END> - page / jump          <ENTER> - toggle details",
            "<s> - toggle short tag names                <n> - toggle numerical values",
            "<b> - save binary data from tag             <h> - show this text",
            "<q> - quit",
            "",
            "Extra controls",
            "<x> - copy tag value to clipboard   <X> - copy numerical value to clipboard",
            "<C> - copy all entry data to clipboard",
            "<F> - filter by current tag's group (family)",
            "<w> - open a web page with this tag's family's information",
            "",
            "Multiple files extra controls",
            "<TAB> - next tab                    <SHIFT+TAB> - previous tab",
            "<W> - close current tab (outside compare mode)",
            "<c> - toggle side-by-side compare mode",
            "<d> - while in compare mode, show only lines that differ",
            "",
            "You can still change tabs while in side-by-side compare mode;",
            "this controls what details are shown and what data is copied or extracted.",
        };
        addstr_clip(stdscr, 0, 0, pad_cell(" Help", static_cast<size_t>(cols_)),
                    A_BOLD | screen_.color(kPairHeader));
        for (size_t i = 0; i < kLines.size(); ++i) {
            const bool heading = i == 0 || kLines[i] == "Extra controls" ||
                                 kLines[i] == "Multiple files extra controls";
            addstr_clip(stdscr, static_cast<int>(i) + 2, 2, kLines[i], heading ? A_BOLD : 0);
        }
    }

    void draw_prompt() {
        const std::string question =
            "You provided one or more folders as input. Read them recursively?";
        const int y = std::max(1, rows_ / 3);
        auto centered = [this](const std::string &s) {
            return std::max(0, (cols_ - static_cast<int>(display_width(s))) / 2);
        };
        addstr_clip(stdscr, y, centered(question), question, A_BOLD);
        const std::string yes = "<y/ENTER>   YES";
        const std::string no = "<n/ESC>     NO ";
        addstr_clip(stdscr, y + 2, centered(yes), yes, A_BOLD | screen_.color(kPairOk));
        addstr_clip(stdscr, y + 3, centered(no), no, A_BOLD | screen_.color(kPairError));
    }

    void draw_save_dialog(const SaveDialog &dialog) {
        const int width = std::max(20, cols_ * 60 / 100);
        const int y = std::max(0, (rows_ - kDialogRows) / 2);
        const int x = std::max(0, (cols_ - width) / 2);
        WINDOW *popup = newwin(kDialogRows, width, y, x);
        if (!popup) {
            return;
        }
        box(popup, 0, 0);
        const std::string title = " Save binary data ";
        addstr_clip(popup, 0, std::max(1, (width - static_cast<int>(title.size())) / 2), title,
                    A_BOLD);
        const size_t field_w = static_cast<size_t>(width - 16);
        std::string name = dialog.name + (dialog.editing_name ? "_" : "");
        std::string ext = dialog.extension + (dialog.editing_name ? "" : "_");
        addstr_clip(popup, 2, 2, "File name: ", dialog.editing_name ? A_BOLD : 0);
        addstr_clip(popup, 2, 13, clip_path_left(name, field_w),
                    dialog.editing_name ? A_UNDERLINE : 0);
        addstr_clip(popup, 3, 2, "Extension: ", dialog.editing_name ? 0 : A_BOLD);
        addstr_clip(popup, 3, 13, clip_path_left(ext, field_w),
                    dialog.editing_name ? 0 : A_UNDERLINE);
        addstr_clip(popup, 5, 2, clip_cell(dialog.status.message, static_cast<size_t>(width - 4), 0),
                    dialog.status.ok ? 0 : screen_.color(kPairError));
        addstr_clip(popup, 6, 2, "<ENTER> - save  <ESC> - discard  <TAB> - switch focus");
        wrefresh(popup);
        delwin(popup);
    }

    App &app_;
    const CursesScreen &screen_;
    int rows_ = 0;
    int cols_ = 0;
};

}  // namespace

void run_tui(App &app) {
    CursesScreen screen;
    while (true) {
        FrameRenderer(app, screen).draw();
        int ch = getch();
        if (ch == KEY_RESIZE || ch == ERR) {
            continue;
        }
        if (app.handle_key(translate_key(ch))) {
            break;
        }
    }
}

}  // namespace taglens
