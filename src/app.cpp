//
//  app.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "app.hpp"

#include <limits>
#include <utility>

#include "desktop.hpp"
#include "logging.hpp"

namespace taglens {

namespace {

constexpr long kSpaceDragRows = 4;
constexpr long kWheelRows = 1;

}  // namespace

DesktopActions system_desktop_actions() {
    return DesktopActions{copy_to_clipboard, open_in_browser};
}

App::App(Options options, MetadataSource &source, DesktopActions desktop)
    : options_(std::move(options)), source_(source), desktop_(std::move(desktop)) {}

LoadResult App::start() {
    if (!options_.recursive && inputs_need_recursion_choice(options_.inputs)) {
        TL_LOG("info", "directory input with sub-directories; asking about recursion");
        screen_ = Screen::RecursivePrompt;
        LoadResult pending;
        pending.code = LoadCode::Ok;
        return pending;
    }
    return load(options_.recursive.value_or(false));
}

LoadResult App::load(bool recursive) {
    LoadResult res = session_.load(source_, options_.inputs, recursive);
    if (res.code == LoadCode::Partial) {
        session_.post_status(make_status(false, "Some records could not be read: " + res.message));
    }
    return res;
}

bool App::handle_key(const KeyEvent &event) {
    switch (screen_) {
        case Screen::RecursivePrompt:
            return handle_prompt(event);
        case Screen::Help:
            if (event.key == Key::Esc || event.key == Key::Enter ||
                (event.key == Key::Char && event.ch == 'q')) {
                screen_ = Screen::Main;
                input_mode_ = InputMode::Browse;
            }
            return false;
        case Screen::Main:
            break;
    }
    switch (input_mode_) {
        case InputMode::Browse:
            return handle_browse(event);
        case InputMode::Filter:
            handle_filter(event);
            return false;
        case InputMode::SaveDialog:
            handle_save_dialog(event);
            return false;
    }
    return false;
}

bool App::handle_prompt(const KeyEvent &event) {
    std::optional<bool> recursive;
    if (event.key == Key::Char && event.ch == 'q') {
        return true;
    }
    if (event.key == Key::Enter || (event.key == Key::Char && event.ch == 'y')) {
        recursive = true;
    } else if (event.key == Key::Esc || (event.key == Key::Char && event.ch == 'n')) {
        recursive = false;
    }
    if (!recursive) {
        return false;
    }
    LoadResult res = load(*recursive);
    if (!res.usable()) {
        fatal_load_ = std::move(res);
        return true;
    }
    screen_ = Screen::Main;
    input_mode_ = InputMode::Browse;
    return false;
}

bool App::handle_browse(const KeyEvent &event) {
    Session &s = session_;
    const long page = static_cast<long>(page_height_ > 1 ? page_height_ - 1 : 1);
    switch (event.key) {
        case Key::Up:
            s.move_cursor(-1);
            return false;
        case Key::Down:
            s.move_cursor(1);
            return false;
        case Key::Left:
            s.scroll_horizontal(-1);
            return false;
        case Key::Right:
            s.scroll_horizontal(1);
            return false;
        case Key::PageUp:
            s.drag(-page);
            return false;
        case Key::PageDown:
            s.drag(page);
            return false;
        case Key::Home:
            s.move_cursor(std::numeric_limits<long>::min());
            return false;
        case Key::End:
            s.move_cursor(std::numeric_limits<long>::max());
            return false;
        case Key::WheelUp:
            s.drag(-kWheelRows);
            return false;
        case Key::WheelDown:
            s.drag(kWheelRows);
            return false;
        case Key::Enter:
            show_details_ = !show_details_;
            return false;
        case Key::Esc:
            show_details_ = false;
            return false;
        case Key::Tab:
            s.next_file();
            return false;
        case Key::BackTab:
            s.prev_file();
            return false;
        case Key::Char:
            break;
        default:
            return false;
    }

    const TagEntry *selected = s.selected_entry();
    switch (event.ch) {
        case 'q':
            return true;
        case ' ':
            s.drag(kSpaceDragRows);
            break;
        case 's':
            s.toggle_short_names();
            break;
        case 'n':
            s.toggle_numeric();
            break;
        case 'f':
            input_mode_ = InputMode::Filter;
            s.reset_position();
            break;
        case 'F':
            s.apply_family_filter();
            break;
        case 'h':
            screen_ = Screen::Help;
            break;
        case 'w':
            if (selected) {
                auto st = desktop_.open_url(tag_reference_url(*selected));
                if (!st.ok) {
                    s.post_status(st);
                }
            }
            break;
        case 'x':
            if (selected) {
                copy(selected->value.to_string(), "value");
            }
            break;
        case 'X':
            if (selected) {
                copy(selected->numeric_or_value().to_string(), "numerical value");
            }
            break;
        case 'C':
            if (selected) {
                copy(selected->render(), "entry data");
            }
            break;
        case 'b':
            if (selected && selected->binary_size_kb) {
                open_save_dialog();
            } else {
                s.post_status(
                    make_status(false, "Selected entry does not contain any binary data!"));
            }
            break;
        case 'W':
            s.remove_active_file();
            break;
        case 'c':
            s.toggle_compare();
            break;
        case 'd':
            s.toggle_diff_only();
            break;
        default:
            break;
    }
    return false;
}

void App::handle_filter(const KeyEvent &event) {
    switch (event.key) {
        case Key::Char:
            session_.append_filter(event.ch);
            break;
        case Key::Backspace:
            session_.pop_filter();
            break;
        case Key::Enter:
            input_mode_ = InputMode::Browse;
            break;
        case Key::Esc:
            input_mode_ = InputMode::Browse;
            session_.clear_filter();
            break;
        default:
            break;
    }
}

void App::open_save_dialog() {
    SaveDialog dialog;
    dialog.status = make_status(
        true, "File will be saved in " + options_.save_dir.string() + ". You probably want a .jpeg.");
    save_dialog_ = std::move(dialog);
    input_mode_ = InputMode::SaveDialog;
}

void App::handle_save_dialog(const KeyEvent &event) {
    if (!save_dialog_) {
        input_mode_ = InputMode::Browse;
        return;
    }
    SaveDialog &d = *save_dialog_;
    std::string &field = d.editing_name ? d.name : d.extension;
    switch (event.key) {
        case Key::Char:
            field.push_back(event.ch);
            break;
        case Key::Backspace:
            if (!field.empty()) {
                field.pop_back();
            }
            break;
        case Key::Tab:
        case Key::BackTab:
            d.editing_name = !d.editing_name;
            break;
        case Key::Enter: {
            Status st = session_.save_binary(SaveRequest{d.name, d.extension}, options_.save_dir,
                                             source_);
            if (!st.ok) {
                d.status = std::move(st);
                break;
            }
            session_.post_status(std::move(st));
            save_dialog_.reset();
            input_mode_ = InputMode::Browse;
            break;
        }
        case Key::Esc:
            save_dialog_.reset();
            input_mode_ = InputMode::Browse;
            break;
        default:
            break;
    }
}

void App::copy(const std::string &text, const char *what) {
    Status st = desktop_.copy_text(text);
    if (st.ok) {
        session_.post_status(make_status(true, std::string("Successfully copied ") + what +
                                                   " to clipboard"));
    } else {
        session_.post_status(std::move(st));
    }
}

}  // namespace taglens
