//
//  app.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "config.hpp"
#include "metadata_source.hpp"
#include "session.hpp"
#include "status.hpp"

namespace taglens {

enum class Screen { Main, Help, RecursivePrompt };

enum class InputMode { Browse, Filter, SaveDialog };

enum class Key {
    Char,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Esc,
    Backspace,
    Tab,
    BackTab,
    PageUp,
    PageDown,
    Home,
    End,
    WheelUp,
    WheelDown,
    Unknown,
};

/// Terminal-independent input event; `ch` is only meaningful for Key::Char.
struct KeyEvent {
    Key key = Key::Unknown;
    char ch = 0;
};

inline KeyEvent char_key(char c) { return KeyEvent{Key::Char, c}; }

struct SaveDialog {
    std::string name;
    std::string extension = "jpeg";
    Status status;
    bool editing_name = true;
};

/// Side effects the controller triggers outside the process.
struct DesktopActions {
    std::function<Status(const std::string &)> copy_text;
    std::function<Status(const std::string &)> open_url;
};

DesktopActions system_desktop_actions();

/**
 * @brief Maps input events onto the session; owns screen, input mode and dialog state.
 *
 * Rendering reads this state; nothing here touches the terminal.
 */
class App {
  public:
    App(Options options, MetadataSource &source, DesktopActions desktop);

    // Loads the inputs, or switches to the recursion prompt when a directory input has
    // sub-directories and no --recursive/--no-recursive was given.
    LoadResult start();

    // Returns true when the application should exit.
    bool handle_key(const KeyEvent &event);

    // Rows of the list area in the last drawn frame; used for page movement.
    void set_page_height(size_t rows) { page_height_ = rows; }
    size_t page_height() const { return page_height_; }

    Screen screen() const { return screen_; }
    InputMode input_mode() const { return input_mode_; }
    bool show_details() const { return show_details_; }
    const std::optional<SaveDialog> &save_dialog() const { return save_dialog_; }
    const Options &options() const { return options_; }
    // Set when a load triggered from the prompt screen failed; the caller exits.
    const std::optional<LoadResult> &fatal_load() const { return fatal_load_; }

    Session &session() { return session_; }
    const Session &session() const { return session_; }

  private:
    LoadResult load(bool recursive);
    bool handle_browse(const KeyEvent &event);
    void handle_filter(const KeyEvent &event);
    void handle_save_dialog(const KeyEvent &event);
    bool handle_prompt(const KeyEvent &event);
    void copy(const std::string &text, const char *what);
    void open_save_dialog();

    Options options_;
    MetadataSource &source_;
    DesktopActions desktop_;
    Session session_;
    Screen screen_ = Screen::Main;
    InputMode input_mode_ = InputMode::Browse;
    bool show_details_ = false;
    std::optional<SaveDialog> save_dialog_;
    std::optional<LoadResult> fatal_load_;
    size_t page_height_ = 1;
};

}  // namespace taglens
