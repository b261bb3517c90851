// Key handling of the controller with a scripted metadata source and recorded desktop actions.
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "app.hpp"
#include "test_utils.hpp"

using taglens::App;
using taglens::InputMode;
using taglens::Key;
using taglens::KeyEvent;
using taglens::LoadCode;
using taglens::Screen;
using taglens::char_key;
using test_utils::make_entry;
using test_utils::make_file;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[app_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

struct Recorder {
    std::vector<std::string> copied;
    std::vector<std::string> opened;
    bool clipboard_works = true;
};

taglens::DesktopActions recording_actions(Recorder &rec) {
    taglens::DesktopActions actions;
    actions.copy_text = [&rec](const std::string &text) {
        if (!rec.clipboard_works) {
            return taglens::make_status(false, "no clipboard");
        }
        rec.copied.push_back(text);
        return taglens::make_status(true);
    };
    actions.open_url = [&rec](const std::string &url) {
        rec.opened.push_back(url);
        return taglens::make_status(true);
    };
    return actions;
}

taglens::Options options_for(const std::filesystem::path &save_dir) {
    taglens::Options o;
    o.inputs = {"photos"};
    o.recursive = false;
    o.save_dir = save_dir;
    return o;
}

std::vector<taglens::FileEntrySet> two_files() {
    taglens::TagEntry make = make_entry("Make", "Canon", "Exif", "IFD0");
    make.display_name = "Camera Make";
    make.numeric_value = taglens::TagValue(std::string("canon-numeric"));
    return {
        make_file("r5.jpg", {make, make_entry("Model", "R5", "Exif", "IFD0"),
                             test_utils::make_binary_entry("ThumbnailImage", 4.0f)}),
        make_file("r6.jpg", {make_entry("Make", "Canon", "Exif", "IFD0"),
                             make_entry("Model", "R6", "Exif", "IFD0")}),
    };
}

void type_text(App &app, const std::string &text) {
    for (char c : text) {
        app.handle_key(char_key(c));
    }
}

bool test_navigation_and_modes() {
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    Recorder rec;
    App app(options_for("."), source, recording_actions(rec));
    bool ok = check(app.start().code == LoadCode::Ok, "start loads");
    ok &= check(source.load_calls == 1 && !source.last_recursive, "non-recursive load");

    auto &s = app.session();
    app.handle_key(KeyEvent{Key::Down, 0});
    ok &= check(s.viewport().cursor == 1, "down moves the cursor");
    app.handle_key(KeyEvent{Key::End, 0});
    ok &= check(s.viewport().cursor == 2, "end jumps to the last row");
    app.handle_key(KeyEvent{Key::Home, 0});
    ok &= check(s.viewport().cursor == 0, "home jumps to the first row");
    app.handle_key(KeyEvent{Key::Right, 0});
    ok &= check(s.viewport().scroll_horizontal == 1, "right scrolls horizontally");

    app.handle_key(KeyEvent{Key::Enter, 0});
    ok &= check(app.show_details(), "enter opens details");
    app.handle_key(KeyEvent{Key::Esc, 0});
    ok &= check(!app.show_details(), "esc closes details");

    app.handle_key(char_key('s'));
    ok &= check(s.display_mode().short_names, "s toggles short names");
    app.handle_key(char_key('n'));
    ok &= check(s.display_mode().numeric, "n toggles numeric values");

    app.handle_key(KeyEvent{Key::Tab, 0});
    ok &= check(s.viewport().active_file_index == 1, "tab switches file");
    app.handle_key(KeyEvent{Key::BackTab, 0});
    ok &= check(s.viewport().active_file_index == 0, "backtab switches back");

    app.handle_key(char_key('c'));
    ok &= check(s.compare_active(), "c enters compare mode");
    app.handle_key(char_key('d'));
    ok &= check(s.compare_mode() == taglens::CompareMode::DiffOnly, "d shows differences only");
    ok &= check(s.compare_view().size() == 2, "Model and ThumbnailImage differ");
    app.handle_key(char_key('c'));
    ok &= check(!s.compare_active(), "c leaves compare mode");

    app.handle_key(char_key('h'));
    ok &= check(app.screen() == Screen::Help, "h opens help");
    ok &= check(!app.handle_key(char_key('q')), "q on help only closes help");
    ok &= check(app.screen() == Screen::Main, "back on the main screen");
    ok &= check(app.handle_key(char_key('q')), "q quits from the main screen");
    return ok;
}

bool test_filter_mode() {
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    Recorder rec;
    App app(options_for("."), source, recording_actions(rec));
    app.start();
    auto &s = app.session();

    app.handle_key(KeyEvent{Key::Down, 0});
    app.handle_key(char_key('f'));
    bool ok = check(app.input_mode() == InputMode::Filter, "f enters filter mode");
    ok &= check(s.viewport().cursor == 0, "entering filter mode resets the cursor");
    type_text(app, "modq");
    ok &= check(s.filter() == "modq", "typed characters, q included, go to the filter");
    app.handle_key(KeyEvent{Key::Backspace, 0});
    ok &= check(s.filter() == "mod" && s.single_view().size() == 1, "backspace edits the filter");
    app.handle_key(KeyEvent{Key::Enter, 0});
    ok &= check(app.input_mode() == InputMode::Browse && s.filter() == "mod",
                "enter keeps the filter");

    app.handle_key(char_key('f'));
    app.handle_key(KeyEvent{Key::Esc, 0});
    ok &= check(app.input_mode() == InputMode::Browse && s.filter().empty(),
                "esc clears the filter");

    app.handle_key(char_key('F'));
    ok &= check(s.filter() == "<<Exif::IFD0>>", "F filters by the selected family");
    return ok;
}

bool test_clipboard_and_url() {
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    Recorder rec;
    App app(options_for("."), source, recording_actions(rec));
    app.start();
    auto &s = app.session();

    app.handle_key(char_key('x'));
    bool ok = check(rec.copied.size() == 1 && rec.copied.back() == "Canon", "x copies the value");
    auto st = s.take_status();
    ok &= check(st && st->ok && st->message == "Successfully copied value to clipboard",
                "copy status posted");
    app.handle_key(char_key('X'));
    ok &= check(rec.copied.back() == "canon-numeric", "X copies the numeric value");
    app.handle_key(char_key('C'));
    ok &= check(rec.copied.back().rfind("Name: Camera Make\n", 0) == 0, "C copies entry data");

    rec.clipboard_works = false;
    s.take_status();
    app.handle_key(char_key('x'));
    st = s.take_status();
    ok &= check(st && !st->ok, "clipboard failure reported");

    app.handle_key(char_key('w'));
    ok &= check(rec.opened.size() == 1 &&
                    rec.opened.back() == "https://exiftool.org/TagNames/EXIF.html",
                "w opens the tag reference");
    return ok;
}

bool test_save_dialog() {
    test_utils::TempDir dir("taglens_app_unit");
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    source.payloads["ThumbnailImage"] = {1, 2, 3};
    Recorder rec;
    App app(options_for(dir.path()), source, recording_actions(rec));
    app.start();
    auto &s = app.session();

    app.handle_key(char_key('b'));
    bool ok = check(app.input_mode() == InputMode::Browse, "b refused on a plain field");
    auto st = s.take_status();
    ok &= check(st && st->message == "Selected entry does not contain any binary data!",
                "refusal explained");

    app.handle_key(KeyEvent{Key::End, 0});
    app.handle_key(char_key('b'));
    ok &= check(app.input_mode() == InputMode::SaveDialog && app.save_dialog(),
                "b opens the save dialog");
    app.handle_key(KeyEvent{Key::Enter, 0});
    ok &= check(app.save_dialog() && app.save_dialog()->status.message == "Please enter a name.",
                "empty name keeps the dialog open");

    type_text(app, "thumb");
    app.handle_key(KeyEvent{Key::Tab, 0});
    for (int i = 0; i < 4; ++i) {
        app.handle_key(KeyEvent{Key::Backspace, 0});
    }
    type_text(app, "bin");
    ok &= check(app.save_dialog()->name == "thumb" && app.save_dialog()->extension == "bin",
                "tab switches between name and extension");
    app.handle_key(KeyEvent{Key::Enter, 0});
    ok &= check(!app.save_dialog() && app.input_mode() == InputMode::Browse,
                "successful save closes the dialog");
    ok &= check(std::filesystem::exists(dir.path() / "thumb.bin"), "payload saved");
    st = s.take_status();
    ok &= check(st && st->ok, "success posted to the status bar");

    app.handle_key(char_key('b'));
    app.handle_key(KeyEvent{Key::Esc, 0});
    ok &= check(!app.save_dialog(), "esc cancels the dialog");
    return ok;
}

bool test_remove_file_key() {
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    Recorder rec;
    App app(options_for("."), source, recording_actions(rec));
    app.start();
    app.handle_key(char_key('W'));
    bool ok = check(app.session().file_count() == 1, "W drops the active file");
    ok &= check(app.session().active_file()->file == "r6.jpg", "remaining file becomes active");
    app.handle_key(char_key('W'));
    ok &= check(app.session().file_count() == 1, "last file is never dropped");
    return ok;
}

bool test_recursion_prompt() {
    test_utils::TempDir dir("taglens_app_prompt");
    std::filesystem::create_directories(dir.path() / "nested");
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    Recorder rec;

    taglens::Options o;
    o.inputs = {dir.path()};
    o.save_dir = dir.path();
    App app(o, source, recording_actions(rec));
    auto res = app.start();
    bool ok = check(res.usable() && app.screen() == Screen::RecursivePrompt,
                    "directory with sub-directories asks first");
    ok &= check(source.load_calls == 0, "nothing loaded before the answer");
    ok &= check(!app.handle_key(char_key('x')), "unrelated keys are ignored");
    ok &= check(!app.handle_key(char_key('y')), "y answers the prompt");
    ok &= check(source.load_calls == 1 && source.last_recursive, "recursive load after y");
    ok &= check(app.screen() == Screen::Main, "main screen after loading");

    App refused(o, source, recording_actions(rec));
    refused.start();
    source.result = taglens::LoadResult{};
    source.result.code = LoadCode::NoData;
    ok &= check(refused.handle_key(KeyEvent{Key::Esc, 0}), "failed load quits");
    ok &= check(!source.last_recursive, "esc loads without recursion");
    ok &= check(refused.fatal_load() && refused.fatal_load()->code == LoadCode::NoData,
                "failure kept for the caller");
    return ok;
}

bool test_partial_load_status() {
    test_utils::FakeSource source;
    source.result = test_utils::ok_result(two_files());
    source.result.code = LoadCode::Partial;
    source.result.message = "skipped 1 malformed record(s)";
    Recorder rec;
    App app(options_for("."), source, recording_actions(rec));
    bool ok = check(app.start().usable(), "partial load is usable");
    auto st = app.session().take_status();
    ok &= check(st && !st->ok, "partial load reported in the status bar");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_navigation_and_modes();
    ok &= test_filter_mode();
    ok &= test_clipboard_and_url();
    ok &= test_save_dialog();
    ok &= test_remove_file_key();
    ok &= test_recursion_prompt();
    ok &= test_partial_load_status();
    if (!ok) {
        return 1;
    }
    std::cout << "[app_unit] OK\n";
    return 0;
}
