// Unit coverage for cursor clamping, scroll following and active-file bookkeeping.
#include <iostream>
#include <limits>
#include <string>

#include "viewport.hpp"

using taglens::Viewport;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[viewport_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_cursor_clamp() {
    Viewport v;
    v.set_visible_rows(10);
    v.move_cursor(3);
    bool ok = check(v.state().cursor == 3, "move down");
    v.move_cursor(-1);
    ok &= check(v.state().cursor == 2, "move up");
    v.move_cursor(100);
    ok &= check(v.state().cursor == 9, "clamped to last row");
    v.move_cursor(std::numeric_limits<long>::max());
    ok &= check(v.state().cursor == 9, "huge positive delta saturates");
    v.move_cursor(std::numeric_limits<long>::min());
    ok &= check(v.state().cursor == 0, "huge negative delta saturates at zero");
    v.move_cursor(-1);
    ok &= check(v.state().cursor == 0, "cannot move above the first row");

    v.move_cursor(8);
    v.set_visible_rows(4);
    ok &= check(v.state().cursor == 3, "shrinking the list pulls the cursor back");
    v.set_visible_rows(0);
    ok &= check(v.state().cursor == 0, "empty list puts the cursor at zero");
    v.move_cursor(5);
    ok &= check(v.state().cursor == 0, "moving in an empty list is a no-op");
    return ok;
}

bool test_follow_cursor() {
    Viewport v;
    v.set_visible_rows(50);
    v.move_cursor(49);
    v.follow_cursor(10);
    bool ok = check(v.state().scroll_vertical == 40, "cursor 49 in height 10 scrolls to 40");

    v.move_cursor(-49);
    v.follow_cursor(10);
    ok &= check(v.state().scroll_vertical == 0, "scrolling back up follows the cursor");

    v.move_cursor(12);
    v.follow_cursor(10);
    ok &= check(v.state().scroll_vertical == 3, "cursor just below the window");
    ok &= check(v.state().cursor >= v.state().scroll_vertical &&
                    v.state().cursor < v.state().scroll_vertical + 10,
                "cursor inside the window");

    v.follow_cursor(0);
    ok &= check(v.state().scroll_vertical == v.state().cursor, "zero height acts as one row");
    return ok;
}

bool test_bottom_margin() {
    Viewport v;
    v.set_visible_rows(20);
    v.drag(30);
    bool ok = check(v.state().cursor == 19, "drag moves the cursor with the list");
    v.follow_cursor(10);
    ok &= check(v.state().scroll_vertical == 15, "scroll limited by the bottom margin");
    ok &= check(v.state().cursor < v.state().scroll_vertical + 10, "cursor stays visible");

    // Window taller than the margin allows: the cursor still wins.
    Viewport tall;
    tall.set_visible_rows(20);
    tall.move_cursor(19);
    tall.follow_cursor(3);
    ok &= check(tall.state().scroll_vertical == 17, "margin never hides the cursor");
    return ok;
}

bool test_horizontal_and_reset() {
    Viewport v;
    v.scroll_horizontal(-4);
    bool ok = check(v.state().scroll_horizontal == 0, "horizontal scroll saturates at zero");
    v.scroll_horizontal(7);
    ok &= check(v.state().scroll_horizontal == 7, "horizontal scroll grows");
    v.set_visible_rows(10);
    v.move_cursor(5);
    v.set_active_file(1, 3);
    v.reset_position();
    ok &= check(v.state().cursor == 0 && v.state().scroll_vertical == 0 &&
                    v.state().scroll_horizontal == 0,
                "reset clears cursor and scrolls");
    ok &= check(v.state().active_file_index == 1, "reset keeps the active file");
    return ok;
}

bool test_file_switching() {
    Viewport v;
    bool ok = check(!v.next_file(1), "single file never switches");
    ok &= check(v.state().active_file_index == 0, "single file stays at zero");
    ok &= check(v.next_file(3) && v.state().active_file_index == 1, "next file");
    v.next_file(3);
    v.next_file(3);
    ok &= check(v.state().active_file_index == 0, "next wraps around");
    v.prev_file(3);
    ok &= check(v.state().active_file_index == 2, "prev wraps around");
    v.set_active_file(9, 3);
    ok &= check(v.state().active_file_index == 2, "set_active_file clamps");
    return ok;
}

bool test_file_removal() {
    Viewport v;
    v.set_active_file(2, 3);
    v.on_file_removed(2, 2);
    bool ok = check(v.state().active_file_index == 1, "removing the last active file");

    v.set_active_file(0, 3);
    v.on_file_removed(0, 2);
    ok &= check(v.state().active_file_index == 0, "removing the first file stays at zero");

    v.set_active_file(2, 4);
    v.on_file_removed(1, 3);
    ok &= check(v.state().active_file_index == 1, "removing an earlier file shifts down");

    v.set_active_file(1, 4);
    v.on_file_removed(3, 3);
    ok &= check(v.state().active_file_index == 1, "removing a later file keeps the index");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_cursor_clamp();
    ok &= test_follow_cursor();
    ok &= test_bottom_margin();
    ok &= test_horizontal_and_reset();
    ok &= test_file_switching();
    ok &= test_file_removal();
    if (!ok) {
        return 1;
    }
    std::cout << "[viewport_unit] OK\n";
    return 0;
}
