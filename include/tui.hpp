//
//  tui.hpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#pragma once

#include "app.hpp"

namespace taglens {

// Runs the curses event loop until the user quits. Log output is deferred while the screen is
// owned by curses and flushed afterwards.
void run_tui(App &app);

}  // namespace taglens
