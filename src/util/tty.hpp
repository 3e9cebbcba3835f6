#pragma once

namespace revdiff {

// Size of the controlling terminal. Returns false when it can't be
// determined (output is not a terminal and LINES/COLUMNS are unset).
bool
tty_get_term_size(int* rows, int* cols);

// Whether stdout is a terminal that understands ANSI colors.
bool
tty_supports_color();

}  // namespace revdiff
