#include "util/tty.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef REVDIFF_PLATFORM_POSIX
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

using namespace revdiff;

bool
revdiff::tty_get_term_size(int* rows, int* cols) {
#ifdef REVDIFF_PLATFORM_POSIX
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_row > 0) {
        *rows = w.ws_row;
        *cols = w.ws_col;
        return true;
    }

    auto term_fd = open(ctermid(nullptr), O_RDONLY);
    if (term_fd >= 0) {
        const bool ok = ioctl(term_fd, TIOCGWINSZ, &w) == 0 && w.ws_row > 0;
        close(term_fd);
        if (ok) {
            *rows = w.ws_row;
            *cols = w.ws_col;
            return true;
        }
    }
#endif

    const char* env_cols = getenv("COLUMNS");
    const char* env_rows = getenv("LINES");
    if (env_cols && env_rows) {
        *cols = std::atoi(env_cols);
        *rows = std::atoi(env_rows);
        return *rows > 0;
    }
    return false;
}

bool
revdiff::tty_supports_color() {
#ifdef REVDIFF_PLATFORM_POSIX
    // Piping to a file or pager gets plain text.
    if (isatty(STDOUT_FILENO) == 0) {
        return false;
    }

    if (getenv("NO_COLOR") != nullptr) {
        return false;
    }

    const char* term = getenv("TERM");
    return term != nullptr && std::string(term) != "dumb";
#else
    return false;
#endif
}
