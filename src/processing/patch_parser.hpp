#pragma once

/*
    Parse the hunks of a single file's unified diff patch, as returned by
    code hosting providers for a changed file:

        @@ -5,3 +5,4 @@ optional section text
         context
        -deleted
        +added

    File headers (`diff --git`, `---`, `+++`) before the first hunk are
    ignored. A hunk whose header cannot be parsed is dropped along with its
    lines.
*/

#include "model/diff.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revdiff {

struct HunkRange {
    int64_t old_start = 0;
    int64_t old_count = 0;
    int64_t new_start = 0;
    int64_t new_count = 0;
};

std::optional<HunkRange>
parse_hunk_header(std::string_view header);

std::vector<Hunk>
parse_patch(std::string_view patch);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string_view>
split_lines(std::string_view text);

}  // namespace revdiff
