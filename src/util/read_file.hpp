#pragma once

#include <string>

namespace revdiff {

// Read a whole file into `contents`. Prints a diagnostic on stderr and
// returns false when the file can't be read.
bool
read_file(const std::string& path, std::string& contents);

}  // namespace revdiff
