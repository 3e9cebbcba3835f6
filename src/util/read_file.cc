#include "util/read_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

bool
revdiff::read_file(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        fprintf(stderr, "Failed to open file '%s': %s\n", path.c_str(), strerror(errno));
        return false;
    }

    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, n);
    }

    const bool failed = ferror(stream) != 0;
    fclose(stream);

    if (failed) {
        fprintf(stderr, "Failed to read file '%s'\n", path.c_str());
        return false;
    }
    return true;
}
