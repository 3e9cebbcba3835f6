#include "view/search.hpp"

#include "processing/patch_parser.hpp"

#include <algorithm>
#include <cctype>
#include <set>

using namespace revdiff;

namespace {

char
to_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool
line_matches(const DiffLine& line, std::string_view query) {
    return line.kind != LineKind::Header && contains_ignore_case(line.content, query);
}

}  // namespace

bool
revdiff::contains_ignore_case(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return to_lower(a) == to_lower(b); });
    return it != haystack.end();
}

std::vector<std::size_t>
revdiff::compute_search_matches(const DiffRows& rows, std::string_view query) {
    std::vector<std::size_t> matches;
    if (query.empty()) {
        return matches;
    }

    for (std::size_t i = 0; i < rows.size(); i++) {
        const auto* row = std::get_if<LineRow>(&rows[i]);
        if (row && line_matches(row->line, query)) {
            matches.push_back(i);
        }
    }
    return matches;
}

std::vector<std::size_t>
revdiff::compute_search_matches(const SideBySideRows& rows, std::string_view query) {
    std::vector<std::size_t> matches;
    if (query.empty()) {
        return matches;
    }

    for (std::size_t i = 0; i < rows.size(); i++) {
        const auto* row = std::get_if<PairedRow>(&rows[i]);
        if (!row) {
            continue;
        }
        if ((row->left && line_matches(*row->left, query)) || (row->right && line_matches(*row->right, query))) {
            matches.push_back(i);
        }
    }
    return matches;
}

std::vector<CrossFileMatch>
revdiff::build_cross_file_matches(const std::vector<PatchFile>& files, std::string_view query) {
    std::vector<CrossFileMatch> matches;
    if (query.empty()) {
        return matches;
    }

    for (std::size_t file_index = 0; file_index < files.size(); file_index++) {
        const auto& file = files[file_index];
        if (file.patch.empty()) {
            continue;
        }

        const auto lines = split_lines(file.patch);
        for (std::size_t line_index = 0; line_index < lines.size(); line_index++) {
            auto line = lines[line_index];
            if (line.substr(0, 2) == "@@") {
                continue;
            }
            if (!line.empty() && (line[0] == '+' || line[0] == '-' || line[0] == ' ')) {
                line.remove_prefix(1);
            }
            if (contains_ignore_case(line, query)) {
                matches.push_back({file.filename, file_index, line_index, std::string(line)});
            }
        }
    }
    return matches;
}

std::size_t
revdiff::count_matched_files(const std::vector<CrossFileMatch>& matches) {
    std::set<std::size_t> files;
    for (const auto& match : matches) {
        files.insert(match.file_index);
    }
    return files.size();
}
