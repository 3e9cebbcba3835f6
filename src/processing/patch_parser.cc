#include "processing/patch_parser.hpp"

#include <charconv>

using namespace revdiff;

namespace {

bool
starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

std::string_view
trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

bool
parse_int(std::string_view s, int64_t& out) {
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// "-5,3" or "+7"; a missing count means 1.
bool
parse_range(std::string_view token, char prefix, int64_t& start, int64_t& count) {
    if (token.empty() || token[0] != prefix) {
        return false;
    }
    token.remove_prefix(1);

    const auto comma = token.find(',');
    if (!parse_int(token.substr(0, comma), start)) {
        return false;
    }

    count = 1;
    if (comma != std::string_view::npos) {
        int64_t parsed = 0;
        if (parse_int(token.substr(comma + 1), parsed)) {
            count = parsed;
        }
    }
    return true;
}

}  // namespace

std::vector<std::string_view>
revdiff::split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true) {
        const auto end = text.find('\n', start);
        auto line = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return lines;
}

std::optional<HunkRange>
revdiff::parse_hunk_header(std::string_view header) {
    auto s = trim(header);
    if (!starts_with(s, "@@")) {
        return std::nullopt;
    }
    s.remove_prefix(2);

    // Anything after the closing "@@" is section text (usually the enclosing
    // function) and is not part of the range.
    const auto close = s.find("@@");
    if (close != std::string_view::npos) {
        s = s.substr(0, close);
    }
    s = trim(s);

    const auto space = s.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }

    HunkRange range;
    if (!parse_range(trim(s.substr(0, space)), '-', range.old_start, range.old_count)) {
        return std::nullopt;
    }
    if (!parse_range(trim(s.substr(space + 1)), '+', range.new_start, range.new_count)) {
        return std::nullopt;
    }
    return range;
}

std::vector<Hunk>
revdiff::parse_patch(std::string_view patch) {
    std::vector<Hunk> hunks;
    if (patch.empty()) {
        return hunks;
    }

    bool in_hunk = false;
    int64_t old_line = 0;
    int64_t new_line = 0;

    for (const auto raw : split_lines(patch)) {
        if (starts_with(raw, "@@")) {
            auto range = parse_hunk_header(raw);
            in_hunk = range.has_value();
            if (!in_hunk) {
                continue;
            }

            Hunk hunk;
            hunk.header = std::string(raw);
            hunk.old_start = range->old_start;
            hunk.old_count = range->old_count;
            hunk.new_start = range->new_start;
            hunk.new_count = range->new_count;
            hunk.lines.push_back({LineKind::Header, std::string(raw), std::nullopt, std::nullopt});
            hunks.push_back(std::move(hunk));

            old_line = range->old_start;
            new_line = range->new_start;
            continue;
        }

        if (!in_hunk || raw.empty()) {
            continue;
        }

        auto& lines = hunks.back().lines;
        const std::string content{raw.substr(1)};
        switch (raw[0]) {
            case ' ':
                lines.push_back({LineKind::Context, content, old_line, new_line});
                old_line++;
                new_line++;
                break;
            case '+':
                lines.push_back({LineKind::Add, content, std::nullopt, new_line});
                new_line++;
                break;
            case '-':
                lines.push_back({LineKind::Del, content, old_line, std::nullopt});
                old_line++;
                break;
            default:
                // "\ No newline at end of file" and other metadata.
                break;
        }
    }

    return hunks;
}
