#include "model/comment.hpp"

#include <fmt/format.h>

#include <charconv>

using namespace revdiff;

std::string
CommentKey::to_string() const {
    return fmt::format("{}:{}", revdiff::to_string(side), line);
}

const char*
revdiff::to_string(Side side) {
    return side == Side::Left ? "LEFT" : "RIGHT";
}

std::optional<Side>
revdiff::side_from_string(const std::string& s) {
    if (s == "LEFT") {
        return Side::Left;
    } else if (s == "RIGHT") {
        return Side::Right;
    }
    return std::nullopt;
}

std::optional<CommentKey>
revdiff::parse_comment_key(const std::string& s) {
    auto colon = s.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    auto side = side_from_string(s.substr(0, colon));
    if (!side) {
        return std::nullopt;
    }

    const char* first = s.data() + colon + 1;
    const char* last = s.data() + s.size();
    if (first == last) {
        return std::nullopt;
    }

    int64_t line = 0;
    auto [ptr, ec] = std::from_chars(first, last, line);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }

    return CommentKey{*side, line};
}

std::optional<CommentKey>
revdiff::comment_key_for(const DiffLine& line) {
    switch (line.kind) {
        case LineKind::Del:
            if (line.old_line_number) {
                return CommentKey{Side::Left, *line.old_line_number};
            }
            break;
        case LineKind::Add:
        case LineKind::Context:
            if (line.new_line_number) {
                return CommentKey{Side::Right, *line.new_line_number};
            }
            break;
        case LineKind::Header:
            break;
    }
    return std::nullopt;
}

std::optional<CommentKey>
revdiff::secondary_comment_key_for(const DiffLine& line) {
    if (line.kind == LineKind::Context && line.old_line_number) {
        return CommentKey{Side::Left, *line.old_line_number};
    }
    return std::nullopt;
}

std::vector<const CommentThread*>
revdiff::threads_for_line(const DiffLine& line, const CommentMap* comments) {
    std::vector<const CommentThread*> threads;
    if (!comments || line.kind == LineKind::Header) {
        return threads;
    }

    for (const auto& key : {comment_key_for(line), secondary_comment_key_for(line)}) {
        if (!key) {
            continue;
        }
        if (auto it = comments->find(*key); it != comments->end()) {
            threads.push_back(&it->second);
        }
    }
    return threads;
}
