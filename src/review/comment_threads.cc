#include "review/comment_threads.hpp"

#include "processing/patch_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <map>

using namespace revdiff;

namespace {

std::vector<std::string_view>
split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto end = s.find(delim, start);
        parts.push_back(s.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return parts;
}

bool
parse_int(std::string_view s, int64_t& value) {
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// "-" means absent.
bool
parse_optional_int(std::string_view s, std::optional<int64_t>& value) {
    if (s == "-") {
        value = std::nullopt;
        return true;
    }
    int64_t v = 0;
    if (!parse_int(s, v)) {
        return false;
    }
    value = v;
    return true;
}

std::string
unescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); i++) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out.push_back(s[i]);
            continue;
        }
        switch (s[++i]) {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            default:
                out.push_back(s[i]);
                break;
        }
    }
    return out;
}

void
set_error(CommentsParseResult& result, CommentsParseErrorKind kind, std::size_t line, std::string message) {
    result.kind = kind;
    result.line = line;
    result.error = fmt::format("line {}: {}", line, message);
}

bool
parse_comment_record(const std::vector<std::string_view>& fields, std::size_t line, CommentsParseResult& result,
                     Comment& comment) {
    if (fields.size() != 9) {
        set_error(result, CommentsParseErrorKind::FieldCount, line,
                  fmt::format("expected 9 fields in comment record, got {}", fields.size()));
        return false;
    }

    if (!parse_int(fields[1], comment.id)) {
        set_error(result, CommentsParseErrorKind::InvalidNumber, line,
                  fmt::format("invalid comment id '{}'", fields[1]));
        return false;
    }
    if (!parse_optional_int(fields[2], comment.in_reply_to_id)) {
        set_error(result, CommentsParseErrorKind::InvalidNumber, line,
                  fmt::format("invalid reply id '{}'", fields[2]));
        return false;
    }

    comment.path = std::string(fields[3]);

    auto side = side_from_string(std::string(fields[4]));
    if (!side) {
        set_error(result, CommentsParseErrorKind::InvalidSide, line,
                  fmt::format("invalid side '{}', expected LEFT or RIGHT", fields[4]));
        return false;
    }
    comment.side = *side;

    if (!parse_optional_int(fields[5], comment.line) || !parse_optional_int(fields[6], comment.original_line)) {
        set_error(result, CommentsParseErrorKind::InvalidNumber, line,
                  fmt::format("invalid line number '{}' / '{}'", fields[5], fields[6]));
        return false;
    }

    comment.author = std::string(fields[7]);
    comment.body = unescape(fields[8]);
    return true;
}

bool
parse_thread_record(const std::vector<std::string_view>& fields, std::size_t line, CommentsParseResult& result,
                    ReviewThread& thread) {
    if (fields.size() != 4) {
        set_error(result, CommentsParseErrorKind::FieldCount, line,
                  fmt::format("expected 4 fields in thread record, got {}", fields.size()));
        return false;
    }

    thread.id = std::string(fields[1]);

    if (fields[2] != "0" && fields[2] != "1") {
        set_error(result, CommentsParseErrorKind::InvalidNumber, line,
                  fmt::format("invalid resolved flag '{}'", fields[2]));
        return false;
    }
    thread.is_resolved = fields[2] == "1";

    if (fields[3].empty()) {
        return true;
    }
    for (const auto id_text : split(fields[3], ',')) {
        int64_t id = 0;
        if (!parse_int(id_text, id)) {
            set_error(result, CommentsParseErrorKind::InvalidNumber, line,
                      fmt::format("invalid comment id '{}' in thread", id_text));
            return false;
        }
        thread.comment_ids.push_back(id);
    }
    return true;
}

const ReviewThread*
find_review_thread(const std::vector<ReviewThread>& review_threads, int64_t root_id) {
    for (const auto& thread : review_threads) {
        for (auto id : thread.comment_ids) {
            if (id == root_id) {
                return &thread;
            }
        }
    }
    return nullptr;
}

}  // namespace

bool
revdiff::has_comments_for_path(const std::vector<Comment>& comments, std::string_view path) {
    return std::any_of(comments.begin(), comments.end(), [&](const Comment& c) { return c.path == path; });
}

CommentMap
revdiff::build_comment_map(const std::vector<Comment>& comments,
                           const std::vector<ReviewThread>& review_threads,
                           const std::optional<std::string>& path) {
    CommentMap map;
    std::map<int64_t, CommentKey> root_keys;

    for (const auto& comment : comments) {
        if (path && comment.path != *path) {
            continue;
        }

        if (comment.in_reply_to_id) {
            auto root = root_keys.find(*comment.in_reply_to_id);
            if (root == root_keys.end()) {
                continue;
            }
            map[root->second].comments.push_back(comment);
            root_keys.emplace(comment.id, root->second);
            continue;
        }

        const auto line = comment.line ? comment.line : comment.original_line;
        if (!line) {
            continue;
        }

        const CommentKey key{comment.side, *line};
        root_keys.emplace(comment.id, key);

        auto [it, inserted] = map.try_emplace(key);
        it->second.comments.push_back(comment);
        if (!inserted) {
            continue;
        }

        if (const auto* review_thread = find_review_thread(review_threads, comment.id)) {
            it->second.thread_id = review_thread->id;
            it->second.is_resolved = review_thread->is_resolved;
        }
    }

    return map;
}

bool
revdiff::parse_comments_file(std::string_view input, CommentsParseResult& result, CommentsFile& out) {
    result = {};
    out = {};

    const auto lines = split_lines(input);
    for (std::size_t i = 0; i < lines.size(); i++) {
        const auto line_number = i + 1;
        const auto text = lines[i];
        if (text.empty() || text[0] == '#') {
            continue;
        }

        const auto fields = split(text, '\t');
        if (fields[0] == "comment") {
            Comment comment;
            if (!parse_comment_record(fields, line_number, result, comment)) {
                return false;
            }
            out.comments.push_back(std::move(comment));
        } else if (fields[0] == "thread") {
            ReviewThread thread;
            if (!parse_thread_record(fields, line_number, result, thread)) {
                return false;
            }
            out.threads.push_back(std::move(thread));
        } else {
            set_error(result, CommentsParseErrorKind::UnknownRecord, line_number,
                      fmt::format("unknown record type '{}'", fields[0]));
            return false;
        }
    }

    return true;
}
