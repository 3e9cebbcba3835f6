#pragma once

/*
    Grouping of flat review comments into the threads shown below diff lines.

    Comments files are tab separated, one record per line, `#` starts a
    comment line:

        comment <id> <reply-to|-> <path> <LEFT|RIGHT> <line|-> <original-line|-> <author> <body>
        thread  <thread-id> <resolved 0|1> <comment-id,comment-id,...>

    Bodies may contain `\n`, `\t` and `\\` escapes.
*/

#include "model/comment.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revdiff {

// Root comments open a thread keyed on (side, line), falling back to the
// original line for outdated positions; roots with neither are skipped.
// Replies join their root's thread in arrival order, replies to unknown or
// skipped roots are dropped. A second root landing on an occupied key is
// appended to the existing thread. When `path` is set only that file's
// comments are considered.
CommentMap
build_comment_map(const std::vector<Comment>& comments,
                  const std::vector<ReviewThread>& review_threads,
                  const std::optional<std::string>& path = std::nullopt);

bool
has_comments_for_path(const std::vector<Comment>& comments, std::string_view path);

enum class CommentsParseErrorKind {
    None,
    UnknownRecord,
    FieldCount,
    InvalidNumber,
    InvalidSide,
};

struct CommentsParseResult {
    CommentsParseErrorKind kind = CommentsParseErrorKind::None;
    std::string error;
    std::size_t line = 0;

    bool
    is_ok() const {
        return kind == CommentsParseErrorKind::None;
    }
};

struct CommentsFile {
    std::vector<Comment> comments;
    std::vector<ReviewThread> threads;
};

bool
parse_comments_file(std::string_view input, CommentsParseResult& result, CommentsFile& out);

}  // namespace revdiff
