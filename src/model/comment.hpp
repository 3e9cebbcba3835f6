#pragma once

#include "model/diff.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace revdiff {

enum class Side {
    Left,   // old file, keyed by old line number
    Right,  // new file, keyed by new line number
};

// Provider-normalized review comment.
struct Comment {
    int64_t id = 0;
    std::optional<int64_t> in_reply_to_id;
    std::string path;
    Side side = Side::Right;
    LineNumber line;
    LineNumber original_line;
    std::string author;
    std::string body;
    std::string created_at;
};

struct ReviewThread {
    std::string id;
    bool is_resolved = false;
    std::vector<int64_t> comment_ids;
};

// Root comment first, replies after in arrival order.
struct CommentThread {
    std::vector<Comment> comments;
    std::optional<std::string> thread_id;
    std::optional<bool> is_resolved;
};

// Identity of the diff line a thread attaches to.
struct CommentKey {
    Side side = Side::Right;
    int64_t line = 0;

    bool
    operator<(const CommentKey& other) const {
        if (side != other.side) {
            return side < other.side;
        }
        return line < other.line;
    }

    bool
    operator==(const CommentKey& other) const {
        return side == other.side && line == other.line;
    }

    // "LEFT:<n>" or "RIGHT:<n>"
    std::string
    to_string() const;
};

using CommentMap = std::map<CommentKey, CommentThread>;

const char*
to_string(Side side);

std::optional<Side>
side_from_string(const std::string& s);

std::optional<CommentKey>
parse_comment_key(const std::string& s);

// Primary key of a line: del -> LEFT:old, add/context -> RIGHT:new. Headers
// and lines missing the relevant number have no key.
std::optional<CommentKey>
comment_key_for(const DiffLine& line);

// Context lines may additionally carry a thread on the old side.
std::optional<CommentKey>
secondary_comment_key_for(const DiffLine& line);

// Threads attached to `line`, primary key first. Empty when `comments` is
// null or nothing matches.
std::vector<const CommentThread*>
threads_for_line(const DiffLine& line, const CommentMap* comments);

}  // namespace revdiff
