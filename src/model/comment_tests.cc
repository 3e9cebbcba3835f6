#include "model/comment.hpp"

#include <doctest.h>

using namespace revdiff;

namespace {

DiffLine
make_line(LineKind kind, LineNumber old_line, LineNumber new_line) {
    DiffLine line;
    line.kind = kind;
    line.content = "text";
    line.old_line_number = old_line;
    line.new_line_number = new_line;
    return line;
}

}  // namespace

TEST_CASE("CommentKey") {
    SUBCASE("to_string") {
        CHECK(CommentKey{Side::Left, 12}.to_string() == "LEFT:12");
        CHECK(CommentKey{Side::Right, 3}.to_string() == "RIGHT:3");
    }

    SUBCASE("round_trip") {
        for (const auto& key : {CommentKey{Side::Left, 1}, CommentKey{Side::Right, 4096}}) {
            auto parsed = parse_comment_key(key.to_string());
            REQUIRE(parsed);
            CHECK(*parsed == key);
        }
    }

    SUBCASE("rejects_malformed") {
        CHECK_FALSE(parse_comment_key("LEFT:"));
        CHECK_FALSE(parse_comment_key("MID:3"));
        CHECK_FALSE(parse_comment_key("RIGHT:4x"));
        CHECK_FALSE(parse_comment_key("RIGHT"));
        CHECK_FALSE(parse_comment_key(""));
        CHECK_FALSE(parse_comment_key("left:3"));
    }

    SUBCASE("ordering_groups_by_side") {
        CHECK(CommentKey{Side::Left, 9} < CommentKey{Side::Right, 1});
        CHECK(CommentKey{Side::Right, 1} < CommentKey{Side::Right, 2});
        CHECK_FALSE(CommentKey{Side::Right, 2} < CommentKey{Side::Right, 2});
    }
}

TEST_CASE("comment_key_for") {
    SUBCASE("del_uses_old_side") {
        auto key = comment_key_for(make_line(LineKind::Del, 7, std::nullopt));
        REQUIRE(key);
        CHECK(*key == CommentKey{Side::Left, 7});
        CHECK_FALSE(secondary_comment_key_for(make_line(LineKind::Del, 7, std::nullopt)));
    }

    SUBCASE("add_uses_new_side") {
        auto key = comment_key_for(make_line(LineKind::Add, std::nullopt, 8));
        REQUIRE(key);
        CHECK(*key == CommentKey{Side::Right, 8});
        CHECK_FALSE(secondary_comment_key_for(make_line(LineKind::Add, std::nullopt, 8)));
    }

    SUBCASE("context_has_both_sides") {
        const auto line = make_line(LineKind::Context, 5, 6);
        auto primary = comment_key_for(line);
        auto secondary = secondary_comment_key_for(line);
        REQUIRE(primary);
        REQUIRE(secondary);
        CHECK(*primary == CommentKey{Side::Right, 6});
        CHECK(*secondary == CommentKey{Side::Left, 5});
    }

    SUBCASE("header_has_no_key") {
        const auto line = make_line(LineKind::Header, std::nullopt, std::nullopt);
        CHECK_FALSE(comment_key_for(line));
        CHECK_FALSE(secondary_comment_key_for(line));
    }

    SUBCASE("missing_line_number_has_no_key") {
        CHECK_FALSE(comment_key_for(make_line(LineKind::Del, std::nullopt, std::nullopt)));
        CHECK_FALSE(comment_key_for(make_line(LineKind::Add, std::nullopt, std::nullopt)));
    }
}

TEST_CASE("threads_for_line") {
    CommentMap comments;
    comments[CommentKey{Side::Right, 6}].comments.push_back(Comment{});
    comments[CommentKey{Side::Left, 5}].comments.push_back(Comment{});

    SUBCASE("primary_first") {
        auto threads = threads_for_line(make_line(LineKind::Context, 5, 6), &comments);
        REQUIRE(threads.size() == 2);
        CHECK(threads[0] == &comments[CommentKey{Side::Right, 6}]);
        CHECK(threads[1] == &comments[CommentKey{Side::Left, 5}]);
    }

    SUBCASE("null_map") {
        CHECK(threads_for_line(make_line(LineKind::Context, 5, 6), nullptr).empty());
    }
}
