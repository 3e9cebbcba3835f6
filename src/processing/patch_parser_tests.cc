#include "processing/patch_parser.hpp"

#include <doctest.h>

using namespace revdiff;

TEST_CASE("parse_hunk_header") {
    SUBCASE("full_ranges") {
        auto r = parse_hunk_header("@@ -5,3 +5,4 @@");
        REQUIRE(r);
        CHECK(r->old_start == 5);
        CHECK(r->old_count == 3);
        CHECK(r->new_start == 5);
        CHECK(r->new_count == 4);
    }

    SUBCASE("missing_counts_default_to_one") {
        auto r = parse_hunk_header("@@ -7 +9 @@");
        REQUIRE(r);
        CHECK(r->old_count == 1);
        CHECK(r->new_count == 1);
    }

    SUBCASE("section_text") {
        auto r = parse_hunk_header("@@ -10,2 +12,3 @@ void foo(int bar)");
        REQUIRE(r);
        CHECK(r->old_start == 10);
        CHECK(r->new_start == 12);
        CHECK(r->new_count == 3);
    }

    SUBCASE("malformed") {
        CHECK_FALSE(parse_hunk_header("@@"));
        CHECK_FALSE(parse_hunk_header("@@ garbage @@"));
        CHECK_FALSE(parse_hunk_header("@@ +1,2 -1,2 @@"));
        CHECK_FALSE(parse_hunk_header("not a header"));
    }
}

TEST_CASE("parse_patch") {
    SUBCASE("empty") {
        CHECK(parse_patch("").empty());
    }

    SUBCASE("single_hunk_line_numbers") {
        auto hunks = parse_patch("@@ -5,3 +5,4 @@\n context line\n-deleted line\n+added line\n+new line\n trailing");
        REQUIRE(hunks.size() == 1);
        const auto& h = hunks[0];
        CHECK(h.header == "@@ -5,3 +5,4 @@");
        CHECK(h.old_start == 5);
        CHECK(h.new_count == 4);
        REQUIRE(h.lines.size() == 6);

        CHECK(h.lines[0].kind == LineKind::Header);
        CHECK(h.lines[0].content == "@@ -5,3 +5,4 @@");
        CHECK_FALSE(h.lines[0].old_line_number);
        CHECK_FALSE(h.lines[0].new_line_number);

        CHECK(h.lines[1].kind == LineKind::Context);
        CHECK(h.lines[1].content == "context line");
        CHECK(h.lines[1].old_line_number == 5);
        CHECK(h.lines[1].new_line_number == 5);

        CHECK(h.lines[2].kind == LineKind::Del);
        CHECK(h.lines[2].old_line_number == 6);
        CHECK_FALSE(h.lines[2].new_line_number);

        CHECK(h.lines[3].kind == LineKind::Add);
        CHECK(h.lines[3].content == "added line");
        CHECK_FALSE(h.lines[3].old_line_number);
        CHECK(h.lines[3].new_line_number == 6);

        CHECK(h.lines[4].new_line_number == 7);

        CHECK(h.lines[5].kind == LineKind::Context);
        CHECK(h.lines[5].old_line_number == 7);
        CHECK(h.lines[5].new_line_number == 8);
    }

    SUBCASE("file_headers_and_metadata_are_skipped") {
        auto hunks = parse_patch(
            "diff --git a/x b/x\n"
            "--- a/x\n"
            "+++ b/x\n"
            "@@ -1 +1 @@\n"
            "-a\n"
            "\\ No newline at end of file\n"
            "+b\n");
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].lines.size() == 3);
        CHECK(hunks[0].lines[1].kind == LineKind::Del);
        CHECK(hunks[0].lines[2].kind == LineKind::Add);
    }

    SUBCASE("multiple_hunks") {
        auto hunks = parse_patch("@@ -1,2 +1,2 @@\n a\n-b\n+c\n@@ -20,1 +20,2 @@\n x\n+y\n");
        REQUIRE(hunks.size() == 2);
        CHECK(hunks[1].lines[1].old_line_number == 20);
        CHECK(hunks[1].lines[2].new_line_number == 21);
    }

    SUBCASE("malformed_hunk_is_dropped") {
        auto hunks = parse_patch("@@ bogus @@\n-a\n+b\n@@ -3 +3 @@\n c\n");
        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].old_start == 3);
        CHECK(hunks[0].lines.size() == 2);
    }

    SUBCASE("crlf_line_endings") {
        auto hunks = parse_patch("@@ -1 +1 @@\r\n-old\r\n+new\r\n");
        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].lines[1].content == "old");
        CHECK(hunks[0].lines[2].content == "new");
    }
}
