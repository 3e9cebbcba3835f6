#include "processing/word_diff.hpp"

#include <doctest.h>

#include <string>
#include <utility>
#include <vector>

using namespace revdiff;

namespace {

std::string
join(const WordDiffSegments& segments) {
    std::string out;
    for (const auto& s : segments) {
        out += s.text;
    }
    return out;
}

std::string
text_of_kind(const WordDiffSegments& segments, SegmentKind kind) {
    std::string out;
    for (const auto& s : segments) {
        if (s.kind == kind) {
            out += s.text;
        }
    }
    return out;
}

bool
contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("compute_word_diff") {
    SUBCASE("identical_lines_are_all_equal") {
        auto d = compute_word_diff("const x = 1", "const x = 1");
        REQUIRE(d.old_segments.size() == 1);
        REQUIRE(d.new_segments.size() == 1);
        CHECK(d.old_segments[0] == WordDiffSegment{"const x = 1", SegmentKind::Equal});
        CHECK(d.new_segments[0] == WordDiffSegment{"const x = 1", SegmentKind::Equal});
        CHECK_FALSE(has_equal_and_changed(d));
    }

    SUBCASE("single_changed_word") {
        auto d = compute_word_diff("const x = 1", "const x = 2");
        CHECK(text_of_kind(d.old_segments, SegmentKind::Changed) == "1");
        CHECK(text_of_kind(d.new_segments, SegmentKind::Changed) == "2");
        CHECK(text_of_kind(d.old_segments, SegmentKind::Equal) == "const x = ");
        CHECK(has_equal_and_changed(d));
    }

    SUBCASE("completely_different") {
        auto d = compute_word_diff("hello", "world");
        REQUIRE(d.old_segments == WordDiffSegments{{"hello", SegmentKind::Changed}});
        REQUIRE(d.new_segments == WordDiffSegments{{"world", SegmentKind::Changed}});
        CHECK_FALSE(has_equal_and_changed(d));
    }

    SUBCASE("empty_sides") {
        auto added = compute_word_diff("", "new content");
        CHECK(added.old_segments.empty());
        CHECK(added.new_segments == WordDiffSegments{{"new content", SegmentKind::Changed}});

        auto removed = compute_word_diff("old content", "");
        CHECK(removed.old_segments == WordDiffSegments{{"old content", SegmentKind::Changed}});
        CHECK(removed.new_segments.empty());

        auto both = compute_word_diff("", "");
        CHECK(both.old_segments.empty());
        CHECK(both.new_segments.empty());
    }

    SUBCASE("indentation_change") {
        auto d = compute_word_diff("  return x", "    return x");
        REQUIRE(!d.old_segments.empty());
        CHECK(d.old_segments[0] == WordDiffSegment{"  ", SegmentKind::Changed});
        CHECK(d.new_segments[0] == WordDiffSegment{"    ", SegmentKind::Changed});
        CHECK(contains(text_of_kind(d.new_segments, SegmentKind::Equal), "return"));
    }

    SUBCASE("punctuation_change") {
        auto d = compute_word_diff("foo(x)", "foo[x]");
        CHECK(text_of_kind(d.old_segments, SegmentKind::Changed) == "()");
        CHECK(text_of_kind(d.new_segments, SegmentKind::Changed) == "[]");
        CHECK(text_of_kind(d.old_segments, SegmentKind::Equal) == "foox");
    }

    SUBCASE("appended_tokens") {
        auto d = compute_word_diff("foo(x)", "foo(x, y)");
        CHECK(text_of_kind(d.new_segments, SegmentKind::Changed) == ", y");
        CHECK(text_of_kind(d.old_segments, SegmentKind::Changed).empty());
    }

    SUBCASE("realistic_code") {
        auto d = compute_word_diff("  const result = await fetchData(url)", "  const response = await fetchData(apiUrl)");
        auto old_changed = text_of_kind(d.old_segments, SegmentKind::Changed);
        auto new_changed = text_of_kind(d.new_segments, SegmentKind::Changed);
        CHECK(contains(old_changed, "result"));
        CHECK(contains(old_changed, "url"));
        CHECK(contains(new_changed, "response"));
        CHECK(contains(new_changed, "apiUrl"));
        CHECK(contains(text_of_kind(d.old_segments, SegmentKind::Equal), "fetchData"));
    }

    SUBCASE("lines_past_token_limit_are_wholly_changed") {
        std::string old_line, new_line;
        for (std::size_t i = 0; i < kMaxWordDiffTokens; i++) {
            old_line += "x ";
            new_line += "x ";
        }
        new_line += "y";
        auto d = compute_word_diff(old_line, new_line);
        REQUIRE(d.old_segments.size() == 1);
        REQUIRE(d.new_segments.size() == 1);
        CHECK(d.old_segments[0] == WordDiffSegment{old_line, SegmentKind::Changed});
        CHECK(d.new_segments[0] == WordDiffSegment{new_line, SegmentKind::Changed});
        CHECK_FALSE(has_equal_and_changed(d));
    }

    SUBCASE("long_dissimilar_lines_within_limit") {
        std::string old_line, new_line;
        for (int i = 0; i < 200; i++) {
            old_line += "a" + std::to_string(i) + ",";
            new_line += "b" + std::to_string(i) + ";";
        }
        auto d = compute_word_diff(old_line, new_line);
        CHECK(join(d.old_segments) == old_line);
        CHECK(join(d.new_segments) == new_line);
    }

    SUBCASE("segments_reconstruct_input_and_alternate") {
        const std::vector<std::pair<std::string, std::string>> pairs = {
            {"const x = foo(bar)", "let y = baz(qux)"},
            {"  if (a && b) {", "  if (a || b) {"},
            {"import { foo } from \"bar\"", "import { baz } from \"qux\""},
            {"return null", "return undefined"},
            {"a.b(c)", "a.d(e)"},
        };

        for (const auto& [old_line, new_line] : pairs) {
            auto d = compute_word_diff(old_line, new_line);
            CHECK(join(d.old_segments) == old_line);
            CHECK(join(d.new_segments) == new_line);
            for (const auto* side : {&d.old_segments, &d.new_segments}) {
                for (std::size_t i = 0; i < side->size(); i++) {
                    CHECK(!(*side)[i].text.empty());
                    if (i > 0) {
                        CHECK((*side)[i].kind != (*side)[i - 1].kind);
                    }
                }
            }
        }
    }
}

TEST_CASE("slice_word_diff_segments") {
    const WordDiffSegments segments = {
        {"const ", SegmentKind::Equal},
        {"foo", SegmentKind::Changed},
        {" = 1", SegmentKind::Equal},
    };

    SUBCASE("full_window") {
        CHECK(slice_word_diff_segments(segments, 0, 100) == segments);
    }

    SUBCASE("window_inside_one_segment") {
        auto s = slice_word_diff_segments(segments, 1, 3);
        REQUIRE(s == WordDiffSegments{{"ons", SegmentKind::Equal}});
    }

    SUBCASE("window_spanning_segments") {
        auto s = slice_word_diff_segments(segments, 4, 6);
        REQUIRE(s.size() == 3);
        CHECK(s[0] == WordDiffSegment{"t ", SegmentKind::Equal});
        CHECK(s[1] == WordDiffSegment{"foo", SegmentKind::Changed});
        CHECK(s[2] == WordDiffSegment{" ", SegmentKind::Equal});
    }

    SUBCASE("window_past_end") {
        CHECK(slice_word_diff_segments(segments, 50, 10).empty());
    }
}

TEST_CASE("expand_tabs") {
    CHECK(expand_tabs("no tabs") == "no tabs");
    CHECK(expand_tabs("\tx") == "    x");
    CHECK(expand_tabs("ab\tc") == "ab  c");
    CHECK(expand_tabs("ab\tc", 8) == "ab      c");
    CHECK(expand_tabs("\tx", 4, 2) == "  x");

    SUBCASE("stops_align_across_segments") {
        const WordDiffSegments segments = {{"ab", SegmentKind::Equal}, {"\tc", SegmentKind::Changed}};
        const WordDiffSegments expected = {{"ab", SegmentKind::Equal}, {"  c", SegmentKind::Changed}};
        CHECK(expand_tabs(segments, 4) == expected);
    }
}
