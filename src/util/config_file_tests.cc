#include "util/config_file.hpp"

#include <doctest.h>

using namespace revdiff;

TEST_CASE("cfg_parse") {
    ConfigParseResult result;
    ConfigTable table;

    SUBCASE("sections_and_values") {
        const std::string input =
            "# revdiff\n"
            "[general]\n"
            "    diff_mode = 'side-by-side'  # trailing comment\n"
            "    word_diff = false\n"
            "    overscan = 12\n"
            "    label = \"a # b\"\n"
            "    bare = plain\n"
            "\n"
            "[other]\n"
            "negative = -3\n";
        REQUIRE(cfg_parse(input, result, table));
        CHECK(result.is_ok());

        auto mode = table.lookup_value_by_path("general.diff_mode");
        REQUIRE(mode);
        CHECK(mode->get().as_string() == "side-by-side");

        auto word_diff = table.lookup_value_by_path("general.word_diff");
        REQUIRE(word_diff);
        CHECK(word_diff->get().is_bool());
        CHECK_FALSE(word_diff->get().as_bool());

        CHECK(table.lookup_value_by_path("general.overscan")->get().as_int() == 12);
        CHECK(table.lookup_value_by_path("general.label")->get().as_string() == "a # b");
        CHECK(table.lookup_value_by_path("general.bare")->get().as_string() == "plain");
        CHECK(table.lookup_value_by_path("other.negative")->get().as_int() == -3);

        CHECK_FALSE(table.lookup_value_by_path("general.missing"));
        CHECK_FALSE(table.lookup_value_by_path("missing.overscan"));
    }

    SUBCASE("empty_input") {
        REQUIRE(cfg_parse("", result, table));
        CHECK_FALSE(table.lookup_value_by_path("general.overscan"));
    }

    SUBCASE("syntax_errors") {
        CHECK_FALSE(cfg_parse("[general\n", result, table));
        CHECK(result.kind == ConfigParseErrorKind::Syntax);
        CHECK(result.line == 1);

        CHECK_FALSE(cfg_parse("[general]\nword_diff\n", result, table));
        CHECK(result.kind == ConfigParseErrorKind::Syntax);
        CHECK(result.line == 2);

        CHECK_FALSE(cfg_parse("[general]\nmode = 'unterminated\n", result, table));
        CHECK(result.error.find("mode") != std::string::npos);

        CHECK_FALSE(cfg_parse("[general]\nbad key = 1\n", result, table));
    }

    SUBCASE("duplicate_key") {
        CHECK_FALSE(cfg_parse("[general]\na = 1\na = 2\n", result, table));
        CHECK(result.kind == ConfigParseErrorKind::DuplicateKey);
        CHECK(result.line == 3);
    }
}

TEST_CASE("cfg_load_file") {
    ConfigParseResult result;
    ConfigTable table;
    CHECK_FALSE(cfg_load_file("/nonexistent/revdiff/revdiff.conf", result, table));
    CHECK(result.kind == ConfigParseErrorKind::File);
}

TEST_CASE("cfg_serialize") {
    ConfigTable table;
    REQUIRE(table.set_value_at("general.diff_mode", ConfigValue{std::string("unified")}));
    REQUIRE(table.set_value_at("general.overscan", ConfigValue{int64_t{5}}));
    REQUIRE(table.set_value_at("general.word_diff", ConfigValue{true}));
    REQUIRE(table.set_value_at("general.overscan", ConfigValue{int64_t{7}}));
    CHECK_FALSE(table.set_value_at("general.bad key", ConfigValue{true}));
    table.section("general").comments.push_back("# defaults");

    const auto text = cfg_serialize(table);
    CHECK(text ==
          "# defaults\n"
          "[general]\n"
          "    diff_mode = 'unified'\n"
          "    overscan = 7\n"
          "    word_diff = true\n"
          "\n");

    ConfigParseResult result;
    ConfigTable reparsed;
    REQUIRE(cfg_parse(text, result, reparsed));
    CHECK(reparsed.lookup_value_by_path("general.overscan")->get().as_int() == 7);
}
