#include "algorithms/myers_linear.hpp"

#include <doctest.h>

#include <vector>

using namespace revdiff;

namespace {

std::vector<int>
apply_edits(const std::vector<int>& a, const std::vector<int>& b, const DiffResult& result) {
    std::vector<int> out;
    for (const auto& e : result.edit_sequence) {
        switch (e.type) {
            case EditType::Common:
                CHECK(a[static_cast<std::size_t>(e.a_index)] == b[static_cast<std::size_t>(e.b_index)]);
                out.push_back(a[static_cast<std::size_t>(e.a_index)]);
                break;
            case EditType::Insert:
                out.push_back(b[static_cast<std::size_t>(e.b_index)]);
                break;
            case EditType::Delete:
                break;
        }
    }
    return out;
}

std::size_t
count_edits(const DiffResult& result, EditType type) {
    std::size_t n = 0;
    for (const auto& e : result.edit_sequence) {
        if (e.type == type) {
            n++;
        }
    }
    return n;
}

}  // namespace

TEST_CASE("myers_linear") {
    SUBCASE("both_empty") {
        std::vector<int> a, b;
        DiffInput<int> input{a, b};
        auto result = MyersLinear<int>(input).compute();
        CHECK(result.status == DiffResultStatus::NoChanges);
        CHECK(result.edit_sequence.empty());
    }

    SUBCASE("one_side_empty") {
        std::vector<int> a, b{1, 2};
        DiffInput<int> input{a, b};
        auto result = MyersLinear<int>(input).compute();
        CHECK(result.status == DiffResultStatus::OK);
        CHECK(count_edits(result, EditType::Insert) == 2);

        DiffInput<int> reversed{b, a};
        auto deleted = MyersLinear<int>(reversed).compute();
        CHECK(count_edits(deleted, EditType::Delete) == 2);
    }

    SUBCASE("identical") {
        std::vector<int> a{1, 2, 3};
        DiffInput<int> input{a, a};
        auto result = MyersLinear<int>(input).compute();
        CHECK(result.status == DiffResultStatus::NoChanges);
        CHECK(count_edits(result, EditType::Common) == 3);
    }

    SUBCASE("shortest_edit_script") {
        // Classic example from Myers' paper: D = 5.
        std::vector<int> a{'A', 'B', 'C', 'A', 'B', 'B', 'A'};
        std::vector<int> b{'C', 'B', 'A', 'B', 'A', 'C'};
        DiffInput<int> input{a, b};
        auto result = MyersLinear<int>(input).compute();
        REQUIRE(result.status == DiffResultStatus::OK);
        CHECK(count_edits(result, EditType::Insert) + count_edits(result, EditType::Delete) == 5);
        CHECK(apply_edits(a, b, result) == b);
    }

    SUBCASE("single_deletion") {
        std::vector<int> a{1, 2, 3};
        std::vector<int> b{1, 3};
        DiffInput<int> input{a, b};
        auto result = MyersLinear<int>(input).compute();
        REQUIRE(result.edit_sequence.size() == 3);
        CHECK(result.edit_sequence[0].type == EditType::Common);
        CHECK(result.edit_sequence[1].type == EditType::Delete);
        CHECK(result.edit_sequence[1].a_index == 1);
        CHECK(result.edit_sequence[2].type == EditType::Common);
    }

    SUBCASE("long_dissimilar_input") {
        std::vector<int> a(2000), b(2000);
        for (int i = 0; i < 2000; i++) {
            a[static_cast<std::size_t>(i)] = i;
            b[static_cast<std::size_t>(i)] = -1 - i;
        }
        DiffInput<int> input{a, b};
        auto result = MyersLinear<int>(input).compute();
        REQUIRE(result.status == DiffResultStatus::OK);
        CHECK(count_edits(result, EditType::Delete) == 2000);
        CHECK(count_edits(result, EditType::Insert) == 2000);
        CHECK(count_edits(result, EditType::Common) == 0);
    }

    SUBCASE("common_prefix_and_suffix") {
        std::vector<int> a{1, 2, 3, 4, 5};
        std::vector<int> b{1, 2, 9, 4, 5};
        DiffInput<int> input{a, b};
        auto result = MyersLinear<int>(input).compute();
        REQUIRE(result.status == DiffResultStatus::OK);
        CHECK(count_edits(result, EditType::Common) == 4);
        CHECK(apply_edits(a, b, result) == b);
    }
}
