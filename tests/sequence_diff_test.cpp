#include <docdelta-cpp/sequence_diff.hpp>

#include "test_documents.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docdelta_cpp;
using namespace docdelta_test;

namespace {

auto kinds(const std::vector<ChangeBlock>& blocks) -> std::vector<ChangeKind> {
    auto out = std::vector<ChangeKind>{};
    for (const auto& block : blocks) out.push_back(block.kind);
    return out;
}

}  // namespace

// -- Indexing -----------------------------------------------------------------

TEST(IndexElements, accumulates_utf16_offsets) {
    const auto content = std::vector<Element>{para("\xF0\x9F\x8E\x89"), table({{"x"}}), para("ab")};
    const auto indexed = index_elements(content, 1);

    ASSERT_EQ(indexed.size(), 3u);
    EXPECT_EQ(indexed[0].start, 1u);
    EXPECT_EQ(indexed[0].end, 4u);
    EXPECT_EQ(indexed[1].start, 4u);
    EXPECT_EQ(indexed[1].end, 10u);
    EXPECT_EQ(indexed[2].start, 10u);
    EXPECT_EQ(indexed[2].end, 13u);
}

// -- Signatures ---------------------------------------------------------------

TEST(ElementSignature, paragraph_ignores_text_style) {
    EXPECT_EQ(element_signature(runs({bold_run("Hi")})), element_signature(para("Hi")));
}

TEST(ElementSignature, paragraph_depends_on_named_style_and_bullet) {
    EXPECT_NE(element_signature(para("Hi", NamedStyle::heading_1)), element_signature(para("Hi")));
    EXPECT_NE(element_signature(bulleted("Hi", BulletKind::bullet)), element_signature(para("Hi")));
}

TEST(ElementSignature, table_is_its_dimensions) {
    EXPECT_EQ(element_signature(table({{"a", "b"}})), "T:1x2");
    EXPECT_EQ(element_signature(table({{"a", "b"}})), element_signature(table({{"c", "d"}})));
}

TEST(ElementSignature, special_excludes_volatile_attributes) {
    const auto a = Element{SpecialElement{SpecialKind::page_break, {{"id", "1"}}}};
    const auto b = Element{SpecialElement{SpecialKind::page_break, {{"id", "2"}}}};
    EXPECT_EQ(element_signature(a), element_signature(b));
}

// -- Deep equality ------------------------------------------------------------

TEST(ElementsMatch, detects_style_changes) {
    EXPECT_TRUE(elements_match(para("Hi"), para("Hi")));
    EXPECT_FALSE(elements_match(runs({bold_run("Hi")}), para("Hi")));
}

TEST(ElementsMatch, explicit_false_equals_unset) {
    auto style = TextStyle{};
    style.bold = false;
    EXPECT_TRUE(elements_match(runs({run("Hi", style)}), para("Hi")));
}

TEST(ElementsMatch, ignores_style_class) {
    auto a = make_paragraph("Hi");
    auto b = make_paragraph("Hi");
    a.style_class = "kix.abc";
    EXPECT_TRUE(elements_match(a, b));
}

TEST(ElementsMatch, compares_cell_content) {
    EXPECT_TRUE(elements_match(table({{"a"}}), table({{"a"}})));
    EXPECT_FALSE(elements_match(table({{"a"}}), table({{"b"}})));
}

TEST(MarkersMatch, ignore_volatile_keys) {
    const auto a = AtomicMarker{MarkerKind::footnote_ref, {{"id", "fn1"}, {"num", "1"}}, "1"};
    const auto b = AtomicMarker{MarkerKind::footnote_ref, {{"id", "fn9"}, {"num", "3"}}, "3"};
    const auto c = AtomicMarker{MarkerKind::person, {{"email", "a@b.c"}}, ""};
    const auto d = AtomicMarker{MarkerKind::person, {{"email", "x@y.z"}}, ""};
    EXPECT_TRUE(markers_match(a, b));
    EXPECT_FALSE(markers_match(c, d));
}

// -- Alignment ----------------------------------------------------------------

TEST(SequenceDiff, identical_lists_are_one_equal_block) {
    const auto content = std::vector<Element>{para("a"), para("b")};
    const auto items = index_elements(content, 1);
    EXPECT_TRUE(sections_are_identical(items, items));

    const auto blocks = sequence_diff(items, items);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].kind, ChangeKind::equal);
    EXPECT_EQ(blocks[0].pristine.size(), 2u);
}

TEST(SequenceDiff, appended_paragraph_is_trailing_insert) {
    const auto pristine = std::vector<Element>{para("Hello")};
    const auto current = std::vector<Element>{para("Hello"), para("World")};
    const auto blocks = sequence_diff(index_elements(pristine, 1), index_elements(current, 1));

    EXPECT_EQ(kinds(blocks), (std::vector<ChangeKind>{ChangeKind::equal, ChangeKind::insert}));
    EXPECT_EQ(blocks[1].pristine_begin, 1u);
    EXPECT_EQ(blocks[1].current_begin, 1u);
    EXPECT_EQ(blocks[1].current_end, 2u);
    EXPECT_EQ(blocks[1].current[0].start, 7u);
}

TEST(SequenceDiff, removed_middle_paragraph) {
    const auto pristine = std::vector<Element>{para("a"), para("b"), para("c")};
    const auto current = std::vector<Element>{para("a"), para("c")};
    const auto blocks = sequence_diff(index_elements(pristine, 1), index_elements(current, 1));

    EXPECT_EQ(kinds(blocks), (std::vector<ChangeKind>{ChangeKind::equal, ChangeKind::remove, ChangeKind::equal}));
    EXPECT_EQ(blocks[1].pristine[0].start, 3u);
    EXPECT_EQ(blocks[1].pristine[0].end, 5u);
}

TEST(SequenceDiff, changed_text_is_replace) {
    const auto pristine = std::vector<Element>{para("a"), para("b"), para("c")};
    const auto current = std::vector<Element>{para("a"), para("B"), para("c")};
    const auto blocks = sequence_diff(index_elements(pristine, 1), index_elements(current, 1));

    EXPECT_EQ(kinds(blocks), (std::vector<ChangeKind>{ChangeKind::equal, ChangeKind::replace, ChangeKind::equal}));
    EXPECT_EQ(blocks[1].pristine_begin, 1u);
    EXPECT_EQ(blocks[1].current_begin, 1u);
}

TEST(SequenceDiff, blocks_cover_both_lists) {
    const auto pristine = std::vector<Element>{para("x"), para("a"), para("y"), para("b")};
    const auto current = std::vector<Element>{para("a"), para("z"), para("b"), para("w")};
    const auto blocks = sequence_diff(index_elements(pristine, 1), index_elements(current, 1));

    auto p = std::size_t{0};
    auto c = std::size_t{0};
    for (const auto& block : blocks) {
        EXPECT_EQ(block.pristine_begin, p);
        EXPECT_EQ(block.current_begin, c);
        p = block.pristine_end;
        c = block.current_end;
    }
    EXPECT_EQ(p, pristine.size());
    EXPECT_EQ(c, current.size());
}

TEST(SequenceDiff, equal_runs_share_signatures_only) {
    const auto pristine = std::vector<Element>{para("Hi")};
    const auto current = std::vector<Element>{runs({bold_run("Hi")})};
    const auto p_items = index_elements(pristine, 1);
    const auto c_items = index_elements(current, 1);

    const auto blocks = sequence_diff(p_items, c_items);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].kind, ChangeKind::equal);
    EXPECT_FALSE(sections_are_identical(p_items, c_items));
}
