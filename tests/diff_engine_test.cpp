#include <docdelta-cpp/diff_engine.hpp>
#include <docdelta-cpp/error.hpp>

#include "test_documents.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docdelta_cpp;
using namespace docdelta_test;

namespace {

auto actions(const std::vector<Operation>& ops) -> std::vector<OperationAction> {
    auto out = std::vector<OperationAction>{};
    for (const auto& op : ops) out.push_back(op.action);
    return out;
}

auto diff_bodies(std::vector<Element> pristine, std::vector<Element> current) -> std::vector<Operation> {
    return DiffEngine{}.diff(body_document(std::move(pristine)), body_document(std::move(current)));
}

auto named(NamedStyle style) -> ParagraphStyle {
    auto s = ParagraphStyle{};
    s.named_style = style;
    return s;
}

auto bold() -> TextStyle {
    auto s = TextStyle{};
    s.bold = true;
    return s;
}

void expect_error(ErrorKind kind, const Document& pristine, const Document& current) {
    try {
        DiffEngine{}.diff(pristine, current);
    } catch (const DiffError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
        return;
    }
    ADD_FAILURE() << "expected " << to_string_view(kind);
}

constexpr auto emoji = "\xF0\x9F\x8E\x89";

}  // namespace

// -- Reference scenarios ------------------------------------------------------

TEST(DiffEngine, appended_paragraph_is_one_insert) {
    const auto ops = diff_bodies({para("Hello")}, {para("Hello"), para("World")});

    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].action, (OperationAction{InsertText{Location{6}, "\nWorld"}}));
    EXPECT_EQ(ops[0].segment, SegmentRef{});
    EXPECT_FALSE(ops[0].tab_id.has_value());
}

TEST(DiffEngine, appended_paragraph_resets_trailing_heading_first) {
    const auto ops = diff_bodies({para("Hello", NamedStyle::heading_1)},
                                 {para("Hello", NamedStyle::heading_1), para("World")});

    const auto expected = std::vector<OperationAction>{
        UpdateParagraphStyle{Range{1, 7}, named(NamedStyle::normal_text), {ParagraphField::named_style_type}},
        InsertText{Location{6}, "\nWorld"},
        UpdateParagraphStyle{Range{1, 7}, named(NamedStyle::heading_1), {ParagraphField::named_style_type}},
    };
    EXPECT_EQ(actions(ops), expected);
    EXPECT_EQ(ops[0].change_group, 0u);
    EXPECT_LT(ops[1].change_group, ops[2].change_group);
}

TEST(DiffEngine, cell_text_change_is_scoped_to_the_cell) {
    const auto ops = diff_bodies({table({{"Old"}}), para("")}, {table({{"New"}}), para("")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{4, 7}},
        InsertText{Location{4}, "New"},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, run_split_reinserts_paragraph_text) {
    const auto ops = diff_bodies({para("Hello World")}, {runs({bold_run("Hello"), run(" World")})});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{1, 12}},
        InsertText{Location{1}, "Hello World"},
        UpdateTextStyle{Range{1, 6}, bold(), {TextField::bold}},
    };
    EXPECT_EQ(actions(ops), expected);
    EXPECT_TRUE(ops[2].is_post_insert);
}

TEST(DiffEngine, resized_table_is_regenerated) {
    const auto ops = diff_bodies({table({{"a", "b"}, {"c", "d"}}), para("")},
                                 {table({{"a", "b", "c"}, {"d", "e", "f"}}), para("")});

    // The table's own newline lands at 1 and is removed once the cells are filled.
    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{1, 17}},
        InsertTable{Location{1}, 2, 3},
        InsertText{Location{5}, "a"},
        InsertText{Location{8}, "b"},
        InsertText{Location{11}, "c"},
        InsertText{Location{15}, "d"},
        InsertText{Location{18}, "e"},
        InsertText{Location{21}, "f"},
        DeleteContentRange{Range{1, 2}},
    };
    ASSERT_EQ(actions(ops), expected);
    EXPECT_LT(ops[7].change_group, ops[8].change_group);
}

TEST(DiffEngine, emoji_counts_two_units_in_ranges) {
    const auto ops = diff_bodies({para(emoji), para("x")}, {para(emoji), para("y")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{4, 5}},
        InsertText{Location{4}, "y"},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, emoji_offsets_style_ranges) {
    const auto ops = diff_bodies({runs({run(emoji), run("ab")})}, {runs({run(emoji), bold_run("ab")})});

    const auto expected = std::vector<OperationAction>{
        UpdateTextStyle{Range{3, 5}, bold(), {TextField::bold}},
    };
    EXPECT_EQ(actions(ops), expected);
}

// -- Paragraph edits ----------------------------------------------------------

TEST(DiffEngine, identical_documents_produce_nothing) {
    const auto doc = body_document({para("a", NamedStyle::title), table({{"x", "y"}}), para("")});
    EXPECT_TRUE(DiffEngine{}.diff(doc, doc).empty());
}

TEST(DiffEngine, middle_insert_attaches_before_next_paragraph) {
    const auto ops = diff_bodies({para("a"), para("c")}, {para("a"), para("b"), para("c")});
    EXPECT_EQ(actions(ops), (std::vector<OperationAction>{InsertText{Location{3}, "b\n"}}));
}

TEST(DiffEngine, middle_delete_removes_whole_paragraph) {
    const auto ops = diff_bodies({para("a"), para("b"), para("c")}, {para("a"), para("c")});
    EXPECT_EQ(actions(ops), (std::vector<OperationAction>{DeleteContentRange{Range{3, 5}}}));
}

TEST(DiffEngine, trailing_delete_keeps_final_newline) {
    const auto ops = diff_bodies({para("a"), para("b"), para("c")}, {para("a")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{4, 6}},
        DeleteContentRange{Range{2, 4}},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, trailing_delete_restores_survivor_style) {
    const auto ops = diff_bodies({para("a"), para("b"), para("c", NamedStyle::heading_1)}, {para("a")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{4, 6}},
        DeleteContentRange{Range{2, 4}},
        UpdateParagraphStyle{Range{1, 3}, named(NamedStyle::normal_text), {ParagraphField::named_style_type}},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, named_style_and_alignment_in_one_update) {
    auto heading = make_paragraph("a", NamedStyle::heading_2);
    heading.alignment = Alignment::center;
    const auto ops = diff_bodies({para("a")}, {heading});

    auto style = named(NamedStyle::heading_2);
    style.alignment = Alignment::center;
    const auto expected = std::vector<OperationAction>{
        UpdateParagraphStyle{Range{1, 3}, style, {ParagraphField::named_style_type, ParagraphField::alignment}},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, bullet_creation_sets_nesting_indent) {
    const auto ops = diff_bodies({para("a")}, {bulleted("a", BulletKind::decimal, 1)});

    auto indent = ParagraphStyle{};
    indent.indent_start = 36.0;
    indent.indent_first_line = 0.0;
    const auto expected = std::vector<OperationAction>{
        CreateParagraphBullets{Range{1, 3}, BulletKind::decimal},
        UpdateParagraphStyle{Range{1, 3}, indent, {ParagraphField::indent_start, ParagraphField::indent_first_line}},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, bullet_removal) {
    const auto ops = diff_bodies({bulleted("a", BulletKind::bullet)}, {para("a")});
    EXPECT_EQ(actions(ops), (std::vector<OperationAction>{DeleteParagraphBullets{Range{1, 3}}}));
}

TEST(DiffEngine, unbolding_resets_the_field) {
    const auto ops = diff_bodies({runs({bold_run("ab"), run("c")})}, {runs({run("ab"), run("c")})});
    EXPECT_EQ(actions(ops), (std::vector<OperationAction>{UpdateTextStyle{Range{1, 3}, TextStyle{}, {TextField::bold}}}));
}

TEST(DiffEngine, empty_current_body_becomes_one_empty_paragraph) {
    const auto ops = diff_bodies({para("a")}, {});
    EXPECT_EQ(actions(ops), (std::vector<OperationAction>{DeleteContentRange{Range{1, 2}}}));
}

// -- Structure ----------------------------------------------------------------

TEST(DiffEngine, cell_shape_change_replaces_cell_content) {
    auto current = make_table({{"a"}});
    current.cells[0].content.push_back(make_paragraph("b"));
    const auto ops = diff_bodies({table({{"a"}}), para("")}, {Element{current}, para("")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{4, 5}},
        InsertText{Location{4}, "b"},
        InsertText{Location{4}, "a\n"},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, paragraph_replaced_by_table) {
    const auto ops = diff_bodies({para("a"), para("b"), para("c")}, {para("a"), table({{"x"}}), para("c")});

    // The table splits "a"; the newline "a" had is left after the table and removed.
    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{3, 5}},
        InsertTable{Location{2}, 1, 1},
        InsertText{Location{6}, "x"},
        DeleteContentRange{Range{9, 10}},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, table_appended_at_end_splits_the_last_paragraph) {
    const auto ops = diff_bodies({para("a")}, {para("a"), table({{"x"}}), para("")});

    const auto expected = std::vector<OperationAction>{
        InsertTable{Location{2}, 1, 1},
        InsertText{Location{6}, "x"},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, paragraph_before_new_table_shares_one_index) {
    const auto ops = diff_bodies({para("x")}, {para("p"), table({{"t"}}), para("x")});

    const auto expected = std::vector<OperationAction>{
        InsertTable{Location{1}, 1, 1},
        InsertText{Location{1}, "p"},
        InsertText{Location{6}, "t"},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, insert_before_leading_page_break) {
    const auto ops = diff_bodies({page_break(), para("a")}, {para("new"), page_break(), para("a")});
    EXPECT_EQ(actions(ops), (std::vector<OperationAction>{InsertText{Location{1}, "new\n"}}));
}

TEST(DiffEngine, insert_before_leading_table_rebuilds_the_table) {
    const auto ops = diff_bodies({table({{"x"}}), para("a")}, {para("new"), table({{"x"}}), para("a")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{1, 7}},
        InsertTable{Location{1}, 1, 1},
        InsertText{Location{1}, "new"},
        InsertText{Location{8}, "x"},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, page_break_between_tables_rebuilds_the_following_table) {
    const auto ops = diff_bodies({para("a"), table({{"x"}}), table({{"y", "z"}}), para("")},
                                 {para("a"), table({{"x"}}), page_break(), table({{"y", "z"}}), para("")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{9, 18}},
        InsertTable{Location{9}, 1, 2},
        InsertPageBreak{Location{9}},
        InsertText{Location{14}, "y"},
        InsertText{Location{17}, "z"},
        DeleteContentRange{Range{10, 11}},
    };
    EXPECT_EQ(actions(ops), expected);
}

TEST(DiffEngine, page_break_change_is_delete_and_reinsert) {
    const auto ops = diff_bodies(
        {para("a"), Element{SpecialElement{SpecialKind::page_break, {{"k", "1"}}}}, para("b")},
        {para("a"), Element{SpecialElement{SpecialKind::page_break, {{"k", "2"}}}}, para("b")});

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{3, 4}},
        InsertPageBreak{Location{3}},
    };
    EXPECT_EQ(actions(ops), expected);
}

// -- Segments -----------------------------------------------------------------

TEST(DiffEngine, headers_and_footers_are_created_changed_and_deleted) {
    const auto pristine = document({body({para("x")}),
                                    section(SectionKind::header, "h1", {para("Old")}),
                                    section(SectionKind::footer, "f0", {para("Gone")})});
    const auto current = document({body({para("x")}),
                                   section(SectionKind::header, "h1", {para("New")}),
                                   section(SectionKind::footer, "f1", {para("Foot")})});
    const auto ops = DiffEngine{}.diff(pristine, current);

    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{0, 3}},
        InsertText{Location{0}, "New"},
        CreateFooter{HeaderFooterType::standard, "f1"},
        InsertText{Location{0}, "Foot"},
        DeleteFooter{"f0"},
    };
    ASSERT_EQ(actions(ops), expected);
    EXPECT_EQ(ops[0].segment, (SegmentRef{"h1", false}));
    EXPECT_EQ(ops[2].segment, SegmentRef{});
    EXPECT_EQ(ops[3].segment, (SegmentRef{"f1", true}));
    EXPECT_TRUE(ops[3].requires_resolution());
    EXPECT_FALSE(ops[4].requires_resolution());
}

TEST(DiffEngine, footnote_reference_creates_the_footnote) {
    const auto pristine = body_document({para("See")});
    const auto current = document({body({runs({run("See"), marker(MarkerKind::footnote_ref, {{"id", "fn1"}})})}),
                                   section(SectionKind::footnote, "fn1", {para("Note")})});
    const auto ops = DiffEngine{}.diff(pristine, current);

    // A new footnote holds " \n"; the space is replaced.
    const auto expected = std::vector<OperationAction>{
        DeleteContentRange{Range{1, 4}},
        CreateFootnote{Location{1}, "fn1"},
        InsertText{Location{1}, "See"},
        DeleteContentRange{Range{0, 1}},
        InsertText{Location{0}, "Note"},
    };
    ASSERT_EQ(actions(ops), expected);
    EXPECT_EQ(ops[3].segment, (SegmentRef{"fn1", true}));
    EXPECT_EQ(ops[4].segment, (SegmentRef{"fn1", true}));
}

TEST(DiffEngine, existing_footnote_is_diffed_in_place) {
    const auto ref = runs({run("See"), marker(MarkerKind::footnote_ref, {{"id", "fn1"}})});
    const auto pristine = document({body({ref}), section(SectionKind::footnote, "fn1", {para("Old")})});
    const auto current = document({body({ref}), section(SectionKind::footnote, "fn1", {para("New")})});
    const auto ops = DiffEngine{}.diff(pristine, current);

    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0].segment, (SegmentRef{"fn1", false}));
    EXPECT_EQ(ops[1].action, (OperationAction{InsertText{Location{0}, "New"}}));
}

TEST(DiffEngine, diff_section_addresses_the_given_segment) {
    const auto ops = DiffEngine{}.diff_section(section(SectionKind::header, "h", {para("a")}),
                                               section(SectionKind::header, "h", {para("b")}),
                                               SegmentRef{"h", false});
    ASSERT_EQ(ops.size(), 2u);
    for (const auto& op : ops) EXPECT_EQ(op.segment.id, "h");
}

// -- Options ------------------------------------------------------------------

TEST(DiffEngine, tab_id_is_attached_to_every_operation) {
    auto options = DiffOptions{};
    options.tab_id = "t.second";
    const auto pristine = document({body({para("a")}), section(SectionKind::footer, "f0", {para("x")})});
    const auto current = document({body({para("b")}), section(SectionKind::header, "h1", {para("y")})});
    const auto ops = DiffEngine{options}.diff(pristine, current);

    ASSERT_FALSE(ops.empty());
    for (const auto& op : ops) EXPECT_EQ(op.tab_id, std::optional<std::string>{"t.second"});
}

TEST(DiffEngine, result_is_deterministic) {
    const auto pristine = body_document({para("a"), table({{"1", "2"}}), para("b"), para("c")});
    const auto current = body_document({para("A"), table({{"1", "3"}}), para("c"), para("d")});
    const auto engine = DiffEngine{};
    EXPECT_EQ(engine.diff(pristine, current), engine.diff(pristine, current));
}

TEST(DiffEngine, thread_count_does_not_change_the_result) {
    auto pristine_sections = std::vector<Section>{body({para("body")})};
    auto current_sections = std::vector<Section>{body({para("body!")})};
    for (int i = 0; i < 16; ++i) {
        const auto id = "h" + std::to_string(i);
        pristine_sections.push_back(section(SectionKind::header, id, {para("old " + id)}));
        current_sections.push_back(section(SectionKind::header, id, {para("new " + id), para("more")}));
    }
    const auto pristine = document(std::move(pristine_sections));
    const auto current = document(std::move(current_sections));

    const auto sequential = DiffEngine{}.diff(pristine, current);
    const auto parallel = DiffEngine{DiffOptions{.num_threads = 4, .tab_id = std::nullopt}}.diff(pristine, current);
    EXPECT_EQ(sequential, parallel);
    EXPECT_EQ(diff_documents(pristine, current, DiffOptions{.num_threads = 0, .tab_id = std::nullopt}), sequential);
}

TEST(DiffEngine, is_movable) {
    auto engine = DiffEngine{DiffOptions{.num_threads = 2, .tab_id = std::nullopt}};
    auto moved = std::move(engine);
    EXPECT_EQ(moved.options().num_threads, 2u);
    EXPECT_TRUE(moved.diff(body_document({para("a")}), body_document({para("a")})).empty());
}

// -- Errors -------------------------------------------------------------------

TEST(DiffEngine, malformed_pristine_is_rejected) {
    expect_error(ErrorKind::input_malformation,
                 body_document({para("a"), table({{"x"}})}), body_document({para("a")}));
}

TEST(DiffEngine, inline_image_cannot_be_inserted) {
    expect_error(ErrorKind::unsupported_content,
                 body_document({para("a")}), body_document({runs({run("a"), marker(MarkerKind::image)})}));
}

TEST(DiffEngine, standalone_rule_cannot_be_inserted) {
    expect_error(ErrorKind::unsupported_content,
                 body_document({para("a"), para("b")}),
                 body_document({para("a"), Element{SpecialElement{SpecialKind::horizontal_rule, {}}}, para("b")}));
}

TEST(DiffEngine, unreferenced_new_footnote_is_a_structural_violation) {
    expect_error(ErrorKind::structural_violation,
                 body_document({para("a")}),
                 document({body({para("a")}), section(SectionKind::footnote, "fn9", {para("x")})}));
}

TEST(DiffEngine, diff_section_rejects_kind_mismatch) {
    EXPECT_THROW(DiffEngine{}.diff_section(body({para("a")}), section(SectionKind::header, "h", {para("a")})),
                 DiffError);
}
