/// @file model.hpp
/// @brief Canonical document tree and its UTF-16 length calculus.
///
/// Both the pristine and the current document are expressed in this model
/// before diffing. The tree is never mutated during a diff pass.

#pragma once

#include <docdelta-cpp/style.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docdelta_cpp {

/// Helper for std::visit with multiple lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Paragraph& p) { ... },
///     [](const Table& t) { ... },
///     [](const SpecialElement& s) { ... },
/// }, element);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Attribute map of atomic markers and special elements.
using Attributes = std::map<std::string, std::string>;

// -- Inline content -----------------------------------------------------------

/// Kind of a non-text atomic marker embedded in a paragraph.
enum class MarkerKind : std::uint8_t {
    horizontal_rule,
    page_break,
    column_break,
    image,
    person,
    date,
    footnote_ref,
    equation,
    autotext,
    rich_link,
};

constexpr auto to_string_view(MarkerKind kind) noexcept -> std::string_view {
    switch (kind) {
        case MarkerKind::horizontal_rule: return "hr";
        case MarkerKind::page_break:      return "pagebreak";
        case MarkerKind::column_break:    return "columnbreak";
        case MarkerKind::image:           return "image";
        case MarkerKind::person:          return "person";
        case MarkerKind::date:            return "date";
        case MarkerKind::footnote_ref:    return "footnoteref";
        case MarkerKind::equation:        return "equation";
        case MarkerKind::autotext:        return "autotext";
        case MarkerKind::rich_link:       return "richlink";
    }
    return "unknown";
}

/// A run of text sharing one style.
struct TextRun {
    std::string text;  ///< UTF-8
    TextStyle style;

    auto operator==(const TextRun&) const -> bool = default;
};

/// A non-text inline unit. Always one UTF-16 unit long.
///
/// Attributes named "id" and "num" are volatile (assigned by the remote
/// side) and ignored when comparing markers.
struct AtomicMarker {
    MarkerKind kind;
    Attributes attributes;
    std::string placeholder;  ///< display text, not part of the length

    auto operator==(const AtomicMarker&) const -> bool = default;
};

using Inline = std::variant<TextRun, AtomicMarker>;

// -- Elements -----------------------------------------------------------------

struct Bullet {
    BulletKind kind = BulletKind::bullet;
    std::string list_id;
    int nesting_level = 0;
};

/// A paragraph. Its length is the sum of its inline lengths plus one for
/// the trailing newline, which is always present.
struct Paragraph {
    std::vector<Inline> content;
    NamedStyle named_style = NamedStyle::normal_text;
    std::optional<Bullet> bullet;
    std::optional<Alignment> alignment;
    std::string style_class;  ///< style-table reference, not diffed
};

enum class SpecialKind : std::uint8_t {
    horizontal_rule,
    page_break,
};

constexpr auto to_string_view(SpecialKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SpecialKind::horizontal_rule: return "hr";
        case SpecialKind::page_break:      return "pagebreak";
    }
    return "unknown";
}

/// A standalone structural unit outside any paragraph. Length 1.
struct SpecialElement {
    SpecialKind kind = SpecialKind::page_break;
    Attributes attributes;
};

struct Table;

/// Top-level or cell-level content item.
using Element = std::variant<Paragraph, Table, SpecialElement>;

struct TableCell {
    std::size_t row = 0;
    std::size_t column = 0;
    std::vector<Element> content;  ///< must end with a Paragraph
    std::size_t column_span = 1;   ///< visual only
    std::size_t row_span = 1;      ///< visual only
    std::string style_class;
};

/// A dense rows x columns grid. Cells may be listed in any order but must
/// cover every (row, column) pair exactly once.
struct Table {
    std::size_t rows = 0;
    std::size_t columns = 0;
    std::vector<TableCell> cells;
};

// -- Sections and documents ---------------------------------------------------

enum class SectionKind : std::uint8_t {
    body,
    header,
    footer,
    footnote,
};

constexpr auto to_string_view(SectionKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SectionKind::body:     return "body";
        case SectionKind::header:   return "header";
        case SectionKind::footer:   return "footer";
        case SectionKind::footnote: return "footnote";
    }
    return "unknown";
}

/// An independently addressed segment of the document.
struct Section {
    SectionKind kind = SectionKind::body;
    std::string id;                       ///< empty for the body
    std::vector<Element> content;         ///< must end with a Paragraph
    std::optional<std::size_t> end_index; ///< asserted segment end, if known
};

struct Document {
    std::string document_id;
    std::string revision_id;
    std::string title;
    std::vector<Section> sections;
};

// -- Length calculus ----------------------------------------------------------

auto length(const Inline& item) -> std::size_t;
auto length(const Paragraph& paragraph) -> std::size_t;
auto length(const SpecialElement& special) -> std::size_t;
auto length(const TableCell& cell) -> std::size_t;
auto length(const Table& table) -> std::size_t;
auto length(const Element& element) -> std::size_t;

/// Sum of element lengths.
auto content_length(const std::vector<Element>& content) -> std::size_t;

/// Offset of the first content unit: 1 for the body (index 0 is the
/// leading section break), 0 for every other segment.
constexpr auto section_start(SectionKind kind) noexcept -> std::size_t {
    return kind == SectionKind::body ? 1 : 0;
}

/// Offset one past the segment's final newline.
auto section_end(const Section& section) -> std::size_t;

// -- Queries ------------------------------------------------------------------

/// Paragraph text with markers rendered as U+FFFC, without the newline.
auto plain_text(const Paragraph& paragraph) -> std::string;

/// The properties the engine diffs.
auto props_of(const Paragraph& paragraph) -> ParagraphProps;

/// Cells in row-major order. Requires a validated table.
auto ordered_cells(const Table& table) -> std::vector<const TableCell*>;

/// The cell at (row, column), or nullptr.
auto find_cell(const Table& table, std::size_t row, std::size_t column) -> const TableCell*;

auto find_section(const Document& doc, SectionKind kind, std::string_view id) -> const Section*;

/// Check the structural rules of a section: content ends with a Paragraph
/// (at every nesting level), tables are dense, and a present end_index
/// matches the computed end. Throws DiffError{input_malformation}.
///
/// @param allow_empty accept empty content (a current section that the
///        engine normalises to one empty paragraph).
void validate(const Section& section, bool allow_empty = false);

/// Validate every section and reject duplicate (kind, id) pairs or a
/// missing body.
void validate(const Document& doc, bool allow_empty = false);

// -- Builders -----------------------------------------------------------------

/// A paragraph with one plain text run (no run for empty text).
auto make_paragraph(std::string text, NamedStyle style = NamedStyle::normal_text) -> Paragraph;

/// A paragraph from explicit runs.
auto make_paragraph(std::vector<Inline> content, NamedStyle style = NamedStyle::normal_text) -> Paragraph;

/// A table whose cells each hold one plain paragraph.
auto make_table(const std::vector<std::vector<std::string>>& rows) -> Table;

}  // namespace docdelta_cpp
