/// @file operation.hpp
/// @brief Positional edit operations produced by the diff engine.

#pragma once

#include <docdelta-cpp/style.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docdelta_cpp {

/// A half-open UTF-16 range [start_index, end_index).
struct Range {
    std::size_t start_index;
    std::size_t end_index;
    auto operator==(const Range&) const -> bool = default;
};

/// A UTF-16 insertion point.
struct Location {
    std::size_t index;
    auto operator==(const Location&) const -> bool = default;
};

/// The segment an operation addresses. An empty id is the body.
///
/// A provisional id names a segment created earlier in the same operation
/// list (a new header, footer or footnote); the batch coordinator replaces
/// it with the id the remote side assigns.
struct SegmentRef {
    std::string id;
    bool provisional{false};
    auto operator==(const SegmentRef&) const -> bool = default;
};

enum class SectionBreakType : std::uint8_t {
    continuous,
    next_page,
};

constexpr auto to_string_view(SectionBreakType type) noexcept -> std::string_view {
    switch (type) {
        case SectionBreakType::continuous: return "CONTINUOUS";
        case SectionBreakType::next_page:  return "NEXT_PAGE";
    }
    return "CONTINUOUS";
}

enum class HeaderFooterType : std::uint8_t {
    standard,
};

constexpr auto to_string_view(HeaderFooterType type) noexcept -> std::string_view {
    switch (type) {
        case HeaderFooterType::standard: return "DEFAULT";
    }
    return "DEFAULT";
}

// -- Payloads -----------------------------------------------------------------

struct DeleteContentRange {
    Range range;
    auto operator==(const DeleteContentRange&) const -> bool = default;
};

struct InsertText {
    Location location;
    std::string text;  ///< UTF-8
    auto operator==(const InsertText&) const -> bool = default;
};

/// Fields listed in the mask but unset in the style are reset.
struct UpdateTextStyle {
    Range range;
    TextStyle text_style;
    std::vector<TextField> fields;
    auto operator==(const UpdateTextStyle&) const -> bool = default;
};

struct UpdateParagraphStyle {
    Range range;
    ParagraphStyle paragraph_style;
    std::vector<ParagraphField> fields;
    auto operator==(const UpdateParagraphStyle&) const -> bool = default;
};

struct CreateParagraphBullets {
    Range range;
    BulletKind bullet;
    auto operator==(const CreateParagraphBullets&) const -> bool = default;
};

struct DeleteParagraphBullets {
    Range range;
    auto operator==(const DeleteParagraphBullets&) const -> bool = default;
};

struct InsertTable {
    Location location;
    std::size_t rows;
    std::size_t columns;
    auto operator==(const InsertTable&) const -> bool = default;
};

struct InsertPageBreak {
    Location location;
    auto operator==(const InsertPageBreak&) const -> bool = default;
};

struct InsertSectionBreak {
    Location location;
    SectionBreakType type{SectionBreakType::continuous};
    auto operator==(const InsertSectionBreak&) const -> bool = default;
};

/// Inserts a footnote reference and creates the footnote segment.
struct CreateFootnote {
    Location location;
    std::string provisional_id;
    auto operator==(const CreateFootnote&) const -> bool = default;
};

struct CreateHeader {
    HeaderFooterType type{HeaderFooterType::standard};
    std::string provisional_id;
    auto operator==(const CreateHeader&) const -> bool = default;
};

struct CreateFooter {
    HeaderFooterType type{HeaderFooterType::standard};
    std::string provisional_id;
    auto operator==(const CreateFooter&) const -> bool = default;
};

struct DeleteHeader {
    std::string header_id;
    auto operator==(const DeleteHeader&) const -> bool = default;
};

struct DeleteFooter {
    std::string footer_id;
    auto operator==(const DeleteFooter&) const -> bool = default;
};

/// The set of possible operation payloads.
using OperationAction = std::variant<
    DeleteContentRange,
    InsertText,
    UpdateTextStyle,
    UpdateParagraphStyle,
    CreateParagraphBullets,
    DeleteParagraphBullets,
    InsertTable,
    InsertPageBreak,
    InsertSectionBreak,
    CreateFootnote,
    CreateHeader,
    CreateFooter,
    DeleteHeader,
    DeleteFooter
>;

/// Operation kinds, in OperationAction alternative order.
enum class OpKind : std::uint8_t {
    delete_content_range,
    insert_text,
    update_text_style,
    update_paragraph_style,
    create_paragraph_bullets,
    delete_paragraph_bullets,
    insert_table,
    insert_page_break,
    insert_section_break,
    create_footnote,
    create_header,
    create_footer,
    delete_header,
    delete_footer,
};

/// Wire name of an operation kind ("deleteContentRange", ...).
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::delete_content_range:     return "deleteContentRange";
        case OpKind::insert_text:              return "insertText";
        case OpKind::update_text_style:        return "updateTextStyle";
        case OpKind::update_paragraph_style:   return "updateParagraphStyle";
        case OpKind::create_paragraph_bullets: return "createParagraphBullets";
        case OpKind::delete_paragraph_bullets: return "deleteParagraphBullets";
        case OpKind::insert_table:             return "insertTable";
        case OpKind::insert_page_break:        return "insertPageBreak";
        case OpKind::insert_section_break:     return "insertSectionBreak";
        case OpKind::create_footnote:          return "createFootnote";
        case OpKind::create_header:            return "createHeader";
        case OpKind::create_footer:            return "createFooter";
        case OpKind::delete_header:            return "deleteHeader";
        case OpKind::delete_footer:            return "deleteFooter";
    }
    return "unknown";
}

/// Kind of a payload. Throws DiffError{unknown_operation} for a valueless
/// variant.
auto kind_of(const OperationAction& action) -> OpKind;

/// A single positional edit.
///
/// Operations are returned in replay order. change_group, is_post_insert
/// and generation are the ordering keys the engine sorted by; they are kept
/// so callers can split the list into batches without reordering it.
struct Operation {
    SegmentRef segment;                 ///< Target segment (empty id = body).
    std::optional<std::string> tab_id;  ///< Non-default document tab.
    OperationAction action;             ///< What to do.
    std::uint32_t change_group{0};      ///< Lower groups are applied first.
    bool is_post_insert{false};         ///< Targets content inserted in the same group.
    std::uint64_t generation{0};        ///< Emission counter, final tie-break.

    auto kind() const -> OpKind { return kind_of(action); }

    /// True if the segment id is a forward reference.
    auto requires_resolution() const noexcept -> bool { return segment.provisional; }

    auto operator==(const Operation&) const -> bool = default;
};

}  // namespace docdelta_cpp
