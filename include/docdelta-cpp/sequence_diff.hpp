/// @file sequence_diff.hpp
/// @brief Signature-based alignment of element sequences.
///
/// Two element lists of one segment are aligned by a longest common
/// subsequence over coarse element signatures. Equal runs only guarantee
/// signature equality; callers re-check pairs with elements_match().

#pragma once

#include <docdelta-cpp/model.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace docdelta_cpp {

/// An element together with its absolute [start, end) offsets.
struct IndexedElement {
    const Element* element = nullptr;
    std::size_t start = 0;
    std::size_t end = 0;
};

/// Walk @p content accumulating lengths from @p start.
auto index_elements(const std::vector<Element>& content, std::size_t start) -> std::vector<IndexedElement>;

enum class ChangeKind : std::uint8_t {
    equal,
    insert,
    remove,
    replace,
};

constexpr auto to_string_view(ChangeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ChangeKind::equal:   return "equal";
        case ChangeKind::insert:  return "insert";
        case ChangeKind::remove:  return "delete";
        case ChangeKind::replace: return "replace";
    }
    return "unknown";
}

/// One contiguous run of the alignment.
///
/// [pristine_begin, pristine_end) and [current_begin, current_end) are
/// positions in the input lists; the elements carry their offsets.
struct ChangeBlock {
    ChangeKind kind = ChangeKind::equal;
    std::size_t pristine_begin = 0;
    std::size_t pristine_end = 0;
    std::size_t current_begin = 0;
    std::size_t current_end = 0;
    std::vector<IndexedElement> pristine;
    std::vector<IndexedElement> current;
};

/// Coarse fingerprint used only for alignment.
///
/// Paragraph: named style, bullet kind and text. Table: dimensions.
/// Special element: kind and non-volatile attributes.
auto element_signature(const Element& element) -> std::string;

/// Deep equality over text, styles, paragraph properties and nested cell
/// content. Volatile marker attributes and style-class references are
/// ignored.
auto elements_match(const Element& a, const Element& b) -> bool;
auto paragraphs_match(const Paragraph& a, const Paragraph& b) -> bool;
auto tables_match(const Table& a, const Table& b) -> bool;
auto specials_match(const SpecialElement& a, const SpecialElement& b) -> bool;
auto markers_match(const AtomicMarker& a, const AtomicMarker& b) -> bool;
auto contents_match(const std::vector<Element>& a, const std::vector<Element>& b) -> bool;

/// True if both lists are pairwise elements_match().
auto sections_are_identical(const std::vector<IndexedElement>& pristine,
                            const std::vector<IndexedElement>& current) -> bool;

/// Align the two lists. Blocks are returned in document order and cover
/// both lists completely. Ties prefer matching earlier elements.
auto sequence_diff(const std::vector<IndexedElement>& pristine,
                   const std::vector<IndexedElement>& current) -> std::vector<ChangeBlock>;

}  // namespace docdelta_cpp
