/// @file replay.hpp
/// @brief Flat UTF-16 images of segments and an operation replayer.
///
/// A SegmentImage is the segment as the remote API addresses it: one unit
/// per UTF-16 code unit. The Replayer applies operations to the images of a
/// document with the remote side's validity rules, which lets a diff be
/// checked by replaying it and comparing against the flattened target.

#pragma once

#include <docdelta-cpp/model.hpp>
#include <docdelta-cpp/operation.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace docdelta_cpp {

enum class UnitKind : std::uint8_t {
    text,
    newline,
    marker,
    table_start,
    row_start,
    cell_start,
    table_end,
};

/// One UTF-16 unit of a segment.
///
/// Text units carry their code unit and normalised style; newlines carry
/// the properties of the paragraph they terminate.
struct Unit {
    UnitKind kind = UnitKind::text;
    char16_t code = 0;
    MarkerKind marker = MarkerKind::page_break;
    TextStyle style;
    ParagraphProps paragraph;

    auto operator==(const Unit&) const -> bool = default;
};

struct SegmentImage {
    std::size_t start = 0;  ///< absolute offset of units[0]
    std::vector<Unit> units;

    auto end() const -> std::size_t { return start + units.size(); }

    auto operator==(const SegmentImage&) const -> bool = default;
};

/// Image of a section.
auto flatten(const Section& section) -> SegmentImage;

/// Image of @p content placed at @p start.
auto flatten(const std::vector<Element>& content, std::size_t start) -> SegmentImage;

/// Readable rendering for diagnostics: text as UTF-8, newlines as "\n",
/// markers as "[kind]", table structure as "<table>", "<row>", "<cell>",
/// "</table>".
auto render(const SegmentImage& image) -> std::string;

/// Applies operations to the images of every segment of a document.
///
/// Segments are keyed by id; the body has the empty id. Every operation is
/// validated against the current state before it is applied; an invalid
/// one throws DiffError{invalid_operation} and leaves the state unchanged.
/// Text inserted by insertText carries no formatting, and a new paragraph
/// newline copies the properties of the paragraph it splits.
class Replayer {
public:
    explicit Replayer(const Document& doc);

    void apply(const Operation& op);
    void apply(const std::vector<Operation>& ops);

    auto has_segment(std::string_view id) const -> bool;
    auto segment(std::string_view id) const -> const SegmentImage&;
    auto segment_count() const -> std::size_t { return segments_.size(); }

private:
    auto image_for(const Operation& op) -> SegmentImage&;

    std::map<std::string, SegmentImage, std::less<>> segments_;
};

}  // namespace docdelta_cpp
