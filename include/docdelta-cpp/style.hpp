/// @file style.hpp
/// @brief Text and paragraph style types.
///
/// Styles are fixed sets of optional fields. An unset field means
/// "inherit"; normalisation maps the API's explicit defaults (false,
/// baseline NONE, empty strings) to unset so that two styles compare equal
/// exactly when they render the same.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docdelta_cpp {

// -- Enumerations -------------------------------------------------------------

/// Named paragraph style.
enum class NamedStyle : std::uint8_t {
    normal_text,
    title,
    subtitle,
    heading_1,
    heading_2,
    heading_3,
    heading_4,
    heading_5,
    heading_6,
};

/// Wire name of a NamedStyle ("NORMAL_TEXT", "HEADING_1", ...).
constexpr auto to_string_view(NamedStyle style) noexcept -> std::string_view {
    switch (style) {
        case NamedStyle::normal_text: return "NORMAL_TEXT";
        case NamedStyle::title:       return "TITLE";
        case NamedStyle::subtitle:    return "SUBTITLE";
        case NamedStyle::heading_1:   return "HEADING_1";
        case NamedStyle::heading_2:   return "HEADING_2";
        case NamedStyle::heading_3:   return "HEADING_3";
        case NamedStyle::heading_4:   return "HEADING_4";
        case NamedStyle::heading_5:   return "HEADING_5";
        case NamedStyle::heading_6:   return "HEADING_6";
    }
    return "NORMAL_TEXT";
}

enum class Alignment : std::uint8_t {
    start,
    center,
    end,
    justified,
};

constexpr auto to_string_view(Alignment alignment) noexcept -> std::string_view {
    switch (alignment) {
        case Alignment::start:     return "START";
        case Alignment::center:    return "CENTER";
        case Alignment::end:       return "END";
        case Alignment::justified: return "JUSTIFIED";
    }
    return "START";
}

enum class BaselineOffset : std::uint8_t {
    none,
    superscript,
    subscript,
};

constexpr auto to_string_view(BaselineOffset offset) noexcept -> std::string_view {
    switch (offset) {
        case BaselineOffset::none:        return "NONE";
        case BaselineOffset::superscript: return "SUPERSCRIPT";
        case BaselineOffset::subscript:   return "SUBSCRIPT";
    }
    return "NONE";
}

/// Kind of list a bulleted paragraph belongs to.
enum class BulletKind : std::uint8_t {
    bullet,
    decimal,
    alpha,
    roman,
    checkbox,
};

constexpr auto to_string_view(BulletKind kind) noexcept -> std::string_view {
    switch (kind) {
        case BulletKind::bullet:   return "bullet";
        case BulletKind::decimal:  return "decimal";
        case BulletKind::alpha:    return "alpha";
        case BulletKind::roman:    return "roman";
        case BulletKind::checkbox: return "checkbox";
    }
    return "bullet";
}

/// The API bullet preset that creates a list of the given kind.
constexpr auto bullet_preset(BulletKind kind) noexcept -> std::string_view {
    switch (kind) {
        case BulletKind::bullet:   return "BULLET_DISC_CIRCLE_SQUARE";
        case BulletKind::decimal:  return "NUMBERED_DECIMAL_NESTED";
        case BulletKind::alpha:    return "NUMBERED_UPPERALPHA_ALPHA_ROMAN";
        case BulletKind::roman:    return "NUMBERED_UPPERROMAN_UPPERALPHA_DECIMAL";
        case BulletKind::checkbox: return "BULLET_CHECKBOX";
    }
    return "BULLET_DISC_CIRCLE_SQUARE";
}

/// Indentation applied per list nesting level, in points.
inline constexpr double indent_per_level_pt = 36.0;

// -- Text style ---------------------------------------------------------------

/// Fields of a TextStyle, named as in the API's field mask.
enum class TextField : std::uint8_t {
    bold,
    italic,
    underline,
    strikethrough,
    small_caps,
    baseline_offset,
    link,
    foreground_color,
    background_color,
    font_family,
    font_size,
};

inline constexpr std::size_t text_field_count = 11;

constexpr auto to_string_view(TextField field) noexcept -> std::string_view {
    switch (field) {
        case TextField::bold:             return "bold";
        case TextField::italic:           return "italic";
        case TextField::underline:        return "underline";
        case TextField::strikethrough:    return "strikethrough";
        case TextField::small_caps:       return "smallCaps";
        case TextField::baseline_offset:  return "baselineOffset";
        case TextField::link:             return "link";
        case TextField::foreground_color: return "foregroundColor";
        case TextField::background_color: return "backgroundColor";
        case TextField::font_family:      return "weightedFontFamily";
        case TextField::font_size:        return "fontSize";
    }
    return "bold";
}

/// Character-level formatting. Colours are "#RRGGBB", sizes in points.
struct TextStyle {
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;
    std::optional<bool> strikethrough;
    std::optional<bool> small_caps;
    std::optional<BaselineOffset> baseline_offset;
    std::optional<std::string> link;
    std::optional<std::string> foreground_color;
    std::optional<std::string> background_color;
    std::optional<std::string> font_family;
    std::optional<double> font_size;

    auto operator==(const TextStyle&) const -> bool = default;
};

/// Map explicit defaults to unset.
auto normalized(const TextStyle& style) -> TextStyle;

/// True if the style carries no formatting after normalisation.
auto is_plain(const TextStyle& style) -> bool;

/// True if @p field has the same value in both styles (both normalised).
auto field_equal(const TextStyle& a, const TextStyle& b, TextField field) -> bool;

/// Fields whose normalised value differs between @p from and @p to.
auto changed_fields(const TextStyle& from, const TextStyle& to) -> std::vector<TextField>;

/// Fields set in the normalised @p style.
auto set_fields(const TextStyle& style) -> std::vector<TextField>;

/// Copy the listed fields from @p source into @p target (unset included).
void copy_fields(TextStyle& target, const TextStyle& source, const std::vector<TextField>& fields);

/// A style containing only the listed fields of @p source.
auto project(const TextStyle& source, const std::vector<TextField>& fields) -> TextStyle;

// -- Paragraph style ----------------------------------------------------------

/// Fields of a ParagraphStyle, named as in the API's field mask.
enum class ParagraphField : std::uint8_t {
    named_style_type,
    alignment,
    indent_start,
    indent_first_line,
};

constexpr auto to_string_view(ParagraphField field) noexcept -> std::string_view {
    switch (field) {
        case ParagraphField::named_style_type:  return "namedStyleType";
        case ParagraphField::alignment:         return "alignment";
        case ParagraphField::indent_start:      return "indentStart";
        case ParagraphField::indent_first_line: return "indentFirstLine";
    }
    return "namedStyleType";
}

/// Paragraph-level style payload of an update operation. Indents in points.
struct ParagraphStyle {
    std::optional<NamedStyle> named_style;
    std::optional<Alignment> alignment;
    std::optional<double> indent_start;
    std::optional<double> indent_first_line;

    auto operator==(const ParagraphStyle&) const -> bool = default;
};

/// The paragraph properties the engine diffs and the replayer tracks.
struct ParagraphProps {
    NamedStyle named_style = NamedStyle::normal_text;
    std::optional<Alignment> alignment;
    std::optional<BulletKind> bullet;
    int nesting_level = 0;

    auto operator==(const ParagraphProps&) const -> bool = default;
};

}  // namespace docdelta_cpp
