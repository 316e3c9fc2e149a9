#include <docdelta-cpp/style.hpp>

#include <iterator>

namespace docdelta_cpp {

namespace {

void clear_false(std::optional<bool>& flag) {
    if (flag && !*flag) flag.reset();
}

void clear_empty(std::optional<std::string>& value) {
    if (value && value->empty()) value.reset();
}

constexpr TextField all_text_fields[] = {
    TextField::bold,
    TextField::italic,
    TextField::underline,
    TextField::strikethrough,
    TextField::small_caps,
    TextField::baseline_offset,
    TextField::link,
    TextField::foreground_color,
    TextField::background_color,
    TextField::font_family,
    TextField::font_size,
};

static_assert(std::size(all_text_fields) == text_field_count);

}  // namespace

auto normalized(const TextStyle& style) -> TextStyle {
    auto out = style;
    clear_false(out.bold);
    clear_false(out.italic);
    clear_false(out.underline);
    clear_false(out.strikethrough);
    clear_false(out.small_caps);
    if (out.baseline_offset == BaselineOffset::none) out.baseline_offset.reset();
    clear_empty(out.link);
    clear_empty(out.foreground_color);
    clear_empty(out.background_color);
    clear_empty(out.font_family);
    return out;
}

auto is_plain(const TextStyle& style) -> bool {
    return normalized(style) == TextStyle{};
}

auto field_equal(const TextStyle& a, const TextStyle& b, TextField field) -> bool {
    const auto na = normalized(a);
    const auto nb = normalized(b);
    switch (field) {
        case TextField::bold:             return na.bold == nb.bold;
        case TextField::italic:           return na.italic == nb.italic;
        case TextField::underline:        return na.underline == nb.underline;
        case TextField::strikethrough:    return na.strikethrough == nb.strikethrough;
        case TextField::small_caps:       return na.small_caps == nb.small_caps;
        case TextField::baseline_offset:  return na.baseline_offset == nb.baseline_offset;
        case TextField::link:             return na.link == nb.link;
        case TextField::foreground_color: return na.foreground_color == nb.foreground_color;
        case TextField::background_color: return na.background_color == nb.background_color;
        case TextField::font_family:      return na.font_family == nb.font_family;
        case TextField::font_size:        return na.font_size == nb.font_size;
    }
    return true;
}

auto changed_fields(const TextStyle& from, const TextStyle& to) -> std::vector<TextField> {
    auto fields = std::vector<TextField>{};
    for (auto field : all_text_fields) {
        if (!field_equal(from, to, field)) fields.push_back(field);
    }
    return fields;
}

auto set_fields(const TextStyle& style) -> std::vector<TextField> {
    return changed_fields(TextStyle{}, style);
}

void copy_fields(TextStyle& target, const TextStyle& source, const std::vector<TextField>& fields) {
    for (auto field : fields) {
        switch (field) {
            case TextField::bold:             target.bold = source.bold; break;
            case TextField::italic:           target.italic = source.italic; break;
            case TextField::underline:        target.underline = source.underline; break;
            case TextField::strikethrough:    target.strikethrough = source.strikethrough; break;
            case TextField::small_caps:       target.small_caps = source.small_caps; break;
            case TextField::baseline_offset:  target.baseline_offset = source.baseline_offset; break;
            case TextField::link:             target.link = source.link; break;
            case TextField::foreground_color: target.foreground_color = source.foreground_color; break;
            case TextField::background_color: target.background_color = source.background_color; break;
            case TextField::font_family:      target.font_family = source.font_family; break;
            case TextField::font_size:        target.font_size = source.font_size; break;
        }
    }
}

auto project(const TextStyle& source, const std::vector<TextField>& fields) -> TextStyle {
    auto out = TextStyle{};
    copy_fields(out, normalized(source), fields);
    return out;
}

}  // namespace docdelta_cpp
