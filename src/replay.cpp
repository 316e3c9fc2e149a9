#include <docdelta-cpp/replay.hpp>

#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/utf16.hpp>

#include <cmath>
#include <utility>
#include <variant>

namespace docdelta_cpp {

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw DiffError{ErrorKind::invalid_operation, message};
}

auto is_structural(UnitKind kind) -> bool {
    return kind == UnitKind::table_start || kind == UnitKind::row_start
        || kind == UnitKind::cell_start || kind == UnitKind::table_end;
}

auto marker_unit(MarkerKind kind) -> Unit {
    auto unit = Unit{};
    unit.kind = UnitKind::marker;
    unit.marker = kind;
    return unit;
}

auto structure_unit(UnitKind kind) -> Unit {
    auto unit = Unit{};
    unit.kind = kind;
    return unit;
}

auto newline_unit(const ParagraphProps& props) -> Unit {
    auto unit = Unit{};
    unit.kind = UnitKind::newline;
    unit.code = u'\n';
    unit.paragraph = props;
    return unit;
}

void flatten_into(const std::vector<Element>& content, std::vector<Unit>& units) {
    for (const auto& element : content) {
        std::visit(overload{
            [&](const Paragraph& p) {
                for (const auto& item : p.content) {
                    if (const auto* run = std::get_if<TextRun>(&item)) {
                        const auto style = normalized(run->style);
                        for (auto code : to_utf16(run->text)) {
                            auto unit = Unit{};
                            unit.code = code;
                            unit.style = style;
                            units.push_back(std::move(unit));
                        }
                    } else {
                        units.push_back(marker_unit(std::get<AtomicMarker>(item).kind));
                    }
                }
                units.push_back(newline_unit(props_of(p)));
            },
            [&](const Table& t) {
                const auto cells = ordered_cells(t);
                units.push_back(structure_unit(UnitKind::table_start));
                for (std::size_t r = 0; r < t.rows; ++r) {
                    units.push_back(structure_unit(UnitKind::row_start));
                    for (std::size_t c = 0; c < t.columns; ++c) {
                        units.push_back(structure_unit(UnitKind::cell_start));
                        flatten_into(cells[r * t.columns + c]->content, units);
                    }
                }
                units.push_back(structure_unit(UnitKind::table_end));
            },
            [&](const SpecialElement& s) {
                units.push_back(marker_unit(s.kind == SpecialKind::horizontal_rule
                                                ? MarkerKind::horizontal_rule
                                                : MarkerKind::page_break));
            },
        }, element);
    }
}

auto blank_image() -> SegmentImage {
    auto image = SegmentImage{};
    image.units.push_back(newline_unit(ParagraphProps{}));
    return image;
}

// A new footnote holds a single space before its newline.
auto blank_footnote_image() -> SegmentImage {
    auto space = Unit{};
    space.code = u' ';
    auto image = SegmentImage{};
    image.units.push_back(space);
    image.units.push_back(newline_unit(ParagraphProps{}));
    return image;
}

// -- Index checks -------------------------------------------------------------

// Local position of an insertion point; it must lie inside a paragraph.
auto insertion_point(const SegmentImage& image, std::size_t index) -> std::size_t {
    if (index < image.start || index >= image.end()) {
        invalid("insertion index " + std::to_string(index) + " outside segment ["
                + std::to_string(image.start) + ", " + std::to_string(image.end()) + ")");
    }
    const auto local = index - image.start;
    const auto kind = image.units[local].kind;
    if (kind != UnitKind::text && kind != UnitKind::newline && kind != UnitKind::marker) {
        invalid("insertion index " + std::to_string(index) + " is not inside a paragraph");
    }
    return local;
}

void check_range(const SegmentImage& image, const Range& range) {
    if (range.start_index >= range.end_index || range.start_index < image.start
        || range.end_index > image.end()) {
        invalid("range [" + std::to_string(range.start_index) + ", " + std::to_string(range.end_index)
                + ") invalid for segment [" + std::to_string(image.start) + ", "
                + std::to_string(image.end()) + ")");
    }
}

void check_deletion(const SegmentImage& image, const Range& range) {
    check_range(image, range);
    if (range.end_index >= image.end()) {
        invalid("delete [" + std::to_string(range.start_index) + ", " + std::to_string(range.end_index)
                + ") includes the final newline");
    }

    const auto first = range.start_index - image.start;
    const auto last = range.end_index - image.start;
    auto depth = 0;
    for (auto i = first; i < last; ++i) {
        switch (image.units[i].kind) {
            case UnitKind::table_start: ++depth; break;
            case UnitKind::table_end:
                if (--depth < 0) invalid("delete ends a table it does not start");
                break;
            case UnitKind::row_start:
            case UnitKind::cell_start:
                if (depth == 0) invalid("delete covers part of a table");
                break;
            default: break;
        }
    }
    if (depth != 0) invalid("delete starts a table it does not end");

    const auto next = image.units[last].kind;
    if (first > 0) {
        const auto prev = image.units[first - 1].kind;
        if (prev == UnitKind::text && is_structural(next)) {
            invalid("delete removes the newline of a paragraph before " + std::to_string(range.end_index));
        }
        if (prev == UnitKind::cell_start && is_structural(next) && next != UnitKind::table_start) {
            invalid("delete empties a table cell at " + std::to_string(range.start_index));
        }
    }
}

// Properties of the paragraph containing local position @p pos.
auto containing_props(const SegmentImage& image, std::size_t pos) -> ParagraphProps {
    for (auto i = pos; i < image.units.size(); ++i) {
        const auto kind = image.units[i].kind;
        if (kind == UnitKind::newline) return image.units[i].paragraph;
        if (is_structural(kind)) break;
    }
    return ParagraphProps{};
}

// Calls fn(newline unit) for every paragraph overlapping the local range.
template <typename Fn>
void for_each_paragraph(SegmentImage& image, const Range& range, Fn&& fn) {
    const auto first = range.start_index - image.start;
    const auto last = range.end_index - image.start;
    auto paragraph_start = std::size_t{0};
    for (std::size_t i = 0; i < image.units.size() && paragraph_start < last; ++i) {
        const auto kind = image.units[i].kind;
        if (kind == UnitKind::newline) {
            if (i >= first) fn(image.units[i]);
            paragraph_start = i + 1;
        } else if (is_structural(kind)) {
            paragraph_start = i + 1;
        }
    }
}

void apply_paragraph_style(ParagraphProps& props, const UpdateParagraphStyle& update) {
    for (auto field : update.fields) {
        const auto& style = update.paragraph_style;
        switch (field) {
            case ParagraphField::named_style_type:
                props.named_style = style.named_style.value_or(NamedStyle::normal_text);
                break;
            case ParagraphField::alignment:
                props.alignment = style.alignment;
                break;
            case ParagraphField::indent_start:
                props.nesting_level = style.indent_start
                    ? static_cast<int>(std::lround(*style.indent_start / indent_per_level_pt))
                    : 0;
                break;
            case ParagraphField::indent_first_line:
                break;
        }
    }
}

}  // namespace

// -- Flattening ---------------------------------------------------------------

auto flatten(const std::vector<Element>& content, std::size_t start) -> SegmentImage {
    auto image = SegmentImage{};
    image.start = start;
    flatten_into(content, image.units);
    return image;
}

auto flatten(const Section& section) -> SegmentImage {
    return flatten(section.content, section_start(section.kind));
}

auto render(const SegmentImage& image) -> std::string {
    auto out = std::string{};
    auto pending = std::u16string{};
    auto flush = [&] {
        out += to_utf8(pending);
        pending.clear();
    };
    for (const auto& unit : image.units) {
        if (unit.kind == UnitKind::text) {
            pending.push_back(unit.code);
            continue;
        }
        flush();
        switch (unit.kind) {
            case UnitKind::newline:     out += '\n'; break;
            case UnitKind::marker:      out += "[" + std::string{to_string_view(unit.marker)} + "]"; break;
            case UnitKind::table_start: out += "<table>"; break;
            case UnitKind::row_start:   out += "<row>"; break;
            case UnitKind::cell_start:  out += "<cell>"; break;
            case UnitKind::table_end:   out += "</table>"; break;
            case UnitKind::text:        break;
        }
    }
    flush();
    return out;
}

// -- Replayer -----------------------------------------------------------------

Replayer::Replayer(const Document& doc) {
    for (const auto& section : doc.sections) {
        segments_.insert_or_assign(section.id, flatten(section));
    }
}

auto Replayer::has_segment(std::string_view id) const -> bool {
    return segments_.find(id) != segments_.end();
}

auto Replayer::segment(std::string_view id) const -> const SegmentImage& {
    auto it = segments_.find(id);
    if (it == segments_.end()) invalid("unknown segment '" + std::string{id} + "'");
    return it->second;
}

auto Replayer::image_for(const Operation& op) -> SegmentImage& {
    auto it = segments_.find(op.segment.id);
    if (it == segments_.end()) invalid("unknown segment '" + op.segment.id + "'");
    return it->second;
}

void Replayer::apply(const std::vector<Operation>& ops) {
    for (const auto& op : ops) apply(op);
}

void Replayer::apply(const Operation& op) {
    if (op.action.valueless_by_exception()) invalid("operation has no payload");

    // -- Segment-level operations ---------------------------------------------

    if (const auto* create = std::get_if<CreateHeader>(&op.action)) {
        if (!segments_.emplace(create->provisional_id, blank_image()).second) {
            invalid("segment '" + create->provisional_id + "' already exists");
        }
        return;
    }
    if (const auto* create = std::get_if<CreateFooter>(&op.action)) {
        if (!segments_.emplace(create->provisional_id, blank_image()).second) {
            invalid("segment '" + create->provisional_id + "' already exists");
        }
        return;
    }
    if (const auto* del = std::get_if<DeleteHeader>(&op.action)) {
        if (segments_.erase(del->header_id) == 0) invalid("unknown header '" + del->header_id + "'");
        return;
    }
    if (const auto* del = std::get_if<DeleteFooter>(&op.action)) {
        if (segments_.erase(del->footer_id) == 0) invalid("unknown footer '" + del->footer_id + "'");
        return;
    }

    // -- Content operations ---------------------------------------------------

    auto& image = image_for(op);
    auto insert_units = [&](std::size_t local, std::vector<Unit> units) {
        image.units.insert(image.units.begin() + static_cast<std::ptrdiff_t>(local),
                           std::make_move_iterator(units.begin()), std::make_move_iterator(units.end()));
    };

    std::visit(overload{
        [&](const DeleteContentRange& a) {
            check_deletion(image, a.range);
            image.units.erase(image.units.begin() + static_cast<std::ptrdiff_t>(a.range.start_index - image.start),
                              image.units.begin() + static_cast<std::ptrdiff_t>(a.range.end_index - image.start));
        },
        [&](const InsertText& a) {
            const auto local = insertion_point(image, a.location.index);
            const auto props = containing_props(image, local);
            auto units = std::vector<Unit>{};
            for (auto code : to_utf16(a.text)) {
                if (code == u'\n') {
                    units.push_back(newline_unit(props));
                } else {
                    auto unit = Unit{};
                    unit.code = code;
                    units.push_back(std::move(unit));
                }
            }
            insert_units(local, std::move(units));
        },
        [&](const UpdateTextStyle& a) {
            check_range(image, a.range);
            for (auto i = a.range.start_index - image.start; i < a.range.end_index - image.start; ++i) {
                auto& unit = image.units[i];
                if (unit.kind != UnitKind::text) continue;
                copy_fields(unit.style, a.text_style, a.fields);
                unit.style = normalized(unit.style);
            }
        },
        [&](const UpdateParagraphStyle& a) {
            check_range(image, a.range);
            for_each_paragraph(image, a.range, [&](Unit& newline) { apply_paragraph_style(newline.paragraph, a); });
        },
        [&](const CreateParagraphBullets& a) {
            check_range(image, a.range);
            for_each_paragraph(image, a.range, [&](Unit& newline) { newline.paragraph.bullet = a.bullet; });
        },
        [&](const DeleteParagraphBullets& a) {
            check_range(image, a.range);
            for_each_paragraph(image, a.range, [&](Unit& newline) { newline.paragraph.bullet.reset(); });
        },
        [&](const InsertTable& a) {
            // The paragraph at the index is split first; the table follows
            // the new newline.
            const auto local = insertion_point(image, a.location.index);
            if (a.rows == 0 || a.columns == 0) invalid("table without rows or columns");
            auto units = std::vector<Unit>{newline_unit(containing_props(image, local)),
                                           structure_unit(UnitKind::table_start)};
            for (std::size_t r = 0; r < a.rows; ++r) {
                units.push_back(structure_unit(UnitKind::row_start));
                for (std::size_t c = 0; c < a.columns; ++c) {
                    units.push_back(structure_unit(UnitKind::cell_start));
                    units.push_back(newline_unit(ParagraphProps{}));
                }
            }
            units.push_back(structure_unit(UnitKind::table_end));
            insert_units(local, std::move(units));
        },
        [&](const InsertPageBreak& a) {
            insert_units(insertion_point(image, a.location.index), {marker_unit(MarkerKind::page_break)});
        },
        [&](const InsertSectionBreak& a) {
            insert_units(insertion_point(image, a.location.index), {marker_unit(MarkerKind::column_break)});
        },
        [&](const CreateFootnote& a) {
            insert_units(insertion_point(image, a.location.index), {marker_unit(MarkerKind::footnote_ref)});
            segments_.insert_or_assign(a.provisional_id, blank_footnote_image());
        },
        [](const auto&) {},
    }, op.action);
}

}  // namespace docdelta_cpp
