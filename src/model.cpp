#include <docdelta-cpp/model.hpp>

#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/utf16.hpp>

#include <set>
#include <utility>

namespace docdelta_cpp {

namespace {

void validate_content(const std::vector<Element>& content, bool allow_empty, std::string_view where);

void validate_table(const Table& table, std::string_view where) {
    if (table.rows == 0 || table.columns == 0) {
        throw DiffError{ErrorKind::input_malformation,
                        std::string{where} + ": table has no rows or columns"};
    }
    if (table.cells.size() != table.rows * table.columns) {
        throw DiffError{ErrorKind::input_malformation,
                        std::string{where} + ": table is not dense"};
    }
    auto seen = std::set<std::pair<std::size_t, std::size_t>>{};
    for (const auto& cell : table.cells) {
        if (cell.row >= table.rows || cell.column >= table.columns
            || !seen.emplace(cell.row, cell.column).second) {
            throw DiffError{ErrorKind::input_malformation,
                            std::string{where} + ": table cell coordinates are invalid"};
        }
        validate_content(cell.content, false, where);
    }
}

void validate_content(const std::vector<Element>& content, bool allow_empty, std::string_view where) {
    if (content.empty()) {
        if (allow_empty) return;
        throw DiffError{ErrorKind::input_malformation, std::string{where} + ": content is empty"};
    }
    if (!std::holds_alternative<Paragraph>(content.back())) {
        throw DiffError{ErrorKind::input_malformation,
                        std::string{where} + ": content does not end with a paragraph"};
    }
    for (const auto& element : content) {
        if (const auto* table = std::get_if<Table>(&element)) validate_table(*table, where);
    }
}

}  // namespace

// -- Length calculus ----------------------------------------------------------

auto length(const Inline& item) -> std::size_t {
    return std::visit(overload{
        [](const TextRun& run) { return utf16_len(run.text); },
        [](const AtomicMarker&) { return std::size_t{1}; },
    }, item);
}

auto length(const Paragraph& paragraph) -> std::size_t {
    auto total = std::size_t{1};
    for (const auto& item : paragraph.content) total += length(item);
    return total;
}

auto length(const SpecialElement&) -> std::size_t {
    return 1;
}

auto length(const TableCell& cell) -> std::size_t {
    return 1 + content_length(cell.content);
}

auto length(const Table& table) -> std::size_t {
    // table start + one row marker per row + table end
    auto total = std::size_t{2} + table.rows;
    for (const auto& cell : table.cells) total += length(cell);
    return total;
}

auto length(const Element& element) -> std::size_t {
    return std::visit([](const auto& e) { return length(e); }, element);
}

auto content_length(const std::vector<Element>& content) -> std::size_t {
    auto total = std::size_t{0};
    for (const auto& element : content) total += length(element);
    return total;
}

auto section_end(const Section& section) -> std::size_t {
    return section_start(section.kind) + content_length(section.content);
}

// -- Queries ------------------------------------------------------------------

auto plain_text(const Paragraph& paragraph) -> std::string {
    auto text = std::string{};
    for (const auto& item : paragraph.content) {
        std::visit(overload{
            [&](const TextRun& run) { text += run.text; },
            [&](const AtomicMarker&) { text += "\xEF\xBF\xBC"; },
        }, item);
    }
    return text;
}

auto props_of(const Paragraph& paragraph) -> ParagraphProps {
    auto props = ParagraphProps{.named_style = paragraph.named_style,
                                .alignment = paragraph.alignment,
                                .bullet = std::nullopt,
                                .nesting_level = 0};
    if (paragraph.bullet) {
        props.bullet = paragraph.bullet->kind;
        props.nesting_level = paragraph.bullet->nesting_level;
    }
    return props;
}

auto ordered_cells(const Table& table) -> std::vector<const TableCell*> {
    auto cells = std::vector<const TableCell*>(table.rows * table.columns, nullptr);
    for (const auto& cell : table.cells) {
        if (cell.row < table.rows && cell.column < table.columns) {
            cells[cell.row * table.columns + cell.column] = &cell;
        }
    }
    return cells;
}

auto find_cell(const Table& table, std::size_t row, std::size_t column) -> const TableCell* {
    for (const auto& cell : table.cells) {
        if (cell.row == row && cell.column == column) return &cell;
    }
    return nullptr;
}

auto find_section(const Document& doc, SectionKind kind, std::string_view id) -> const Section* {
    for (const auto& section : doc.sections) {
        if (section.kind == kind && (kind == SectionKind::body || section.id == id)) return &section;
    }
    return nullptr;
}

void validate(const Section& section, bool allow_empty) {
    const auto where = std::string{to_string_view(section.kind)}
                     + (section.id.empty() ? std::string{} : " '" + section.id + "'");
    validate_content(section.content, allow_empty, where);
    if (section.end_index && !section.content.empty()) {
        const auto computed = section_end(section);
        if (computed != *section.end_index) {
            throw DiffError{ErrorKind::input_malformation,
                            where + ": computed end index " + std::to_string(computed)
                            + " does not match asserted " + std::to_string(*section.end_index)};
        }
    }
}

void validate(const Document& doc, bool allow_empty) {
    auto keys = std::set<std::pair<SectionKind, std::string>>{};
    auto bodies = 0;
    for (const auto& section : doc.sections) {
        if (section.kind == SectionKind::body) {
            ++bodies;
        } else if (section.id.empty()) {
            throw DiffError{ErrorKind::input_malformation,
                            std::string{to_string_view(section.kind)} + " section has no id"};
        }
        if (!keys.emplace(section.kind, section.id).second) {
            throw DiffError{ErrorKind::input_malformation,
                            "duplicate " + std::string{to_string_view(section.kind)}
                            + " section '" + section.id + "'"};
        }
        validate(section, allow_empty);
    }
    if (bodies != 1) {
        throw DiffError{ErrorKind::input_malformation, "document must have exactly one body"};
    }
}

// -- Builders -----------------------------------------------------------------

auto make_paragraph(std::string text, NamedStyle style) -> Paragraph {
    auto paragraph = Paragraph{};
    paragraph.named_style = style;
    if (!text.empty()) paragraph.content.emplace_back(TextRun{std::move(text), {}});
    return paragraph;
}

auto make_paragraph(std::vector<Inline> content, NamedStyle style) -> Paragraph {
    auto paragraph = Paragraph{};
    paragraph.content = std::move(content);
    paragraph.named_style = style;
    return paragraph;
}

auto make_table(const std::vector<std::vector<std::string>>& rows) -> Table {
    auto table = Table{};
    table.rows = rows.size();
    table.columns = rows.empty() ? 0 : rows.front().size();
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < rows[r].size(); ++c) {
            auto cell = TableCell{};
            cell.row = r;
            cell.column = c;
            cell.content.emplace_back(make_paragraph(rows[r][c]));
            table.cells.push_back(std::move(cell));
        }
    }
    return table;
}

}  // namespace docdelta_cpp
