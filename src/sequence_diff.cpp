#include <docdelta-cpp/sequence_diff.hpp>

#include "lcs.hpp"

#include <string_view>
#include <utility>

namespace docdelta_cpp {

namespace {

// Attributes assigned by the remote side; never compared.
auto is_volatile_key(std::string_view key) -> bool {
    return key == "id" || key == "num";
}

auto stable_attributes_equal(const Attributes& a, const Attributes& b) -> bool {
    auto ia = a.begin();
    auto ib = b.begin();
    while (true) {
        while (ia != a.end() && is_volatile_key(ia->first)) ++ia;
        while (ib != b.end() && is_volatile_key(ib->first)) ++ib;
        if (ia == a.end() || ib == b.end()) return ia == a.end() && ib == b.end();
        if (ia->first != ib->first || ia->second != ib->second) return false;
        ++ia;
        ++ib;
    }
}

auto stable_attributes_key(const Attributes& attributes) -> std::string {
    auto key = std::string{};
    for (const auto& [name, value] : attributes) {
        if (is_volatile_key(name)) continue;
        key += name;
        key += '=';
        key += value;
        key += ';';
    }
    return key;
}

auto inlines_match(const Inline& a, const Inline& b) -> bool {
    if (a.index() != b.index()) return false;
    if (const auto* run = std::get_if<TextRun>(&a)) {
        const auto& other = std::get<TextRun>(b);
        return run->text == other.text && normalized(run->style) == normalized(other.style);
    }
    return markers_match(std::get<AtomicMarker>(a), std::get<AtomicMarker>(b));
}

auto signature_text(const Paragraph& paragraph) -> std::string {
    auto text = std::string{};
    for (const auto& item : paragraph.content) {
        std::visit(overload{
            [&](const TextRun& run) { text += run.text; },
            [&](const AtomicMarker& marker) {
                text += "\xEF\xBF\xBC";
                text += to_string_view(marker.kind);
            },
        }, item);
    }
    return text;
}

}  // namespace

auto index_elements(const std::vector<Element>& content, std::size_t start) -> std::vector<IndexedElement> {
    auto indexed = std::vector<IndexedElement>{};
    indexed.reserve(content.size());
    auto offset = start;
    for (const auto& element : content) {
        const auto len = length(element);
        indexed.push_back({&element, offset, offset + len});
        offset += len;
    }
    return indexed;
}

// -- Signatures ---------------------------------------------------------------

auto element_signature(const Element& element) -> std::string {
    return std::visit(overload{
        [](const Paragraph& p) {
            auto sig = std::string{"P:"};
            sig += to_string_view(p.named_style);
            sig += ':';
            if (p.bullet) sig += to_string_view(p.bullet->kind);
            sig += ':';
            sig += signature_text(p);
            return sig;
        },
        [](const Table& t) {
            return "T:" + std::to_string(t.rows) + "x" + std::to_string(t.columns);
        },
        [](const SpecialElement& s) {
            return "S:" + std::string{to_string_view(s.kind)} + ":" + stable_attributes_key(s.attributes);
        },
    }, element);
}

// -- Deep equality ------------------------------------------------------------

auto paragraphs_match(const Paragraph& a, const Paragraph& b) -> bool {
    if (props_of(a) != props_of(b)) return false;
    if (a.content.size() != b.content.size()) return false;
    for (std::size_t i = 0; i < a.content.size(); ++i) {
        if (!inlines_match(a.content[i], b.content[i])) return false;
    }
    return true;
}

auto tables_match(const Table& a, const Table& b) -> bool {
    if (a.rows != b.rows || a.columns != b.columns) return false;
    const auto cells_a = ordered_cells(a);
    const auto cells_b = ordered_cells(b);
    for (std::size_t i = 0; i < cells_a.size(); ++i) {
        const auto* ca = cells_a[i];
        const auto* cb = cells_b[i];
        if (ca == nullptr || cb == nullptr) return ca == cb;
        if (ca->column_span != cb->column_span || ca->row_span != cb->row_span) return false;
        if (!contents_match(ca->content, cb->content)) return false;
    }
    return true;
}

auto specials_match(const SpecialElement& a, const SpecialElement& b) -> bool {
    return a.kind == b.kind && stable_attributes_equal(a.attributes, b.attributes);
}

auto markers_match(const AtomicMarker& a, const AtomicMarker& b) -> bool {
    return a.kind == b.kind && stable_attributes_equal(a.attributes, b.attributes);
}

auto elements_match(const Element& a, const Element& b) -> bool {
    if (a.index() != b.index()) return false;
    return std::visit(overload{
        [&](const Paragraph& p) { return paragraphs_match(p, std::get<Paragraph>(b)); },
        [&](const Table& t) { return tables_match(t, std::get<Table>(b)); },
        [&](const SpecialElement& s) { return specials_match(s, std::get<SpecialElement>(b)); },
    }, a);
}

auto contents_match(const std::vector<Element>& a, const std::vector<Element>& b) -> bool {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!elements_match(a[i], b[i])) return false;
    }
    return true;
}

auto sections_are_identical(const std::vector<IndexedElement>& pristine,
                            const std::vector<IndexedElement>& current) -> bool {
    if (pristine.size() != current.size()) return false;
    for (std::size_t i = 0; i < pristine.size(); ++i) {
        if (!elements_match(*pristine[i].element, *current[i].element)) return false;
    }
    return true;
}

// -- Alignment ----------------------------------------------------------------

auto sequence_diff(const std::vector<IndexedElement>& pristine,
                   const std::vector<IndexedElement>& current) -> std::vector<ChangeBlock> {
    auto a = std::vector<std::string>{};
    auto b = std::vector<std::string>{};
    a.reserve(pristine.size());
    b.reserve(current.size());
    for (const auto& item : pristine) a.push_back(element_signature(*item.element));
    for (const auto& item : current) b.push_back(element_signature(*item.element));

    auto blocks = std::vector<ChangeBlock>{};
    for (const auto& op : detail::lcs_opcodes(a, b)) {
        auto block = ChangeBlock{};
        block.kind = op.kind;
        block.pristine_begin = op.a_begin;
        block.pristine_end = op.a_end;
        block.current_begin = op.b_begin;
        block.current_end = op.b_end;
        block.pristine.assign(pristine.begin() + static_cast<std::ptrdiff_t>(op.a_begin),
                              pristine.begin() + static_cast<std::ptrdiff_t>(op.a_end));
        block.current.assign(current.begin() + static_cast<std::ptrdiff_t>(op.b_begin),
                             current.begin() + static_cast<std::ptrdiff_t>(op.b_end));
        blocks.push_back(std::move(block));
    }
    return blocks;
}

}  // namespace docdelta_cpp
