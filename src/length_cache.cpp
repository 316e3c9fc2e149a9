#include "length_cache.hpp"

#include <variant>

namespace docdelta_cpp::detail {

auto LengthCache::of(const Element& element) -> std::size_t {
    if (auto it = lengths_.find(&element); it != lengths_.end()) return it->second;

    const auto len = std::visit(overload{
        [](const Paragraph& p) { return length(p); },
        [](const SpecialElement& s) { return length(s); },
        [this](const Table& t) {
            auto total = std::size_t{2} + t.rows;
            for (const auto& cell : t.cells) total += 1 + of(cell.content);
            return total;
        },
    }, element);
    lengths_.emplace(&element, len);
    return len;
}

auto LengthCache::of(const std::vector<Element>& content) -> std::size_t {
    auto total = std::size_t{0};
    for (const auto& element : content) total += of(element);
    return total;
}

auto LengthCache::index(const std::vector<Element>& content, std::size_t start)
    -> std::vector<IndexedElement> {
    auto indexed = std::vector<IndexedElement>{};
    indexed.reserve(content.size());
    auto offset = start;
    for (const auto& element : content) {
        const auto len = of(element);
        indexed.push_back({&element, offset, offset + len});
        offset += len;
    }
    return indexed;
}

auto LengthCache::cell_starts(const Table& table, std::size_t start) -> std::vector<std::size_t> {
    const auto cells = ordered_cells(table);
    auto starts = std::vector<std::size_t>{};
    starts.reserve(cells.size());
    auto offset = start + 1;
    for (std::size_t r = 0; r < table.rows; ++r) {
        ++offset;
        for (std::size_t c = 0; c < table.columns; ++c) {
            ++offset;
            starts.push_back(offset);
            offset += of(cells[r * table.columns + c]->content);
        }
    }
    return starts;
}

}  // namespace docdelta_cpp::detail
