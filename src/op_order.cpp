#include "op_order.hpp"

#include <docdelta-cpp/model.hpp>

#include <algorithm>
#include <variant>

namespace docdelta_cpp::detail {

auto tier_of(const Operation& op) -> OrderTier {
    switch (op.kind()) {
        case OpKind::update_paragraph_style:
        case OpKind::create_paragraph_bullets:
        case OpKind::delete_paragraph_bullets:
            return op.is_post_insert ? OrderTier::other : OrderTier::existing_paragraph_style;
        case OpKind::delete_content_range:
            return OrderTier::deletion;
        case OpKind::insert_text:
        case OpKind::insert_table:
        case OpKind::insert_page_break:
        case OpKind::insert_section_break:
        case OpKind::create_footnote:
            return OrderTier::insertion;
        case OpKind::update_text_style:
        case OpKind::create_header:
        case OpKind::create_footer:
        case OpKind::delete_header:
        case OpKind::delete_footer:
            return OrderTier::other;
    }
    return OrderTier::other;
}

auto order_index(const Operation& op) -> std::size_t {
    return std::visit(overload{
        [](const DeleteContentRange& a) { return a.range.start_index; },
        [](const InsertText& a) { return a.location.index; },
        [](const UpdateTextStyle& a) { return a.range.start_index; },
        [](const UpdateParagraphStyle& a) { return a.range.start_index; },
        [](const CreateParagraphBullets& a) { return a.range.start_index; },
        [](const DeleteParagraphBullets& a) { return a.range.start_index; },
        [](const InsertTable& a) { return a.location.index; },
        [](const InsertPageBreak& a) { return a.location.index; },
        [](const InsertSectionBreak& a) { return a.location.index; },
        [](const CreateFootnote& a) { return a.location.index; },
        [](const auto&) { return std::size_t{0}; },
    }, op.action);
}

void order_operations(std::vector<Operation>& ops) {
    std::stable_sort(ops.begin(), ops.end(), [](const Operation& a, const Operation& b) {
        if (a.change_group != b.change_group) return a.change_group < b.change_group;
        const auto ta = tier_of(a);
        const auto tb = tier_of(b);
        if (ta != tb) return ta < tb;
        if (ta != OrderTier::other) {
            const auto ia = order_index(a);
            const auto ib = order_index(b);
            if (ia != ib) return ta == OrderTier::deletion ? ia > ib : ia < ib;
        }
        return a.generation < b.generation;
    });
}

}  // namespace docdelta_cpp::detail
