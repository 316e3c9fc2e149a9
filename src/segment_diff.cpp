#include "segment_diff.hpp"

#include "length_cache.hpp"
#include "log.hpp"
#include "op_order.hpp"

#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/sequence_diff.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

namespace docdelta_cpp::detail {

namespace {

// How a run of new elements is attached to the surrounding content.
enum class InsertForm : std::uint8_t {
    suffix,  // index is the start of the element that follows the run
    prefix,  // index is the newline of the paragraph before the run
    absorb,  // the run's last paragraph takes over the newline at index
};

// Where the elements of one rebuilt run go.
struct Placement {
    InsertForm form = InsertForm::suffix;
    std::size_t index = 0;     // every piece is inserted here
    ParagraphProps inherited;  // properties of the newlines created at index
};

// The sibling elements a run is rebuilt in: a segment's top level or the
// content of one table cell.
struct Scope {
    const std::vector<IndexedElement>& pristine;
    const std::vector<IndexedElement>& current;
    bool top_level = false;
};

auto is_paragraph(const Element& element) -> bool {
    return std::holds_alternative<Paragraph>(element);
}

auto is_table(const Element& element) -> bool {
    return std::holds_alternative<Table>(element);
}

auto same_kinds(const std::vector<IndexedElement>& a, const std::vector<IndexedElement>& b) -> bool {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].element->index() != b[i].element->index()) return false;
    }
    return true;
}

auto all_paragraphs(const std::vector<IndexedElement>& items) -> bool {
    return std::all_of(items.begin(), items.end(),
                       [](const IndexedElement& item) { return is_paragraph(*item.element); });
}

// An inserted table brings its own newline, placed in front of it. That
// newline ends the paragraph before the table; with no paragraph there it is
// surplus. @p previous is null for the first element of a run.
auto surplus_before(const Element& element, const Element* previous, InsertForm form) -> bool {
    if (!is_table(element)) return false;
    if (previous == nullptr) return form != InsertForm::prefix;
    return !is_paragraph(*previous);
}

auto surplus_before(const std::vector<IndexedElement>& elements, std::size_t k, InsertForm form) -> bool {
    return surplus_before(*elements[k].element, k == 0 ? nullptr : elements[k - 1].element, form);
}

// In prefix form the split newline follows the run and is surplus unless the
// run ends with a paragraph.
auto surplus_after(const std::vector<IndexedElement>& elements, InsertForm form) -> bool {
    return form == InsertForm::prefix && !is_paragraph(*elements.back().element);
}

// Surplus newlines in front of a table count double.
auto placement_cost(const std::vector<IndexedElement>& elements, InsertForm form) -> std::size_t {
    auto cost = surplus_after(elements, form) ? std::size_t{1} : std::size_t{0};
    for (std::size_t k = 0; k < elements.size(); ++k) {
        if (surplus_before(elements, k, form)) cost += 2;
    }
    return cost;
}

// Properties of the paragraph content inserted before current[pos] joins:
// the first paragraph from there, unless a table comes first.
auto following_props(const std::vector<IndexedElement>& current, std::size_t pos) -> ParagraphProps {
    for (auto i = pos; i < current.size(); ++i) {
        const auto& element = *current[i].element;
        if (const auto* p = std::get_if<Paragraph>(&element)) return props_of(*p);
        if (is_table(element)) break;
    }
    return ParagraphProps{};
}

auto with_props(Paragraph paragraph, const ParagraphProps& props) -> Paragraph {
    paragraph.named_style = props.named_style;
    paragraph.alignment = props.alignment;
    if (props.bullet) {
        auto bullet = paragraph.bullet.value_or(Bullet{});
        bullet.kind = *props.bullet;
        bullet.nesting_level = props.nesting_level;
        paragraph.bullet = bullet;
    } else {
        paragraph.bullet.reset();
    }
    return paragraph;
}

// Same inline units (text and markers), ignoring text styles.
auto same_inline_sequence(const Paragraph& a, const Paragraph& b) -> bool {
    if (a.content.size() != b.content.size()) return false;
    for (std::size_t i = 0; i < a.content.size(); ++i) {
        const auto& x = a.content[i];
        const auto& y = b.content[i];
        if (x.index() != y.index()) return false;
        if (const auto* run = std::get_if<TextRun>(&x)) {
            if (run->text != std::get<TextRun>(y).text) return false;
        } else if (!markers_match(std::get<AtomicMarker>(x), std::get<AtomicMarker>(y))) {
            return false;
        }
    }
    return true;
}

// Normalised style of every UTF-16 unit; markers have none.
auto unit_styles(const Paragraph& paragraph) -> std::vector<std::optional<TextStyle>> {
    auto styles = std::vector<std::optional<TextStyle>>{};
    for (const auto& item : paragraph.content) {
        if (const auto* run = std::get_if<TextRun>(&item)) {
            styles.insert(styles.end(), length(item), normalized(run->style));
        } else {
            styles.emplace_back(std::nullopt);
        }
    }
    return styles;
}

class SegmentDiffer {
public:
    SegmentDiffer(const SegmentTarget& target, std::size_t segment_end)
        : target_{target}, segment_end_{segment_end} {}

    auto run(const std::vector<Element>& pristine, const std::vector<Element>& current,
             std::size_t start) -> SegmentResult;

private:
    // -- Emission -------------------------------------------------------------

    auto next_group() -> std::uint32_t { return ++group_; }

    void emit(OperationAction action, std::uint32_t group, bool post_insert = false) {
        ops_.push_back(Operation{.segment = target_.segment,
                                 .tab_id = target_.tab_id,
                                 .action = std::move(action),
                                 .change_group = group,
                                 .is_post_insert = post_insert,
                                 .generation = generation_++});
    }

    void emit_delete(std::size_t start, std::size_t end, std::uint32_t group) {
        if (start < end) emit(DeleteContentRange{Range{start, end}}, group);
    }

    // Pieces are built in logical order and all target one index, so they
    // are emitted last-first.
    void emit_pieces(std::vector<OperationAction>& pieces, std::uint32_t group) {
        for (auto it = pieces.rbegin(); it != pieces.rend(); ++it) emit(std::move(*it), group);
    }

    // -- Effective pristine ---------------------------------------------------

    auto pristine_at(std::size_t pos) const -> const Element& {
        if (auto it = overrides_.find(pos); it != overrides_.end()) return it->second;
        return *pristine_[pos].element;
    }

    auto element_in(const Scope& scope, std::size_t pos) const -> const Element& {
        return scope.top_level ? pristine_at(pos) : *scope.pristine[pos].element;
    }

    void override_props(std::size_t pos, const ParagraphProps& props) {
        auto paragraph = with_props(std::get<Paragraph>(pristine_at(pos)), props);
        overrides_.insert_or_assign(pos, Element{std::move(paragraph)});
    }

    void reset_trailing_style();

    // -- Blocks ---------------------------------------------------------------

    void handle_equal(const ChangeBlock& block);
    void handle_remove(const ChangeBlock& block);
    void handle_insert(const ChangeBlock& block);
    void handle_replace(const ChangeBlock& block);

    void rebuild(const Scope& scope, std::size_t pristine_begin, std::size_t pristine_end,
                 std::size_t current_begin, std::size_t current_end);
    auto choose_placement(const Scope& scope, std::size_t pristine_begin, std::size_t pristine_end,
                          std::size_t current_end, const std::vector<IndexedElement>& elements) const
        -> std::optional<Placement>;
    void remove_surplus();

    // -- Elements -------------------------------------------------------------

    void diff_pair(const Scope& scope, std::size_t pos, std::size_t current_pos);
    void diff_paragraph(const Paragraph& pristine, Range range, const Paragraph& current,
                        std::uint32_t group);
    void diff_table(const Table& pristine, std::size_t start, const Table& current);
    void diff_cell(const TableCell& pristine, std::size_t start, const TableCell& current);

    // -- Insertion ------------------------------------------------------------

    void insert_elements(const std::vector<IndexedElement>& elements, const Placement& placement,
                         std::uint32_t group);
    void fill_table_cells(const Table& table, std::size_t start, std::uint32_t group);
    auto inserted_length(const Element& element) -> std::size_t;
    auto inserted_cell_starts(const Table& table, std::size_t start) -> std::vector<std::size_t>;
    void append_inline_pieces(const Paragraph& paragraph, std::size_t index, bool leading_newline,
                              bool trailing_newline, std::vector<OperationAction>& pieces);
    auto marker_action(const AtomicMarker& marker, std::size_t index) -> OperationAction;

    // -- Styles ---------------------------------------------------------------

    void emit_paragraph_props(const ParagraphProps& from, const ParagraphProps& to, Range range,
                              std::uint32_t group, bool post_insert);
    void emit_run_styles(const Paragraph& paragraph, std::size_t start, std::uint32_t group);
    void emit_style_spans(const Paragraph& pristine, const Paragraph& current,
                          std::size_t start, std::uint32_t group);

    void finalize();

    const SegmentTarget& target_;
    std::size_t segment_end_;
    LengthCache lengths_;
    std::unordered_map<const Element*, std::size_t> inserted_lengths_;
    std::vector<IndexedElement> pristine_;
    std::vector<IndexedElement> current_;
    std::map<std::size_t, Element> overrides_;
    std::vector<Operation> ops_;
    std::vector<std::size_t> surplus_;  // surplus newlines of the run being inserted
    std::set<std::string> created_footnotes_;
    std::uint32_t group_ = 0;  // 0 is reserved for the trailing style reset
    std::uint64_t generation_ = 0;
};

auto SegmentDiffer::run(const std::vector<Element>& pristine, const std::vector<Element>& current,
                        std::size_t start) -> SegmentResult {
    pristine_ = lengths_.index(pristine, start);
    current_ = lengths_.index(current, start);
    if (sections_are_identical(pristine_, current_)) return {};

    const auto blocks = sequence_diff(pristine_, current_);
    const auto& last = blocks.back();
    if (last.kind == ChangeKind::insert
        || (last.kind == ChangeKind::replace && !same_kinds(last.pristine, last.current))) {
        reset_trailing_style();
    }

    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
        switch (it->kind) {
            case ChangeKind::equal:   handle_equal(*it); break;
            case ChangeKind::remove:  handle_remove(*it); break;
            case ChangeKind::insert:  handle_insert(*it); break;
            case ChangeKind::replace: handle_replace(*it); break;
        }
    }

    finalize();
    return SegmentResult{std::move(ops_), std::move(created_footnotes_)};
}

// New content at the end of a segment splits the last paragraph's newline
// and would inherit its named style; reset it first.
void SegmentDiffer::reset_trailing_style() {
    const auto pos = pristine_.size() - 1;
    const auto& trailing = std::get<Paragraph>(pristine_at(pos));
    if (trailing.named_style == NamedStyle::normal_text) return;

    auto style = ParagraphStyle{};
    style.named_style = NamedStyle::normal_text;
    emit(UpdateParagraphStyle{Range{pristine_[pos].start, pristine_[pos].end}, style,
                              {ParagraphField::named_style_type}},
         0);

    auto props = props_of(trailing);
    props.named_style = NamedStyle::normal_text;
    override_props(pos, props);
    DOCDELTA_LOG_DEBUG("reset trailing paragraph style at %zu", pristine_[pos].start);
}

// -- Blocks -------------------------------------------------------------------

void SegmentDiffer::handle_equal(const ChangeBlock& block) {
    const auto scope = Scope{pristine_, current_, true};
    for (auto k = block.pristine.size(); k-- > 0;) {
        const auto pos = block.pristine_begin + k;
        if (elements_match(pristine_at(pos), *block.current[k].element)) continue;
        diff_pair(scope, pos, block.current_begin + k);
    }
}

void SegmentDiffer::handle_remove(const ChangeBlock& block) {
    if (block.pristine_end < pristine_.size()) {
        for (auto k = block.pristine.size(); k-- > 0;) {
            emit_delete(block.pristine[k].start, block.pristine[k].end, next_group());
        }
        return;
    }

    // The segment's final newline stays: remove the newline before each
    // element instead, so the preceding paragraph becomes the last one and
    // carries the final newline's properties.
    if (block.pristine_begin == 0 || !is_paragraph(pristine_at(block.pristine_begin - 1))) {
        throw DiffError{ErrorKind::structural_violation,
                        "trailing content at " + std::to_string(block.pristine.front().start)
                        + " cannot be removed: no paragraph precedes it"};
    }
    override_props(block.pristine_begin - 1,
                   props_of(std::get<Paragraph>(pristine_at(pristine_.size() - 1))));

    if (all_paragraphs(block.pristine)) {
        for (auto k = block.pristine.size(); k-- > 0;) {
            emit_delete(block.pristine[k].start - 1, block.pristine[k].end - 1, next_group());
        }
    } else {
        emit_delete(block.pristine.front().start - 1, segment_end_ - 1, next_group());
    }
}

void SegmentDiffer::handle_insert(const ChangeBlock& block) {
    rebuild(Scope{pristine_, current_, true}, block.pristine_begin, block.pristine_begin,
            block.current_begin, block.current_end);
}

void SegmentDiffer::handle_replace(const ChangeBlock& block) {
    if (same_kinds(block.pristine, block.current)) {
        handle_equal(block);
        return;
    }
    rebuild(Scope{pristine_, current_, true}, block.pristine_begin, block.pristine_end,
            block.current_begin, block.current_end);
}

// Replace pristine [pristine_begin, pristine_end) of the scope by current
// [current_begin, current_end). Either range may be empty, not both.
void SegmentDiffer::rebuild(const Scope& scope, std::size_t pristine_begin, std::size_t pristine_end,
                            std::size_t current_begin, std::size_t current_end) {
    const auto first = static_cast<std::ptrdiff_t>(current_begin);
    const auto last = static_cast<std::ptrdiff_t>(current_end);
    auto elements = std::vector<IndexedElement>(scope.current.begin() + first, scope.current.begin() + last);
    const auto widen_from = pristine_end;

    auto placement = choose_placement(scope, pristine_begin, pristine_end, current_end, elements);
    while (!placement) {
        // Neither neighbour takes new content: the table that follows is
        // rebuilt together with the run.
        if (current_end >= scope.current.size() || pristine_end >= scope.pristine.size()) {
            throw DiffError{ErrorKind::structural_violation,
                            "no paragraph adjacent to inserted content at "
                            + std::to_string(pristine_end > 0 ? scope.pristine[pristine_end - 1].end : 0)};
        }
        DOCDELTA_LOG_DEBUG("table at %zu is rebuilt with the content inserted before it",
                           scope.pristine[pristine_end].start);
        elements.push_back(scope.current[current_end]);
        ++pristine_end;
        ++current_end;
        placement = choose_placement(scope, pristine_begin, pristine_end, current_end, elements);
    }

    const auto group = next_group();
    for (auto k = pristine_end; k-- > pristine_begin;) {
        const auto& item = scope.pristine[k];
        auto end = item.end;
        if (k >= widen_from) {
            // Already diffed: the table is in its current state.
            const auto& now = elements[elements.size() - (pristine_end - k)];
            end = item.start + (now.end - now.start);
        } else if (placement->form == InsertForm::absorb && k + 1 == pristine_end) {
            --end;
        }
        emit_delete(item.start, end, group);
    }
    insert_elements(elements, *placement, group);
    remove_surplus();
}

// Candidates, cheapest first and in this order on ties: absorbing the
// replaced run's last newline, inserting before the following element,
// inserting at the newline of the preceding paragraph. None fits when a
// table follows and no paragraph precedes.
auto SegmentDiffer::choose_placement(const Scope& scope, std::size_t pristine_begin,
                                     std::size_t pristine_end, std::size_t current_end,
                                     const std::vector<IndexedElement>& elements) const
    -> std::optional<Placement> {
    auto best = std::optional<Placement>{};
    auto best_cost = std::size_t{0};
    auto consider = [&](Placement placement) {
        const auto cost = placement_cost(elements, placement.form);
        if (best && cost >= best_cost) return;
        best = std::move(placement);
        best_cost = cost;
    };

    const auto replaces = pristine_begin < pristine_end;
    const auto has_next = current_end < scope.current.size() && pristine_end < scope.pristine.size();

    if (replaces && is_paragraph(element_in(scope, pristine_end - 1))
        && is_paragraph(*elements.back().element)) {
        consider(Placement{InsertForm::absorb, scope.pristine[pristine_begin].start,
                           props_of(std::get<Paragraph>(element_in(scope, pristine_end - 1)))});
    }
    // The scope's final newline stays.
    if (replaces && !has_next) return best;

    if (has_next && !is_table(*scope.current[current_end].element)) {
        consider(Placement{InsertForm::suffix, scope.pristine[pristine_begin].start,
                           following_props(scope.current, current_end)});
    }
    if (pristine_begin > 0 && is_paragraph(element_in(scope, pristine_begin - 1))) {
        consider(Placement{InsertForm::prefix, scope.pristine[pristine_begin - 1].end - 1,
                           props_of(std::get<Paragraph>(element_in(scope, pristine_begin - 1)))});
    }
    return best;
}

// Surplus newlines go in a group of their own, once the run and its styles
// are in place.
void SegmentDiffer::remove_surplus() {
    if (surplus_.empty()) return;
    DOCDELTA_LOG_DEBUG("removing %zu surplus newlines", surplus_.size());
    const auto group = next_group();
    for (auto pos : surplus_) emit_delete(pos, pos + 1, group);
    surplus_.clear();
}

// -- Elements -----------------------------------------------------------------

void SegmentDiffer::diff_pair(const Scope& scope, std::size_t pos, std::size_t current_pos) {
    const auto& pristine = element_in(scope, pos);
    const auto& item = scope.pristine[pos];
    const auto& current = *scope.current[current_pos].element;
    if (pristine.index() != current.index()) {
        throw DiffError{ErrorKind::structural_violation,
                        "paired elements at " + std::to_string(item.start) + " differ in kind"};
    }
    std::visit(overload{
        [&](const Paragraph& p) {
            diff_paragraph(p, Range{item.start, item.end}, std::get<Paragraph>(current), next_group());
        },
        [&](const Table& t) {
            const auto& table = std::get<Table>(current);
            if (t.rows == table.rows && t.columns == table.columns) {
                diff_table(t, item.start, table);
                return;
            }
            DOCDELTA_LOG_DEBUG("table at %zu resized %zux%zu -> %zux%zu, regenerating",
                               item.start, t.rows, t.columns, table.rows, table.columns);
            rebuild(scope, pos, pos + 1, current_pos, current_pos + 1);
        },
        [&](const SpecialElement&) {
            rebuild(scope, pos, pos + 1, current_pos, current_pos + 1);
        },
    }, pristine);
}

void SegmentDiffer::diff_paragraph(const Paragraph& pristine, Range range, const Paragraph& current,
                                   std::uint32_t group) {
    emit_paragraph_props(props_of(pristine), props_of(current), range, group, false);

    if (same_inline_sequence(pristine, current)) {
        emit_style_spans(pristine, current, range.start_index, group);
        return;
    }

    // Text changed: replace the whole run set, keep the newline.
    emit_delete(range.start_index, range.end_index - 1, group);
    auto pieces = std::vector<OperationAction>{};
    append_inline_pieces(current, range.start_index, false, false, pieces);
    emit_pieces(pieces, group);
    emit_run_styles(current, range.start_index, group);
}

void SegmentDiffer::diff_table(const Table& pristine, std::size_t start, const Table& current) {
    const auto pristine_cells = ordered_cells(pristine);
    const auto current_cells = ordered_cells(current);
    const auto starts = lengths_.cell_starts(pristine, start);
    for (auto i = pristine_cells.size(); i-- > 0;) {
        const auto& p = *pristine_cells[i];
        const auto& c = *current_cells[i];
        if (contents_match(p.content, c.content)) {
            if (p.column_span != c.column_span || p.row_span != c.row_span) {
                DOCDELTA_LOG_WARN("span change of cell (%zu, %zu) at %zu is not synchronised",
                                  p.row, p.column, starts[i]);
            }
            continue;
        }
        diff_cell(p, starts[i], c);
    }
}

void SegmentDiffer::diff_cell(const TableCell& pristine, std::size_t start, const TableCell& current) {
    const auto p_items = lengths_.index(pristine.content, start);
    const auto c_items = lengths_.index(current.content, start);
    const auto scope = Scope{p_items, c_items, false};
    if (same_kinds(p_items, c_items)) {
        for (auto k = p_items.size(); k-- > 0;) {
            if (elements_match(*p_items[k].element, *c_items[k].element)) continue;
            diff_pair(scope, k, k);
        }
        return;
    }

    DOCDELTA_LOG_DEBUG("cell (%zu, %zu) at %zu changed shape, replacing its content",
                       pristine.row, pristine.column, start);
    rebuild(scope, 0, p_items.size(), 0, c_items.size());
}

// -- Insertion ----------------------------------------------------------------

// Pieces all go to placement.index. Positions recorded for styles, cell
// content and surplus newlines address the layout once every piece is in,
// surplus newlines included.
void SegmentDiffer::insert_elements(const std::vector<IndexedElement>& elements,
                                    const Placement& placement, std::uint32_t group) {
    if (elements.empty()) return;
    const auto form = placement.form;
    const auto index = placement.index;
    if (form == InsertForm::absorb && !is_paragraph(*elements.back().element)) {
        throw DiffError{ErrorKind::structural_violation,
                        "inserted content at " + std::to_string(index) + " must end with a paragraph"};
    }

    auto pieces = std::vector<OperationAction>{};
    auto starts = std::vector<std::size_t>{};
    starts.reserve(elements.size());
    auto offset = form == InsertForm::prefix ? index + 1 : index;
    for (std::size_t k = 0; k < elements.size(); ++k) {
        // In prefix form a paragraph before the element still needs its newline.
        const auto open_paragraph = form == InsertForm::prefix
                                 && (k == 0 || is_paragraph(*elements[k - 1].element));
        if (surplus_before(elements, k, form)) surplus_.push_back(offset++);
        starts.push_back(offset);
        offset += inserted_length(*elements[k].element);

        std::visit(overload{
            [&](const Paragraph& p) {
                auto trailing = false;
                if (form != InsertForm::prefix) {
                    trailing = k + 1 < elements.size() ? !is_table(*elements[k + 1].element)
                                                       : form == InsertForm::suffix;
                }
                append_inline_pieces(p, index, open_paragraph, trailing, pieces);
            },
            [&](const Table& t) {
                pieces.emplace_back(InsertTable{Location{index}, t.rows, t.columns});
            },
            [&](const SpecialElement& s) {
                if (s.kind != SpecialKind::page_break) {
                    throw DiffError{ErrorKind::unsupported_content,
                                    "a standalone " + std::string{to_string_view(s.kind)}
                                    + " cannot be inserted"};
                }
                if (open_paragraph) pieces.emplace_back(InsertText{Location{index}, "\n"});
                pieces.emplace_back(InsertPageBreak{Location{index}});
            },
        }, *elements[k].element);
    }
    if (surplus_after(elements, form)) surplus_.push_back(offset);
    emit_pieces(pieces, group);

    for (std::size_t k = 0; k < elements.size(); ++k) {
        const auto& element = *elements[k].element;
        if (const auto* p = std::get_if<Paragraph>(&element)) {
            const auto range = Range{starts[k], starts[k] + (elements[k].end - elements[k].start)};
            emit_paragraph_props(placement.inherited, props_of(*p), range, group, true);
            emit_run_styles(*p, starts[k], group);
        } else if (const auto* t = std::get_if<Table>(&element)) {
            fill_table_cells(*t, starts[k], group);
        }
    }
}

// A new table's cells each hold one empty paragraph; content is absorbed
// into it.
void SegmentDiffer::fill_table_cells(const Table& table, std::size_t start, std::uint32_t group) {
    const auto cells = ordered_cells(table);
    const auto starts = inserted_cell_starts(table, start);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        insert_elements(lengths_.index(cells[i]->content, starts[i]),
                        Placement{InsertForm::absorb, starts[i], ParagraphProps{}}, group);
    }
}

// Length of a new element until its surplus newlines are removed: a table
// nested at the start of a new cell, or after another table, keeps one in
// front of it.
auto SegmentDiffer::inserted_length(const Element& element) -> std::size_t {
    const auto* table = std::get_if<Table>(&element);
    if (table == nullptr) return lengths_.of(element);
    if (auto it = inserted_lengths_.find(&element); it != inserted_lengths_.end()) return it->second;

    auto total = std::size_t{2} + table->rows;
    for (const auto& cell : table->cells) {
        total += 1;
        const Element* previous = nullptr;
        for (const auto& nested : cell.content) {
            if (surplus_before(nested, previous, InsertForm::absorb)) ++total;
            total += inserted_length(nested);
            previous = &nested;
        }
    }
    inserted_lengths_.emplace(&element, total);
    return total;
}

auto SegmentDiffer::inserted_cell_starts(const Table& table, std::size_t start) -> std::vector<std::size_t> {
    const auto cells = ordered_cells(table);
    auto starts = std::vector<std::size_t>{};
    starts.reserve(cells.size());
    auto offset = start + 1;
    for (std::size_t r = 0; r < table.rows; ++r) {
        ++offset;
        for (std::size_t c = 0; c < table.columns; ++c) {
            ++offset;
            starts.push_back(offset);
            const Element* previous = nullptr;
            for (const auto& nested : cells[r * table.columns + c]->content) {
                if (surplus_before(nested, previous, InsertForm::absorb)) ++offset;
                offset += inserted_length(nested);
                previous = &nested;
            }
        }
    }
    return starts;
}

void SegmentDiffer::append_inline_pieces(const Paragraph& paragraph, std::size_t index,
                                         bool leading_newline, bool trailing_newline,
                                         std::vector<OperationAction>& pieces) {
    auto text = std::string{leading_newline ? "\n" : ""};
    auto flush = [&] {
        if (text.empty()) return;
        pieces.emplace_back(InsertText{Location{index}, std::move(text)});
        text.clear();
    };
    for (const auto& item : paragraph.content) {
        if (const auto* run = std::get_if<TextRun>(&item)) {
            text += run->text;
        } else {
            flush();
            pieces.push_back(marker_action(std::get<AtomicMarker>(item), index));
        }
    }
    if (trailing_newline) text += '\n';
    flush();
}

auto SegmentDiffer::marker_action(const AtomicMarker& marker, std::size_t index) -> OperationAction {
    switch (marker.kind) {
        case MarkerKind::page_break:
            return InsertPageBreak{Location{index}};
        case MarkerKind::column_break:
            return InsertSectionBreak{Location{index}, SectionBreakType::continuous};
        case MarkerKind::footnote_ref: {
            auto it = marker.attributes.find("id");
            if (it == marker.attributes.end() || it->second.empty()) {
                throw DiffError{ErrorKind::unsupported_content, "footnote reference without id"};
            }
            created_footnotes_.insert(it->second);
            return CreateFootnote{Location{index}, it->second};
        }
        default:
            throw DiffError{ErrorKind::unsupported_content,
                            "inline " + std::string{to_string_view(marker.kind)}
                            + " cannot be inserted"};
    }
}

// -- Styles -------------------------------------------------------------------

void SegmentDiffer::emit_paragraph_props(const ParagraphProps& from, const ParagraphProps& to,
                                         Range range, std::uint32_t group, bool post_insert) {
    auto style = ParagraphStyle{};
    auto fields = std::vector<ParagraphField>{};
    if (from.named_style != to.named_style) {
        style.named_style = to.named_style;
        fields.push_back(ParagraphField::named_style_type);
    }
    if (from.alignment != to.alignment) {
        style.alignment = to.alignment;
        fields.push_back(ParagraphField::alignment);
    }
    if (!fields.empty()) emit(UpdateParagraphStyle{range, style, std::move(fields)}, group, post_insert);

    if (from.bullet != to.bullet) {
        if (to.bullet) {
            emit(CreateParagraphBullets{range, *to.bullet}, group, post_insert);
        } else {
            emit(DeleteParagraphBullets{range}, group, post_insert);
        }
    }

    if (from.nesting_level != to.nesting_level) {
        auto indent = ParagraphStyle{};
        indent.indent_start = indent_per_level_pt * to.nesting_level;
        indent.indent_first_line = 0.0;
        emit(UpdateParagraphStyle{range, indent,
                                  {ParagraphField::indent_start, ParagraphField::indent_first_line}},
             group, post_insert);
    }
}

// Inserted text carries no formatting; set every styled run explicitly.
void SegmentDiffer::emit_run_styles(const Paragraph& paragraph, std::size_t start, std::uint32_t group) {
    auto offset = start;
    for (const auto& item : paragraph.content) {
        const auto len = length(item);
        if (const auto* run = std::get_if<TextRun>(&item); run != nullptr && len > 0 && !is_plain(run->style)) {
            emit(UpdateTextStyle{Range{offset, offset + len}, normalized(run->style), set_fields(run->style)},
                 group, true);
        }
        offset += len;
    }
}

// One update per maximal span whose delta (changed fields and their new
// values) is identical.
void SegmentDiffer::emit_style_spans(const Paragraph& pristine, const Paragraph& current,
                                     std::size_t start, std::uint32_t group) {
    struct Span {
        std::size_t begin;
        std::vector<TextField> fields;
        TextStyle payload;
    };

    const auto from = unit_styles(pristine);
    const auto to = unit_styles(current);
    auto open = std::optional<Span>{};
    auto close = [&](std::size_t end) {
        if (!open) return;
        emit(UpdateTextStyle{Range{start + open->begin, start + end}, open->payload, open->fields}, group);
        open.reset();
    };

    for (std::size_t u = 0; u < from.size(); ++u) {
        if (!from[u] || !to[u]) {
            close(u);
            continue;
        }
        auto fields = changed_fields(*from[u], *to[u]);
        if (fields.empty()) {
            close(u);
            continue;
        }
        auto payload = project(*to[u], fields);
        if (open && open->fields == fields && open->payload == payload) continue;
        close(u);
        open = Span{u, std::move(fields), std::move(payload)};
    }
    close(from.size());
}

void SegmentDiffer::finalize() {
    for (auto& op : ops_) {
        auto* del = std::get_if<DeleteContentRange>(&op.action);
        if (del == nullptr || del->range.end_index < segment_end_) continue;
        DOCDELTA_LOG_WARN("delete [%zu, %zu) reaches the final newline, truncating",
                          del->range.start_index, del->range.end_index);
        del->range.end_index = segment_end_ - 1;
    }
    std::erase_if(ops_, [](const Operation& op) {
        const auto* del = std::get_if<DeleteContentRange>(&op.action);
        return del != nullptr && del->range.start_index >= del->range.end_index;
    });
    order_operations(ops_);
}

}  // namespace

auto diff_segment(const Section& pristine, const Section& current,
                  const SegmentTarget& target) -> SegmentResult {
    auto normalized_content = std::vector<Element>{};
    const auto* content = &current.content;
    if (current.content.empty()) {
        DOCDELTA_LOG_WARN("%s '%s' has no content, keeping one empty paragraph",
                          std::string{to_string_view(current.kind)}.c_str(), current.id.c_str());
        normalized_content.emplace_back(Paragraph{});
        content = &normalized_content;
    }

    DOCDELTA_LOG_DEBUG("diffing %s '%s': %zu pristine, %zu current elements",
                       std::string{to_string_view(pristine.kind)}.c_str(), pristine.id.c_str(),
                       pristine.content.size(), content->size());

    auto differ = SegmentDiffer{target, section_end(pristine)};
    return differ.run(pristine.content, *content, section_start(pristine.kind));
}

}  // namespace docdelta_cpp::detail
