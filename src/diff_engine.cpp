#include <docdelta-cpp/diff_engine.hpp>

#include "log.hpp"
#include "segment_diff.hpp"
#include "thread_pool.hpp"

#include <docdelta-cpp/error.hpp>

#include <iterator>
#include <thread>
#include <utility>

namespace docdelta_cpp {

namespace {

auto resolve_thread_count(unsigned int requested) -> unsigned int {
    if (requested != 0) return requested;
    const auto hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : hardware;
}

// A segment created by the operation list starts as one empty paragraph;
// a footnote's paragraph holds a single space.
auto blank_section(SectionKind kind, const std::string& id) -> Section {
    auto section = Section{};
    section.kind = kind;
    section.id = id;
    auto paragraph = Paragraph{};
    if (kind == SectionKind::footnote) paragraph.content.emplace_back(TextRun{.text = " "});
    section.content.emplace_back(std::move(paragraph));
    return section;
}

// One non-body section of the current document.
struct SectionTask {
    const Section* current = nullptr;
    const Section* pristine = nullptr;      // nullptr: the segment is new
    std::optional<OperationAction> create;  // creates the new segment
};

}  // namespace

DiffEngine::DiffEngine()
    : DiffEngine{DiffOptions{}} {}

DiffEngine::DiffEngine(DiffOptions options)
    : options_{std::move(options)} {
    const auto threads = resolve_thread_count(options_.num_threads);
    if (threads > 1) pool_ = std::make_unique<detail::ThreadPool>(threads);
}

DiffEngine::~DiffEngine() = default;
DiffEngine::DiffEngine(DiffEngine&&) noexcept = default;
auto DiffEngine::operator=(DiffEngine&&) noexcept -> DiffEngine& = default;

auto DiffEngine::options() const -> const DiffOptions& {
    return options_;
}

auto DiffEngine::diff_section(const Section& pristine, const Section& current,
                              const SegmentRef& segment) const -> std::vector<Operation> {
    if (pristine.kind != current.kind) {
        throw DiffError{ErrorKind::input_malformation,
                        "cannot diff a " + std::string{to_string_view(pristine.kind)}
                        + " section against a " + std::string{to_string_view(current.kind)}};
    }
    validate(pristine);
    validate(current, true);
    return detail::diff_segment(pristine, current, detail::SegmentTarget{segment, options_.tab_id})
        .operations;
}

auto DiffEngine::diff(const Document& pristine, const Document& current) const -> std::vector<Operation> {
    validate(pristine);
    validate(current, true);

    // -- Body -----------------------------------------------------------------

    const auto* pristine_body = find_section(pristine, SectionKind::body, "");
    const auto* current_body = find_section(current, SectionKind::body, "");
    auto body = detail::diff_segment(*pristine_body, *current_body,
                                     detail::SegmentTarget{SegmentRef{}, options_.tab_id});
    auto ops = std::move(body.operations);

    // -- Other sections, in current document order ----------------------------

    auto tasks = std::vector<SectionTask>{};
    for (const auto& section : current.sections) {
        if (section.kind == SectionKind::body) continue;
        const auto* match = find_section(pristine, section.kind, section.id);

        if (section.kind == SectionKind::footnote) {
            // A footnote whose reference was (re)inserted is created afresh.
            if (body.created_footnotes.contains(section.id)) {
                tasks.push_back(SectionTask{&section, nullptr, std::nullopt});
            } else if (match != nullptr) {
                tasks.push_back(SectionTask{&section, match, std::nullopt});
            } else {
                throw DiffError{ErrorKind::structural_violation,
                                "footnote '" + section.id + "' has no inserted reference"};
            }
            continue;
        }

        if (match != nullptr) {
            tasks.push_back(SectionTask{&section, match, std::nullopt});
        } else if (section.kind == SectionKind::header) {
            tasks.push_back(SectionTask{&section, nullptr,
                                        CreateHeader{HeaderFooterType::standard, section.id}});
        } else {
            tasks.push_back(SectionTask{&section, nullptr,
                                        CreateFooter{HeaderFooterType::standard, section.id}});
        }
    }

    auto results = std::vector<std::vector<Operation>>(tasks.size());
    auto run_task = [&](std::size_t i) {
        const auto& task = tasks[i];
        auto& out = results[i];
        if (task.pristine != nullptr) {
            out = detail::diff_segment(*task.pristine, *task.current,
                                       detail::SegmentTarget{SegmentRef{task.current->id, false},
                                                             options_.tab_id})
                      .operations;
            return;
        }

        if (task.create) {
            out.push_back(Operation{.segment = SegmentRef{},
                                    .tab_id = options_.tab_id,
                                    .action = *task.create});
        }
        const auto blank = blank_section(task.current->kind, task.current->id);
        auto content = detail::diff_segment(blank, *task.current,
                                            detail::SegmentTarget{SegmentRef{task.current->id, true},
                                                                  options_.tab_id})
                           .operations;
        out.insert(out.end(), std::make_move_iterator(content.begin()),
                   std::make_move_iterator(content.end()));
    };

    if (pool_ && tasks.size() > 1) {
        pool_->parallel_for(tasks.size(), run_task);
    } else {
        for (std::size_t i = 0; i < tasks.size(); ++i) run_task(i);
    }
    for (auto& result : results) {
        ops.insert(ops.end(), std::make_move_iterator(result.begin()),
                   std::make_move_iterator(result.end()));
    }

    // -- Removed headers and footers ------------------------------------------

    for (const auto& section : pristine.sections) {
        if (section.kind != SectionKind::header && section.kind != SectionKind::footer) continue;
        if (find_section(current, section.kind, section.id) != nullptr) continue;
        auto action = section.kind == SectionKind::header
                    ? OperationAction{DeleteHeader{section.id}}
                    : OperationAction{DeleteFooter{section.id}};
        ops.push_back(Operation{.segment = SegmentRef{},
                                .tab_id = options_.tab_id,
                                .action = std::move(action)});
    }

    DOCDELTA_LOG_INFO("document '%s': %zu operations", current.document_id.c_str(), ops.size());
    return ops;
}

auto diff_documents(const Document& pristine, const Document& current,
                    const DiffOptions& options) -> std::vector<Operation> {
    return DiffEngine{options}.diff(pristine, current);
}

}  // namespace docdelta_cpp
