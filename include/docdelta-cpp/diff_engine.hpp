/// @file diff_engine.hpp
/// @brief Document diff: pristine + current trees -> ordered operations.

#pragma once

#include <docdelta-cpp/model.hpp>
#include <docdelta-cpp/operation.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docdelta_cpp {

namespace detail {
class ThreadPool;
}

/// Engine configuration.
struct DiffOptions {
    /// Workers used to diff non-body segments: 1 = sequential,
    /// 0 = hardware concurrency.
    unsigned int num_threads{1};
    /// Attached to every operation when edits target a non-default tab.
    std::optional<std::string> tab_id;
};

/// Produces the operations that turn a pristine document into a current one.
///
/// The result is a pure function of the inputs: identical inputs give an
/// identical list whatever the thread count. Each operation's indices are
/// valid against the document state produced by replaying every earlier
/// operation of the list.
///
/// @code
/// auto engine = docdelta_cpp::DiffEngine{};
/// auto ops = engine.diff(pristine, current);
/// auto body = docdelta_cpp::to_batch_update(ops);
/// @endcode
class DiffEngine {
public:
    DiffEngine();
    explicit DiffEngine(DiffOptions options);
    ~DiffEngine();

    DiffEngine(const DiffEngine&) = delete;
    auto operator=(const DiffEngine&) -> DiffEngine& = delete;
    DiffEngine(DiffEngine&&) noexcept;
    auto operator=(DiffEngine&&) noexcept -> DiffEngine&;

    /// Diff two whole documents.
    ///
    /// Order of the result: body operations, then every other current
    /// section in document order (a new header/footer is preceded by its
    /// create operation), then deletions of pristine-only headers/footers.
    ///
    /// @throws DiffError on malformed input or unsynthesisable changes.
    auto diff(const Document& pristine, const Document& current) const -> std::vector<Operation>;

    /// Diff two versions of one section, addressed to @p segment.
    auto diff_section(const Section& pristine, const Section& current,
                      const SegmentRef& segment = {}) const -> std::vector<Operation>;

    auto options() const -> const DiffOptions&;

private:
    DiffOptions options_;
    std::unique_ptr<detail::ThreadPool> pool_;
};

/// Convenience wrapper around DiffEngine::diff().
auto diff_documents(const Document& pristine, const Document& current,
                    const DiffOptions& options = {}) -> std::vector<Operation>;

}  // namespace docdelta_cpp
