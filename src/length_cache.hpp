#pragma once

// Internal header — not installed.
// Element lengths memoised for one diff pass.

#include <docdelta-cpp/model.hpp>
#include <docdelta-cpp/sequence_diff.hpp>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace docdelta_cpp::detail {

/// Lengths keyed by element address. A table's length is built from its
/// cells' cached content lengths, so every element is measured once no
/// matter how deeply it is nested or how often it is re-indexed.
///
/// The elements must outlive the cache and must not move.
class LengthCache {
public:
    auto of(const Element& element) -> std::size_t;
    auto of(const std::vector<Element>& content) -> std::size_t;

    /// Same as index_elements(), from cached lengths.
    auto index(const std::vector<Element>& content, std::size_t start) -> std::vector<IndexedElement>;

    /// Offset of each cell's content, row-major, for a table starting at
    /// @p start.
    auto cell_starts(const Table& table, std::size_t start) -> std::vector<std::size_t>;

    auto size() const -> std::size_t { return lengths_.size(); }

private:
    std::unordered_map<const Element*, std::size_t> lengths_;
};

}  // namespace docdelta_cpp::detail
