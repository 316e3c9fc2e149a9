#pragma once

// Internal header — not installed.
// Operation synthesis for a single segment.

#include <docdelta-cpp/model.hpp>
#include <docdelta-cpp/operation.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace docdelta_cpp::detail {

/// Where the operations of one segment are addressed.
struct SegmentTarget {
    SegmentRef segment;
    std::optional<std::string> tab_id;
};

/// Operations of one segment diff, already in replay order.
struct SegmentResult {
    std::vector<Operation> operations;
    std::set<std::string> created_footnotes;  ///< ids of inserted footnote references
};

/// Diff @p current against @p pristine, both of the same segment.
///
/// @p pristine must be validated. An empty @p current is treated as one
/// empty paragraph.
auto diff_segment(const Section& pristine, const Section& current,
                  const SegmentTarget& target) -> SegmentResult;

}  // namespace docdelta_cpp::detail
