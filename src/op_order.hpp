#pragma once

// Internal header — not installed.
// Replay ordering of the operations emitted for one segment.

#include <docdelta-cpp/operation.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace docdelta_cpp::detail {

/// Priority tier inside one change group.
enum class OrderTier : std::uint8_t {
    existing_paragraph_style = 1,  ///< paragraph/bullet updates on pristine ranges
    deletion = 2,
    insertion = 3,
    other = 4,                     ///< text styles and post-insert updates
};

auto tier_of(const Operation& op) -> OrderTier;

/// The index an operation sorts by within its tier: the range start or the
/// insertion location; 0 for segment-level operations.
auto order_index(const Operation& op) -> std::size_t;

/// Sort by (change_group, tier, tier key, generation). Deletes sort by
/// descending start, every other tier by ascending index.
void order_operations(std::vector<Operation>& ops);

}  // namespace docdelta_cpp::detail
