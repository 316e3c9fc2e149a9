#pragma once

// Internal header — not installed.
// Longest-common-subsequence opcodes over two key sequences.

#include <docdelta-cpp/sequence_diff.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace docdelta_cpp::detail {

/// One run of the edit script: [a_begin, a_end) of the old sequence
/// against [b_begin, b_end) of the new one.
struct Opcode {
    ChangeKind kind;
    std::size_t a_begin;
    std::size_t a_end;
    std::size_t b_begin;
    std::size_t b_end;
};

/// Edit script between @p a and @p b with maximal matched length.
///
/// The common prefix is matched first; the remainder is solved with a
/// suffix-length table walked forwards, so ambiguous alignments match the
/// earliest candidates. Within a gap, removals precede insertions and an
/// adjacent removal/insertion pair becomes one replace.
template <typename Key>
auto lcs_opcodes(const std::vector<Key>& a, const std::vector<Key>& b) -> std::vector<Opcode> {
    const auto n = a.size();
    const auto m = b.size();

    // Step kinds of the walk: 0 match, 1 remove a[i], 2 insert b[j].
    auto steps = std::vector<std::uint8_t>{};
    steps.reserve(n + m);

    auto prefix = std::size_t{0};
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) {
        steps.push_back(0);
        ++prefix;
    }

    const auto rows = n - prefix;
    const auto cols = m - prefix;
    // table[i * (cols + 1) + j] = LCS length of a[prefix+i..] and b[prefix+j..]
    auto table = std::vector<std::uint32_t>((rows + 1) * (cols + 1), 0);
    auto at = [&](std::size_t i, std::size_t j) -> std::uint32_t& {
        return table[i * (cols + 1) + j];
    };
    for (auto i = rows; i-- > 0;) {
        for (auto j = cols; j-- > 0;) {
            if (a[prefix + i] == b[prefix + j]) {
                at(i, j) = at(i + 1, j + 1) + 1;
            } else {
                at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
            }
        }
    }

    auto i = std::size_t{0};
    auto j = std::size_t{0};
    while (i < rows || j < cols) {
        if (i < rows && j < cols && a[prefix + i] == b[prefix + j]) {
            steps.push_back(0);
            ++i;
            ++j;
        } else if (j == cols || (i < rows && at(i + 1, j) >= at(i, j + 1))) {
            steps.push_back(1);
            ++i;
        } else {
            steps.push_back(2);
            ++j;
        }
    }

    auto opcodes = std::vector<Opcode>{};
    auto ai = std::size_t{0};
    auto bi = std::size_t{0};
    auto k = std::size_t{0};
    while (k < steps.size()) {
        const auto a_begin = ai;
        const auto b_begin = bi;
        if (steps[k] == 0) {
            while (k < steps.size() && steps[k] == 0) {
                ++ai;
                ++bi;
                ++k;
            }
            opcodes.push_back({ChangeKind::equal, a_begin, ai, b_begin, bi});
            continue;
        }
        while (k < steps.size() && steps[k] != 0) {
            if (steps[k] == 1) ++ai;
            else ++bi;
            ++k;
        }
        auto kind = ChangeKind::replace;
        if (ai == a_begin) kind = ChangeKind::insert;
        else if (bi == b_begin) kind = ChangeKind::remove;
        opcodes.push_back({kind, a_begin, ai, b_begin, bi});
    }
    return opcodes;
}

}  // namespace docdelta_cpp::detail
