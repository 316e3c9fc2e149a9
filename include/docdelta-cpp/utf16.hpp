/// @file utf16.hpp
/// @brief UTF-16 code-unit indexing of UTF-8 text.
///
/// The remote document API addresses content by UTF-16 code units. Every
/// length and offset computed by this library goes through these functions.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docdelta_cpp {

/// Length of @p text in UTF-16 code units.
///
/// Code points above 0xFFFF contribute 2 units, every other code point 1.
/// Malformed UTF-8 bytes are counted as one unit each (they become U+FFFD).
auto utf16_len(std::string_view text) noexcept -> std::size_t;

/// Transcode UTF-8 text to UTF-16. Malformed bytes become U+FFFD.
auto to_utf16(std::string_view text) -> std::u16string;

/// Transcode UTF-16 text to UTF-8. Unpaired surrogates become U+FFFD.
auto to_utf8(std::u16string_view text) -> std::string;

}  // namespace docdelta_cpp
