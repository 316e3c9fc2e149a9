#include <docdelta-cpp/utf16.hpp>

#include <cstdint>

namespace docdelta_cpp {

namespace {

constexpr char32_t replacement_char = 0xFFFD;

auto sequence_length(unsigned char lead) noexcept -> std::size_t {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;  // invalid lead byte
}

auto is_continuation(unsigned char c) noexcept -> bool {
    return (c & 0xC0) == 0x80;
}

// Decode the code point starting at text[pos]; advances pos.
// Truncated or malformed sequences consume a single byte.
auto decode_one(std::string_view text, std::size_t& pos) noexcept -> char32_t {
    const auto lead = static_cast<unsigned char>(text[pos]);
    auto len = sequence_length(lead);
    if (len == 1) {
        ++pos;
        return lead < 0x80 ? static_cast<char32_t>(lead) : replacement_char;
    }
    if (pos + len > text.size()) {
        ++pos;
        return replacement_char;
    }
    auto cp = static_cast<char32_t>(lead & (0x7F >> len));
    for (std::size_t k = 1; k < len; ++k) {
        const auto c = static_cast<unsigned char>(text[pos + k]);
        if (!is_continuation(c)) {
            ++pos;
            return replacement_char;
        }
        cp = (cp << 6) | static_cast<char32_t>(c & 0x3F);
    }
    pos += len;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return replacement_char;
    return cp;
}

}  // namespace

auto utf16_len(std::string_view text) noexcept -> std::size_t {
    auto units = std::size_t{0};
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        units += decode_one(text, pos) > 0xFFFF ? 2 : 1;
    }
    return units;
}

auto to_utf16(std::string_view text) -> std::u16string {
    auto out = std::u16string{};
    out.reserve(text.size());
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        auto cp = decode_one(text, pos);
        if (cp > 0xFFFF) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
    }
    return out;
}

auto to_utf8(std::u16string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto cp = static_cast<char32_t>(text[i]);
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < text.size()
            && text[i + 1] >= 0xDC00 && text[i + 1] <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (static_cast<char32_t>(text[i + 1]) - 0xDC00);
            ++i;
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = replacement_char;
        }

        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

}  // namespace docdelta_cpp
