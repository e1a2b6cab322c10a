#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace utils {

    // Number of characters in a UTF-8 string. A well-formed multi-byte sequence counts
    // once; every byte of a truncated or stray sequence counts on its own, so the byte
    // length never exceeds four times the result.
    inline std::size_t utf8_length(std::string_view text) noexcept {
        std::size_t count = 0;
        std::size_t i = 0;
        while (i < text.size()) {
            auto lead = static_cast<unsigned char>(text[i]);
            std::size_t expected = 1;
            if ((lead & 0xE0) == 0xC0) expected = 2;
            else if ((lead & 0xF0) == 0xE0) expected = 3;
            else if ((lead & 0xF8) == 0xF0) expected = 4;

            std::size_t k = 1;
            while (k < expected && i + k < text.size() &&
                   (static_cast<unsigned char>(text[i + k]) & 0xC0) == 0x80) {
                ++k;
            }
            i += (k == expected) ? expected : 1;
            ++count;
        }
        return count;
    }

    inline bool is_ascii_space(unsigned char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    // Strips leading and trailing ASCII whitespace. Interior characters are untouched.
    inline std::string trim(std::string_view text) {
        std::size_t begin = 0;
        std::size_t end = text.size();
        while (begin < end && is_ascii_space(static_cast<unsigned char>(text[begin]))) ++begin;
        while (end > begin && is_ascii_space(static_cast<unsigned char>(text[end - 1]))) --end;
        return std::string(text.substr(begin, end - begin));
    }

} // namespace utils
