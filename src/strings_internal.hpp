#pragma once

#include "plstrings/strings_file.hpp"

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace plstrings {
namespace internal {

// ------------------------------
// Scalar classes of the strings grammar
// ------------------------------

inline bool is_newline(char32_t c) {
    return c == U'\n' || c == U'\r' || c == 0x2028 || c == 0x2029;
}

inline bool is_whitespace(char32_t c) {
    return c == U' ' || c == U'\t' || c == 0x0B || c == 0x0C || is_newline(c);
}

inline bool is_unquoted(char32_t c) {
    if (c >= U'a' && c <= U'z') return true;
    if (c >= U'A' && c <= U'Z') return true;
    if (c >= U'0' && c <= U'9') return true;
    switch (c) {
        case U'_': case U'$': case U'/': case U':': case U'.': case U'-':
            return true;
        default:
            return false;
    }
}

// Horizontal whitespace used to trim comments: tab and the space separators (Zs).
inline bool is_blank(char32_t c) {
    switch (c) {
        case U'\t': case U' ': case 0x00A0: case 0x1680: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

// ------------------------------
// UTF helpers
// ------------------------------

inline bool is_scalar(char32_t cp) {
    return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

/// True if `s` is well-formed UTF-8.
bool is_valid_utf8(std::string_view s);

void append_utf8(std::string& out, char32_t cp);
void append_utf16(std::u16string& out, char32_t cp);
std::string scalars_to_utf8(std::u32string_view s);

/// Well-formed UTF-16 to UTF-8. Returns false (leaving `out` unspecified) on unpaired surrogates.
bool utf16_to_utf8(const std::u16string& in, std::string& out);

// ------------------------------
// Grammar parser
// ------------------------------

/// Raised by the parser; turned into a located DeserializationError at the decode boundary.
class ParseFailure : public std::exception {
public:
    ParseFailure(ErrorKind k, std::size_t offset) noexcept : kind_(k), offset_(offset) {}
    ErrorKind kind() const noexcept { return kind_; }
    std::size_t offset() const noexcept { return offset_; }
    const char* what() const noexcept override { return "strings parse failure"; }

private:
    ErrorKind kind_;
    std::size_t offset_;
};

std::vector<Entry> parse_entries(std::u32string_view text);

} // namespace internal
} // namespace plstrings
