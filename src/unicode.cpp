#include "plstrings/strings_file.hpp"
#include "strings_internal.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace plstrings {

// ------------------------------
// Encoding names
// ------------------------------

std::string to_string(Encoding e) {
    switch (e) {
        case Encoding::Utf8: return "UTF-8";
        case Encoding::Utf16BE: return "UTF-16BE";
        case Encoding::Utf16LE: return "UTF-16LE";
        case Encoding::Utf32BE: return "UTF-32BE";
        case Encoding::Utf32LE: return "UTF-32LE";
    }
    return "unknown";
}

Encoding encoding_from_string(const std::string& s) {
    std::string n;
    n.reserve(s.size());
    for (char c : s) {
        if (c == '-' || c == '_') continue;
        n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (n == "utf8") return Encoding::Utf8;
    if (n == "utf16be") return Encoding::Utf16BE;
    if (n == "utf16le") return Encoding::Utf16LE;
    if (n == "utf32be") return Encoding::Utf32BE;
    if (n == "utf32le") return Encoding::Utf32LE;
    throw std::invalid_argument("unknown encoding: '" + s + "'");
}

// ------------------------------
// Byte order mark
// ------------------------------

std::optional<Bom> detect_bom(const std::uint8_t* data, std::size_t size) noexcept {
    auto at = [&](std::size_t i) -> int { return i < size ? data[i] : -1; };
    const int b0 = at(0), b1 = at(1), b2 = at(2), b3 = at(3);

    if (b0 == 0x00 && b1 == 0x00 && b2 == 0xFE && b3 == 0xFF) return Bom{Encoding::Utf32BE, 4};
    if (b0 == 0xFF && b1 == 0xFE && b2 == 0x00 && b3 == 0x00) return Bom{Encoding::Utf32LE, 4};
    if (b0 == 0xFE && b1 == 0xFF) return Bom{Encoding::Utf16BE, 2};
    if (b0 == 0xFF && b1 == 0xFE) return Bom{Encoding::Utf16LE, 2};
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) return Bom{Encoding::Utf8, 3};
    return std::nullopt;
}

std::vector<std::uint8_t> bom_bytes(Encoding e) {
    return encode_unicode(std::u32string_view(U"\uFEFF"), e);
}

// ------------------------------
// Code unit access
// ------------------------------

namespace {

constexpr char32_t kReplacement = 0xFFFD;

/// Fixed-width code units over a raw byte buffer. A byte count that is not a
/// multiple of the unit width leaves a partial unit, exposed as has_trailing_bytes().
template <typename Unit>
class CodeUnitView {
public:
    CodeUnitView(const std::uint8_t* data, std::size_t size, bool big_endian)
        : data_(data),
          count_(size / sizeof(Unit)),
          trailing_(size % sizeof(Unit) != 0),
          big_endian_(big_endian) {}

    std::size_t size() const noexcept { return count_; }
    bool has_trailing_bytes() const noexcept { return trailing_; }

    std::uint32_t operator[](std::size_t i) const {
        const std::uint8_t* p = data_ + i * sizeof(Unit);
        std::uint32_t v = 0;
        for (std::size_t b = 0; b < sizeof(Unit); ++b) {
            std::size_t idx = big_endian_ ? b : sizeof(Unit) - 1 - b;
            v = (v << 8) | p[idx];
        }
        return v;
    }

private:
    const std::uint8_t* data_;
    std::size_t count_;
    bool trailing_;
    bool big_endian_;
};

// Result of parsing one scalar: on error, `length` is the maximal ill-formed subpart.
struct ScalarParse {
    char32_t scalar{0};
    std::size_t length{1};
    bool ok{false};
};

// Strict forward scalar parsers, one per encoding form.

struct Utf8Form {
    using Unit = std::uint8_t;

    static bool is_cont(std::uint32_t b) { return (b & 0xC0u) == 0x80u; }

    static ScalarParse parse(const CodeUnitView<Unit>& u, std::size_t i) {
        const std::size_t n = u.size();
        const std::uint32_t b0 = u[i];
        if (b0 < 0x80) return {b0, 1, true};
        if (b0 < 0xC2) return {0, 1, false};

        if (b0 < 0xE0) {
            if (i + 1 >= n || !is_cont(u[i + 1])) return {0, 1, false};
            return {((b0 & 0x1Fu) << 6) | (u[i + 1] & 0x3Fu), 2, true};
        }

        if (b0 < 0xF0) {
            std::uint32_t lo = 0x80, hi = 0xBF;
            if (b0 == 0xE0) lo = 0xA0;      // overlong
            if (b0 == 0xED) hi = 0x9F;      // surrogates
            if (i + 1 >= n || u[i + 1] < lo || u[i + 1] > hi) return {0, 1, false};
            if (i + 2 >= n || !is_cont(u[i + 2])) return {0, 2, false};
            return {((b0 & 0x0Fu) << 12) | ((u[i + 1] & 0x3Fu) << 6) | (u[i + 2] & 0x3Fu), 3, true};
        }

        if (b0 < 0xF5) {
            std::uint32_t lo = 0x80, hi = 0xBF;
            if (b0 == 0xF0) lo = 0x90;      // overlong
            if (b0 == 0xF4) hi = 0x8F;      // above U+10FFFF
            if (i + 1 >= n || u[i + 1] < lo || u[i + 1] > hi) return {0, 1, false};
            if (i + 2 >= n || !is_cont(u[i + 2])) return {0, 2, false};
            if (i + 3 >= n || !is_cont(u[i + 3])) return {0, 3, false};
            return {((b0 & 0x07u) << 18) | ((u[i + 1] & 0x3Fu) << 12) |
                        ((u[i + 2] & 0x3Fu) << 6) | (u[i + 3] & 0x3Fu),
                    4, true};
        }

        return {0, 1, false};
    }
};

struct Utf16Form {
    using Unit = std::uint16_t;

    static ScalarParse parse(const CodeUnitView<Unit>& u, std::size_t i) {
        const std::uint32_t w0 = u[i];
        if (w0 < 0xD800 || w0 > 0xDFFF) return {w0, 1, true};
        if (w0 > 0xDBFF) return {0, 1, false}; // lone low surrogate
        if (i + 1 >= u.size()) return {0, 1, false};
        const std::uint32_t w1 = u[i + 1];
        if (w1 < 0xDC00 || w1 > 0xDFFF) return {0, 1, false};
        return {0x10000u + (((w0 - 0xD800u) << 10) | (w1 - 0xDC00u)), 2, true};
    }
};

struct Utf32Form {
    using Unit = std::uint32_t;

    static ScalarParse parse(const CodeUnitView<Unit>& u, std::size_t i) {
        const std::uint32_t v = u[i];
        if (v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF)) return {0, 1, false};
        return {v, 1, true};
    }
};

template <typename Form>
bool validate(const CodeUnitView<typename Form::Unit>& units) {
    std::size_t i = 0;
    while (i < units.size()) {
        ScalarParse r = Form::parse(units, i);
        if (!r.ok) return false;
        i += r.length;
    }
    return true;
}

template <typename Form>
DecodedText decode_form(const std::uint8_t* data, std::size_t size, bool big_endian) {
    using Unit = typename Form::Unit;
    CodeUnitView<Unit> units(data, size, big_endian);

    DecodedText out;
    out.text.reserve(units.size());
    bool error_seen = false;
    std::size_t i = 0;
    while (i < units.size()) {
        ScalarParse r = Form::parse(units, i);
        if (r.ok) {
            out.text.push_back(r.scalar);
        } else {
            out.text.push_back(kReplacement);
            if (!error_seen) {
                error_seen = true;
                out.first_error_byte = i * sizeof(Unit);
            }
        }
        i += r.length;
    }

    out.repairs_made = !validate<Form>(units);
    if (units.has_trailing_bytes()) {
        out.text.push_back(kReplacement);
        if (!out.repairs_made) out.first_error_byte = units.size() * sizeof(Unit);
        out.repairs_made = true;
    }
    return out;
}

void check_scalar(char32_t cp) {
    if (!internal::is_scalar(cp)) {
        std::ostringstream oss;
        oss << "value 0x" << std::hex << std::uppercase << static_cast<std::uint32_t>(cp)
            << " is not a Unicode scalar";
        throw UnicodeDecodingError(oss.str());
    }
}

void put_unit(std::vector<std::uint8_t>& out, std::uint32_t v, std::size_t width, bool big_endian) {
    for (std::size_t b = 0; b < width; ++b) {
        std::size_t shift = big_endian ? (width - 1 - b) * 8 : b * 8;
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFFu));
    }
}

} // namespace

DecodedText decode_unicode(const std::uint8_t* data, std::size_t size, Encoding e) {
    switch (e) {
        case Encoding::Utf8: return decode_form<Utf8Form>(data, size, false);
        case Encoding::Utf16BE: return decode_form<Utf16Form>(data, size, true);
        case Encoding::Utf16LE: return decode_form<Utf16Form>(data, size, false);
        case Encoding::Utf32BE: return decode_form<Utf32Form>(data, size, true);
        case Encoding::Utf32LE: return decode_form<Utf32Form>(data, size, false);
    }
    throw std::invalid_argument("unsupported encoding");
}

std::vector<std::uint8_t> encode_unicode(std::u32string_view text, Encoding e) {
    std::vector<std::uint8_t> out;
    switch (e) {
        case Encoding::Utf8: {
            std::string s;
            s.reserve(text.size());
            for (char32_t cp : text) {
                check_scalar(cp);
                internal::append_utf8(s, cp);
            }
            out.assign(s.begin(), s.end());
            break;
        }
        case Encoding::Utf16BE:
        case Encoding::Utf16LE: {
            const bool be = (e == Encoding::Utf16BE);
            out.reserve(text.size() * 2);
            for (char32_t cp : text) {
                check_scalar(cp);
                std::u16string units;
                internal::append_utf16(units, cp);
                for (char16_t w : units) put_unit(out, w, 2, be);
            }
            break;
        }
        case Encoding::Utf32BE:
        case Encoding::Utf32LE: {
            const bool be = (e == Encoding::Utf32BE);
            out.reserve(text.size() * 4);
            for (char32_t cp : text) {
                check_scalar(cp);
                put_unit(out, cp, 4, be);
            }
            break;
        }
    }
    return out;
}

// ------------------------------
// UTF helpers (internal)
// ------------------------------

namespace internal {

bool is_valid_utf8(std::string_view s) {
    return !decode_unicode(reinterpret_cast<const std::uint8_t*>(s.data()), s.size(), Encoding::Utf8).repairs_made;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void append_utf16(std::u16string& out, char32_t cp) {
    if (cp < 0x10000) {
        out.push_back(static_cast<char16_t>(cp));
    } else {
        cp -= 0x10000;
        out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
        out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
    }
}

std::string scalars_to_utf8(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) append_utf8(out, cp);
    return out;
}

bool utf16_to_utf8(const std::u16string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    std::size_t i = 0;
    while (i < in.size()) {
        char32_t w0 = in[i++];
        if (w0 >= 0xD800 && w0 <= 0xDBFF) {
            if (i >= in.size()) return false;
            char32_t w1 = in[i];
            if (w1 < 0xDC00 || w1 > 0xDFFF) return false;
            ++i;
            append_utf8(out, 0x10000 + (((w0 - 0xD800) << 10) | (w1 - 0xDC00)));
        } else if (w0 >= 0xDC00 && w0 <= 0xDFFF) {
            return false;
        } else {
            append_utf8(out, w0);
        }
    }
    return true;
}

} // namespace internal
} // namespace plstrings
