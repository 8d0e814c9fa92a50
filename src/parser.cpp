#include "plstrings/strings_file.hpp"
#include "strings_internal.hpp"

#include <algorithm>
#include <optional>

namespace plstrings {
namespace internal {

namespace {

std::u32string_view trim_blanks(std::u32string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_blank(s[b])) ++b;
    while (e > b && is_blank(s[e - 1])) --e;
    return s.substr(b, e - b);
}

int hex_value(char32_t c) {
    if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
    if (c >= U'a' && c <= U'f') return static_cast<int>(10 + (c - U'a'));
    if (c >= U'A' && c <= U'F') return static_cast<int>(10 + (c - U'A'));
    return -1;
}

/// Recursive descent over Unicode scalars. Positions are scalar offsets into `s_`.
class StringsParser {
public:
    explicit StringsParser(std::u32string_view s) : s_(s) {}

    std::vector<Entry> parse() {
        std::vector<Entry> entries;
        while (!at_end()) {
            std::optional<std::u32string_view> comment = skip_whitespace_and_comments();
            if (at_end()) break;

            Entry e = parse_key_value();
            if (comment) {
                e.comment = scalars_to_utf8(trim_blanks(*comment));
            }
            entries.push_back(std::move(e));
        }
        return entries;
    }

private:
    std::u32string_view s_;
    std::size_t pos_{0};

    bool at_end() const { return pos_ >= s_.size(); }

    [[noreturn]] void fail(ErrorKind k, std::size_t at) const {
        throw ParseFailure(k, at);
    }

    // Returns the text of the last comment skipped, if any.
    std::optional<std::u32string_view> skip_whitespace_and_comments() {
        std::optional<std::u32string_view> last;
        while (!at_end()) {
            while (!at_end() && s_[pos_] != U'/' && is_whitespace(s_[pos_])) ++pos_;
            if (at_end() || s_[pos_] != U'/') break;

            std::optional<std::u32string_view> c = parse_comment();
            if (!c) break; // a lone '/' starts an unquoted string
            last = c;
        }
        return last;
    }

    // At a '/'. Consumes a comment and returns its body, or consumes nothing.
    std::optional<std::u32string_view> parse_comment() {
        const std::size_t start = pos_;
        if (start + 1 >= s_.size()) return std::nullopt;

        if (s_[start + 1] == U'/') {
            pos_ = start + 2;
            const std::size_t body = pos_;
            while (!at_end() && !is_newline(s_[pos_])) ++pos_;
            return s_.substr(body, pos_ - body);
        }

        if (s_[start + 1] == U'*') {
            const std::size_t body = start + 2;
            const std::size_t close = s_.find(U"*/", body);
            if (close == std::u32string_view::npos) {
                fail(ErrorKind::UnterminatedComment, start);
            }
            pos_ = close + 2;
            return s_.substr(body, close - body);
        }

        return std::nullopt;
    }

    Entry parse_key_value() {
        Entry e;
        e.key = parse_string();
        (void)skip_whitespace_and_comments();

        if (!at_end() && s_[pos_] == U';') {
            // shortcut form
            ++pos_;
            e.value = e.key;
            return e;
        }
        if (at_end() || s_[pos_] != U'=') {
            fail(ErrorKind::ExpectedSemicolonOrEqualsSignAfterKey, pos_);
        }

        ++pos_;
        (void)skip_whitespace_and_comments();
        e.value = parse_string();
        (void)skip_whitespace_and_comments();
        if (at_end() || s_[pos_] != U';') {
            fail(ErrorKind::ExpectedSemicolonAfterKeyValue, pos_);
        }
        ++pos_;
        return e;
    }

    std::string parse_string() {
        if (at_end()) fail(ErrorKind::UnexpectedEndOfFile, pos_);

        const char32_t c = s_[pos_];
        if (c == U'"' || c == U'\'') return parse_quoted_string();
        if (is_unquoted(c)) return parse_unquoted_string();
        fail(ErrorKind::UnexpectedCharacter, pos_);
    }

    std::string parse_unquoted_string() {
        const std::size_t start = pos_;
        while (!at_end() && is_unquoted(s_[pos_])) ++pos_;
        return scalars_to_utf8(s_.substr(start, pos_ - start));
    }

    // Scalars are copied through until the first escape. From then on the string is
    // collected as UTF-16 code units, since \U escapes produce code units (possibly
    // surrogate halves) rather than scalars; the units are validated at the closing quote.
    std::string parse_quoted_string() {
        const std::size_t start = pos_;
        const char32_t quote = s_[pos_++];

        std::u16string units;
        bool escaped = false;
        std::size_t pending = pos_;

        while (!at_end()) {
            const char32_t c = s_[pos_];

            if (c == quote) {
                std::string out;
                if (!escaped) {
                    out = scalars_to_utf8(s_.substr(pending, pos_ - pending));
                } else {
                    append_pending(units, pending, pos_);
                    if (!utf16_to_utf8(units, out)) {
                        fail(ErrorKind::StringEscapeSequenceInvalidUTF16Surrogate, start);
                    }
                }
                ++pos_;
                return out;
            }

            if (c == U'\\') {
                // Backslash as the last scalar: the string runs past the end.
                if (pos_ + 1 >= s_.size()) break;
                append_pending(units, pending, pos_);
                escaped = true;
                ++pos_;
                parse_escape(units);
                pending = pos_;
                continue;
            }

            ++pos_;
        }

        fail(ErrorKind::UnterminatedString, start);
    }

    void append_pending(std::u16string& units, std::size_t from, std::size_t to) const {
        for (std::size_t i = from; i < to; ++i) append_utf16(units, s_[i]);
    }

    // At the scalar following a backslash.
    void parse_escape(std::u16string& units) {
        const char32_t c = s_[pos_];
        if (c >= U'0' && c <= U'9') {
            // NeXTSTEP octal escapes are not supported.
            fail(ErrorKind::UnsupportedEscapeSequenceOctalNextStepLatin, pos_);
        }
        ++pos_;

        switch (c) {
            case U'a': units.push_back(0x07); return;
            case U'b': units.push_back(0x08); return;
            case U'f': units.push_back(0x0C); return;
            case U'n': units.push_back(0x0A); return;
            case U'r': units.push_back(0x0D); return;
            case U't': units.push_back(0x09); return;
            case U'v': units.push_back(0x0B); return;
            case U'U': {
                unsigned v = 0;
                int digits = 0;
                while (digits < 4 && !at_end() && hex_value(s_[pos_]) >= 0) {
                    v = (v << 4) | static_cast<unsigned>(hex_value(s_[pos_]));
                    ++pos_;
                    ++digits;
                }
                if (digits == 0) {
                    units.push_back(u'U');
                } else {
                    units.push_back(static_cast<char16_t>(v));
                }
                return;
            }
            default:
                append_utf16(units, c);
                return;
        }
    }
};

} // namespace

std::vector<Entry> parse_entries(std::u32string_view text) {
    StringsParser p(text);
    return p.parse();
}

} // namespace internal

// ------------------------------
// Error location
// ------------------------------

// Counts scalars, not grapheme clusters: CR LF is two line breaks.
Location locate(std::u32string_view text, std::size_t offset) {
    Location loc;
    loc.offset = offset;
    const std::size_t end = std::min(offset, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (internal::is_newline(text[i])) {
            ++loc.line;
            loc.column = 0;
        } else {
            ++loc.column;
        }
    }
    return loc;
}

} // namespace plstrings
