#include "plstrings/strings_file.hpp"
#include "strings_internal.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace plstrings {

// ------------------------------
// Errors
// ------------------------------

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "I/O error";
        case ErrorKind::UnicodeDecoding: return "invalid Unicode byte sequence";
        case ErrorKind::UnexpectedEndOfFile: return "unexpected end of file";
        case ErrorKind::UnexpectedCharacter: return "unexpected character";
        case ErrorKind::UnterminatedComment: return "unterminated comment";
        case ErrorKind::UnterminatedString: return "unterminated string";
        case ErrorKind::UnsupportedEscapeSequenceOctalNextStepLatin:
            return "unsupported octal escape sequence";
        case ErrorKind::ExpectedSemicolonOrEqualsSignAfterKey:
            return "expected ';' or '=' after key";
        case ErrorKind::ExpectedSemicolonAfterKeyValue:
            return "expected ';' after key/value";
        case ErrorKind::StringEscapeSequenceInvalidUTF16Surrogate:
            return "escape sequence forms an invalid UTF-16 surrogate";
        case ErrorKind::CommentContainsEndOfComment:
            return "comment contains end-of-comment marker '*/'";
    }
    return "unknown error";
}

StringsError::StringsError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind StringsError::kind() const noexcept { return kind_; }

FileReadError::FileReadError(const std::filesystem::path& file, const std::string& reason)
    : StringsError(ErrorKind::Io, "failed to read file: " + file.string() + ": " + reason),
      path_(file) {}

const std::filesystem::path& FileReadError::path() const noexcept { return path_; }

FileWriteError::FileWriteError(const std::filesystem::path& file, const std::string& reason)
    : StringsError(ErrorKind::Io, "failed to write file: " + file.string() + ": " + reason),
      path_(file) {}

const std::filesystem::path& FileWriteError::path() const noexcept { return path_; }

UnicodeDecodingError::UnicodeDecodingError(const std::string& msg)
    : StringsError(ErrorKind::UnicodeDecoding, msg) {}

static std::string located_message(ErrorKind k, const Location& loc) {
    std::ostringstream oss;
    oss << to_string(k) << " at line " << (loc.line + 1) << ", column " << (loc.column + 1);
    return oss.str();
}

DeserializationError::DeserializationError(ErrorKind k, const Location& loc)
    : StringsError(k, located_message(k, loc)), location_(loc) {}

const Location& DeserializationError::location() const noexcept { return location_; }

SerializationError::SerializationError(ErrorKind k, std::size_t entry_index)
    : StringsError(k, to_string(k) + " (entry " + std::to_string(entry_index) + ")"),
      entry_index_(entry_index) {}

std::size_t SerializationError::entry_index() const noexcept { return entry_index_; }

// ------------------------------
// Decoding
// ------------------------------

StringsFile decode(std::u32string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!internal::is_scalar(text[i])) {
            std::ostringstream oss;
            oss << "value 0x" << std::hex << std::uppercase << static_cast<std::uint32_t>(text[i])
                << std::dec << " at offset " << i << " is not a Unicode scalar";
            throw UnicodeDecodingError(oss.str());
        }
    }

    StringsFile out;
    try {
        out.entries = internal::parse_entries(text);
    } catch (const internal::ParseFailure& f) {
        throw DeserializationError(f.kind(), locate(text, f.offset()));
    }
    return out;
}

StringsFile decode(const std::uint8_t* data, std::size_t size, const ReadOptions& opts) {
    Encoding enc = opts.encoding.value_or(Encoding::Utf8);
    std::size_t skip = 0;
    if (std::optional<Bom> bom = detect_bom(data, size)) {
        enc = bom->encoding;
        skip = bom->byte_length;
    }

    DecodedText decoded = decode_unicode(data + skip, size - skip, enc);
    if (decoded.repairs_made) {
        std::ostringstream oss;
        oss << "invalid " << to_string(enc) << " byte sequence at byte "
            << (skip + decoded.first_error_byte);
        throw UnicodeDecodingError(oss.str());
    }
    return decode(decoded.text);
}

StringsFile decode(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts) {
    return decode(bytes.data(), bytes.size(), opts);
}

StringsFile decode_utf8(std::string_view text) {
    DecodedText decoded = decode_unicode(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), Encoding::Utf8);
    if (decoded.repairs_made) {
        throw UnicodeDecodingError(
            "invalid UTF-8 byte sequence at byte " + std::to_string(decoded.first_error_byte));
    }
    return decode(decoded.text);
}

// ------------------------------
// File I/O
// ------------------------------

StringsFile read_file(const std::filesystem::path& file, const ReadOptions& opts) {
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw FileReadError(file, std::strerror(errno));
    }

    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    if (is.bad()) {
        throw FileReadError(file, "read failed");
    }
    return decode(bytes, opts);
}

void write_file(const std::filesystem::path& file, const StringsFile& strings, const WriteOptions& opts) {
    // Serialize first so a SerializationError leaves any existing file untouched.
    std::vector<std::uint8_t> bytes = encode_as(strings, opts);

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) {
        throw FileWriteError(file, std::strerror(errno));
    }
    os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
        throw FileWriteError(file, "write failed");
    }
}

} // namespace plstrings
