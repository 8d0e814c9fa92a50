#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace plstrings {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    UnicodeDecoding,

    // Deserialization (grammar) errors
    UnexpectedEndOfFile,
    UnexpectedCharacter,
    UnterminatedComment,
    UnterminatedString,
    UnsupportedEscapeSequenceOctalNextStepLatin,
    ExpectedSemicolonOrEqualsSignAfterKey,
    ExpectedSemicolonAfterKeyValue,
    StringEscapeSequenceInvalidUTF16Surrogate,

    // Serialization errors
    CommentContainsEndOfComment,
};

std::string to_string(ErrorKind k);

class StringsError : public std::runtime_error {
public:
    StringsError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

class FileReadError : public StringsError {
public:
    FileReadError(const std::filesystem::path& file, const std::string& reason);
    const std::filesystem::path& path() const noexcept;

private:
    std::filesystem::path path_;
};

class FileWriteError : public StringsError {
public:
    FileWriteError(const std::filesystem::path& file, const std::string& reason);
    const std::filesystem::path& path() const noexcept;

private:
    std::filesystem::path path_;
};

class UnicodeDecodingError : public StringsError {
public:
    explicit UnicodeDecodingError(const std::string& msg);
};

/// A position in decoded text. All fields are zero-based.
struct Location {
    std::size_t offset{0}; // Unicode scalars from the start of the text
    std::size_t line{0};
    std::size_t column{0}; // Unicode scalars from the start of the line
};

class DeserializationError : public StringsError {
public:
    DeserializationError(ErrorKind k, const Location& loc);
    const Location& location() const noexcept;

private:
    Location location_;
};

class SerializationError : public StringsError {
public:
    SerializationError(ErrorKind k, std::size_t entry_index);
    std::size_t entry_index() const noexcept;

private:
    std::size_t entry_index_;
};

// ------------------------------
// Unicode encoding forms
// ------------------------------

enum class Encoding {
    Utf8,
    Utf16BE,
    Utf16LE,
    Utf32BE,
    Utf32LE,
};

std::string to_string(Encoding e);
/// Accepts "utf8", "UTF-8", "utf16le", "utf-16-le", ... Throws std::invalid_argument.
Encoding encoding_from_string(const std::string& s);

/// Byte order mark found at the start of a buffer.
struct Bom {
    Encoding encoding{Encoding::Utf8};
    std::size_t byte_length{0}; // 2, 3 or 4
};

/// Detect a BOM in the first (up to) four bytes. No match means UTF-8 without a mark.
std::optional<Bom> detect_bom(const std::uint8_t* data, std::size_t size) noexcept;

/// Bytes of the BOM for `e` (U+FEFF in that encoding form).
std::vector<std::uint8_t> bom_bytes(Encoding e);

struct DecodedText {
    std::u32string text{};
    // True when the input was not well formed. `text` then holds U+FFFD in place of
    // every ill-formed subsequence and must not be used as the user's data.
    bool repairs_made{false};
    // Byte offset of the first ill-formed subsequence when repairs_made is set.
    std::size_t first_error_byte{0};
};

/// Decode `data` (without BOM) as `e`, validating it strictly.
DecodedText decode_unicode(const std::uint8_t* data, std::size_t size, Encoding e);

/// Encode Unicode scalars as `e`. Throws UnicodeDecodingError on surrogates or values above U+10FFFF.
std::vector<std::uint8_t> encode_unicode(std::u32string_view text, Encoding e);

// ------------------------------
// Public data model
// ------------------------------

/// One key/value line of a strings table. Strings are UTF-8.
struct Entry {
    std::string key{};
    std::string value{};
    // Absent and empty are distinct: "/**/" before an entry gives an empty comment.
    std::optional<std::string> comment{};

    bool operator==(const Entry& o) const {
        return key == o.key && value == o.value && comment == o.comment;
    }
    bool operator!=(const Entry& o) const { return !(*this == o); }
};

struct StringsFile {
    // File order. Duplicate keys are kept.
    std::vector<Entry> entries{};

    bool operator==(const StringsFile& o) const { return entries == o.entries; }
    bool operator!=(const StringsFile& o) const { return !(*this == o); }
};

// ------------------------------
// Options
// ------------------------------

struct ReadOptions {
    // Encoding assumed for input without a BOM (a BOM always wins). Unset means UTF-8.
    std::optional<Encoding> encoding{};
};

struct WriteOptions {
    Encoding encoding{Encoding::Utf8};
    bool write_bom{false};
};

// ------------------------------
// API
// ------------------------------

/// Decode a byte buffer. A leading BOM selects the encoding and is skipped.
/// Throws UnicodeDecodingError or DeserializationError.
StringsFile decode(const std::uint8_t* data, std::size_t size, const ReadOptions& opts = ReadOptions{});
StringsFile decode(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts = ReadOptions{});

/// Parse already decoded text. Throws UnicodeDecodingError if `text` holds a surrogate
/// or a value above U+10FFFF, else DeserializationError on syntax errors.
StringsFile decode(std::u32string_view text);

/// Parse UTF-8 text (no BOM handling). Throws UnicodeDecodingError or DeserializationError.
StringsFile decode_utf8(std::string_view text);

/// Serialize to UTF-8 without BOM. Throws UnicodeDecodingError if an entry is not
/// valid UTF-8, SerializationError if a comment contains '*/'.
std::vector<std::uint8_t> encode(const StringsFile& file);

/// Serialize and transcode to `opts.encoding`, optionally BOM-prefixed.
std::vector<std::uint8_t> encode_as(const StringsFile& file, const WriteOptions& opts);

/// Map a scalar offset in `text` to a zero-based line/column.
Location locate(std::u32string_view text, std::size_t offset);

/// CRC-32 of the canonical UTF-8 serialization. Equal entries give equal fingerprints.
std::uint32_t fingerprint(const StringsFile& file);
std::string fingerprint_hex(const StringsFile& file);

/// Read and decode a strings file. Throws FileReadError on I/O failure.
StringsFile read_file(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

/// Serialize and write a strings file. Throws FileWriteError on I/O failure.
void write_file(
    const std::filesystem::path& file,
    const StringsFile& strings,
    const WriteOptions& opts = WriteOptions{}
);

} // namespace plstrings
