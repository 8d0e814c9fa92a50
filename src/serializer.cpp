#include "plstrings/strings_file.hpp"
#include "strings_internal.hpp"

#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace plstrings {

static void require_utf8(const std::string& s, const char* what, std::size_t index) {
    if (!internal::is_valid_utf8(s)) {
        throw UnicodeDecodingError(
            std::string(what) + " of entry " + std::to_string(index) + " is not valid UTF-8");
    }
}

static void append_escaped(std::string& out, const std::string& s) {
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
}

std::vector<std::uint8_t> encode(const StringsFile& file) {
    std::string out;
    for (std::size_t i = 0; i < file.entries.size(); ++i) {
        const Entry& e = file.entries[i];
        require_utf8(e.key, "key", i);
        require_utf8(e.value, "value", i);
        if (e.comment) require_utf8(*e.comment, "comment", i);

        if (e.comment) {
            // A '*/' inside the comment would close the block comment early.
            if (e.comment->find("*/") != std::string::npos) {
                throw SerializationError(ErrorKind::CommentContainsEndOfComment, i);
            }
            out += "/* ";
            out += *e.comment;
            out += " */\n";
        }

        out.push_back('"');
        append_escaped(out, e.key);
        out += "\" = \"";
        append_escaped(out, e.value);
        out += "\";\n\n";
    }
    return std::vector<std::uint8_t>(out.begin(), out.end());
}

std::vector<std::uint8_t> encode_as(const StringsFile& file, const WriteOptions& opts) {
    std::vector<std::uint8_t> utf8 = encode(file);

    std::vector<std::uint8_t> out;
    if (opts.write_bom) {
        out = bom_bytes(opts.encoding);
    }
    if (opts.encoding == Encoding::Utf8) {
        out.insert(out.end(), utf8.begin(), utf8.end());
        return out;
    }

    DecodedText text = decode_unicode(utf8.data(), utf8.size(), Encoding::Utf8);
    std::vector<std::uint8_t> body = encode_unicode(text.text, opts.encoding);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

// ------------------------------
// Fingerprint
// ------------------------------

static std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(len));
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t fingerprint(const StringsFile& file) {
    std::vector<std::uint8_t> bytes = encode(file);
    return crc32_bytes(bytes.data(), bytes.size());
}

std::string fingerprint_hex(const StringsFile& file) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << fingerprint(file);
    return oss.str();
}

} // namespace plstrings
