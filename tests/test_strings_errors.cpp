
#include "plstrings/strings_easy.hpp"
#include "plstrings/strings_file.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>



#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using plstrings::DeserializationError;
using plstrings::ErrorKind;

static DeserializationError expect_syntax_error(const std::string& input) {
    try {
        (void)plstrings::decode_utf8(input);
    } catch (const DeserializationError& e) {
        return e;
    }
    throw std::runtime_error("expected a DeserializationError for input: " + input);
}

static bool fails_at(const std::string& input, ErrorKind kind, std::size_t line, std::size_t column) {
    DeserializationError e = expect_syntax_error(input);
    return e.kind() == kind && e.location().line == line && e.location().column == column;
}

static void test_error_location_line_column() {
    DeserializationError e = expect_syntax_error("\n  *");
    CHECK(e.kind() == ErrorKind::UnexpectedCharacter);
    CHECK(e.location().line == 1);
    CHECK(e.location().column == 2);
    CHECK(e.location().offset == 3);
    // The message counts from 1 for editors.
    CHECK(std::string(e.what()).find("line 2, column 3") != std::string::npos);
}

static void test_missing_semicolon_after_value() {
    CHECK(fails_at("\"key\" = \"value\"", ErrorKind::ExpectedSemicolonAfterKeyValue, 0, 15));
    CHECK(fails_at("a = b;\nc = d;\ne = f", ErrorKind::ExpectedSemicolonAfterKeyValue, 2, 5));
    CHECK(fails_at("k = v w;", ErrorKind::ExpectedSemicolonAfterKeyValue, 0, 6));
}

static void test_duplicate_semicolon_fails_whole_parse() {
    CHECK(fails_at("\"key0\" = \"value0\";;\n\"key1\" = \"value1\";",
                   ErrorKind::UnexpectedCharacter, 0, 18));
}

static void test_missing_semicolon_after_key_shortcut() {
    CHECK(fails_at("\"key\"", ErrorKind::ExpectedSemicolonOrEqualsSignAfterKey, 0, 5));
    CHECK(fails_at("\"key\" : \"value\";", ErrorKind::ExpectedSemicolonOrEqualsSignAfterKey, 0, 6));
}

static void test_missing_value_at_end_of_file() {
    CHECK(fails_at("\"key\" =", ErrorKind::UnexpectedEndOfFile, 0, 7));
    CHECK(fails_at("k = /* c */ ", ErrorKind::UnexpectedEndOfFile, 0, 12));
}

static void test_unterminated_comments() {
    CHECK(fails_at("/*", ErrorKind::UnterminatedComment, 0, 0));
    CHECK(fails_at("/**", ErrorKind::UnterminatedComment, 0, 0));
    CHECK(fails_at("/*/", ErrorKind::UnterminatedComment, 0, 0));
    CHECK(fails_at("k = v;\n  /* never closed", ErrorKind::UnterminatedComment, 1, 2));
    CHECK(fails_at("k = /* open", ErrorKind::UnterminatedComment, 0, 4));
}

static void test_lone_slash_is_unquoted_string() {
    // A single '/' starts an unquoted string, so the error comes after the key.
    CHECK(fails_at("/ a comment\n\"key\" = \"value\"",
                   ErrorKind::ExpectedSemicolonOrEqualsSignAfterKey, 0, 2));
    CHECK(fails_at("/", ErrorKind::ExpectedSemicolonOrEqualsSignAfterKey, 0, 1));
}

static void test_stray_unquoted_character() {
    CHECK(fails_at("=\n\"key\" = \"value\"", ErrorKind::UnexpectedCharacter, 0, 0));
    CHECK(fails_at("k = ;", ErrorKind::UnexpectedCharacter, 0, 4));
    CHECK(fails_at("k = v;\n#", ErrorKind::UnexpectedCharacter, 1, 0));
}

static void test_unterminated_string() {
    CHECK(fails_at("\"abc", ErrorKind::UnterminatedString, 0, 0));
    CHECK(fails_at("k = 'abc\"", ErrorKind::UnterminatedString, 0, 4));
    // A backslash as the very last scalar lets the string run past the end.
    CHECK(fails_at("\"abc\\", ErrorKind::UnterminatedString, 0, 0));
    CHECK(fails_at("x = y;\n\"\\\"", ErrorKind::UnterminatedString, 1, 0));
}

static void test_invalid_utf16_surrogate_escapes() {
    CHECK(fails_at("\"\\UD800\" = \"value\"", ErrorKind::StringEscapeSequenceInvalidUTF16Surrogate, 0, 0));
    CHECK(fails_at("k = \"\\UDC00\";", ErrorKind::StringEscapeSequenceInvalidUTF16Surrogate, 0, 4));
    CHECK(fails_at("\"\\UDF0D\\UD83C\";", ErrorKind::StringEscapeSequenceInvalidUTF16Surrogate, 0, 0));
    CHECK(fails_at("\"\\UD83Cx\";", ErrorKind::StringEscapeSequenceInvalidUTF16Surrogate, 0, 0));
}

static void test_unsupported_octal_escape() {
    CHECK(fails_at("\"\\000\" = \"value\"", ErrorKind::UnsupportedEscapeSequenceOctalNextStepLatin, 0, 2));
    CHECK(fails_at("k = \"ok \\9\";", ErrorKind::UnsupportedEscapeSequenceOctalNextStepLatin, 0, 9));
    CHECK(fails_at("k = 'a\\0", ErrorKind::UnsupportedEscapeSequenceOctalNextStepLatin, 0, 7));
}

static void test_columns_count_scalars_not_bytes() {
    // "\xC3\xA9" is one scalar (U+00E9); U+1F30D is one scalar of four bytes.
    CHECK(fails_at("\"\xC3\xA9\" = \"x\" y", ErrorKind::ExpectedSemicolonAfterKeyValue, 0, 10));
    CHECK(fails_at("\"\xF0\x9F\x8C\x8D\" = \"x\" y", ErrorKind::ExpectedSemicolonAfterKeyValue, 0, 10));
}

static void test_unicode_newlines_in_locations() {
    try {
        (void)plstrings::decode(U"a = b;\u2028  *");
        CHECK(false);
    } catch (const DeserializationError& e) {
        CHECK(e.kind() == ErrorKind::UnexpectedCharacter);
        CHECK(e.location().line == 1);
        CHECK(e.location().column == 2);
    }
    // CR and LF each end a line.
    CHECK(fails_at("a = b;\r\n*", ErrorKind::UnexpectedCharacter, 2, 0));
}

static void test_locate() {
    plstrings::Location loc = plstrings::locate(U"ab\ncd", 4);
    CHECK(loc.line == 1 && loc.column == 1 && loc.offset == 4);

    loc = plstrings::locate(U"", 0);
    CHECK(loc.line == 0 && loc.column == 0);

    loc = plstrings::locate(U"\r\r\u2029x", 4);
    CHECK(loc.line == 3 && loc.column == 1);
}

static void test_serialization_comment_end_marker() {
    plstrings::StringsFile f;
    plstrings::easy::add(f, "key", "value", "*/");
    try {
        (void)plstrings::encode(f);
        CHECK(false);
    } catch (const plstrings::SerializationError& e) {
        CHECK(e.kind() == ErrorKind::CommentContainsEndOfComment);
        CHECK(e.entry_index() == 0);
    }

    plstrings::StringsFile g;
    plstrings::easy::add(g, "a", "1", "fine * / comment");
    plstrings::easy::add(g, "b", "2", "closes */ early");
    try {
        (void)plstrings::encode(g);
        CHECK(false);
    } catch (const plstrings::SerializationError& e) {
        CHECK(e.kind() == ErrorKind::CommentContainsEndOfComment);
        CHECK(e.entry_index() == 1);
    }

    // Values may contain the marker; only comments are checked.
    plstrings::StringsFile h;
    plstrings::easy::add(h, "*/", "*/");
    CHECK(!plstrings::encode(h).empty());
}

static void test_serialization_rejects_invalid_utf8() {
    auto rejects = [](const plstrings::StringsFile& f) {
        try {
            (void)plstrings::encode(f);
        } catch (const plstrings::UnicodeDecodingError& e) {
            return std::string(e.what());
        }
        return std::string();
    };

    plstrings::StringsFile overlong;
    plstrings::easy::add(overlong, "k", "\xC0\xAF");
    CHECK(rejects(overlong).find("value of entry 0") != std::string::npos);

    plstrings::StringsFile bad_key;
    plstrings::easy::add(bad_key, "ok", "ok");
    plstrings::easy::add(bad_key, "\xFFk", "v");
    CHECK(rejects(bad_key).find("key of entry 1") != std::string::npos);

    // CESU-style encoded surrogate.
    plstrings::StringsFile bad_comment;
    plstrings::easy::add(bad_comment, "k", "v", "\xED\xA0\x80");
    CHECK(rejects(bad_comment).find("comment of entry 0") != std::string::npos);

    plstrings::StringsFile truncated;
    plstrings::easy::add(truncated, "k", "\xF0\x9F\x8C");
    CHECK(!rejects(truncated).empty());

    // encode_as goes through the same check, also for UTF-8 output.
    bool threw = false;
    try {
        (void)plstrings::encode_as(overlong, plstrings::WriteOptions{});
    } catch (const plstrings::UnicodeDecodingError&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_errors_share_base_class() {
    bool caught = false;
    try {
        (void)plstrings::decode_utf8("\"open");
    } catch (const plstrings::StringsError& e) {
        caught = (e.kind() == ErrorKind::UnterminatedString);
    }
    CHECK(caught);
}

int main() {
    try {
        test_error_location_line_column();
        test_missing_semicolon_after_value();
        test_duplicate_semicolon_fails_whole_parse();
        test_missing_semicolon_after_key_shortcut();
        test_missing_value_at_end_of_file();
        test_unterminated_comments();
        test_lone_slash_is_unquoted_string();
        test_stray_unquoted_character();
        test_unterminated_string();
        test_invalid_utf16_surrogate_escapes();
        test_unsupported_octal_escape();
        test_columns_count_scalars_not_bytes();
        test_unicode_newlines_in_locations();
        test_locate();
        test_serialization_comment_end_marker();
        test_serialization_rejects_invalid_utf8();
        test_errors_share_base_class();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
