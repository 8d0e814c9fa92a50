#include "plstrings/strings_easy.hpp"

#include <cstdint>
#include <iostream>
#include <vector>


int main() {
    try {
        using namespace plstrings;

        StringsFile table;
        easy::add(table, "app.title", "Weather", "Window title");
        easy::add(table, "app.greeting", "Hello, \"friend\"");
        easy::add(table, "app.city", "Z\xC3\xBCrich", "City shown on the\nsecond line");
        // U+2600 BLACK SUN WITH RAYS
        easy::add(table, "icon.sun", "\xE2\x98\x80");

        // Write as UTF-16LE with a byte order mark, the way legacy tools expect it
        WriteOptions wo;
        wo.encoding = Encoding::Utf16LE;
        wo.write_bom = true;

        std::string file = "demo_out.strings";
        write_file(file, table, wo);

        std::cout << "Wrote: " << file << " (" << to_string(wo.encoding) << ", BOM)\n";

        // Read back; the BOM selects the encoding
        StringsFile read_back = read_file(file);
        std::cout << "Read " << read_back.entries.size() << " entries, fingerprint "
                  << fingerprint_hex(read_back) << "\n";

        if (auto v = easy::lookup(read_back, "app.city")) {
            std::cout << "app.city = " << *v << "\n";
        }
        if (const Entry* e = easy::find(read_back, "app.title")) {
            std::cout << "app.title comment: " << e->comment.value_or("(none)") << "\n";
        }

        std::vector<std::uint8_t> utf8 = encode(read_back);
        std::cout << "\nUTF-8 form:\n" << std::string(utf8.begin(), utf8.end());

        std::cout << (read_back == table ? "OK\n" : "MISMATCH\n");
        return read_back == table ? 0 : 1;

    } catch (const plstrings::DeserializationError& e) {
        std::cerr << "Syntax error: " << e.what() << "\n";
        return 1;
    } catch (const plstrings::StringsError& e) {
        std::cerr << "Strings error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
