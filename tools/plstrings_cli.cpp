#include "plstrings/strings_easy.hpp"
#include "plstrings/strings_file.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

// Make control characters visible; everything else is passed through as UTF-8.
static std::string display_escape(const std::string& s) {
    std::ostringstream oss;
    for (unsigned char c : s) {
        switch (c) {
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            default:
                if (c < 0x20 || c == 0x7F) {
                    static const char* hex = "0123456789ABCDEF";
                    oss << "\\U00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                } else {
                    oss << static_cast<char>(c);
                }
        }
    }
    return oss.str();
}

static void usage() {
    std::cerr <<
        "plstrings - .strings table inspector\n"
        "\n"
        "Usage:\n"
        "  plstrings dump        <FILE> [--encoding E] [--no-color]\n"
        "  plstrings check       <FILE> [--encoding E] [--no-color]\n"
        "  plstrings convert     <FILE> <OUT> [--to E] [--bom] [--encoding E]\n"
        "  plstrings fingerprint <FILE> [--encoding E]\n"
        "  plstrings browse      <FILE> [--encoding E]\n"
        "\n"
        "Encodings: utf8, utf16be, utf16le, utf32be, utf32le.\n"
        "--encoding applies to input without a byte order mark.\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string out;
    bool no_color{false};
    plstrings::ReadOptions read{};
    plstrings::WriteOptions write{};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional output for convert
    if (a.cmd == "convert") {
        if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) {
            std::cerr << "convert needs an output file\n";
            return false;
        }
        a.out = argv[i++];
    }

    try {
        while (i < argc) {
            std::string opt = argv[i++];
            if (opt == "--no-color") a.no_color = true;
            else if (opt == "--bom") a.write.write_bom = true;
            else if (opt == "--encoding" && i < argc) a.read.encoding = plstrings::encoding_from_string(argv[i++]);
            else if (opt == "--to" && i < argc) a.write.encoding = plstrings::encoding_from_string(argv[i++]);
            else {
                std::cerr << "Unknown option: " << opt << "\n";
                return false;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return false;
    }

    if (a.cmd != "dump" && a.cmd != "check" && a.cmd != "convert" &&
        a.cmd != "fingerprint" && a.cmd != "browse") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// Encoding the file is read as: its BOM, else --encoding, else UTF-8.
static std::string effective_encoding(const Args& a) {
    std::ifstream is(a.file, std::ios::binary);
    std::vector<std::uint8_t> head(4, 0);
    is.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(std::max<std::streamsize>(0, is.gcount())));

    if (auto bom = plstrings::detect_bom(head.data(), head.size())) {
        return plstrings::to_string(bom->encoding) + " (BOM)";
    }
    return plstrings::to_string(a.read.encoding.value_or(plstrings::Encoding::Utf8));
}

static void print_entries(const plstrings::StringsFile& f, const Ansi& ansi) {
    for (std::size_t i = 0; i < f.entries.size(); ++i) {
        const auto& e = f.entries[i];
        if (e.comment) {
            std::cout << ansi.gray() << "    # " << display_escape(*e.comment) << ansi.reset() << "\n";
        }
        std::cout << ansi.dim() << "[" << i << "]" << ansi.reset() << " "
                  << ansi.cyan() << "\"" << display_escape(e.key) << "\"" << ansi.reset()
                  << " = "
                  << ansi.green() << "\"" << display_escape(e.value) << "\"" << ansi.reset()
                  << "\n";
    }
}

// ----------------- Interactive browser (FTXUI) -----------------

static int browse(const Args& a, const plstrings::StringsFile& f) {
    using namespace ftxui;

    const std::vector<std::string> dups = plstrings::easy::duplicate_keys(f);
    auto is_dup = [&](const std::string& k) {
        return std::find(dups.begin(), dups.end(), k) != dups.end();
    };

    int selected = 0;
    int top = 0; // first visible row in the left pane
    const int total = static_cast<int>(f.entries.size());
    const std::string encoding = effective_encoding(a);
    const std::string fp = plstrings::fingerprint_hex(f);

    auto left_pane = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        // header (1) + separator (1) + border (2) + a bit of margin
        int visible_rows = std::max(3, term_h - 6);

        if (total <= 0) {
            top = 0;
        } else {
            if (selected < top) top = selected;
            if (selected >= top + visible_rows) top = selected - visible_rows + 1;
            top = std::max(0, std::min(top, std::max(0, total - visible_rows)));
        }
        int end = std::min(total, top + visible_rows);

        std::vector<Element> items;
        items.reserve(static_cast<std::size_t>(std::max(0, end - top)) + 2);
        if (top > 0) items.push_back(text("↑ more") | color(Color::GrayDark));

        for (int i = top; i < end; ++i) {
            const auto& e = f.entries[static_cast<std::size_t>(i)];
            Element idx = text(std::to_string(i) + " ") | color(Color::GrayDark);
            Element key = text(display_escape(e.key)) | color(is_dup(e.key) ? Color::Yellow : Color::Cyan) | flex;
            Element line = hbox({idx, key}) | size(WIDTH, LESS_THAN, 58);
            if (i == selected) line = line | inverted;
            items.push_back(line);
        }
        if (end < total) items.push_back(text("↓ more") | color(Color::GrayDark));
        if (total == 0) items.push_back(text("(no entries)") | color(Color::GrayDark));

        auto header = hbox({
            text("strings") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("PgUp/PgDn") | bold | color(Color::Yellow),
            text(" page") | color(Color::GrayDark),
        });

        return vbox({header, separator(), vbox(std::move(items)) | flex}) | flex | border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta;
        meta.push_back(hbox({text("encoding") | bold | color(Color::Yellow), text(": " + encoding)}));
        meta.push_back(hbox({text("entries") | bold | color(Color::Yellow), text(": " + std::to_string(total))}));
        meta.push_back(hbox({text("fingerprint") | bold | color(Color::Yellow), text(": " + fp)}));

        std::vector<Element> body;
        if (total > 0) {
            const auto& e = f.entries[static_cast<std::size_t>(selected)];
            body.push_back(text("key") | bold | color(Color::Magenta));
            body.push_back(paragraph(display_escape(e.key)) | color(Color::Cyan));
            body.push_back(text(""));
            body.push_back(text("value") | bold | color(Color::Magenta));
            body.push_back(paragraph(display_escape(e.value)) | color(Color::Green));
            body.push_back(text(""));
            body.push_back(text("comment") | bold | color(Color::Magenta));
            if (e.comment) {
                body.push_back(paragraph(display_escape(*e.comment)) | color(Color::GrayLight));
            } else {
                body.push_back(text("(none)") | color(Color::GrayDark));
            }
            if (is_dup(e.key)) {
                body.push_back(text(""));
                body.push_back(text("key occurs more than once; the last entry wins on load") | color(Color::Yellow));
            }
        }

        return vbox({
                   vbox(std::move(meta)),
                   separator(),
                   vbox(std::move(body)) | vscroll_indicator | frame | flex,
               }) |
               flex | border;
    });

    auto layout = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);
        return hbox({
                   left_pane->Render() | size(WIDTH, EQUAL, 60),
                   right_pane->Render() | flex,
               }) |
               size(WIDTH, EQUAL, term_w) | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (total == 0) return false;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < total) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min(total - 1, selected + 25);
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min(total - 1, selected + 3);
                return true;
            }
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "dump") {
            plstrings::StringsFile f = plstrings::read_file(a.file, a.read);
            print_entries(f, ansi);
            return 0;
        }

        if (a.cmd == "check") {
            plstrings::StringsFile f = plstrings::read_file(a.file, a.read);
            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Encoding" << ansi.reset() << ": " << effective_encoding(a) << "\n";
            std::cout << ansi.bold() << "Entries" << ansi.reset() << ": " << f.entries.size() << "\n";

            std::vector<std::string> dups = plstrings::easy::duplicate_keys(f);
            if (!dups.empty()) {
                std::cout << ansi.yellow() << "Duplicate keys" << ansi.reset() << ":";
                for (const auto& k : dups) std::cout << " \"" << display_escape(k) << "\"";
                std::cout << "\n";
            }
            std::cout << ansi.green() << "OK" << ansi.reset() << "\n";
            return 0;
        }

        if (a.cmd == "convert") {
            plstrings::StringsFile f = plstrings::read_file(a.file, a.read);
            plstrings::write_file(a.out, f, a.write);
            std::cout << "Wrote " << f.entries.size() << " entries to " << a.out
                      << " (" << plstrings::to_string(a.write.encoding)
                      << (a.write.write_bom ? ", BOM" : "") << ")\n";
            return 0;
        }

        if (a.cmd == "fingerprint") {
            plstrings::StringsFile f = plstrings::read_file(a.file, a.read);
            std::cout << plstrings::fingerprint_hex(f) << "  " << a.file << "\n";
            return 0;
        }

        if (a.cmd == "browse") {
            plstrings::StringsFile f = plstrings::read_file(a.file, a.read);
            return browse(a, f);
        }

    } catch (const plstrings::DeserializationError& e) {
        const auto& loc = e.location();
        std::cerr << a.file << ":" << (loc.line + 1) << ":" << (loc.column + 1) << ": "
                  << ansi.red() << "error" << ansi.reset() << ": " << plstrings::to_string(e.kind()) << "\n";
        return 1;
    } catch (const plstrings::StringsError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
