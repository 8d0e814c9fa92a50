#pragma once

#include "plstrings/strings_file.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace plstrings::easy {

inline Entry make_entry(std::string key, std::string value) {
    Entry e;
    e.key = std::move(key);
    e.value = std::move(value);
    return e;
}

inline Entry make_entry(std::string key, std::string value, std::string comment) {
    Entry e = make_entry(std::move(key), std::move(value));
    e.comment = std::move(comment);
    return e;
}

inline void add(StringsFile& file, std::string key, std::string value) {
    file.entries.push_back(make_entry(std::move(key), std::move(value)));
}

inline void add(StringsFile& file, std::string key, std::string value, std::string comment) {
    file.entries.push_back(make_entry(std::move(key), std::move(value), std::move(comment)));
}

/// First entry with `key`, or nullptr.
inline const Entry* find(const StringsFile& file, const std::string& key) {
    for (const auto& e : file.entries) {
        if (e.key == key) return &e;
    }
    return nullptr;
}

inline Entry* find(StringsFile& file, const std::string& key) {
    for (auto& e : file.entries) {
        if (e.key == key) return &e;
    }
    return nullptr;
}

/// Value a dictionary loader would see for `key`: the last entry wins.
inline std::optional<std::string> lookup(const StringsFile& file, const std::string& key) {
    for (auto it = file.entries.rbegin(); it != file.entries.rend(); ++it) {
        if (it->key == key) return it->value;
    }
    return std::nullopt;
}

/// Keys that occur more than once, in order of their second occurrence.
inline std::vector<std::string> duplicate_keys(const StringsFile& file) {
    std::set<std::string> seen;
    std::set<std::string> reported;
    std::vector<std::string> out;
    for (const auto& e : file.entries) {
        if (!seen.insert(e.key).second && reported.insert(e.key).second) {
            out.push_back(e.key);
        }
    }
    return out;
}

/// Collapse to a dictionary, last entry wins.
inline std::map<std::string, std::string> to_map(const StringsFile& file) {
    std::map<std::string, std::string> m;
    for (const auto& e : file.entries) {
        m[e.key] = e.value;
    }
    return m;
}

} // namespace plstrings::easy
