#pragma once

#include <string>
#include <vector>

namespace bulk_planner {

/// Host and port the HTTP adapter binds to.
struct ListenAddress {
    std::string    host;
    unsigned short port = 0;
};

/// Parse "host:port" (or ":port", meaning all interfaces).
/// Throws std::invalid_argument on malformed input.
ListenAddress parseListenAddress(const std::string& spec);

/// ASCII lower-casing; bytes >= 0x80 are left untouched.
std::string toLower(const std::string& s);

std::string trim(const std::string& s);

/// Replace every whitespace run with a single space and trim both ends.
std::string collapseWhitespace(const std::string& s);

/// True if @p keyword occurs in @p text (case-insensitive) at the start of a
/// word, i.e. not preceded by a letter, digit or underscore.
bool containsWordPrefix(const std::string& text, const std::string& keyword);

bool containsAnyKeyword(const std::string& text,
                        const std::vector<std::string>& keywords);

/// True if any of @p keywords occurs anywhere in @p text (case-insensitive),
/// including inside a longer word ("restock" contains "stock").
bool containsAnySubstring(const std::string& text,
                          const std::vector<std::string>& keywords);

/// Replace each case-insensitive, whole-word occurrence of @p word with a
/// single space.
std::string removeWholeWord(const std::string& text, const std::string& word);

} // namespace bulk_planner
