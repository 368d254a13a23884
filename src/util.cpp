#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bulk_planner {

namespace {

bool isWordByte(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

bool isBoundaryBefore(const std::string& text, std::size_t pos) {
    return pos == 0 || !isWordByte(text[pos - 1]);
}

bool isBoundaryAfter(const std::string& text, std::size_t end) {
    return end >= text.size() || !isWordByte(text[end]);
}

} // namespace

ListenAddress parseListenAddress(const std::string& spec) {
    ListenAddress addr;

    // --- host ---
    std::string portText;
    if (!spec.empty() && spec.front() == '[') {
        auto close = spec.find(']');
        if (close == std::string::npos || close + 1 >= spec.size() ||
            spec[close + 1] != ':') {
            throw std::invalid_argument("Invalid listen address: " + spec);
        }
        addr.host = spec.substr(1, close - 1);
        portText  = spec.substr(close + 2);
    } else {
        auto colon = spec.rfind(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument(
                "Invalid listen address (missing port): " + spec);
        }
        addr.host = spec.substr(0, colon);
        portText  = spec.substr(colon + 1);
    }
    if (addr.host.empty()) {
        addr.host = "0.0.0.0";
    }

    // --- port ---
    if (portText.empty() || portText.size() > 5 ||
        !std::all_of(portText.begin(), portText.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid listen port: " + spec);
    }
    const int port = std::stoi(portText);
    if (port > 65535) {
        throw std::invalid_argument("Listen port out of range: " + spec);
    }
    addr.port = static_cast<unsigned short>(port);
    return addr;
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

std::string trim(const std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

bool containsWordPrefix(const std::string& text, const std::string& keyword) {
    if (keyword.empty()) return false;
    const std::string lower  = toLower(text);
    const std::string needle = toLower(keyword);

    for (auto pos = lower.find(needle); pos != std::string::npos;
         pos = lower.find(needle, pos + 1)) {
        if (isBoundaryBefore(lower, pos)) return true;
    }
    return false;
}

bool containsAnyKeyword(const std::string& text,
                        const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](const std::string& k) { return containsWordPrefix(text, k); });
}

bool containsAnySubstring(const std::string& text,
                          const std::vector<std::string>& keywords) {
    const std::string lower = toLower(text);
    return std::any_of(keywords.begin(), keywords.end(), [&](const std::string& k) {
        return !k.empty() && lower.find(toLower(k)) != std::string::npos;
    });
}

std::string removeWholeWord(const std::string& text, const std::string& word) {
    if (word.empty()) return text;
    const std::string needle = toLower(word);

    std::string out = text;
    std::string lower = toLower(out);
    std::size_t pos = lower.find(needle);
    while (pos != std::string::npos) {
        const std::size_t end = pos + needle.size();
        if (isBoundaryBefore(lower, pos) && isBoundaryAfter(lower, end)) {
            out.replace(pos, needle.size(), " ");
            lower.replace(pos, needle.size(), " ");
            pos = lower.find(needle, pos + 1);
        } else {
            pos = lower.find(needle, pos + 1);
        }
    }
    return out;
}

} // namespace bulk_planner
