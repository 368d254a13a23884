#include "extract.hpp"
#include "util.hpp"
#include "vocabulary.hpp"

#include <regex>

namespace bulk_planner {

namespace {

const std::regex& numberPattern() {
    static const std::regex re(R"((-?\d+(?:\.\d+)?))");
    return re;
}

std::optional<double> toNumber(const std::string& digits) {
    try {
        return std::stod(digits);
    } catch (const std::exception&) {
        // out_of_range for absurdly long digit runs
        return std::nullopt;
    }
}

} // namespace

std::optional<double> extractPercentage(const std::string& text) {
    static const std::regex re(R"((-?\d+(?:\.\d+)?)\s*%)");
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    return toNumber(m[1].str());
}

std::optional<double> extractCurrencyAmount(const std::string& text) {
    static const std::regex amount(R"(\s*(-?\d+(?:\.\d+)?))");

    // Earliest symbol-prefixed amount across all symbols.
    std::size_t bestPos = std::string::npos;
    std::string bestDigits;
    for (const auto& symbol : vocabulary::kCurrencySymbols) {
        for (auto pos = text.find(symbol); pos != std::string::npos;
             pos = text.find(symbol, pos + 1)) {
            if (pos >= bestPos) break;
            std::smatch m;
            auto from = text.begin() + static_cast<std::ptrdiff_t>(pos + symbol.size());
            if (std::regex_search(from, text.end(), m, amount,
                                  std::regex_constants::match_continuous)) {
                bestPos    = pos;
                bestDigits = m[1].str();
                break;
            }
        }
    }

    if (bestPos != std::string::npos) {
        if (auto value = toNumber(bestDigits)) return value;
    }
    return extractPlainNumber(text);
}

std::optional<double> extractPlainNumber(const std::string& text) {
    std::smatch m;
    if (!std::regex_search(text, m, numberPattern())) return std::nullopt;
    return toNumber(m[1].str());
}

std::optional<std::string> extractFilterTerm(const std::string& text) {
    static const std::regex re(R"(\b(?:for|of|on|in)\s+([^.,;!?]+))",
                               std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    std::string term = trim(m[1].str());
    if (term.empty()) return std::nullopt;
    return term;
}

std::vector<std::string> parseTags(const std::string& text) {
    static const std::regex quoted(R"quo("([^"]+)"|'([^']+)')quo");
    static const std::regex keyword(R"(\btags?\b)", std::regex::icase);

    std::vector<std::string> tags;

    // --- quoted literals win ---
    for (auto it = std::sregex_iterator(text.begin(), text.end(), quoted);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        std::string tag = trim(m[1].matched ? m[1].str() : m[2].str());
        if (!tag.empty()) tags.push_back(tag);
    }
    if (!tags.empty()) return tags;

    // --- segment after the first "tag(s)" keyword ---
    std::smatch first;
    if (!std::regex_search(text, first, keyword)) return tags;

    const std::string rest = first.suffix().str();
    std::string segment = rest;
    std::smatch next;
    if (std::regex_search(rest, next, keyword)) {
        segment = next.prefix().str();
    }

    std::string current;
    auto flush = [&] {
        std::string tag = trim(current);
        if (!tag.empty()) tags.push_back(tag);
        current.clear();
    };
    for (char c : segment) {
        if (c == ',' || c == '&') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return tags;
}

std::optional<std::string> detectLocation(const std::string& text) {
    static const std::regex re(R"(\b(?:location|at|in)\s+(?:location\s+)?([\w\s-]+))",
                               std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    std::string location = trim(m[1].str());
    if (location.empty()) return std::nullopt;
    return location;
}

std::optional<ProductStatus> deriveStatus(const std::string& text) {
    for (const auto& rule : vocabulary::kStatusRules) {
        if (containsAnyKeyword(text, rule.keywords)) return rule.status;
    }
    return std::nullopt;
}

} // namespace bulk_planner
