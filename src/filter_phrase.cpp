#include "filter_phrase.hpp"
#include "util.hpp"
#include "vocabulary.hpp"

#include <algorithm>
#include <regex>

namespace bulk_planner {

namespace {

constexpr std::size_t kMinTitleHintLength = 3;

std::string stripPunctuation(std::string s) {
    std::replace_if(s.begin(), s.end(),
                    [](char c) {
                        return c == ',' || c == '.' || c == ';' || c == ':' ||
                               c == '!' || c == '?' || c == '&' || c == '"' ||
                               c == '%';
                    },
                    ' ');
    return s;
}

} // namespace

std::string residualPhrase(const std::string& text,
                           const std::vector<std::string>& consumed) {
    static const std::regex quoted(R"quo("([^"]+)"|'([^']+)')quo");
    static const std::regex numbers(R"(-?\d+(?:\.\d+)?\s*%?)");

    std::string cleaned = std::regex_replace(text, quoted, " ");
    cleaned = std::regex_replace(cleaned, numbers, " ");

    for (const auto& symbol : vocabulary::kCurrencySymbols) {
        for (auto pos = cleaned.find(symbol); pos != std::string::npos;
             pos = cleaned.find(symbol, pos)) {
            cleaned.replace(pos, symbol.size(), " ");
        }
    }
    cleaned = stripPunctuation(cleaned);

    // Longest fragments first so multi-word phrases go before their parts.
    std::vector<std::string> fragments = consumed;
    fragments.insert(fragments.end(),
                     vocabulary::kStopWords.begin(), vocabulary::kStopWords.end());
    std::stable_sort(fragments.begin(), fragments.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.size() > b.size();
                     });
    for (const auto& fragment : fragments) {
        if (trim(fragment).empty()) continue;
        cleaned = removeWholeWord(cleaned, fragment);
    }

    return collapseWhitespace(cleaned);
}

FilterSpec buildFilterSpec(const std::string& text,
                           const std::vector<std::string>& consumed) {
    FilterSpec filter;
    std::string residue = residualPhrase(text, consumed);
    if (residue.size() >= kMinTitleHintLength) {
        filter.titleContains = std::move(residue);
    }
    return filter;
}

} // namespace bulk_planner
