#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bulk_planner {

// Stateless text extractors. None of them throw; "not found" is an empty
// optional (or an empty vector for parseTags).

/// First signed decimal immediately followed by '%' ("-15 %" -> -15).
std::optional<double> extractPercentage(const std::string& text);

/// First amount prefixed by a known currency symbol ("$19.99" -> 19.99);
/// falls back to extractPlainNumber when no symbol-prefixed amount exists.
std::optional<double> extractCurrencyAmount(const std::string& text);

/// First signed decimal anywhere in the text.
std::optional<double> extractPlainNumber(const std::string& text);

/// Phrase after "for|of|on|in" up to the next punctuation mark.
/// Kept for the single-page price flow; the planner uses buildFilterSpec.
std::optional<std::string> extractFilterTerm(const std::string& text);

/// Quoted literals in order of appearance. Without quotes, the text after
/// the word "tag"/"tags" split on ',' and '&'.
std::vector<std::string> parseTags(const std::string& text);

/// Phrase after "location", "at" or "in" (e.g. "at Main Warehouse").
std::optional<std::string> detectLocation(const std::string& text);

/// Target lifecycle status named by the text, first matching rule wins.
std::optional<ProductStatus> deriveStatus(const std::string& text);

} // namespace bulk_planner
