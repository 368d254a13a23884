#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace bulk_planner {

/// Residual text that remains once structural tokens are stripped: quoted
/// literals, numbers and percentages, currency symbols, punctuation, stop
/// words and the @p consumed fragments (case-insensitive, whole words).
/// Whitespace is collapsed.
std::string residualPhrase(const std::string& text,
                           const std::vector<std::string>& consumed);

/// Build the selection filter for @p text. A residue of at least three
/// characters becomes titleContains; otherwise the filter stays empty.
FilterSpec buildFilterSpec(const std::string& text,
                           const std::vector<std::string>& consumed);

} // namespace bulk_planner
