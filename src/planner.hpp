#pragma once

#include "models.hpp"
#include "vocabulary.hpp"

#include <optional>
#include <string>

namespace bulk_planner {

/// First family (in dispatch order) whose trigger keywords occur in @p text.
std::optional<Family> classifyFamily(const std::string& text);

/// Route @p text to its family builder and validate the result.
/// Unrecognised text yields a clarify with plan.unrecognized.
/// @throws SchemaViolation if a builder produced an invalid response.
PlanResponse planFromText(const std::string& text);

/// Engine entry point. Pure: the response depends only on request.text.
/// The locale is accepted for the caller's message rendering only.
/// An empty (or blank) text yields an error with plan.invalid_request.
/// @throws SchemaViolation if a builder produced an invalid response.
PlanResponse planFromRequest(const PlanRequest& request);

} // namespace bulk_planner
