#pragma once

#include "models.hpp"

#include <stdexcept>
#include <string>

namespace bulk_planner {

/// A value produced by the engine does not satisfy the schema.
/// This is a programming error, never a user-facing outcome.
class SchemaViolation : public std::logic_error {
public:
    explicit SchemaViolation(const std::string& what)
        : std::logic_error("schema violation: " + what) {}
};

namespace schema {

constexpr std::size_t kCurrencyCodeLength   = 3;
constexpr std::size_t kSeoTitleMax          = 70;
constexpr std::size_t kSeoDescriptionMax    = 320;

/// ISO-8601 date-time with seconds optional and a Z or +hh:mm offset.
bool isIsoDateTime(const std::string& s);

} // namespace schema

// Each validator throws SchemaViolation naming the offending field path.

void validate(const OpSpec& op);
void validate(const FilterSpec& filter);
void validate(const ClarifyIssue& issue);
void validate(const PlanSuccess& plan);
void validate(const PlanClarify& clarify);
void validate(const PlanError& error);
void validate(const PlanResponse& response);

} // namespace bulk_planner
