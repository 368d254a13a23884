#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace bulk_planner {

/// The request body does not have the {text, locale?} shape.
/// what() carries the validation detail returned to the caller.
class InvalidRequest : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Validate and map a request body.
/// Throws InvalidRequest listing every failed field ("text: Required").
PlanRequest parsePlanRequest(const nlohmann::json& body);

// ---- engine types -> JSON ----

nlohmann::json toJson(const OpSpec& op);
nlohmann::json toJson(const FilterSpec& filter);
nlohmann::json toJson(const ClarifyIssue& issue);
nlohmann::json toJson(const PlanDraft& draft);
nlohmann::json toJson(const PlanSuccess& plan);
nlohmann::json toJson(const PlanClarify& clarify);
nlohmann::json toJson(const PlanError& error);

/// Serialise with the "action" discriminant (plan | clarify | error).
nlohmann::json toJson(const PlanResponse& response);

// ---- JSON -> engine types (what an executor consumes) ----

/// Map an opSpec node, applying schema defaults (scope = product).
/// Throws std::runtime_error if the node is outside the schema.
OpSpec parseOpSpec(const nlohmann::json& node);

/// Map a filterSpec node; missing collections default to empty.
/// Throws std::runtime_error if the node is outside the schema.
FilterSpec parseFilterSpec(const nlohmann::json& node);

} // namespace bulk_planner
