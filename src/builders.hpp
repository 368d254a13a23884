#pragma once

#include "models.hpp"

#include <string>

namespace bulk_planner {

// One builder per operation family. Each returns either a PlanSuccess or a
// PlanClarify; none of them throws for unusable text.

/// Price and compare-at changes: inc_percent, inc_value or set.
PlanResponse buildPricePlan(const std::string& text);

/// Add, remove or replace tag literals.
PlanResponse buildTagsPlan(const std::string& text);

/// Set, increase or decrease inventory at a location. Issues accumulate, and
/// a full plan is only produced when both an amount and a location exist.
PlanResponse buildInventoryPlan(const std::string& text);

/// Change lifecycle status (ACTIVE / DRAFT / ARCHIVED).
PlanResponse buildStatusPlan(const std::string& text);

} // namespace bulk_planner
