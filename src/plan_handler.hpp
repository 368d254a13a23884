#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace bulk_planner {

/// Transport-independent outcome of one /api/plan call.
struct HandlerResult {
    unsigned int   httpStatus = 200;
    nlohmann::json body;
};

/// Parse a raw JSON request body, plan it and serialise the response.
///   200  plan or clarify
///   400  error plan.invalid_request (unparseable body, wrong shape, blank text)
///   500  error plan.failed (any exception raised while planning)
/// Never throws.
HandlerResult handlePlanBody(const std::string& requestBody, bool verbose = false);

/// Planning step used by handlePlanBody; planFromRequest in production.
using PlanFunction = PlanResponse (*)(const PlanRequest&);

/// Same as above, planning with @p plan instead of planFromRequest.
HandlerResult handlePlanBody(PlanFunction plan, const std::string& requestBody,
                             bool verbose = false);

/// Serialise a response body; invalid UTF-8 in strings becomes U+FFFD.
std::string dumpBody(const nlohmann::json& body, int indent = -1);

} // namespace bulk_planner
