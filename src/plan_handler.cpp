#include "plan_handler.hpp"
#include "mapping.hpp"
#include "planner.hpp"

#include <iostream>

namespace bulk_planner {

namespace {

HandlerResult errorResult(unsigned int status, const std::string& code,
                          const std::string& message) {
    return {status, toJson(PlanError{code, message})};
}

} // namespace

std::string dumpBody(const nlohmann::json& body, int indent) {
    return body.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

HandlerResult handlePlanBody(const std::string& requestBody, bool verbose) {
    return handlePlanBody(planFromRequest, requestBody, verbose);
}

HandlerResult handlePlanBody(PlanFunction plan, const std::string& requestBody,
                             bool verbose) {
    if (verbose) {
        if (requestBody.size() <= 300) {
            std::cerr << "[PlanHandler] Body: " << requestBody << "\n";
        } else {
            std::cerr << "[PlanHandler] Body: " << requestBody.substr(0, 300)
                      << " ...(truncated)\n";
        }
    }

    // --- shape validation ---
    PlanRequest request;
    try {
        request = parsePlanRequest(nlohmann::json::parse(requestBody));
    } catch (const nlohmann::json::parse_error& e) {
        // e.what() may quote the offending bytes, which need not be valid UTF-8.
        if (verbose) {
            std::cerr << "[PlanHandler] Rejected unparseable body: " << e.what() << "\n";
        }
        return errorResult(400, error_codes::kInvalidRequest,
                           "body: invalid JSON at byte " + std::to_string(e.byte));
    } catch (const InvalidRequest& e) {
        if (verbose) {
            std::cerr << "[PlanHandler] Rejected request: " << e.what() << "\n";
        }
        return errorResult(400, error_codes::kInvalidRequest, e.what());
    }

    // --- planning ---
    try {
        const PlanResponse response = plan(request);
        HandlerResult result;
        result.body       = toJson(response);
        result.httpStatus = std::holds_alternative<PlanError>(response) ? 400 : 200;

        if (verbose) {
            std::cerr << "[PlanHandler] action=" << result.body.value("action", "")
                      << " locale=" << request.locale.value_or("-") << "\n";
        }
        return result;

    } catch (const std::exception& e) {
        std::cerr << "[PlanHandler] /api/plan failed: " << e.what() << "\n";
        return errorResult(500, error_codes::kFailed, e.what());
    }
}

} // namespace bulk_planner
