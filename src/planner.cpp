#include "planner.hpp"
#include "builders.hpp"
#include "schema.hpp"
#include "util.hpp"

namespace bulk_planner {

std::optional<Family> classifyFamily(const std::string& text) {
    for (const auto& trigger : vocabulary::kFamilyTriggers) {
        if (containsAnySubstring(text, trigger.keywords)) return trigger.family;
    }
    return std::nullopt;
}

PlanResponse planFromText(const std::string& text) {
    const std::string input = trim(text);

    PlanResponse response;
    const auto family = classifyFamily(input);
    if (!family) {
        PlanClarify clarify;
        ClarifyIssue issue;
        issue.code       = ClarifyCode::PlanUnrecognized;
        issue.messageKey = vocabulary::kMsgUnrecognized;
        clarify.issues.push_back(std::move(issue));
        response = std::move(clarify);
    } else {
        switch (*family) {
            case Family::Price:     response = buildPricePlan(input);     break;
            case Family::Tags:      response = buildTagsPlan(input);      break;
            case Family::Inventory: response = buildInventoryPlan(input); break;
            case Family::Status:    response = buildStatusPlan(input);    break;
        }
    }

    validate(response);
    return response;
}

PlanResponse planFromRequest(const PlanRequest& request) {
    if (trim(request.text).empty()) {
        return PlanError{error_codes::kInvalidRequest,
                         "text: must be a non-empty string"};
    }
    return planFromText(request.text);
}

} // namespace bulk_planner
