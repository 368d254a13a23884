#include "builders.hpp"
#include "extract.hpp"
#include "filter_phrase.hpp"
#include "util.hpp"
#include "vocabulary.hpp"

#include <cmath>
#include <cstdint>
#include <optional>

namespace bulk_planner {

using namespace vocabulary;

namespace {

/// Quantities beyond this cannot be represented exactly as a double.
constexpr double kMaxQuantity = 9007199254740991.0;   // 2^53 - 1

ClarifyIssue makeIssue(ClarifyCode code, const std::string& messageKey) {
    ClarifyIssue issue;
    issue.code       = code;
    issue.messageKey = messageKey;
    return issue;
}

PlanClarify clarifyWith(ClarifyCode code, const std::string& messageKey) {
    PlanClarify clarify;
    clarify.issues.push_back(makeIssue(code, messageKey));
    return clarify;
}

double withSign(double sign, double magnitude) {
    const double m = std::abs(magnitude);
    return (sign < 0.0 && m != 0.0) ? -m : m;
}

/// Whole, representable inventory magnitude, or nothing.
std::optional<std::int64_t> toQuantity(const std::optional<double>& number) {
    if (!number || !std::isfinite(*number)) return std::nullopt;
    const double magnitude = std::abs(*number);
    if (magnitude != std::floor(magnitude) || magnitude > kMaxQuantity) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(magnitude);
}

} // namespace

// ---------------------------------------------------------------------------
// Price / compare-at
// ---------------------------------------------------------------------------

PlanResponse buildPricePlan(const std::string& text) {
    const bool compareAt = containsAnyKeyword(text, kCompareAtWords);
    const std::string summaryPrefix =
        compareAt ? "plan.summary.compareAt" : "plan.summary.price";

    FilterSpec filterSpec = buildFilterSpec(text, kPriceConsumed);

    std::optional<PriceMode> mode;
    std::optional<double>    value;
    std::string              summarySuffix;

    auto signedChange = [&](double sign, const char* direction) {
        if (auto percent = extractPercentage(text)) {
            mode          = PriceMode::IncPercent;
            value         = withSign(sign, *percent);
            summarySuffix = std::string(direction) + "Percent";
        } else if (auto amount = extractCurrencyAmount(text)) {
            mode          = PriceMode::IncValue;
            value         = withSign(sign, *amount);
            summarySuffix = std::string(direction) + "Value";
        }
    };

    if (containsAnyKeyword(text, kIncreaseWords)) {
        signedChange(+1.0, "Increase");
    } else if (containsAnyKeyword(text, kDecreaseWords)) {
        signedChange(-1.0, "Decrease");
    } else if (containsAnyKeyword(text, kSetWords) &&
               containsAnyKeyword(text, kPriceWords)) {
        if (auto amount = extractCurrencyAmount(text)) {
            mode          = PriceMode::Set;
            value         = *amount;
            summarySuffix = "Set";
        }
    }

    if (!mode || !value) {
        return clarifyWith(ClarifyCode::PlanMissingAmount, kMsgMissingAmount);
    }

    PriceParams params;
    params.mode  = *mode;
    params.value = *value;

    OpSpec opSpec;
    opSpec.scope = Scope::Product;
    if (compareAt) {
        CompareAtParams compareAtParams;
        static_cast<PriceParams&>(compareAtParams) = params;
        opSpec.params = compareAtParams;
    } else {
        opSpec.params = params;
    }

    PlanSuccess plan;
    plan.opSpec     = std::move(opSpec);
    plan.filterSpec = std::move(filterSpec);
    plan.confidence = Confidence::Medium;
    plan.summaryKey = summaryPrefix + summarySuffix;
    return plan;
}

// ---------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------

PlanResponse buildTagsPlan(const std::string& text) {
    FilterSpec filterSpec = buildFilterSpec(text, kTagsConsumed);
    std::vector<std::string> tags = parseTags(text);

    if (tags.empty()) {
        return clarifyWith(ClarifyCode::PlanMissingTagValues, kMsgMissingTags);
    }

    TagsParams params;
    params.values = std::move(tags);
    if (containsAnyKeyword(text, kTagsReplaceWords)) {
        params.mode = TagsMode::Replace;
    } else if (containsAnyKeyword(text, kTagsRemoveWords)) {
        params.mode = TagsMode::Remove;
    } else {
        params.mode = TagsMode::Add;
    }

    PlanSuccess plan;
    plan.opSpec.scope  = Scope::Product;
    plan.filterSpec    = std::move(filterSpec);
    plan.confidence    = Confidence::Medium;
    switch (params.mode) {
        case TagsMode::Add:     plan.summaryKey = kSummaryTagsAdd;     break;
        case TagsMode::Remove:  plan.summaryKey = kSummaryTagsRemove;  break;
        case TagsMode::Replace: plan.summaryKey = kSummaryTagsReplace; break;
    }
    plan.opSpec.params = std::move(params);
    return plan;
}

// ---------------------------------------------------------------------------
// Inventory
// ---------------------------------------------------------------------------

PlanResponse buildInventoryPlan(const std::string& text) {
    const auto location = detectLocation(text);

    // Digits inside the location label ("Warehouse 3") are never the amount.
    const std::string rest = location ? removeWholeWord(text, *location) : text;
    const auto quantity = toQuantity(extractPlainNumber(rest));

    InventoryMode mode = InventoryMode::Set;
    if (containsAnyKeyword(text, kInventoryIncWords)) mode = InventoryMode::Inc;
    if (containsAnyKeyword(text, kInventoryDecWords)) mode = InventoryMode::Dec;

    FilterSpec filterSpec = buildFilterSpec(rest, kInventoryConsumed);

    std::optional<OpSpec> draftOp;
    if (quantity) {
        InventoryParams params;
        params.mode       = mode;
        params.value      = *quantity;
        params.locationId = location;

        OpSpec op;
        op.scope  = Scope::Variant;
        op.params = std::move(params);
        draftOp   = std::move(op);
    }

    PlanClarify clarify;
    if (!quantity) {
        clarify.issues.push_back(
            makeIssue(ClarifyCode::PlanMissingAmount, kMsgMissingAmount));
    }
    if (!location) {
        clarify.issues.push_back(
            makeIssue(ClarifyCode::InventoryRequireLocation, kMsgRequireLocation));
    }

    if (!clarify.issues.empty()) {
        if (draftOp) {
            PlanDraft draft;
            draft.opSpec     = std::move(draftOp);
            draft.filterSpec = std::move(filterSpec);
            draft.confidence = Confidence::Low;
            clarify.draft    = std::move(draft);
        }
        return clarify;
    }

    PlanSuccess plan;
    plan.opSpec     = std::move(*draftOp);
    plan.filterSpec = std::move(filterSpec);
    plan.confidence = Confidence::Medium;
    plan.summaryKey = kSummaryInventoryAdjust;
    return plan;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

PlanResponse buildStatusPlan(const std::string& text) {
    const auto status = deriveStatus(text);
    if (!status) {
        PlanClarify clarify =
            clarifyWith(ClarifyCode::PlanUnsupported, kMsgUnsupportedStatus);
        clarify.issues.front().options = {
            {toString(ProductStatus::Active),   "plan.status.active"},
            {toString(ProductStatus::Draft),    "plan.status.draft"},
            {toString(ProductStatus::Archived), "plan.status.archived"},
        };
        return clarify;
    }

    PlanSuccess plan;
    plan.opSpec.scope  = Scope::Product;
    plan.opSpec.params = StatusParams{*status};
    plan.filterSpec    = buildFilterSpec(text, kStatusConsumed);
    plan.confidence    = Confidence::Medium;
    plan.summaryKey    = kSummaryStatusChange;
    return plan;
}

} // namespace bulk_planner
