#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bulk_planner {

// ============================================================================
// Operation spec: what to change
// ============================================================================

enum class Scope { Product, Variant };

enum class PriceMode { IncPercent, IncValue, Set };

enum class RoundingDirection { Nearest, Up, Down };

/// Optional rounding applied by the executor after a price change.
struct RoundingPolicy {
    double                     precision = 0.01;   // (0, 1]
    std::optional<std::string> endWith;            // e.g. ".99"
    RoundingDirection          mode = RoundingDirection::Nearest;
};

/// Payload shared by the price and compare-at families.
/// inc_percent / inc_value carry the intended sign, set carries the target.
struct PriceParams {
    PriceMode                     mode  = PriceMode::IncPercent;
    double                        value = 0.0;
    std::optional<std::string>    currency;   // ISO 4217, 3 letters
    std::optional<RoundingPolicy> round;
};

struct CompareAtParams : PriceParams {};

enum class TagsMode { Add, Remove, Replace };

struct TagsParams {
    TagsMode                 mode = TagsMode::Add;
    std::vector<std::string> values;   // order and case as given
};

enum class InventoryMode { Set, Inc, Dec };

struct InventoryParams {
    InventoryMode              mode  = InventoryMode::Set;
    std::int64_t               value = 0;      // non-negative magnitude
    std::optional<std::string> locationId;     // free-text label, resolved later
};

enum class ProductStatus { Active, Draft, Archived };

struct StatusParams {
    ProductStatus status = ProductStatus::Active;
};

using MetafieldValue = std::variant<std::nullptr_t, std::string, double, bool>;

struct MetafieldParams {
    std::string                   ns;
    std::string                   key;
    std::string                   type;
    std::optional<MetafieldValue> value;
};

struct SeoParams {
    std::optional<std::string> title;         // <= 70 chars
    std::optional<std::string> description;   // <= 320 chars
};

/// Alternatives are listed in the same order as the Operation enum.
using OpParams = std::variant<PriceParams,
                              CompareAtParams,
                              TagsParams,
                              InventoryParams,
                              StatusParams,
                              MetafieldParams,
                              SeoParams>;

enum class Operation { Price, CompareAt, Tags, Inventory, Status, Metafield, Seo };

struct OpSpec {
    Scope                      scope = Scope::Product;
    std::optional<std::string> schedule;   // ISO-8601 timestamp
    OpParams                   params;

    Operation operation() const { return static_cast<Operation>(params.index()); }
};

// ============================================================================
// Filter spec: what to select
// ============================================================================

/// AND across categories, OR within a category.
struct FilterMust {
    std::vector<std::string> vendors;
    std::vector<std::string> types;
    std::vector<std::string> collections;
    std::vector<std::string> tags;
};

struct FilterMustNot {
    std::vector<std::string> tags;
};

struct FilterNumeric {
    std::optional<double> priceGte;
    std::optional<double> priceLte;
    std::optional<double> inventoryEq;
};

struct FilterSpec {
    FilterMust                 must;
    FilterMustNot              mustNot;
    std::optional<std::string> titleContains;
    FilterNumeric              numeric;

    /// True when the filter does not narrow the selection at all.
    bool empty() const;
};

// ============================================================================
// Responses
// ============================================================================

enum class Confidence { High, Medium, Low };

enum class ClarifyCode {
    InventoryRequireLocation,
    PlanUnrecognized,
    PlanUnsupported,
    PlanMissingAmount,
    PlanMissingTagValues,
};

struct ClarifyOption {
    std::string value;
    std::string labelKey;
};

struct ClarifyIssue {
    ClarifyCode                code = ClarifyCode::PlanUnrecognized;
    std::string                messageKey;
    std::vector<ClarifyOption> options;   // empty when nothing is selectable
};

struct PlanSuccess {
    OpSpec                     opSpec;
    FilterSpec                 filterSpec;
    Confidence                 confidence = Confidence::Medium;
    std::optional<std::string> summaryKey;
};

/// Whatever could be inferred despite a clarification being needed.
struct PlanDraft {
    std::optional<OpSpec>      opSpec;
    std::optional<FilterSpec>  filterSpec;
    std::optional<Confidence>  confidence;
    std::optional<std::string> summaryKey;
};

struct PlanClarify {
    std::vector<ClarifyIssue> issues;
    std::optional<PlanDraft>  draft;
};

struct PlanError {
    std::string code;
    std::string message;
};

using PlanResponse = std::variant<PlanSuccess, PlanClarify, PlanError>;

struct PlanRequest {
    std::string                text;
    std::optional<std::string> locale;
};

namespace error_codes {
inline const std::string kInvalidRequest = "plan.invalid_request";
inline const std::string kFailed         = "plan.failed";
} // namespace error_codes

// ---- enum <-> wire string ----

const char* toString(Scope scope);
const char* toString(Operation op);
const char* toString(PriceMode mode);
const char* toString(RoundingDirection mode);
const char* toString(TagsMode mode);
const char* toString(InventoryMode mode);
const char* toString(ProductStatus status);
const char* toString(Confidence confidence);
const char* toString(ClarifyCode code);

std::optional<Scope>             scopeFromString(const std::string& s);
std::optional<Operation>         operationFromString(const std::string& s);
std::optional<PriceMode>         priceModeFromString(const std::string& s);
std::optional<RoundingDirection> roundingDirectionFromString(const std::string& s);
std::optional<TagsMode>          tagsModeFromString(const std::string& s);
std::optional<InventoryMode>     inventoryModeFromString(const std::string& s);
std::optional<ProductStatus>     productStatusFromString(const std::string& s);
std::optional<Confidence>        confidenceFromString(const std::string& s);
std::optional<ClarifyCode>       clarifyCodeFromString(const std::string& s);

} // namespace bulk_planner
