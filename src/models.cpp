#include "models.hpp"

#include <type_traits>

namespace bulk_planner {

static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::Price), OpParams>, PriceParams>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::CompareAt), OpParams>, CompareAtParams>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::Tags), OpParams>, TagsParams>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::Inventory), OpParams>, InventoryParams>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::Status), OpParams>, StatusParams>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::Metafield), OpParams>, MetafieldParams>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(Operation::Seo), OpParams>, SeoParams>);
static_assert(std::variant_size_v<OpParams> == 7);

bool FilterSpec::empty() const {
    return must.vendors.empty() && must.types.empty() &&
           must.collections.empty() && must.tags.empty() &&
           mustNot.tags.empty() && !titleContains.has_value() &&
           !numeric.priceGte && !numeric.priceLte && !numeric.inventoryEq;
}

// ---------------------------------------------------------------------------
// Enum -> wire string
// ---------------------------------------------------------------------------

const char* toString(Scope scope) {
    switch (scope) {
        case Scope::Product: return "product";
        case Scope::Variant: return "variant";
    }
    return "product";
}

const char* toString(Operation op) {
    switch (op) {
        case Operation::Price:     return "price";
        case Operation::CompareAt: return "compare_at";
        case Operation::Tags:      return "tags";
        case Operation::Inventory: return "inventory";
        case Operation::Status:    return "status";
        case Operation::Metafield: return "metafield";
        case Operation::Seo:       return "seo";
    }
    return "price";
}

const char* toString(PriceMode mode) {
    switch (mode) {
        case PriceMode::IncPercent: return "inc_percent";
        case PriceMode::IncValue:   return "inc_value";
        case PriceMode::Set:        return "set";
    }
    return "set";
}

const char* toString(RoundingDirection mode) {
    switch (mode) {
        case RoundingDirection::Nearest: return "nearest";
        case RoundingDirection::Up:      return "up";
        case RoundingDirection::Down:    return "down";
    }
    return "nearest";
}

const char* toString(TagsMode mode) {
    switch (mode) {
        case TagsMode::Add:     return "add";
        case TagsMode::Remove:  return "remove";
        case TagsMode::Replace: return "replace";
    }
    return "add";
}

const char* toString(InventoryMode mode) {
    switch (mode) {
        case InventoryMode::Set: return "set";
        case InventoryMode::Inc: return "inc";
        case InventoryMode::Dec: return "dec";
    }
    return "set";
}

const char* toString(ProductStatus status) {
    switch (status) {
        case ProductStatus::Active:   return "ACTIVE";
        case ProductStatus::Draft:    return "DRAFT";
        case ProductStatus::Archived: return "ARCHIVED";
    }
    return "ACTIVE";
}

const char* toString(Confidence confidence) {
    switch (confidence) {
        case Confidence::High:   return "high";
        case Confidence::Medium: return "medium";
        case Confidence::Low:    return "low";
    }
    return "medium";
}

const char* toString(ClarifyCode code) {
    switch (code) {
        case ClarifyCode::InventoryRequireLocation: return "inventory.requireLocation";
        case ClarifyCode::PlanUnrecognized:         return "plan.unrecognized";
        case ClarifyCode::PlanUnsupported:          return "plan.unsupported";
        case ClarifyCode::PlanMissingAmount:        return "plan.missingAmount";
        case ClarifyCode::PlanMissingTagValues:     return "plan.missingTagValues";
    }
    return "plan.unrecognized";
}

// ---------------------------------------------------------------------------
// Wire string -> enum
// ---------------------------------------------------------------------------

namespace {

/// Linear lookup over every value of a small enum.
template <typename Enum, std::size_t N>
std::optional<Enum> lookup(const std::string& s, const Enum (&values)[N]) {
    for (Enum v : values) {
        if (s == toString(v)) return v;
    }
    return std::nullopt;
}

} // namespace

std::optional<Scope> scopeFromString(const std::string& s) {
    static const Scope kAll[] = {Scope::Product, Scope::Variant};
    return lookup(s, kAll);
}

std::optional<Operation> operationFromString(const std::string& s) {
    static const Operation kAll[] = {
        Operation::Price, Operation::CompareAt, Operation::Tags,
        Operation::Inventory, Operation::Status, Operation::Metafield,
        Operation::Seo};
    return lookup(s, kAll);
}

std::optional<PriceMode> priceModeFromString(const std::string& s) {
    static const PriceMode kAll[] = {
        PriceMode::IncPercent, PriceMode::IncValue, PriceMode::Set};
    return lookup(s, kAll);
}

std::optional<RoundingDirection> roundingDirectionFromString(const std::string& s) {
    static const RoundingDirection kAll[] = {
        RoundingDirection::Nearest, RoundingDirection::Up, RoundingDirection::Down};
    return lookup(s, kAll);
}

std::optional<TagsMode> tagsModeFromString(const std::string& s) {
    static const TagsMode kAll[] = {TagsMode::Add, TagsMode::Remove, TagsMode::Replace};
    return lookup(s, kAll);
}

std::optional<InventoryMode> inventoryModeFromString(const std::string& s) {
    static const InventoryMode kAll[] = {
        InventoryMode::Set, InventoryMode::Inc, InventoryMode::Dec};
    return lookup(s, kAll);
}

std::optional<ProductStatus> productStatusFromString(const std::string& s) {
    static const ProductStatus kAll[] = {
        ProductStatus::Active, ProductStatus::Draft, ProductStatus::Archived};
    return lookup(s, kAll);
}

std::optional<Confidence> confidenceFromString(const std::string& s) {
    static const Confidence kAll[] = {
        Confidence::High, Confidence::Medium, Confidence::Low};
    return lookup(s, kAll);
}

std::optional<ClarifyCode> clarifyCodeFromString(const std::string& s) {
    static const ClarifyCode kAll[] = {
        ClarifyCode::InventoryRequireLocation, ClarifyCode::PlanUnrecognized,
        ClarifyCode::PlanUnsupported, ClarifyCode::PlanMissingAmount,
        ClarifyCode::PlanMissingTagValues};
    return lookup(s, kAll);
}

} // namespace bulk_planner
