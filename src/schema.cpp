#include "schema.hpp"

#include <cctype>
#include <cmath>
#include <regex>

namespace bulk_planner {

namespace {

void require(bool condition, const std::string& path, const std::string& rule) {
    if (!condition) {
        throw SchemaViolation(path + ": " + rule);
    }
}

std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

void validatePrice(const PriceParams& p, const std::string& path) {
    require(std::isfinite(p.value), path + ".value", "must be a finite number");
    if (p.currency) {
        const auto& c = *p.currency;
        bool upperAlpha = c.size() == schema::kCurrencyCodeLength;
        for (unsigned char ch : c) upperAlpha = upperAlpha && std::isupper(ch);
        require(upperAlpha, path + ".currency", "must be a 3-letter currency code");
    }
    if (p.round) {
        require(std::isfinite(p.round->precision) && p.round->precision > 0.0 &&
                    p.round->precision <= 1.0,
                path + ".round.precision", "must be in (0, 1]");
    }
}

/// One overload per OpParams alternative; a missing one fails to compile.
struct ParamsValidator {
    const std::string path;

    void operator()(const PriceParams& p) const { validatePrice(p, path); }
    void operator()(const CompareAtParams& p) const { validatePrice(p, path); }

    void operator()(const TagsParams& p) const {
        require(!p.values.empty(), path + ".values", "must contain at least one tag");
        for (std::size_t i = 0; i < p.values.size(); ++i) {
            require(!p.values[i].empty(),
                    path + ".values[" + std::to_string(i) + "]", "must not be empty");
        }
    }

    void operator()(const InventoryParams& p) const {
        require(p.value >= 0, path + ".value", "must be a non-negative integer");
        if (p.locationId) {
            require(!p.locationId->empty(), path + ".locationId", "must not be empty");
        }
    }

    void operator()(const StatusParams&) const {}

    void operator()(const MetafieldParams& p) const {
        require(!p.ns.empty(), path + ".metafield.ns", "must not be empty");
        require(!p.key.empty(), path + ".metafield.key", "must not be empty");
        require(!p.type.empty(), path + ".metafield.type", "must not be empty");
        if (p.value) {
            if (const auto* d = std::get_if<double>(&*p.value)) {
                require(std::isfinite(*d), path + ".metafield.value",
                        "must be a finite number");
            }
        }
    }

    void operator()(const SeoParams& p) const {
        if (p.title) {
            require(utf8Length(*p.title) <= schema::kSeoTitleMax, path + ".seo.title",
                    "must be at most 70 characters");
        }
        if (p.description) {
            require(utf8Length(*p.description) <= schema::kSeoDescriptionMax,
                    path + ".seo.description", "must be at most 320 characters");
        }
    }
};

void validateOptionalNumber(const std::optional<double>& v, const std::string& path) {
    if (v) require(std::isfinite(*v), path, "must be a finite number");
}

} // namespace

bool schema::isIsoDateTime(const std::string& s) {
    static const std::regex re(
        R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])T([01]\d|2[0-3]):[0-5]\d(:[0-5]\d(\.\d+)?)?(Z|[+-]([01]\d|2[0-3]):[0-5]\d)$)");
    return std::regex_match(s, re);
}

void validate(const OpSpec& op) {
    if (op.schedule) {
        require(schema::isIsoDateTime(*op.schedule), "opSpec.schedule",
                "must be an ISO-8601 date-time");
    }
    require(!op.params.valueless_by_exception(), "opSpec.params", "must hold a value");
    std::visit(ParamsValidator{"opSpec.params"}, op.params);
}

void validate(const FilterSpec& filter) {
    validateOptionalNumber(filter.numeric.priceGte, "filterSpec.numeric.priceGte");
    validateOptionalNumber(filter.numeric.priceLte, "filterSpec.numeric.priceLte");
    validateOptionalNumber(filter.numeric.inventoryEq, "filterSpec.numeric.inventoryEq");
}

void validate(const ClarifyIssue& issue) {
    require(!issue.messageKey.empty(), "issues.messageKey", "must not be empty");
}

void validate(const PlanSuccess& plan) {
    validate(plan.opSpec);
    validate(plan.filterSpec);
}

void validate(const PlanClarify& clarify) {
    require(!clarify.issues.empty(), "issues", "must contain at least one issue");
    for (const auto& issue : clarify.issues) {
        validate(issue);
    }
    if (clarify.draft) {
        if (clarify.draft->opSpec) validate(*clarify.draft->opSpec);
        if (clarify.draft->filterSpec) validate(*clarify.draft->filterSpec);
    }
}

void validate(const PlanError& error) {
    require(!error.code.empty(), "code", "must not be empty");
}

void validate(const PlanResponse& response) {
    std::visit([](const auto& r) { validate(r); }, response);
}

} // namespace bulk_planner
