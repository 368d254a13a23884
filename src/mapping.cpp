#include "mapping.hpp"
#include "schema.hpp"

#include <cmath>
#include <vector>

namespace bulk_planner {

using json = nlohmann::json;

// ============================================================================
// Request
// ============================================================================

PlanRequest parsePlanRequest(const json& body) {
    if (!body.is_object()) {
        throw InvalidRequest("body: Expected object, received " +
                             std::string(body.type_name()));
    }

    std::vector<std::string> problems;
    PlanRequest request;

    // --- text ---
    if (!body.contains("text")) {
        problems.emplace_back("text: Required");
    } else if (!body["text"].is_string()) {
        problems.emplace_back("text: Expected string, received " +
                              std::string(body["text"].type_name()));
    } else {
        request.text = body["text"].get<std::string>();
        if (request.text.empty()) {
            problems.emplace_back("text: String must contain at least 1 character(s)");
        }
    }

    // --- locale ---
    if (body.contains("locale")) {
        if (!body["locale"].is_string()) {
            problems.emplace_back("locale: Expected string, received " +
                                  std::string(body["locale"].type_name()));
        } else {
            request.locale = body["locale"].get<std::string>();
        }
    }

    if (!problems.empty()) {
        std::string detail;
        for (const auto& p : problems) {
            if (!detail.empty()) detail += "; ";
            detail += p;
        }
        throw InvalidRequest(detail);
    }
    return request;
}

// ============================================================================
// Serialisation
// ============================================================================

namespace {

json priceParamsJson(const PriceParams& p) {
    json j = {{"mode", toString(p.mode)}, {"value", p.value}};
    if (p.currency) j["currency"] = *p.currency;
    if (p.round) {
        json round = {{"precision", p.round->precision},
                      {"mode", toString(p.round->mode)}};
        if (p.round->endWith) round["endWith"] = *p.round->endWith;
        j["round"] = std::move(round);
    }
    return j;
}

json metafieldValueJson(const MetafieldValue& v) {
    return std::visit([](const auto& x) -> json { return json(x); }, v);
}

/// One overload per OpParams alternative.
struct ParamsSerializer {
    json operator()(const PriceParams& p) const { return priceParamsJson(p); }
    json operator()(const CompareAtParams& p) const { return priceParamsJson(p); }

    json operator()(const TagsParams& p) const {
        return {{"mode", toString(p.mode)}, {"values", p.values}};
    }

    json operator()(const InventoryParams& p) const {
        json j = {{"mode", toString(p.mode)}, {"value", p.value}};
        if (p.locationId) j["locationId"] = *p.locationId;
        return j;
    }

    json operator()(const StatusParams& p) const {
        return {{"status", toString(p.status)}};
    }

    json operator()(const MetafieldParams& p) const {
        json mf = {{"ns", p.ns}, {"key", p.key}, {"type", p.type}};
        if (p.value) mf["value"] = metafieldValueJson(*p.value);
        return {{"metafield", std::move(mf)}};
    }

    json operator()(const SeoParams& p) const {
        json seo = json::object();
        if (p.title) seo["title"] = *p.title;
        if (p.description) seo["description"] = *p.description;
        return {{"seo", std::move(seo)}};
    }
};

} // namespace

json toJson(const OpSpec& op) {
    json j;
    j["operation"] = toString(op.operation());
    j["scope"]     = toString(op.scope);
    if (op.schedule) j["schedule"] = *op.schedule;
    j["params"] = std::visit(ParamsSerializer{}, op.params);
    return j;
}

json toJson(const FilterSpec& filter) {
    json numeric = json::object();
    if (filter.numeric.priceGte) numeric["priceGte"] = *filter.numeric.priceGte;
    if (filter.numeric.priceLte) numeric["priceLte"] = *filter.numeric.priceLte;
    if (filter.numeric.inventoryEq) numeric["inventoryEq"] = *filter.numeric.inventoryEq;

    return {
        {"must", {
            {"vendors", filter.must.vendors},
            {"types", filter.must.types},
            {"collections", filter.must.collections},
            {"tags", filter.must.tags}
        }},
        {"mustNot", {{"tags", filter.mustNot.tags}}},
        {"titleContains", filter.titleContains ? json(*filter.titleContains) : json(nullptr)},
        {"numeric", std::move(numeric)}
    };
}

json toJson(const ClarifyIssue& issue) {
    json j = {{"code", toString(issue.code)}, {"messageKey", issue.messageKey}};
    if (!issue.options.empty()) {
        json options = json::array();
        for (const auto& o : issue.options) {
            options.push_back({{"value", o.value}, {"labelKey", o.labelKey}});
        }
        j["options"] = std::move(options);
    }
    return j;
}

json toJson(const PlanDraft& draft) {
    json j = json::object();
    if (draft.opSpec) j["opSpec"] = toJson(*draft.opSpec);
    if (draft.filterSpec) j["filterSpec"] = toJson(*draft.filterSpec);
    if (draft.confidence) j["confidence"] = toString(*draft.confidence);
    if (draft.summaryKey) j["summaryKey"] = *draft.summaryKey;
    return j;
}

json toJson(const PlanSuccess& plan) {
    json j;
    j["action"]     = "plan";
    j["opSpec"]     = toJson(plan.opSpec);
    j["filterSpec"] = toJson(plan.filterSpec);
    j["confidence"] = toString(plan.confidence);
    if (plan.summaryKey) j["summaryKey"] = *plan.summaryKey;
    return j;
}

json toJson(const PlanClarify& clarify) {
    json issues = json::array();
    for (const auto& issue : clarify.issues) {
        issues.push_back(toJson(issue));
    }
    json j = {{"action", "clarify"}, {"issues", std::move(issues)}};
    if (clarify.draft) j["draft"] = toJson(*clarify.draft);
    return j;
}

json toJson(const PlanError& error) {
    return {{"action", "error"}, {"code", error.code}, {"message", error.message}};
}

json toJson(const PlanResponse& response) {
    return std::visit([](const auto& r) { return toJson(r); }, response);
}

// ============================================================================
// Parsing (executor side)
// ============================================================================

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& rule) {
    throw std::runtime_error(path + ": " + rule);
}

const json& requireObject(const json& node, const std::string& path) {
    if (!node.is_object()) fail(path, "expected object");
    return node;
}

const json& requireField(const json& parent, const char* key, const std::string& path) {
    if (!parent.contains(key)) fail(path + "." + key, "required");
    return parent[key];
}

std::string requireString(const json& parent, const char* key, const std::string& path) {
    const auto& v = requireField(parent, key, path);
    if (!v.is_string()) fail(path + "." + key, "expected string");
    return v.get<std::string>();
}

/// Absent and null both map to nullopt.
std::optional<std::string> optionalString(const json& parent, const char* key,
                                          const std::string& path) {
    if (!parent.contains(key) || parent[key].is_null()) return std::nullopt;
    if (!parent[key].is_string()) fail(path + "." + key, "expected string");
    return parent[key].get<std::string>();
}

double requireNumber(const json& parent, const char* key, const std::string& path) {
    const auto& v = requireField(parent, key, path);
    if (!v.is_number()) fail(path + "." + key, "expected number");
    return v.get<double>();
}

std::optional<double> optionalNumber(const json& parent, const char* key,
                                     const std::string& path) {
    if (!parent.contains(key) || parent[key].is_null()) return std::nullopt;
    if (!parent[key].is_number()) fail(path + "." + key, "expected number");
    return parent[key].get<double>();
}

template <typename Enum>
Enum requireEnum(const json& parent, const char* key, const std::string& path,
                 std::optional<Enum> (*fromString)(const std::string&)) {
    const std::string raw = requireString(parent, key, path);
    auto value = fromString(raw);
    if (!value) fail(path + "." + key, "invalid value '" + raw + "'");
    return *value;
}

std::vector<std::string> stringArray(const json& parent, const char* key,
                                     const std::string& path) {
    std::vector<std::string> out;
    if (!parent.contains(key)) return out;
    const auto& arr = parent[key];
    if (!arr.is_array()) fail(path + "." + key, "expected array");
    for (const auto& item : arr) {
        if (!item.is_string()) fail(path + "." + key, "expected array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

PriceParams parsePriceParams(const json& node, const std::string& path) {
    requireObject(node, path);
    PriceParams p;
    p.mode     = requireEnum(node, "mode", path, &priceModeFromString);
    p.value    = requireNumber(node, "value", path);
    p.currency = optionalString(node, "currency", path);
    if (node.contains("round")) {
        const std::string roundPath = path + ".round";
        const auto& r = requireObject(node["round"], roundPath);
        RoundingPolicy round;
        round.precision = requireNumber(r, "precision", roundPath);
        round.endWith   = optionalString(r, "endWith", roundPath);
        if (r.contains("mode")) {
            round.mode = requireEnum(r, "mode", roundPath, &roundingDirectionFromString);
        }
        p.round = round;
    }
    return p;
}

MetafieldValue parseMetafieldValue(const json& v, const std::string& path) {
    if (v.is_null()) return nullptr;
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>();
    fail(path, "expected string, number, boolean or null");
}

OpParams parseParams(Operation op, const json& node, const std::string& path) {
    requireObject(node, path);
    switch (op) {
        case Operation::Price:
            return parsePriceParams(node, path);

        case Operation::CompareAt: {
            CompareAtParams p;
            static_cast<PriceParams&>(p) = parsePriceParams(node, path);
            return p;
        }

        case Operation::Tags: {
            TagsParams p;
            p.mode = requireEnum(node, "mode", path, &tagsModeFromString);
            requireField(node, "values", path);
            p.values = stringArray(node, "values", path);
            return p;
        }

        case Operation::Inventory: {
            InventoryParams p;
            p.mode = requireEnum(node, "mode", path, &inventoryModeFromString);
            const double value = requireNumber(node, "value", path);
            if (value != std::floor(value) || std::abs(value) > 9007199254740991.0) {
                fail(path + ".value", "expected integer");
            }
            p.value      = static_cast<std::int64_t>(value);
            p.locationId = optionalString(node, "locationId", path);
            return p;
        }

        case Operation::Status:
            return StatusParams{
                requireEnum(node, "status", path, &productStatusFromString)};

        case Operation::Metafield: {
            const std::string mfPath = path + ".metafield";
            const auto& mf = requireObject(requireField(node, "metafield", path), mfPath);
            MetafieldParams p;
            p.ns   = requireString(mf, "ns", mfPath);
            p.key  = requireString(mf, "key", mfPath);
            p.type = requireString(mf, "type", mfPath);
            if (mf.contains("value")) {
                p.value = parseMetafieldValue(mf["value"], mfPath + ".value");
            }
            return p;
        }

        case Operation::Seo: {
            const std::string seoPath = path + ".seo";
            const auto& seo = requireObject(requireField(node, "seo", path), seoPath);
            SeoParams p;
            p.title       = optionalString(seo, "title", seoPath);
            p.description = optionalString(seo, "description", seoPath);
            return p;
        }
    }
    fail(path, "unknown operation");
}

} // namespace

OpSpec parseOpSpec(const json& node) {
    const std::string path = "opSpec";
    requireObject(node, path);

    const Operation operation =
        requireEnum(node, "operation", path, &operationFromString);

    OpSpec op;
    if (node.contains("scope")) {
        op.scope = requireEnum(node, "scope", path, &scopeFromString);
    }
    op.schedule = optionalString(node, "schedule", path);
    op.params   = parseParams(operation, requireField(node, "params", path),
                              path + ".params");

    try {
        validate(op);
    } catch (const SchemaViolation& e) {
        throw std::runtime_error(e.what());
    }
    return op;
}

FilterSpec parseFilterSpec(const json& node) {
    const std::string path = "filterSpec";
    requireObject(node, path);

    FilterSpec filter;
    if (node.contains("must")) {
        const auto& must = requireObject(node["must"], path + ".must");
        filter.must.vendors     = stringArray(must, "vendors", path + ".must");
        filter.must.types       = stringArray(must, "types", path + ".must");
        filter.must.collections = stringArray(must, "collections", path + ".must");
        filter.must.tags        = stringArray(must, "tags", path + ".must");
    }
    if (node.contains("mustNot")) {
        const auto& mustNot = requireObject(node["mustNot"], path + ".mustNot");
        filter.mustNot.tags = stringArray(mustNot, "tags", path + ".mustNot");
    }
    filter.titleContains = optionalString(node, "titleContains", path);
    if (node.contains("numeric")) {
        const std::string numPath = path + ".numeric";
        const auto& numeric = requireObject(node["numeric"], numPath);
        filter.numeric.priceGte    = optionalNumber(numeric, "priceGte", numPath);
        filter.numeric.priceLte    = optionalNumber(numeric, "priceLte", numPath);
        filter.numeric.inventoryEq = optionalNumber(numeric, "inventoryEq", numPath);
    }

    try {
        validate(filter);
    } catch (const SchemaViolation& e) {
        throw std::runtime_error(e.what());
    }
    return filter;
}

} // namespace bulk_planner
