#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace bulk_planner {

/// Operation families the dispatcher can route to.
enum class Family { Price, Tags, Inventory, Status };

namespace vocabulary {

// Family triggers match anywhere in the text ("restock" is inventory).
// Other keyword lists are matched case-insensitively at the start of a word
// ("archive" matches "archived", "publish" does not match "unpublish").
// Consumed-fragment lists are removed as whole words.

/// Words that never describe which items to target.
inline const std::vector<std::string> kStopWords = {
    "please", "all", "products", "product", "items", "item", "the",
    "to", "for", "of", "with", "and", "that", "my",
};

/// Recognised currency prefixes (UTF-8).
inline const std::vector<std::string> kCurrencySymbols = {
    "$", "€", "£", "₹", "¥", "₤", "₱", "₦", "₽",
};

struct FamilyTrigger {
    Family                   family;
    std::vector<std::string> keywords;
};

/// Dispatch order; the first family with a keyword anywhere in the text wins.
inline const std::vector<FamilyTrigger> kFamilyTriggers = {
    {Family::Price,     {"price"}},
    {Family::Tags,      {"tag"}},
    {Family::Inventory, {"inventory", "stock", "quantity"}},
    {Family::Status,    {"publish", "unpublish", "archive", "draft"}},
};

struct StatusRule {
    ProductStatus            status;
    std::vector<std::string> keywords;
};

/// Evaluated in order; the first rule with a matching keyword wins.
inline const std::vector<StatusRule> kStatusRules = {
    {ProductStatus::Draft,    {"unpublish"}},
    {ProductStatus::Active,   {"publish", "activate"}},
    {ProductStatus::Draft,    {"draft"}},
    {ProductStatus::Archived, {"archive"}},
};

// ---- price / compare-at ----

inline const std::vector<std::string> kIncreaseWords  = {"increase", "raise"};
inline const std::vector<std::string> kDecreaseWords  = {"decrease", "reduce", "lower"};
inline const std::vector<std::string> kSetWords       = {"set", "change"};
inline const std::vector<std::string> kPriceWords     = {"price"};
inline const std::vector<std::string> kCompareAtWords = {"compare at", "compare-at", "compare_at"};

inline const std::vector<std::string> kPriceConsumed = {
    "compare at", "compare-at", "compare_at",
    "price", "prices",
    "increase", "raise", "decrease", "reduce", "lower",
    "set", "change", "by",
};

// ---- tags ----

inline const std::vector<std::string> kTagsReplaceWords = {"replace"};
inline const std::vector<std::string> kTagsRemoveWords  = {"remove", "delete"};

inline const std::vector<std::string> kTagsConsumed = {
    "tag", "tags", "tagged", "add", "remove", "delete", "replace",
};

// ---- inventory ----

inline const std::vector<std::string> kInventoryIncWords = {"increase", "add", "plus"};
inline const std::vector<std::string> kInventoryDecWords = {"decrease", "remove", "minus", "deduct"};

inline const std::vector<std::string> kInventoryConsumed = {
    "inventory", "stock", "quantity", "quantities", "units",
    "increase", "add", "plus", "decrease", "remove", "minus", "deduct",
    "set", "by", "location", "at", "in",
};

// ---- status ----

inline const std::vector<std::string> kStatusConsumed = {
    "unpublish", "publish", "activate", "archive", "archived",
    "draft", "drafts", "status",
};

// ---- message / summary keys ----

inline const std::string kMsgMissingAmount     = "plan.clarify.missingAmount";
inline const std::string kMsgMissingTags       = "plan.clarify.missingTags";
inline const std::string kMsgRequireLocation   = "plan.clarify.requireLocation";
inline const std::string kMsgUnsupportedStatus = "plan.clarify.unsupportedStatus";
inline const std::string kMsgUnrecognized      = "plan.clarify.unrecognized";

inline const std::string kSummaryInventoryAdjust = "plan.summary.inventoryAdjust";
inline const std::string kSummaryStatusChange    = "plan.summary.statusChange";
inline const std::string kSummaryTagsAdd         = "plan.summary.tagsAdd";
inline const std::string kSummaryTagsRemove      = "plan.summary.tagsRemove";
inline const std::string kSummaryTagsReplace     = "plan.summary.tagsReplace";

} // namespace vocabulary
} // namespace bulk_planner
