/// @file test_planner.cpp
/// Unit tests for planner.hpp: dispatch order and end-to-end planning
/// properties (determinism, validity, inventory safety, sign handling).

#include "mapping.hpp"
#include "planner.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace bulk_planner;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Inputs exercising every family and every clarify path.
// ---------------------------------------------------------------------------

static const std::vector<std::string> kCorpus = {
    "increase hoodie prices by 10%",
    "decrease price by 15%",
    "raise sock prices by $2.50",
    "set beanie price to €19.99",
    "lower compare-at price by 5",
    "increase hoodie prices",
    R"(add "Summer Sale" and "Clearance" tags)",
    "remove tags winter, sale from jackets",
    "add tags",
    "set inventory to 12 at Main Warehouse",
    "set inventory to 5",
    "increase stock",
    "deduct 3 quantity in location Depot-2",
    "archive all products",
    "unpublish winter coats",
    "publish drafts of scarves",
    "do something vague",
    "   ",
};

// ============================================================================
// classifyFamily
// ============================================================================

TEST(ClassifyFamily, EachFamilyKeyword) {
    EXPECT_EQ(classifyFamily("raise prices 5%"), Family::Price);
    EXPECT_EQ(classifyFamily("tag mugs \"gift\""), Family::Tags);
    EXPECT_EQ(classifyFamily("set inventory to 4"), Family::Inventory);
    EXPECT_EQ(classifyFamily("Stock up 4"), Family::Inventory);
    EXPECT_EQ(classifyFamily("quantity 4"), Family::Inventory);
    EXPECT_EQ(classifyFamily("publish hats"), Family::Status);
    EXPECT_EQ(classifyFamily("move to draft"), Family::Status);
}

TEST(ClassifyFamily, PriceOutranksTags) {
    EXPECT_EQ(classifyFamily("raise price of items tagged sale by 5%"), Family::Price);
}

TEST(ClassifyFamily, TagsOutrankInventoryAndStatus) {
    EXPECT_EQ(classifyFamily("tag low stock items \"restock\""), Family::Tags);
    EXPECT_EQ(classifyFamily("archive products tagged old"), Family::Tags);
}

TEST(ClassifyFamily, InventoryOutranksStatus) {
    EXPECT_EQ(classifyFamily("set stock of draft items to 0"), Family::Inventory);
}

TEST(ClassifyFamily, TriggersMatchInsideWords) {
    EXPECT_EQ(classifyFamily("restock hoodies by 5 at Main Warehouse"), Family::Inventory);
    EXPECT_EQ(classifyFamily("reprice hoodies to $20"), Family::Price);
    EXPECT_EQ(classifyFamily("retag hoodies \"sale\""), Family::Tags);
    EXPECT_EQ(classifyFamily("unpublish hats"), Family::Status);
}

TEST(ClassifyFamily, NoFamily) {
    EXPECT_FALSE(classifyFamily("do something vague").has_value());
    EXPECT_FALSE(classifyFamily("clean up old listings").has_value());
}

// ============================================================================
// planFromRequest: documented examples
// ============================================================================

TEST(PlanFromRequest, SignCorrectness) {
    auto dec = planFromRequest({"decrease price by 15%", std::nullopt});
    auto inc = planFromRequest({"increase price by 15%", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanSuccess>(dec));
    ASSERT_TRUE(std::holds_alternative<PlanSuccess>(inc));

    json decParams = toJson(dec)["opSpec"]["params"];
    EXPECT_EQ(decParams["mode"], "inc_percent");
    EXPECT_DOUBLE_EQ(decParams["value"].get<double>(), -15.0);

    json incParams = toJson(inc)["opSpec"]["params"];
    EXPECT_EQ(incParams["mode"], "inc_percent");
    EXPECT_DOUBLE_EQ(incParams["value"].get<double>(), 15.0);
}

TEST(PlanFromRequest, TagLiteralFidelity) {
    auto r = planFromRequest({R"(add "Summer Sale" and "Clearance" tags)", "en"});
    json j = toJson(r);
    EXPECT_EQ(j["action"], "plan");
    EXPECT_EQ(j["opSpec"]["params"]["values"], json::array({"Summer Sale", "Clearance"}));
}

TEST(PlanFromRequest, ResidualFilterExtraction) {
    json j = toJson(planFromRequest({"increase hoodie prices by 10%", std::nullopt}));
    EXPECT_EQ(j["filterSpec"]["titleContains"], "hoodie");
}

TEST(PlanFromRequest, UnrecognizedFallback) {
    auto r = planFromRequest({"do something vague", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanClarify>(r));
    const auto& clarify = std::get<PlanClarify>(r);
    ASSERT_EQ(clarify.issues.size(), 1u);
    EXPECT_EQ(clarify.issues[0].code, ClarifyCode::PlanUnrecognized);
    EXPECT_EQ(clarify.issues[0].messageKey, "plan.clarify.unrecognized");
    EXPECT_FALSE(clarify.draft.has_value());
}

TEST(PlanFromRequest, PrefixedVerbsAreRecognized) {
    auto restock = planFromRequest({"restock hoodies by 5 at Main Warehouse", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanSuccess>(restock));
    const auto& inv =
        std::get<InventoryParams>(std::get<PlanSuccess>(restock).opSpec.params);
    EXPECT_EQ(inv.value, 5);
    EXPECT_EQ(inv.locationId, "Main Warehouse");

    auto retag = planFromRequest({"retag hoodies \"sale\"", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanSuccess>(retag));
    EXPECT_EQ(std::get<TagsParams>(std::get<PlanSuccess>(retag).opSpec.params).values,
              std::vector<std::string>{"sale"});

    auto reprice = planFromRequest({"reprice hoodies to $20", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanClarify>(reprice));
    EXPECT_EQ(std::get<PlanClarify>(reprice).issues[0].code, ClarifyCode::PlanMissingAmount);
}

TEST(PlanFromRequest, MissingAmount) {
    auto r = planFromRequest({"increase hoodie prices", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanClarify>(r));
    EXPECT_EQ(std::get<PlanClarify>(r).issues[0].code, ClarifyCode::PlanMissingAmount);
}

TEST(PlanFromRequest, StatusKeywordMapping) {
    json j = toJson(planFromRequest({"archive all products", std::nullopt}));
    EXPECT_EQ(j["opSpec"]["operation"], "status");
    EXPECT_EQ(j["opSpec"]["params"], json({{"status", "ARCHIVED"}}));
}

TEST(PlanFromRequest, SurroundingWhitespaceIsIgnored) {
    json a = toJson(planFromRequest({"  archive all products \n", std::nullopt}));
    json b = toJson(planFromRequest({"archive all products", std::nullopt}));
    EXPECT_EQ(a, b);
}

TEST(PlanFromRequest, BlankTextIsInvalidRequest) {
    auto r = planFromRequest({"   ", std::nullopt});
    ASSERT_TRUE(std::holds_alternative<PlanError>(r));
    EXPECT_EQ(std::get<PlanError>(r).code, "plan.invalid_request");
}

TEST(PlanFromRequest, LocaleDoesNotChangeOutcome) {
    for (const auto& text : kCorpus) {
        EXPECT_EQ(toJson(planFromRequest({text, "de-DE"})),
                  toJson(planFromRequest({text, std::nullopt})))
            << "Locale changed the plan for: " << text;
    }
}

// ============================================================================
// Properties over the corpus
// ============================================================================

TEST(PlanProperties, Deterministic) {
    for (const auto& text : kCorpus) {
        const std::string first  = toJson(planFromRequest({text, "en"})).dump();
        const std::string second = toJson(planFromRequest({text, "en"})).dump();
        EXPECT_EQ(first, second) << "Non-deterministic for: " << text;
    }
}

TEST(PlanProperties, EveryOpSpecAndFilterSpecParsesDownstream) {
    for (const auto& text : kCorpus) {
        json j = toJson(planFromRequest({text, std::nullopt}));
        if (j["action"] == "plan") {
            EXPECT_NO_THROW(parseOpSpec(j["opSpec"])) << text;
            EXPECT_NO_THROW(parseFilterSpec(j["filterSpec"])) << text;
        } else if (j["action"] == "clarify") {
            ASSERT_FALSE(j["issues"].empty()) << text;
            if (j.contains("draft") && j["draft"].contains("opSpec")) {
                EXPECT_NO_THROW(parseOpSpec(j["draft"]["opSpec"])) << text;
            }
        } else {
            EXPECT_EQ(j["action"], "error") << text;
        }
    }
}

TEST(PlanProperties, InventoryPlansAlwaysCarryLocationAndAmount) {
    for (const auto& text : kCorpus) {
        auto r = planFromRequest({text, std::nullopt});
        if (auto* plan = std::get_if<PlanSuccess>(&r)) {
            if (plan->opSpec.operation() != Operation::Inventory) continue;
            const auto& p = std::get<InventoryParams>(plan->opSpec.params);
            EXPECT_TRUE(p.locationId.has_value()) << text;
            EXPECT_GE(p.value, 0) << text;
        }
    }
}

TEST(PlanProperties, MissingLocationAlwaysRaisesRequireLocation) {
    for (const std::string text : {"set inventory to 5", "increase stock", "add stock"}) {
        auto r = planFromRequest({text, std::nullopt});
        ASSERT_TRUE(std::holds_alternative<PlanClarify>(r)) << text;
        bool found = false;
        for (const auto& issue : std::get<PlanClarify>(r).issues) {
            found = found || issue.code == ClarifyCode::InventoryRequireLocation;
        }
        EXPECT_TRUE(found) << text;
    }
}

TEST(PlanProperties, ConcurrentCallsAgreeWithSequential) {
    std::vector<std::string> expected;
    for (const auto& text : kCorpus) {
        expected.push_back(toJson(planFromRequest({text, std::nullopt})).dump());
    }

    std::vector<std::vector<std::string>> results(4);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < results.size(); ++t) {
        workers.emplace_back([&results, t] {
            for (const auto& text : kCorpus) {
                results[t].push_back(toJson(planFromRequest({text, std::nullopt})).dump());
            }
        });
    }
    for (auto& w : workers) w.join();

    for (const auto& r : results) {
        EXPECT_EQ(r, expected);
    }
}
