#include "fakes.hpp"

#include "kiln/complexity.hpp"

#include <gtest/gtest.h>
#include <set>

using namespace kiln;
using namespace kiln::testing;

namespace {

constexpr std::string_view kDepotRequirements = R"(# Purpose

Runs a parcel depot.

## Functional Requirements

- MUST accept parcels at the intake counter
- MUST move parcels between loading bays
- SHOULD charge customers for each delivery
)";

constexpr std::string_view kDepotDesign = R"(# Architecture Overview

Three cooperating parts.

## Components

### Intake

Accepts parcels at the counter.

### Router

Moves parcels between bays.

### Billing

Charges customers for delivery.
)";

constexpr std::string_view kManyMusts = R"(# Purpose

Grades essays.

## Functional Requirements

- MUST accept an essay
- MUST count words
- MUST flag repeated phrases
- MUST score grammar
- MUST score structure
- COULD suggest synonyms
)";

constexpr std::string_view kLayeredRequirements = R"(# Purpose

Tracks orders.

## Functional Requirements

- MUST persist orders to storage
- MUST calculate order totals
- MUST display totals on a dashboard
)";

Recipe depot() {
    return make_recipe("depot", {"common"}, "", kDepotRequirements, kDepotDesign);
}

ComplexityConfig small_limits() {
    ComplexityConfig config;
    config.component_threshold = 2;
    config.must_threshold = 2;
    config.boundary = 0.5;
    return config;
}

std::set<std::string> requirement_ids(const std::vector<Recipe> &children) {
    std::set<std::string> ids;
    for (const auto &child : children) {
        for (const auto &req : child.requirements.requirements)
            EXPECT_TRUE(ids.insert(req.id).second) << req.id << " assigned twice";
    }
    return ids;
}

} // namespace

TEST(Complexity, SmallRecipeStaysWhole) {
    ComplexityEvaluator evaluator{ComplexityConfig{}};
    auto score = evaluator.evaluate(make_recipe("ledger"));
    EXPECT_EQ(score.components, 1u);
    EXPECT_EQ(score.musts, 1u);
    EXPECT_FALSE(score.exceeds);
    EXPECT_EQ(score.strategy, DecompositionStrategy::None);
}

TEST(Complexity, DetectsFunctionalAreas) {
    Design design;
    design.architecture_summary = "Persists data in storage and renders a dashboard behind authentication.";
    EXPECT_EQ(detect_functional_areas(design), (std::vector<std::string>{"data", "presentation", "security"}));
}

TEST(Complexity, ComponentHeavyRecipeSplitsFunctionally) {
    ComplexityEvaluator evaluator(small_limits());
    auto recipe = depot();
    auto score = evaluator.evaluate(recipe);
    EXPECT_TRUE(score.exceeds);
    EXPECT_EQ(score.strategy, DecompositionStrategy::Functional);

    auto split = evaluator.decompose(recipe, score.strategy);
    ASSERT_EQ(split.children.size(), 3u);
    EXPECT_EQ(split.children[0].name, "depot-intake");
    EXPECT_EQ(split.children[0].requirements.requirements[0].id, "req_1");
    EXPECT_EQ(split.children[1].name, "depot-router");
    EXPECT_EQ(split.children[1].requirements.requirements[0].id, "req_2");
    EXPECT_EQ(split.children[2].name, "depot-billing");
    EXPECT_EQ(split.children[2].requirements.requirements[0].id, "req_3");
    EXPECT_EQ(requirement_ids(split.children), (std::set<std::string>{"req_1", "req_2", "req_3"}));

    for (const auto &child : split.children) {
        EXPECT_EQ(child.dependencies(), (std::vector<std::string>{"common"}));
        EXPECT_EQ(child.metadata.attributes.at("parent"), "depot");
        EXPECT_FALSE(child.is_aggregate());
        EXPECT_NE(child.checksum, recipe.checksum);
    }

    EXPECT_TRUE(split.parent.is_aggregate());
    EXPECT_EQ(split.parent.dependencies(),
              (std::vector<std::string>{"common", "depot-intake", "depot-router", "depot-billing"}));
}

TEST(Complexity, MustHeavyRecipeSplitsByRisk) {
    ComplexityConfig config = small_limits();
    config.component_threshold = 5;
    ComplexityEvaluator evaluator(config);
    auto recipe = make_recipe("grader", {}, "", kManyMusts);

    auto score = evaluator.evaluate(recipe);
    EXPECT_EQ(score.strategy, DecompositionStrategy::RiskBased);

    auto split = evaluator.decompose(recipe, score.strategy);
    ASSERT_EQ(split.children.size(), 4u);
    EXPECT_EQ(split.children[0].name, "grader-core-1");
    EXPECT_EQ(split.children[0].requirements.requirements.size(), 2u);
    EXPECT_EQ(split.children[2].name, "grader-core-3");
    EXPECT_EQ(split.children[2].requirements.requirements.size(), 1u);
    EXPECT_EQ(split.children[3].name, "grader-extensions");
    EXPECT_EQ(split.children[3].dependencies(),
              (std::vector<std::string>{"grader-core-1", "grader-core-2", "grader-core-3"}));
    EXPECT_EQ(requirement_ids(split.children).size(), 6u);
}

TEST(Complexity, LayeredSplitChainsLayers) {
    ComplexityEvaluator evaluator(small_limits());
    auto recipe = make_recipe("orders", {}, "", kLayeredRequirements);
    auto split = evaluator.decompose(recipe, DecompositionStrategy::Layered);

    ASSERT_EQ(split.children.size(), 3u);
    EXPECT_EQ(split.children[0].name, "orders-data");
    EXPECT_EQ(split.children[0].requirements.requirements[0].description, "persist orders to storage");
    EXPECT_TRUE(split.children[0].dependencies().empty());
    EXPECT_EQ(split.children[1].name, "orders-logic");
    EXPECT_EQ(split.children[1].dependencies(), (std::vector<std::string>{"orders-data"}));
    EXPECT_EQ(split.children[2].name, "orders-presentation");
    EXPECT_EQ(split.children[2].dependencies(), (std::vector<std::string>{"orders-logic"}));
}

TEST(Complexity, ExpandReplacesParentWithChildren) {
    ComplexityEvaluator evaluator(small_limits());
    auto set = make_set({depot(), make_recipe("common")});
    auto expanded = evaluator.expand(set);
    ASSERT_TRUE(expanded) << expanded.error().message;

    EXPECT_EQ(expanded->size(), 5u);
    EXPECT_TRUE(expanded->at("depot").is_aggregate());
    EXPECT_TRUE(expanded->contains("depot-router"));
    EXPECT_FALSE(expanded->at("common").is_aggregate());

    // Already-split parents are not split again.
    auto again = evaluator.expand(*expanded);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->size(), 5u);
}

TEST(Complexity, DepthLimitIsFatal) {
    ComplexityConfig config = small_limits();
    config.max_depth = 0;
    ComplexityEvaluator evaluator(config);
    auto expanded = evaluator.expand(make_set({depot()}));
    ASSERT_FALSE(expanded);
    EXPECT_EQ(expanded.error().kind, ErrorKind::ComplexityExceeded);
    EXPECT_EQ(expanded.error().subjects, (std::vector<std::string>{"depot"}));
}
