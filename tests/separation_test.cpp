#include "fakes.hpp"

#include "kiln/separation.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::testing;

namespace {

constexpr std::string_view kLeakyRequirements = R"(# Purpose

Keeps sessions alive.

## Functional Requirements

- MUST store sessions in Redis
- MUST call `connect()` before use
)";

constexpr std::string_view kLeakyDesign = R"(# Architecture Overview

The cache MUST expire entries. Callers should batch lookups.

## Components

### Cache

Holds sessions.

```
void expire(); // MUST run hourly
```
)";

constexpr std::string_view kCleanRequirements = R"(# Purpose

Keeps sessions alive.

## Functional Requirements

- MUST keep each session available until it expires
- MUST refuse use of a session before it is opened
)";

constexpr std::string_view kCleanDesign = R"(# Architecture Overview

An in-memory cache expires entries hourly.

## Components

### Cache

Holds sessions.
)";

Recipe leaky() {
    return make_recipe("sessions", {}, "", kLeakyRequirements, kLeakyDesign);
}

SeparationConfig with_policy(SeparationPolicy policy) {
    SeparationConfig config;
    config.policy = policy;
    return config;
}

} // namespace

TEST(Separation, CleanRecipeHasNoViolations) {
    SeparationValidator validator{SeparationConfig{}};
    EXPECT_TRUE(validator.check(make_recipe("ledger")).clean());
}

TEST(Separation, FindsLeaksInBothDirections) {
    SeparationValidator validator{SeparationConfig{}};
    auto report = validator.check(leaky());
    ASSERT_EQ(report.violations.size(), 3u);

    EXPECT_EQ(report.violations[0].artifact, "requirements");
    EXPECT_EQ(report.violations[0].line, 7u);
    EXPECT_EQ(report.violations[0].phrase, "redis");

    EXPECT_EQ(report.violations[1].artifact, "requirements");
    EXPECT_EQ(report.violations[1].line, 8u);
    EXPECT_EQ(report.violations[1].phrase, "connect()");

    EXPECT_EQ(report.violations[2].artifact, "design");
    EXPECT_EQ(report.violations[2].line, 3u);
    EXPECT_EQ(report.violations[2].phrase, "must");
}

TEST(Separation, ReportPolicyKeepsTheRecipe) {
    SeparationValidator validator(with_policy(SeparationPolicy::Report));
    auto recipe = leaky();
    auto res = validator.enforce(recipe, nullptr);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res->checksum, recipe.checksum);
}

TEST(Separation, FailPolicyRaisesValidationError) {
    SeparationValidator validator(with_policy(SeparationPolicy::Fail));
    auto res = validator.enforce(leaky(), nullptr);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Validation);
    EXPECT_EQ(res.error().phase, "separation");
    EXPECT_EQ(res.error().recipe, "sessions");
    EXPECT_EQ(res.error().subjects.front(), "requirements:7: redis");
}

TEST(Separation, AutoApplyNeedsAnOracle) {
    SeparationValidator validator(with_policy(SeparationPolicy::AutoApply));
    auto res = validator.enforce(leaky(), nullptr);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Validation);
}

TEST(Separation, AutoApplyProducesACorrectedRecipe) {
    SeparationValidator validator(with_policy(SeparationPolicy::AutoApply));
    ScriptedOracle oracle;
    oracle.correction = SeparationCorrection{std::string(kCleanRequirements), std::string(kCleanDesign)};

    auto original = leaky();
    auto res = validator.enforce(original, &oracle);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(oracle.correction_calls.load(), 1);
    EXPECT_EQ(res->name, "sessions");
    EXPECT_NE(res->checksum, original.checksum);
    EXPECT_EQ(res->requirements.requirements[0].description, "keep each session available until it expires");
    EXPECT_TRUE(validator.check(*res).clean());
    // The input value is untouched.
    EXPECT_FALSE(validator.check(original).clean());
}

TEST(Separation, CorrectionThatStillLeaksIsRejected) {
    SeparationValidator validator(with_policy(SeparationPolicy::AutoApply));
    ScriptedOracle oracle;
    oracle.correction = SeparationCorrection{std::string(kCleanRequirements), std::string(kLeakyDesign)};

    auto res = validator.enforce(leaky(), &oracle);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Validation);
    EXPECT_EQ(res.error().subjects, (std::vector<std::string>{"design:3: must"}));
}

TEST(Separation, OracleFailureCarriesRecipeContext) {
    SeparationValidator validator(with_policy(SeparationPolicy::AutoApply));
    ScriptedOracle oracle;
    auto res = validator.enforce(leaky(), &oracle);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Generation);
    EXPECT_EQ(res.error().recipe, "sessions");
    EXPECT_EQ(res.error().phase, "separation");
}
