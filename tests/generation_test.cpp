#include "fakes.hpp"

#include "kiln/generation.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::testing;

namespace {

struct GenerationFixture : ::testing::Test {
    ScriptedOracle oracle;
    FakeQualityTools tools;
    GenerationConfig config;
    Recipe recipe = make_recipe("ledger");
    GenerationState state = GenerationState::NotStarted;

    Result<GenerationOutcome> run() {
        GenerationPipeline pipeline(oracle, tools, config);
        return pipeline.run(recipe, state);
    }
};

} // namespace

TEST_F(GenerationFixture, TestFirstHappyPath) {
    auto res = run();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(state, GenerationState::TestsPassing);
    EXPECT_EQ(res->fix_iterations, 0u);
    EXPECT_EQ(res->stub_remediations, 0u);
    EXPECT_EQ(res->candidate.tests.files.at("tests/test_widgets.txt"), "checks req_1\nchecks req_2\n");
    EXPECT_EQ(res->candidate.implementation.files.at("src/impl.txt"), "implements req_1\nimplements req_2\n");
    // Red phase, then the first green check.
    EXPECT_EQ(tools.test_runs.load(), 2);
    EXPECT_EQ(oracle.test_calls.load(), 1);
    EXPECT_EQ(oracle.implementation_calls.load(), 1);
}

TEST_F(GenerationFixture, TestsThatPassAloneAreRejected) {
    tools.tests_pass = [](std::string_view, const ArtifactSet &) { return true; };
    auto res = run();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Validation);
    EXPECT_EQ(res.error().phase, "red_phase");
    EXPECT_EQ(res.error().recipe, "ledger");
    EXPECT_EQ(state, GenerationState::TestsGenerated);
    EXPECT_EQ(oracle.implementation_calls.load(), 0);
}

TEST_F(GenerationFixture, RepairMakesTestsPass) {
    oracle.implementations.push_back(files({{"src/impl.txt", "BROKEN"}}));
    auto res = run();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res->fix_iterations, 1u);
    EXPECT_EQ(oracle.repair_calls.load(), 1);
    EXPECT_EQ(res->candidate.implementation.files.at("src/impl.txt"), "implements req_1\nimplements req_2\n");
}

TEST_F(GenerationFixture, FixLoopStopsAfterConfiguredRepairs) {
    config.max_fix_iterations = 2;
    tools.failing_recipes.insert("ledger");
    auto res = run();
    ASSERT_FALSE(res);
    EXPECT_EQ(state, GenerationState::FixExhausted);
    EXPECT_EQ(oracle.repair_calls.load(), 2);
    EXPECT_EQ(res.error().kind, ErrorKind::TestFailure);
    EXPECT_EQ(res.error().phase, "fix_loop");
    EXPECT_EQ(res.error().subjects, (std::vector<std::string>{"test_widgets"}));
    EXPECT_EQ(res.error().diagnostic, "1 failed");
}

TEST_F(GenerationFixture, FailedRepairCallCountsAgainstTheBudget) {
    config.max_fix_iterations = 1;
    oracle.implementations.push_back(files({{"src/impl.txt", "BROKEN"}}));
    oracle.repairs.push_back(fail(ErrorKind::Generation, "oracle timed out"));
    auto res = run();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::TestFailure);
    EXPECT_EQ(oracle.repair_calls.load(), 1);
}

TEST_F(GenerationFixture, OracleFailuresAreRetried) {
    oracle.tests.push_back(fail(ErrorKind::Generation, "oracle timed out"));
    auto res = run();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(oracle.test_calls.load(), 2);
}

TEST_F(GenerationFixture, EmptyResponsesExhaustAttempts) {
    oracle.tests.push_back(ArtifactSet{});
    oracle.tests.push_back(ArtifactSet{});
    auto res = run();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Generation);
    EXPECT_EQ(res.error().phase, "test_generation");
    EXPECT_EQ(state, GenerationState::NotStarted);
}

TEST_F(GenerationFixture, StubsAreRemediated) {
    oracle.implementations.push_back(
        files({{"src/impl.txt", "implements req_1\nimplements req_2\n# TODO finish\n"}}));
    auto res = run();
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res->fix_iterations, 0u);
    EXPECT_EQ(res->stub_remediations, 1u);
    EXPECT_EQ(res->candidate.implementation.files.at("src/impl.txt").find("TODO"), std::string::npos);
}

TEST_F(GenerationFixture, RemediationThatBreaksTestsIsDiscarded) {
    oracle.implementations.push_back(
        files({{"src/impl.txt", "implements req_1\nimplements req_2\n# TODO finish\n"}}));
    oracle.repairs.push_back(files({{"src/impl.txt", "BROKEN"}}));
    oracle.repairs.push_back(files({{"src/impl.txt", "BROKEN"}}));
    auto res = run();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Validation);
    EXPECT_EQ(res.error().phase, "stub_scan");
    EXPECT_EQ(res.error().subjects, (std::vector<std::string>{"src/impl.txt:3 TODO"}));
    EXPECT_EQ(oracle.repair_calls.load(), 2);
}

TEST(ApplyPatch, TestFilesAreNeverRewritten) {
    auto implementation = files({{"src/a.txt", "1"}, {"src/b.txt", "keep"}});
    auto tests = files({{"fixtures/expected.txt", "contract"}});
    auto patch = files({{"src/a.txt", "2"}, {"tests/test_a.txt", "hacked"}, {"fixtures/expected.txt", "hacked"}});

    auto merged = apply_patch(implementation, patch, tests);
    EXPECT_EQ(merged.files, (std::map<std::string, std::string>{{"src/a.txt", "2"}, {"src/b.txt", "keep"}}));
}

TEST(GenerationStateNames, MatchTheStateMachine) {
    EXPECT_EQ(to_string(GenerationState::TestsConfirmedFailing), "TESTS_CONFIRMED_FAILING");
    EXPECT_EQ(to_string(GenerationState::FixExhausted), "FIX_EXHAUSTED");
}
