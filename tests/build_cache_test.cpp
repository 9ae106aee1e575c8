#include "fakes.hpp"

#include "kiln/build_cache.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::testing;

TEST(BuildCache, UnrecordedRecipeNeedsRebuild) {
    BuildCache cache;
    auto a = make_recipe("a");
    EXPECT_TRUE(cache.needs_rebuild(a, make_set({a})));
}

TEST(BuildCache, SuccessfulUnchangedRecipeIsSkipped) {
    BuildCache cache;
    auto a = make_recipe("a");
    auto set = make_set({a});
    ASSERT_TRUE(cache.record(a, BuildOutcome::Success));
    EXPECT_FALSE(cache.needs_rebuild(a, set));
    EXPECT_TRUE(cache.needs_rebuild(a, set, true));
}

TEST(BuildCache, FailedRecipeIsRetried) {
    BuildCache cache;
    auto a = make_recipe("a");
    ASSERT_TRUE(cache.record(a, BuildOutcome::Failure, {}, {"TestFailureError: boom"}));
    EXPECT_TRUE(cache.needs_rebuild(a, make_set({a})));
    EXPECT_EQ(cache.last_build("a")->errors, (std::vector<std::string>{"TestFailureError: boom"}));
}

TEST(BuildCache, ChangedTextInvalidatesTransitiveDependents) {
    BuildCache cache;
    auto a = make_recipe("a");
    auto b = make_recipe("b", {"a"});
    auto c = make_recipe("c", {"b"});
    for (const auto &r : {a, b, c})
        ASSERT_TRUE(cache.record(r, BuildOutcome::Success));

    auto set = make_set({a, b, c});
    EXPECT_FALSE(cache.needs_rebuild(c, set));

    auto edited = make_recipe("a", {}, "edited");
    ASSERT_NE(edited.checksum, a.checksum);
    auto changed = make_set({edited, b, c});
    EXPECT_TRUE(cache.needs_rebuild(edited, changed));
    EXPECT_TRUE(cache.needs_rebuild(b, changed));
    EXPECT_TRUE(cache.needs_rebuild(c, changed));
}

TEST(BuildCache, RebuiltDependencyFlagsDependentsChanged) {
    BuildCache cache;
    auto a = make_recipe("a");
    auto b = make_recipe("b", {"a"});
    auto set = make_set({a, b});
    ASSERT_TRUE(cache.record(a, BuildOutcome::Success));
    ASSERT_TRUE(cache.record(b, BuildOutcome::Success));

    ASSERT_TRUE(cache.record(a, BuildOutcome::Success));
    EXPECT_FALSE(cache.needs_rebuild(a, set));
    EXPECT_TRUE(cache.needs_rebuild(b, set));

    ASSERT_TRUE(cache.record(b, BuildOutcome::Success));
    EXPECT_FALSE(cache.needs_rebuild(b, set));
}

TEST(BuildCache, PersistsAcrossInstances) {
    TempDir tmp;
    auto a = make_recipe("a");
    auto b = make_recipe("b", {"a"});
    {
        BuildCache cache(tmp.path());
        ASSERT_TRUE(cache.load());
        ASSERT_TRUE(cache.record(a, BuildOutcome::Success, {"out/a/src/impl.txt"}));
        ASSERT_TRUE(cache.record(b, BuildOutcome::Failure));
    }
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "state.json"));

    BuildCache reloaded(tmp.path());
    ASSERT_TRUE(reloaded.load());
    auto record = reloaded.last_build("a");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->last_checksum, a.checksum);
    EXPECT_EQ(record->outcome, BuildOutcome::Success);
    EXPECT_EQ(record->outputs, (std::vector<std::string>{"out/a/src/impl.txt"}));
    EXPECT_FALSE(reloaded.needs_rebuild(a, make_set({a, b})));
    EXPECT_TRUE(reloaded.needs_rebuild(b, make_set({a, b})));

    auto stats = reloaded.statistics();
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.successful, 1u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.recipes, (std::vector<std::string>{"a", "b"}));
}

TEST(BuildCache, PersistsErrorsQuotingInvalidUtf8) {
    TempDir tmp;
    auto a = make_recipe("a");
    {
        BuildCache cache(tmp.path());
        ASSERT_TRUE(cache.record(a, BuildOutcome::Failure, {}, {"TestFailureError: got b'\xff'"}));
    }
    BuildCache reloaded(tmp.path());
    ASSERT_TRUE(reloaded.load());
    auto record = reloaded.last_build("a");
    ASSERT_TRUE(record);
    ASSERT_EQ(record->errors.size(), 1u);
    EXPECT_TRUE(record->errors[0].starts_with("TestFailureError: got b'"));
    EXPECT_EQ(record->errors[0].find('\xff'), std::string::npos);
}

TEST(BuildCache, CorruptStateIsAnError) {
    TempDir tmp;
    std::ofstream(tmp.path() / "state.json") << "{\"records\": 4";
    BuildCache cache(tmp.path());
    auto res = cache.load();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Io);
}

TEST(BuildCache, ClearRemovesRecordsExplicitly) {
    BuildCache cache;
    auto a = make_recipe("a");
    auto b = make_recipe("b");
    ASSERT_TRUE(cache.record(a, BuildOutcome::Success));
    ASSERT_TRUE(cache.record(b, BuildOutcome::Success));

    ASSERT_TRUE(cache.clear("a"));
    EXPECT_FALSE(cache.last_build("a"));
    EXPECT_TRUE(cache.last_build("b"));

    auto missing = cache.clear("a");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::Io);

    ASSERT_TRUE(cache.clear());
    EXPECT_EQ(cache.statistics().total, 0u);
}
