#include "kiln/error.hpp"
#include "kiln/process_exec.hpp"
#include "kiln/utility.hpp"

#include <format>
#include <gtest/gtest.h>

using namespace kiln;

TEST(Utility, Fnv1aIsChainable) {
    EXPECT_EQ(fnv1a(""), 14695981039346656037ULL);
    EXPECT_EQ(fnv1a("ab"), fnv1a("b", fnv1a("a")));
    EXPECT_EQ(to_hex(0xabcULL), "0000000000000abc");
}

TEST(Utility, ContainsWordRespectsBoundaries) {
    EXPECT_TRUE(contains_word("Stored in Redis today", "redis"));
    EXPECT_FALSE(contains_word("predisposed", "redis"));
    EXPECT_TRUE(contains_word("uses a REST API here", "rest api"));
    EXPECT_FALSE(contains_word("must be fast", "MUST", false));
    EXPECT_TRUE(contains_word("It MUST be fast", "MUST", false));
}

TEST(Utility, SignificantKeywordsDropStopwordsAndShortWords) {
    EXPECT_EQ(significant_keywords("The system must record every widget and its owner, widget first"),
              (std::vector<std::string>{"record", "widget", "owner", "first"}));
    EXPECT_EQ(significant_keywords("record every widget owner", 2), (std::vector<std::string>{"record", "widget"}));
}

TEST(Utility, TextHelpers) {
    EXPECT_EQ(trim("  x y \t"), "x y");
    EXPECT_EQ(slugify("Dependency Resolver (v2)"), "dependency-resolver-v2");
    EXPECT_EQ(split_lines("a\r\nb\n\nc"), (std::vector<std::string_view>{"a", "b", "", "c"}));
    EXPECT_EQ(split_words("  one two\tthree "), (std::vector<std::string_view>{"one", "two", "three"}));
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
}

TEST(Utility, ErrorFormattingCarriesContext) {
    Error err{.kind = ErrorKind::Compliance,
              .message = "2 MUST requirement(s) lack evidence",
              .recipe = "ledger",
              .phase = "compliance",
              .subjects = {"req_1", "req_3"}};
    EXPECT_EQ(std::format("{}", err),
              "ComplianceError: 2 MUST requirement(s) lack evidence [recipe=ledger phase=compliance] (req_1, req_3)");
    EXPECT_EQ(exit_code(ErrorKind::Compliance), 3);
    EXPECT_EQ(exit_code(ErrorKind::CircularDependency), 2);
    EXPECT_EQ(exit_code(ErrorKind::Io), 1);
    EXPECT_FALSE(is_structural(ErrorKind::TestFailure));
}

TEST(Utility, ContextIsOnlyFilledOnce) {
    Error err{.kind = ErrorKind::Generation, .message = "timeout", .phase = "repair"};
    err.in_recipe("a").in_recipe("b").in_phase("other");
    EXPECT_EQ(err.recipe, "a");
    EXPECT_EQ(err.phase, "repair");
}

TEST(Utility, ExpandsPlaceholders) {
    auto args = expand_placeholders({"gen", "--out={output}", "{recipe}", "{unknown}"},
                                    {{"output", "/tmp/next"}, {"recipe", "kiln"}});
    EXPECT_EQ(args, (std::vector<std::string>{"gen", "--out=/tmp/next", "kiln", "{unknown}"}));
}
