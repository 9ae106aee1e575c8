#include "fakes.hpp"

#include "kiln/stub_scan.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::testing;

TEST(StubScan, CleanImplementationHasNoMarkers) {
    EXPECT_TRUE(scan_for_stubs(files({{"src/impl.txt", "implements req_1\n"}})).empty());
}

TEST(StubScan, FlagsUnfinishedWork) {
    constexpr std::string_view source = "def record(widget):\n"
                                        "    pass\n"
                                        "# FIXME later\n"
                                        "raise NotImplementedError\n"
                                        "todo: lowercase notes are prose\n"
                                        "int count() const {}\n"
                                        "auto total = compute();\n";
    auto markers = scan_for_stubs(files({{"src/ledger.py", std::string(source)}}));
    ASSERT_EQ(markers.size(), 4u);
    EXPECT_EQ(markers[0].line, 2u);
    EXPECT_EQ(markers[0].marker, "empty body 'pass'");
    EXPECT_EQ(markers[1].line, 3u);
    EXPECT_EQ(markers[1].marker, "FIXME");
    EXPECT_EQ(markers[2].line, 4u);
    EXPECT_EQ(markers[2].marker, "not implemented");
    EXPECT_EQ(markers[3].line, 6u);
    EXPECT_EQ(markers[3].marker, "empty function body");
    EXPECT_EQ(markers[3].path, "src/ledger.py");
}

TEST(StubScan, TestFilesAreIgnored) {
    auto markers = scan_for_stubs(files({{"tests/test_ledger.py", "# TODO more cases\n"},
                                         {"src/ledger_test.cc", "TEST(Ledger, Empty) {}\n"},
                                         {"src/ledger.py", "..."}}));
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0].path, "src/ledger.py");
}

TEST(StubScan, FailureReportNamesEachLocation) {
    auto report = stub_failure_report({{"src/a.py", 3, "TODO"}, {"src/b.py", 1, "not implemented"}});
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].name, "src/a.py:3");
    EXPECT_EQ(report.failures[1].message, "not implemented");
    EXPECT_EQ(report.raw_output, "src/a.py:3: TODO\nsrc/b.py:1: not implemented\n");
}
