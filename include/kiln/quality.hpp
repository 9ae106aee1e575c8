#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

struct ToolReport {
    bool passed = false;
    std::string output;
};

struct LintReport {
    bool passed = false;
    ArtifactSet artifacts; ///< The input with auto-fixes applied.
    std::string output;
};

struct TestReport {
    bool passed = false;
    std::vector<TestCaseResult> cases;
    std::optional<double> coverage; ///< Percent; empty when the runner did not measure it.
    std::string output;

    FailureReport failure_report() const;
};

/**
 * @brief The type checker, linter and test runner run at each gate.
 *
 * An error result means the tool could not be run (or missed its deadline); a report with
 * `passed == false` means it ran and found problems. `recipe` scopes any scratch state so calls for
 * different recipes can run concurrently.
 */
class QualityTools {
public:
    virtual ~QualityTools() = default;

    virtual Result<ToolReport> type_check(std::string_view recipe, const ArtifactSet &artifacts) = 0;
    virtual Result<LintReport> lint(std::string_view recipe, const ArtifactSet &artifacts) = 0;
    virtual Result<TestReport> run_tests(std::string_view recipe, const ArtifactSet &artifacts) = 0;
};

/**
 * @brief Runs configured commands inside `<work_dir>/<recipe>`.
 *
 * Arguments may use `{workdir}`. The test runner may print a JSON report
 * (`{"tests": [{"name", "passed", "message"}], "coverage": 87.5}`) as its last stdout line;
 * without one, the exit code decides and coverage counts as unmeasured.
 */
class CommandQualityTools final : public QualityTools {
public:
    explicit CommandQualityTools(QualityConfig config);

    Result<ToolReport> type_check(std::string_view recipe, const ArtifactSet &artifacts) override;
    Result<LintReport> lint(std::string_view recipe, const ArtifactSet &artifacts) override;
    Result<TestReport> run_tests(std::string_view recipe, const ArtifactSet &artifacts) override;

private:
    Result<std::filesystem::path> stage(std::string_view recipe, const ArtifactSet &artifacts) const;

    QualityConfig config_;
};

/** @brief Parses a test runner's stdout; see CommandQualityTools. */
TestReport parse_test_output(std::string_view out, int exit_code);

/** @brief Outcome of the four gates. */
struct QualityResult {
    ArtifactSet artifacts; ///< After lint auto-fixes.
    TestReport tests;
};

/**
 * @brief Type check, lint, test execution and coverage, in that order; all must pass.
 *
 * A failure is a `QualityGate` error whose phase names the gate and whose diagnostic holds the raw
 * tool output.
 */
class QualityGateRunner {
public:
    QualityGateRunner(QualityTools &tools, QualityConfig config);

    Result<QualityResult> run(std::string_view recipe, const ArtifactSet &artifacts);

private:
    QualityTools &tools_;
    QualityConfig config_;
};

} // namespace kiln
