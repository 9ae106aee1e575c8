#include "kiln/quality.hpp"

#include "kiln/artifacts.hpp"
#include "kiln/process_exec.hpp"

#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kiln {

namespace {

std::unexpected<Error> gate_failure(std::string_view gate, std::string message, std::string output) {
    Error err{.kind = ErrorKind::QualityGate,
              .message = std::move(message),
              .phase = std::string(gate),
              .diagnostic = std::move(output)};
    return fail(std::move(err));
}

std::unexpected<Error> gate_error(std::string_view gate, Error cause) {
    cause.kind = ErrorKind::QualityGate;
    cause.phase = std::string(gate);
    cause.message = std::format("Gate '{}' could not run: {}", gate, cause.message);
    return fail(std::move(cause));
}

Result<ProcessOutput> run_in(const std::vector<std::string> &command, const fs::path &dir,
                             std::chrono::seconds timeout) {
    auto args = expand_placeholders(command, {{"workdir", dir.string()}});
    return process_exec(std::move(args), {.working_dir = dir.string(), .timeout = timeout});
}

// Ill-typed fields read as empty.
std::string text_field(const json &entry, const char *key) {
    auto it = entry.find(key);
    return it != entry.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

bool passed_field(const json &entry) {
    if (auto it = entry.find("passed"); it != entry.end())
        return it->is_boolean() && it->get<bool>();
    return to_lower(text_field(entry, "outcome")) == "passed";
}

} // namespace

FailureReport TestReport::failure_report() const {
    FailureReport report;
    report.raw_output = output;
    for (const auto &c : cases) {
        if (!c.passed)
            report.failures.push_back(c);
    }
    report.summary = report.failures.empty() ? std::string("test run failed")
                                             : std::format("{} of {} tests failed", report.failures.size(), cases.size());
    return report;
}

TestReport parse_test_output(std::string_view out, int exit_code) {
    TestReport report;
    report.output = std::string(out);
    report.passed = exit_code == 0;

    const auto lines = split_lines(out);
    std::string_view last;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!trim(*it).empty()) {
            last = trim(*it);
            break;
        }
    }
    if (!last.starts_with('{'))
        return report;

    json doc;
    try {
        doc = json::parse(last);
    } catch (const json::parse_error &e) {
        spdlog::debug("test runner output is not a JSON report: {}", e.what());
        return report;
    }
    if (!doc.is_object())
        return report;

    if (auto it = doc.find("tests"); it != doc.end() && it->is_array()) {
        for (const auto &entry : *it) {
            if (!entry.is_object())
                continue;
            TestCaseResult result;
            result.name = text_field(entry, "name");
            result.passed = passed_field(entry);
            result.message = text_field(entry, "message");
            report.cases.push_back(std::move(result));
        }
    }
    if (auto it = doc.find("coverage"); it != doc.end() && it->is_number())
        report.coverage = it->get<double>();

    report.passed = report.passed && std::ranges::all_of(report.cases, &TestCaseResult::passed);
    return report;
}

CommandQualityTools::CommandQualityTools(QualityConfig config) : config_(std::move(config)) {
}

Result<fs::path> CommandQualityTools::stage(std::string_view recipe, const ArtifactSet &artifacts) const {
    const fs::path dir = config_.work_dir / recipe;
    if (auto res = remove_tree(dir); !res)
        return std::unexpected(res.error());
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        return fail(ErrorKind::Io, std::format("Failed to create {}: {}", dir.string(), ec.message()));
    if (auto res = write_artifacts(dir, artifacts); !res)
        return std::unexpected(res.error());
    return dir;
}

Result<ToolReport> CommandQualityTools::type_check(std::string_view recipe, const ArtifactSet &artifacts) {
    if (config_.type_check_command.empty())
        return ToolReport{.passed = true, .output = "type check not configured"};
    auto dir = stage(recipe, artifacts);
    if (!dir)
        return std::unexpected(dir.error());
    auto out = run_in(config_.type_check_command, *dir, config_.timeout);
    if (!out)
        return std::unexpected(out.error());
    return ToolReport{.passed = out->exit_code == 0, .output = out->out + out->err};
}

Result<LintReport> CommandQualityTools::lint(std::string_view recipe, const ArtifactSet &artifacts) {
    if (config_.lint_command.empty())
        return LintReport{.passed = true, .artifacts = artifacts, .output = "lint not configured"};
    auto dir = stage(recipe, artifacts);
    if (!dir)
        return std::unexpected(dir.error());
    auto out = run_in(config_.lint_command, *dir, config_.timeout);
    if (!out)
        return std::unexpected(out.error());
    auto fixed = read_artifacts(*dir);
    if (!fixed)
        return std::unexpected(fixed.error());
    // Only files the linter was given count; caches and reports it leaves behind do not.
    ArtifactSet normalized;
    normalized.generated_at = artifacts.generated_at;
    for (const auto &[path, content] : artifacts.files) {
        auto it = fixed->files.find(path);
        normalized.files.emplace(path, it == fixed->files.end() ? content : it->second);
    }
    return LintReport{.passed = out->exit_code == 0, .artifacts = std::move(normalized), .output = out->out + out->err};
}

Result<TestReport> CommandQualityTools::run_tests(std::string_view recipe, const ArtifactSet &artifacts) {
    if (config_.test_command.empty())
        return fail(ErrorKind::Config, "No test runner configured (quality.test)");
    auto dir = stage(recipe, artifacts);
    if (!dir)
        return std::unexpected(dir.error());
    auto out = run_in(config_.test_command, *dir, config_.timeout);
    if (!out)
        return std::unexpected(out.error());
    TestReport report = parse_test_output(out->out, out->exit_code);
    if (!out->err.empty())
        report.output += out->err;
    return report;
}

QualityGateRunner::QualityGateRunner(QualityTools &tools, QualityConfig config)
    : tools_(tools), config_(std::move(config)) {
}

Result<QualityResult> QualityGateRunner::run(std::string_view recipe, const ArtifactSet &artifacts) {
    auto types = tools_.type_check(recipe, artifacts);
    if (!types)
        return gate_error("type_check", std::move(types.error()));
    if (!types->passed)
        return gate_failure("type_check", "Static type verification reported errors", std::move(types->output));
    spdlog::debug("{}: type check passed", recipe);

    auto lint = tools_.lint(recipe, artifacts);
    if (!lint)
        return gate_error("lint", std::move(lint.error()));
    if (!lint->passed)
        return gate_failure("lint", "Lint issues remain after auto-fix", std::move(lint->output));
    spdlog::debug("{}: lint passed", recipe);

    QualityResult result;
    result.artifacts = std::move(lint->artifacts);

    auto tests = tools_.run_tests(recipe, result.artifacts);
    if (!tests)
        return gate_error("tests", std::move(tests.error()));
    if (!tests->passed)
        return gate_failure("tests", tests->failure_report().summary, std::move(tests->output));

    if (config_.min_coverage > 0.0) {
        if (!tests->coverage)
            return gate_failure("coverage", "Coverage was not measured", std::move(tests->output));
        if (*tests->coverage < config_.min_coverage) {
            return gate_failure("coverage",
                                std::format("Coverage {:.1f}% is below the minimum of {:.1f}%", *tests->coverage,
                                            config_.min_coverage),
                                std::move(tests->output));
        }
    }
    spdlog::debug("{}: tests and coverage passed", recipe);
    result.tests = std::move(*tests);
    return result;
}

} // namespace kiln
