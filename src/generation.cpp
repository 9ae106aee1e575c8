#include "kiln/generation.hpp"

#include "kiln/stub_scan.hpp"

#include <format>
#include <spdlog/spdlog.h>

namespace kiln {

namespace {

FailureReport failure_of(const Result<TestReport> &report) {
    if (report)
        return report->failure_report();
    return FailureReport{.summary = report.error().message, .raw_output = report.error().diagnostic};
}

std::vector<std::string> failing_names(const FailureReport &report) {
    std::vector<std::string> names;
    for (const auto &f : report.failures)
        names.push_back(f.name);
    return names;
}

} // namespace

std::string_view to_string(GenerationState state) {
    switch (state) {
    case GenerationState::NotStarted:
        return "NOT_STARTED";
    case GenerationState::TestsGenerated:
        return "TESTS_GENERATED";
    case GenerationState::TestsConfirmedFailing:
        return "TESTS_CONFIRMED_FAILING";
    case GenerationState::ImplementationGenerated:
        return "IMPLEMENTATION_GENERATED";
    case GenerationState::TestsPassing:
        return "TESTS_PASSING";
    case GenerationState::FixExhausted:
        return "FIX_EXHAUSTED";
    }
    return "NOT_STARTED";
}

ArtifactSet apply_patch(const ArtifactSet &implementation, const ArtifactSet &patch, const ArtifactSet &tests) {
    ArtifactSet allowed;
    allowed.generated_at = patch.generated_at;
    for (const auto &[path, content] : patch.files) {
        if (tests.files.contains(path) || is_test_path(path)) {
            spdlog::debug("ignoring patch to test file {}", path);
            continue;
        }
        allowed.files.emplace(path, content);
    }
    return implementation.merged_with(allowed);
}

GenerationPipeline::GenerationPipeline(GenerationOracle &oracle, QualityTools &tools, GenerationConfig config)
    : oracle_(oracle), tools_(tools), config_(config) {
}

Result<ArtifactSet> GenerationPipeline::request(const Recipe &recipe, std::string_view phase, auto &&call) {
    Error last;
    for (size_t attempt = 1; attempt <= config_.oracle_attempts; ++attempt) {
        Result<ArtifactSet> res = call();
        if (res && !res->empty())
            return res;
        last = res ? Error{.kind = ErrorKind::Generation, .message = "Oracle returned no files"} : std::move(res.error());
        spdlog::warn("{}: {} attempt {}/{} failed: {}", recipe.name, phase, attempt, config_.oracle_attempts,
                     last.message);
    }
    last.kind = ErrorKind::Generation;
    return fail(std::move(last).in_recipe(recipe.name).in_phase(std::string(phase)));
}

Result<GenerationOutcome> GenerationPipeline::run(const Recipe &recipe, GenerationState &state) {
    state = GenerationState::NotStarted;
    GenerationOutcome outcome;
    CandidateBuild &candidate = outcome.candidate;

    auto tests = request(recipe, "test_generation",
                         [&] { return oracle_.generate_tests(recipe.requirements, recipe.design); });
    if (!tests)
        return std::unexpected(tests.error());
    candidate.tests = std::move(*tests);
    state = GenerationState::TestsGenerated;
    spdlog::debug("{}: {} test file(s) generated", recipe.name, candidate.tests.files.size());

    // Red phase: the tests alone must fail.
    auto red = tools_.run_tests(recipe.name, candidate.tests);
    if (!red)
        return std::unexpected(std::move(red.error()).in_recipe(recipe.name).in_phase("red_phase"));
    if (red->passed) {
        Error err{.kind = ErrorKind::Validation,
                  .message = "Generated tests pass without an implementation and cannot drive one",
                  .recipe = recipe.name,
                  .phase = "red_phase",
                  .diagnostic = red->output};
        return fail(std::move(err));
    }
    state = GenerationState::TestsConfirmedFailing;

    auto implementation = request(recipe, "implementation_generation", [&] {
        return oracle_.generate_implementation(recipe.requirements, recipe.design, candidate.tests);
    });
    if (!implementation)
        return std::unexpected(implementation.error());
    candidate.implementation = apply_patch({}, *implementation, candidate.tests);
    state = GenerationState::ImplementationGenerated;

    // Fix loop: exactly max_fix_iterations repair requests before giving up.
    while (true) {
        auto report = tools_.run_tests(recipe.name, candidate.merged());
        if (report && report->passed)
            break;
        FailureReport failure = failure_of(report);
        if (outcome.fix_iterations == config_.max_fix_iterations) {
            state = GenerationState::FixExhausted;
            Error err{.kind = ErrorKind::TestFailure,
                      .message = std::format("Tests still failing after {} repair attempt(s): {}",
                                             outcome.fix_iterations, failure.summary),
                      .recipe = recipe.name,
                      .phase = "fix_loop",
                      .diagnostic = failure.raw_output,
                      .subjects = failing_names(failure)};
            return fail(std::move(err));
        }
        ++outcome.fix_iterations;
        spdlog::info("{}: repair {}/{} ({})", recipe.name, outcome.fix_iterations, config_.max_fix_iterations,
                     failure.summary);
        auto patch = oracle_.repair(candidate.merged(), failure);
        if (!patch) {
            spdlog::warn("{}: repair request failed: {}", recipe.name, patch.error().message);
            continue;
        }
        candidate.implementation = apply_patch(candidate.implementation, *patch, candidate.tests);
    }

    // Stub scan: bounded remediation, each accepted only if the tests stay green.
    while (true) {
        auto markers = scan_for_stubs(candidate.implementation);
        if (markers.empty())
            break;
        if (outcome.stub_remediations == config_.max_stub_remediations) {
            std::vector<std::string> where;
            for (const auto &m : markers)
                where.push_back(std::format("{}:{} {}", m.path, m.line, m.marker));
            Error err{.kind = ErrorKind::Validation,
                      .message = std::format("{} unfinished-work marker(s) remain after {} remediation(s)",
                                             markers.size(), outcome.stub_remediations),
                      .recipe = recipe.name,
                      .phase = "stub_scan",
                      .subjects = std::move(where)};
            return fail(std::move(err));
        }
        ++outcome.stub_remediations;
        auto patch = oracle_.repair(candidate.merged(), stub_failure_report(markers));
        if (!patch) {
            spdlog::warn("{}: stub remediation request failed: {}", recipe.name, patch.error().message);
            continue;
        }
        CandidateBuild next = candidate;
        next.implementation = apply_patch(candidate.implementation, *patch, candidate.tests);
        auto report = tools_.run_tests(recipe.name, next.merged());
        if (!report || !report->passed) {
            spdlog::warn("{}: stub remediation broke the tests; discarded", recipe.name);
            continue;
        }
        candidate = std::move(next);
    }

    state = GenerationState::TestsPassing;
    return outcome;
}

} // namespace kiln
