#include "kiln/review.hpp"

#include "kiln/generation.hpp"
#include "kiln/stub_scan.hpp"

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace kiln {

ReviewPipeline::ReviewPipeline(GenerationOracle &oracle, ReviewConfig config) : oracle_(oracle), config_(config) {
}

Result<ReviewOutcome> ReviewPipeline::run(const Recipe &recipe, CandidateBuild candidate) {
    ReviewOutcome outcome;

    auto review_error = [&](std::string message, std::vector<std::string> subjects, std::string diagnostic = {}) {
        Error err{.kind = ErrorKind::Review,
                  .message = std::move(message),
                  .recipe = recipe.name,
                  .phase = "review",
                  .diagnostic = std::move(diagnostic),
                  .subjects = std::move(subjects)};
        return fail(std::move(err));
    };

    while (true) {
        auto report = oracle_.review(candidate.merged(), recipe.requirements);
        if (!report) {
            // A failed review call uses up a revision slot.
            if (outcome.revisions == config_.max_review_iterations) {
                return review_error(std::format("Review request failed: {}", report.error().message), {},
                                    report.error().diagnostic);
            }
            ++outcome.revisions;
            spdlog::warn("{}: review request failed: {}", recipe.name, report.error().message);
            continue;
        }

        for (auto &suggestion : report->suggestions()) {
            auto same = [&](const ReviewFinding &f) {
                return f.location == suggestion.location && f.message == suggestion.message;
            };
            if (std::ranges::none_of(outcome.suggestions, same))
                outcome.suggestions.push_back(std::move(suggestion));
        }

        auto critical = report->critical();
        // Revisions must not reintroduce unfinished work.
        for (auto &m : scan_for_stubs(candidate.implementation)) {
            critical.push_back(ReviewFinding{.severity = Severity::Critical,
                                             .location = std::format("{}:{}", m.path, m.line),
                                             .message = std::move(m.marker)});
        }
        if (critical.empty())
            break;

        if (outcome.revisions == config_.max_review_iterations) {
            std::vector<std::string> messages;
            for (const auto &f : critical)
                messages.push_back(f.location.empty() ? f.message : std::format("{}: {}", f.location, f.message));
            return review_error(std::format("{} critical finding(s) remain after {} revision(s)", critical.size(),
                                            outcome.revisions),
                                std::move(messages));
        }
        ++outcome.revisions;
        spdlog::info("{}: revision {}/{} for {} critical finding(s)", recipe.name, outcome.revisions,
                     config_.max_review_iterations, critical.size());
        auto revised = oracle_.revise_for_review(candidate.merged(), critical);
        if (!revised) {
            spdlog::warn("{}: revision request failed: {}", recipe.name, revised.error().message);
            continue;
        }
        candidate.implementation = apply_patch(candidate.implementation, *revised, candidate.tests);
    }

    outcome.candidate = std::move(candidate);
    return outcome;
}

} // namespace kiln
