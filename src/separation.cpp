#include "kiln/separation.hpp"

#include "kiln/recipe_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <iterator>
#include <spdlog/spdlog.h>

namespace kiln {

namespace {

std::string to_upper(std::string_view sv) {
    std::string out(sv);
    for (char &c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool is_priority_term(std::string_view term) {
    const std::string t = to_lower(term);
    return t == "must" || t == "should" || t == "could";
}

// Backticked calls such as `connect()` name a specific integration.
std::vector<std::string> integration_calls(std::string_view line) {
    std::vector<std::string> calls;
    size_t open = line.find('`');
    while (open != std::string_view::npos) {
        size_t close = line.find('`', open + 1);
        if (close == std::string_view::npos)
            break;
        std::string_view inner = line.substr(open + 1, close - open - 1);
        size_t paren = inner.find('(');
        if (paren != std::string_view::npos && paren > 0 && inner.ends_with(')'))
            calls.emplace_back(inner);
        open = line.find('`', close + 1);
    }
    return calls;
}

std::string describe(const SeparationViolation &v) {
    return std::format("{}:{}: {}", v.artifact, v.line, v.phrase);
}

} // namespace

SeparationValidator::SeparationValidator(SeparationConfig config) : config_(std::move(config)) {
}

SeparationReport SeparationValidator::check(const Recipe &recipe) const {
    SeparationReport report;

    const auto req_lines = split_lines(recipe.requirements.source);
    for (size_t i = 0; i < req_lines.size(); ++i) {
        const std::string_view line = req_lines[i];
        if (trim(line).starts_with('#'))
            continue;
        for (const auto &term : config_.technology_terms) {
            if (contains_word(line, term))
                report.violations.push_back({"requirements", i + 1, term, std::string(trim(line))});
        }
        for (auto &call : integration_calls(line))
            report.violations.push_back({"requirements", i + 1, std::move(call), std::string(trim(line))});
    }

    const auto design_lines = split_lines(recipe.design.source);
    bool in_fence = false;
    for (size_t i = 0; i < design_lines.size(); ++i) {
        const std::string_view line = design_lines[i];
        if (trim(line).starts_with("```")) {
            in_fence = !in_fence;
            continue;
        }
        if (in_fence)
            continue;
        for (const auto &term : config_.requirement_terms) {
            // Priority markers only count in their uppercase form; "should" in prose is fine.
            bool hit = is_priority_term(term) ? contains_word(line, to_upper(term), false) : contains_word(line, term);
            if (hit)
                report.violations.push_back({"design", i + 1, term, std::string(trim(line))});
        }
    }
    return report;
}

Result<SeparationCorrection> SeparationValidator::request_correction(GenerationOracle &oracle, const Recipe &recipe,
                                                                    const SeparationReport &report) const {
    auto correction = oracle.correct_separation(recipe.requirements.source, recipe.design.source, report.violations);
    if (!correction)
        return std::unexpected(std::move(correction.error()).in_recipe(recipe.name).in_phase("separation"));
    return correction;
}

Result<Recipe> SeparationValidator::enforce(const Recipe &recipe, GenerationOracle *oracle) const {
    const SeparationReport report = check(recipe);
    if (report.clean())
        return recipe;

    std::vector<std::string> subjects;
    std::ranges::transform(report.violations, std::back_inserter(subjects), describe);

    switch (config_.policy) {
    case SeparationPolicy::Report:
        for (const auto &subject : subjects)
            spdlog::warn("{}: separation violation at {}", recipe.name, subject);
        return recipe;
    case SeparationPolicy::Fail: {
        Error err{.kind = ErrorKind::Validation,
                  .message = std::format("{} separation violation(s)", subjects.size()),
                  .recipe = recipe.name,
                  .phase = "separation",
                  .subjects = std::move(subjects)};
        return fail(std::move(err));
    }
    case SeparationPolicy::AutoApply:
        break;
    }

    if (!oracle) {
        Error err{.kind = ErrorKind::Validation,
                  .message = "Separation violations found and no oracle is available to correct them",
                  .recipe = recipe.name,
                  .phase = "separation",
                  .subjects = std::move(subjects)};
        return fail(std::move(err));
    }

    auto correction = request_correction(*oracle, recipe, report);
    if (!correction)
        return std::unexpected(correction.error());

    const std::string base = std::filesystem::path(recipe.location).filename().string();
    const std::string_view meta_text =
        recipe.metadata.source.empty() ? std::string_view("{}") : std::string_view(recipe.metadata.source);
    auto corrected = parse_recipe(correction->requirements, correction->design, meta_text, recipe.location,
                                  base.empty() ? recipe.name : base);
    if (!corrected)
        return std::unexpected(std::move(corrected.error()).in_phase("separation"));
    // Metadata may carry attributes added after parsing (decomposition); keep the caller's.
    corrected->name = recipe.name;
    corrected->metadata = recipe.metadata;

    const SeparationReport recheck = check(*corrected);
    if (!recheck.clean()) {
        std::vector<std::string> remaining;
        std::ranges::transform(recheck.violations, std::back_inserter(remaining), describe);
        Error err{.kind = ErrorKind::Validation,
                  .message = "Corrected recipe still violates separation",
                  .recipe = recipe.name,
                  .phase = "separation",
                  .subjects = std::move(remaining)};
        return fail(std::move(err));
    }
    spdlog::info("{}: applied separation correction for {} violation(s)", recipe.name, report.violations.size());
    return corrected;
}

} // namespace kiln
