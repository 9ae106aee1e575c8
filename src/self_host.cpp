#include "kiln/self_host.hpp"

#include "kiln/artifacts.hpp"
#include "kiln/compliance.hpp"
#include "kiln/process_exec.hpp"
#include "kiln/quality.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace kiln {

namespace {

Error self_hosting(Error cause, std::string phase) {
    cause.kind = ErrorKind::SelfHosting;
    cause.phase = std::move(phase);
    return cause;
}

Result<void> run_step(const std::vector<std::string> &command, const fs::path &cwd, std::chrono::seconds timeout,
                      std::string_view step) {
    ProcessOptions options{.working_dir = cwd.string(), .timeout = timeout};
    auto res = process_exec(command, options);
    if (!res)
        return std::unexpected(res.error());
    if (res->exit_code != 0) {
        Error err{.kind = ErrorKind::SelfHosting,
                  .message = std::format("{} exited with code {}", step, res->exit_code),
                  .diagnostic = res->out + res->err};
        return fail(std::move(err));
    }
    return {};
}

} // namespace

CommandBootstrapLauncher::CommandBootstrapLauncher(SelfHostConfig config) : config_(std::move(config)) {
}

Result<CandidateBuild> CommandBootstrapLauncher::launch(const CandidateBuild &generation, const Recipe &recipe) {
    if (config_.run_command.empty())
        return fail(ErrorKind::Config, "self_host.run is not configured");

    const fs::path gen_dir = config_.work_dir / "gen";
    const fs::path next_dir = config_.work_dir / "next";
    for (const auto &dir : {gen_dir, next_dir}) {
        if (auto res = remove_tree(dir); !res)
            return std::unexpected(res.error());
    }
    if (auto res = write_artifacts(gen_dir, generation.merged()); !res)
        return std::unexpected(res.error());

    if (!config_.build_command.empty()) {
        spdlog::info("bootstrap: building generated orchestrator in {}", gen_dir.string());
        if (auto res = run_step(config_.build_command, gen_dir, config_.timeout, "build"); !res)
            return std::unexpected(res.error());
    }

    std::error_code ec;
    const fs::path output = fs::absolute(next_dir, ec);
    if (ec)
        return fail(ErrorKind::Io, std::format("Failed to resolve {}: {}", next_dir.string(), ec.message()));

    auto command = expand_placeholders(config_.run_command, {{"recipe", recipe.location},
                                                             {"output", output.string()},
                                                             {"workdir", gen_dir.string()}});
    spdlog::info("bootstrap: running generated orchestrator on {}", recipe.name);
    if (auto res = run_step(command, gen_dir, config_.timeout, "run"); !res)
        return std::unexpected(res.error());

    auto artifacts = read_artifacts(output);
    if (!artifacts)
        return std::unexpected(artifacts.error());
    return split_candidate(*artifacts);
}

std::vector<std::string> missing_components(const CandidateBuild &candidate,
                                            const std::vector<std::string> &components) {
    std::vector<std::string> missing;
    for (const auto &component : components) {
        const std::string needle = to_lower(component);
        bool found = std::ranges::any_of(candidate.implementation.files, [&](const auto &file) {
            return to_lower(file.first).find(needle) != std::string::npos;
        });
        if (!found)
            missing.push_back(component);
    }
    return missing;
}

SelfHost::SelfHost(Orchestrator &orchestrator, BootstrapLauncher &launcher, QualityTools &tools,
                   SelfHostConfig config)
    : orchestrator_(orchestrator), launcher_(launcher), tools_(tools), config_(std::move(config)) {
}

Result<void> SelfHost::check_components(const CandidateBuild &candidate, std::string_view generation,
                                        const Recipe &recipe) const {
    auto missing = missing_components(candidate, config_.components);
    if (missing.empty())
        return {};
    Error err{.kind = ErrorKind::SelfHosting,
              .message = std::format("{} generation lacks {} of {} components", generation, missing.size(),
                                     config_.components.size()),
              .recipe = recipe.name,
              .phase = std::format("{}_components", generation),
              .subjects = std::move(missing)};
    return fail(std::move(err));
}

Result<SelfHostResult> SelfHost::run(const Recipe &recipe) {
    SelfHostResult result;
    result.components = config_.components;

    spdlog::info("bootstrap: generating second generation from {}", recipe.name);
    result.second = orchestrator_.execute_recipe(recipe);
    if (!result.second.ok()) {
        Error cause = result.second.error.value_or(Error{.message = "second generation did not build"});
        return fail(self_hosting(std::move(cause), "second_generation").in_recipe(recipe.name));
    }
    if (auto res = check_components(result.second.candidate, "second", recipe); !res)
        return std::unexpected(res.error());

    spdlog::info("bootstrap: launching third generation");
    auto third = launcher_.launch(result.second.candidate, recipe);
    if (!third)
        return fail(self_hosting(std::move(third.error()), "third_generation").in_recipe(recipe.name));
    if (auto res = check_components(*third, "third", recipe); !res)
        return std::unexpected(res.error());

    QualityGateRunner gates(tools_, orchestrator_.config().quality);
    auto checked = gates.run(recipe.name, third->merged());
    if (!checked)
        return fail(self_hosting(std::move(checked.error()), "third_quality").in_recipe(recipe.name));

    ComplianceValidator compliance;
    if (auto matrix = compliance.validate(recipe, *third); !matrix)
        return fail(self_hosting(std::move(matrix.error()), "third_compliance").in_recipe(recipe.name));

    result.third = std::move(*third);
    spdlog::info("bootstrap: {} regenerated itself twice", recipe.name);
    return result;
}

} // namespace kiln
