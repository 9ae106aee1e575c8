#include "kiln/orchestrator.hpp"

#include "kiln/artifacts.hpp"
#include "kiln/review.hpp"
#include "kiln/separation.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <format>
#include <print>
#include <queue>
#include <set>
#include <spdlog/spdlog.h>
#include <thread>

namespace fs = std::filesystem;

namespace kiln {

namespace {

bool is_within(const fs::path &child, const fs::path &parent) {
    auto rel = child.lexically_relative(parent);
    return !rel.empty() && *rel.begin() != "..";
}

fs::path canonical_or_self(const fs::path &p) {
    std::error_code ec;
    auto out = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : out;
}

// Lint may rewrite tests as well as implementation files; keep the split.
CandidateBuild resplit(const ArtifactSet &artifacts, const CandidateBuild &before) {
    CandidateBuild out;
    out.tests.generated_at = before.tests.generated_at;
    out.implementation.generated_at = artifacts.generated_at;
    for (const auto &[path, content] : artifacts.files) {
        if (before.tests.files.contains(path))
            out.tests.files.emplace(path, content);
        else
            out.implementation.files.emplace(path, content);
    }
    return out;
}

} // namespace

std::string_view to_string(BuildStatus status) {
    switch (status) {
    case BuildStatus::Succeeded:
        return "succeeded";
    case BuildStatus::Failed:
        return "failed";
    case BuildStatus::UpToDate:
        return "up to date";
    case BuildStatus::SkippedDependencyFailure:
        return "skipped (dependency failed)";
    case BuildStatus::Aggregated:
        return "aggregated";
    case BuildStatus::Planned:
        return "planned";
    }
    return "failed";
}

bool BuildResult::success() const {
    return std::ranges::all_of(results, &SingleBuildResult::ok);
}

const SingleBuildResult *BuildResult::find(std::string_view name) const {
    auto it = std::ranges::find(results, name, &SingleBuildResult::recipe);
    return it == results.end() ? nullptr : &*it;
}

Orchestrator::Orchestrator(KilnConfig config, GenerationOracle &oracle, QualityTools &tools, BuildCache &cache)
    : config_(std::move(config)), oracle_(oracle), tools_(tools), cache_(cache) {
}

SingleBuildResult Orchestrator::execute_recipe(const Recipe &recipe) {
    const auto start = std::chrono::steady_clock::now();
    SingleBuildResult result;
    result.recipe = recipe.name;

    auto finish = [&](BuildStatus status, std::optional<Error> error = std::nullopt) {
        result.status = status;
        result.error = std::move(error);
        result.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return std::move(result);
    };

    if (recipe.is_aggregate())
        return finish(BuildStatus::Aggregated);

    spdlog::info("{}: generating", recipe.name);
    GenerationPipeline generation(oracle_, tools_, config_.generation);
    auto generated = generation.run(recipe, result.state);
    if (!generated)
        return finish(BuildStatus::Failed, std::move(generated.error()));
    result.candidate = generated->candidate;

    spdlog::info("{}: reviewing", recipe.name);
    ReviewPipeline review(oracle_, config_.review);
    auto reviewed = review.run(recipe, std::move(generated->candidate));
    if (!reviewed)
        return finish(BuildStatus::Failed, std::move(reviewed.error()));
    result.candidate = reviewed->candidate;
    result.suggestions = std::move(reviewed->suggestions);

    spdlog::info("{}: running quality gates", recipe.name);
    QualityGateRunner gates(tools_, config_.quality);
    auto checked = gates.run(recipe.name, result.candidate.merged());
    if (!checked)
        return finish(BuildStatus::Failed, std::move(checked.error()).in_recipe(recipe.name));
    result.candidate = resplit(checked->artifacts, result.candidate);

    ComplianceValidator compliance;
    result.compliance = compliance.build_matrix(recipe.requirements, result.candidate);
    if (auto matrix = compliance.validate(recipe, result.candidate); !matrix)
        return finish(BuildStatus::Failed, std::move(matrix.error()));

    return finish(BuildStatus::Succeeded);
}

Result<BuildPlan> Orchestrator::plan(const RecipeSet &recipes) {
    SeparationValidator separation(config_.separation);
    RecipeSet checked;
    for (const auto &[name, recipe] : recipes) {
        auto res = separation.enforce(recipe, &oracle_);
        if (!res)
            return std::unexpected(res.error());
        checked.emplace(name, std::move(*res));
    }

    ComplexityEvaluator complexity(config_.complexity);
    auto expanded = complexity.expand(checked);
    if (!expanded)
        return std::unexpected(expanded.error());

    // Children produced by decomposition re-enter separation.
    for (auto &[name, recipe] : *expanded) {
        if (checked.contains(name))
            continue;
        auto res = separation.enforce(recipe, &oracle_);
        if (!res)
            return std::unexpected(res.error());
        recipe = std::move(*res);
    }

    auto resolution = resolve(*expanded);
    if (!resolution)
        return std::unexpected(resolution.error());
    return BuildPlan{std::move(*expanded), std::move(*resolution)};
}

void Orchestrator::report(const SingleBuildResult &result, size_t total) {
    std::lock_guard lock(print_mtx_);
    ++printed_;
    if (config_.dry_run)
        std::println("[DRY RUN] {} -> {}", result.recipe, to_string(result.status));
    else
        std::println("[{}/{}] {} -> {}", printed_, total, result.recipe, to_string(result.status));
    if (result.error)
        std::println(stderr, "  {}", *result.error);
    if (!result.blocked_by.empty())
        std::println(stderr, "  blocked by: {}", join(result.blocked_by, ", "));
}

Result<std::vector<std::string>> Orchestrator::write_output(const SingleBuildResult &result) const {
    const fs::path dir = config_.output_dir / result.recipe;
    if (auto res = remove_tree(dir); !res)
        return std::unexpected(res.error());
    const ArtifactSet merged = result.candidate.merged();
    if (auto res = write_artifacts(dir, merged); !res)
        return std::unexpected(res.error());
    std::vector<std::string> outputs;
    for (const auto &[path, content] : merged.files)
        outputs.push_back((dir / path).string());
    return outputs;
}

SingleBuildResult Orchestrator::build_one(const Recipe &recipe) {
    SingleBuildResult result;
    try {
        result = execute_recipe(recipe);
    } catch (const std::exception &e) {
        result.recipe = recipe.name;
        result.status = BuildStatus::Failed;
        result.error = Error{.kind = ErrorKind::Generation,
                             .message = std::format("Unexpected exception: {}", e.what()),
                             .recipe = recipe.name};
    }

    std::vector<std::string> outputs;
    if (result.status == BuildStatus::Succeeded) {
        auto written = write_output(result);
        if (written) {
            outputs = std::move(*written);
        } else {
            result.status = BuildStatus::Failed;
            result.error = std::move(written.error()).in_recipe(recipe.name).in_phase("output");
        }
    }

    std::vector<std::string> errors;
    if (result.error)
        errors.push_back(std::format("{}", *result.error));
    const BuildOutcome outcome = result.ok() ? BuildOutcome::Success : BuildOutcome::Failure;
    if (auto res = cache_.record(recipe, outcome, std::move(outputs), std::move(errors)); !res)
        spdlog::error("{}: failed to record build: {}", recipe.name, res.error().message);
    return result;
}

Result<BuildResult> Orchestrator::execute_collection(const RecipeSet &recipes) {
    auto planned = plan(recipes);
    if (!planned)
        return std::unexpected(planned.error());
    if (!config_.dry_run) {
        if (auto res = check_output_dir(); !res)
            return std::unexpected(res.error());
    }

    const RecipeSet &all = planned->recipes;
    BuildResult result;
    result.groups = planned->resolution.groups;
    std::set<std::string> failed;
    const size_t total = all.size();
    printed_ = 0;

    for (const auto &group : planned->resolution.groups) {
        std::vector<SingleBuildResult> slots(group.size());
        std::queue<size_t> ready_queue;

        for (size_t i = 0; i < group.size(); ++i) {
            const Recipe &recipe = all.at(group[i]);
            SingleBuildResult &slot = slots[i];
            slot.recipe = recipe.name;

            for (const auto &dep : recipe.dependencies()) {
                if (failed.contains(dep))
                    slot.blocked_by.push_back(dep);
            }
            if (!slot.blocked_by.empty()) {
                slot.status = BuildStatus::SkippedDependencyFailure;
            } else if (!cache_.needs_rebuild(recipe, all, config_.force)) {
                slot.status = BuildStatus::UpToDate;
            } else if (config_.dry_run) {
                slot.status = BuildStatus::Planned;
            } else if (recipe.is_aggregate()) {
                slot.status = BuildStatus::Aggregated;
                if (auto res = cache_.record(recipe, BuildOutcome::Success); !res)
                    spdlog::error("{}: failed to record build: {}", recipe.name, res.error().message);
            } else {
                ready_queue.push(i);
                continue;
            }
            report(slot, total);
        }

        std::mutex mtx;
        auto worker = [&]() {
            while (true) {
                size_t idx;
                {
                    std::lock_guard lock(mtx);
                    if (ready_queue.empty())
                        return;
                    idx = ready_queue.front();
                    ready_queue.pop();
                }
                slots[idx] = build_one(all.at(group[idx]));
                report(slots[idx], total);
            }
        };

        size_t thread_count = config_.jobs;
        if (thread_count == 0)
            thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0)
            thread_count = 1;
        thread_count = std::min(thread_count, ready_queue.size());

        {
            std::vector<std::jthread> pool;
            for (size_t i = 0; i < thread_count; ++i)
                pool.emplace_back(worker);
        } // Join all threads

        for (auto &slot : slots) {
            if (!slot.ok())
                failed.insert(slot.recipe);
            result.results.push_back(std::move(slot));
        }
    }
    return result;
}

Result<RecipeAnalysis> Orchestrator::analyze(const RecipeSet &recipes, std::string_view name) {
    auto it = recipes.find(std::string(name));
    if (it == recipes.end()) {
        Error err{.kind = ErrorKind::MissingDependency,
                  .message = std::format("No recipe named '{}'", name),
                  .subjects = {std::string(name)}};
        return fail(std::move(err));
    }
    const Recipe &recipe = it->second;

    RecipeAnalysis analysis;
    analysis.name = recipe.name;
    analysis.dependencies = recipe.dependencies();
    analysis.complexity = ComplexityEvaluator(config_.complexity).evaluate(recipe);
    analysis.needs_rebuild = cache_.needs_rebuild(recipe, recipes, config_.force);

    if (recipe.requirements.count(Priority::Must) == 0)
        analysis.issues.push_back("no MUST requirements");
    if (recipe.design.components.empty())
        analysis.issues.push_back("design lists no components");
    if (std::ranges::find(recipe.dependencies(), recipe.name) != recipe.dependencies().end())
        analysis.issues.push_back("recipe depends on itself");
    if (analysis.complexity.exceeds) {
        analysis.issues.push_back(std::format("complexity {:.1f} exceeds {:.1f}; {} split suggested",
                                              analysis.complexity.score, config_.complexity.boundary,
                                              to_string(analysis.complexity.strategy)));
    }
    for (const auto &v : SeparationValidator(config_.separation).check(recipe).violations)
        analysis.issues.push_back(std::format("separation: {}:{} '{}'", v.artifact, v.line, v.phrase));

    auto graph = RecipeGraph::build(recipes);
    if (!graph) {
        analysis.issues.push_back(std::format("{}", graph.error()));
        return analysis;
    }
    analysis.dependents = graph->transitive_dependents(name);

    auto order = graph->topo_sort();
    if (!order) {
        analysis.issues.push_back(std::format("{}", order.error()));
        return analysis;
    }
    const auto needed = graph->transitive_dependencies(name);
    for (size_t idx : *order) {
        const std::string &node = graph->nodes()[idx].name;
        if (node == name || std::ranges::binary_search(needed, node))
            analysis.plan.push_back(node);
    }
    return analysis;
}

Result<std::string> Orchestrator::emit_graph(const RecipeSet &recipes) {
    auto planned = plan(recipes);
    if (!planned)
        return std::unexpected(planned.error());
    auto graph = RecipeGraph::build(planned->recipes);
    if (!graph)
        return std::unexpected(graph.error());

    std::string out = "digraph kiln_build {\n";
    out += "  rankdir=LR;\n";
    out += "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    const auto &nodes = graph->nodes();
    for (size_t i = 0; i < nodes.size(); ++i) {
        const Recipe &recipe = planned->recipes.at(nodes[i].name);
        std::string color = "white";
        if (recipe.is_aggregate())
            color = "lightgray";
        else if (cache_.needs_rebuild(recipe, planned->recipes, config_.force))
            color = "green";

        out += std::format("  n{} [label=\"{}\", fillcolor=\"{}\"];\n", i, nodes[i].name, color);
        for (size_t target_idx : nodes[i].out_edges)
            out += std::format("  n{} -> n{};\n", i, target_idx);
    }
    out += "}\n";
    return out;
}

Result<void> Orchestrator::check_output_dir() const {
    if (config_.allow_self_overwrite || config_.source_root.empty())
        return {};

    const fs::path output = canonical_or_self(config_.output_dir);
    const fs::path root = canonical_or_self(config_.source_root);
    bool overlaps = output == root || is_within(root, output);
    for (const char *tree : {"src", "include", "recipes"})
        overlaps = overlaps || output == root / tree || is_within(output, root / tree);

    if (overlaps) {
        Error err{.kind = ErrorKind::Validation,
                  .message = std::format("Output directory {} would overwrite kiln's own sources in {}",
                                         output.string(), root.string()),
                  .phase = "output"};
        return fail(std::move(err));
    }
    return {};
}

} // namespace kiln
