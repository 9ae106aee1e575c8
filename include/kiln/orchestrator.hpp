#pragma once

#include "kiln/build_cache.hpp"
#include "kiln/complexity.hpp"
#include "kiln/compliance.hpp"
#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/generation.hpp"
#include "kiln/graph.hpp"
#include "kiln/oracle.hpp"
#include "kiln/quality.hpp"
#include "kiln/utility.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class BuildStatus : uint8_t {
    Succeeded,
    Failed,
    UpToDate,
    SkippedDependencyFailure,
    Aggregated, ///< Decomposed parent whose children all succeeded.
    Planned,    ///< Dry run: would have been built.
};

std::string_view to_string(BuildStatus status);

struct SingleBuildResult {
    std::string recipe;
    BuildStatus status = BuildStatus::Failed;
    std::optional<Error> error;
    std::vector<std::string> blocked_by; ///< Failed dependencies, for skipped recipes.
    GenerationState state = GenerationState::NotStarted;
    CandidateBuild candidate;
    ComplianceMatrix compliance;
    std::vector<ReviewFinding> suggestions;
    std::chrono::milliseconds duration{0};

    bool ok() const {
        return status != BuildStatus::Failed && status != BuildStatus::SkippedDependencyFailure;
    }
};

struct BuildResult {
    std::vector<SingleBuildResult> results; ///< In group order.
    std::vector<std::vector<std::string>> groups;

    bool success() const;
    const SingleBuildResult *find(std::string_view name) const;
};

/** @brief The recipe set after separation and decomposition, with its resolved order. */
struct BuildPlan {
    RecipeSet recipes;
    Resolution resolution;
};

struct RecipeAnalysis {
    std::string name;
    std::vector<std::string> dependencies;
    std::vector<std::string> dependents; ///< Transitive.
    std::vector<std::string> plan;       ///< Build order for this recipe and what it needs.
    std::vector<std::string> issues;
    ComplexityScore complexity;
    bool needs_rebuild = true;
};

class Orchestrator {
public:
    Orchestrator(KilnConfig config, GenerationOracle &oracle, QualityTools &tools, BuildCache &cache);

    /**
     * @brief Generation, review, quality gates and compliance for one recipe, in that order.
     *
     * The first failure stops the recipe and is returned in `error`; nothing is recorded or written.
     */
    SingleBuildResult execute_recipe(const Recipe &recipe);

    /** @brief Separation, decomposition to a fixed point, then resolution. */
    Result<BuildPlan> plan(const RecipeSet &recipes);

    /**
     * @brief Builds a recipe set group by group.
     *
     * Structural errors fail the call before any generation. Per-recipe failures are reported in
     * the result and skip the recipe's dependents.
     */
    Result<BuildResult> execute_collection(const RecipeSet &recipes);

    Result<RecipeAnalysis> analyze(const RecipeSet &recipes, std::string_view name);

    /** @brief Graphviz DOT of the planned recipe graph; recipes needing a rebuild are green. */
    Result<std::string> emit_graph(const RecipeSet &recipes);

    /** @brief Refuses output directories that overlap the orchestrator's own sources. */
    Result<void> check_output_dir() const;

    const KilnConfig &config() const {
        return config_;
    }

private:
    SingleBuildResult build_one(const Recipe &recipe);
    Result<std::vector<std::string>> write_output(const SingleBuildResult &result) const;
    void report(const SingleBuildResult &result, size_t total);

    KilnConfig config_;
    GenerationOracle &oracle_;
    QualityTools &tools_;
    BuildCache &cache_;
    std::mutex print_mtx_;
    size_t printed_ = 0;
};

} // namespace kiln
