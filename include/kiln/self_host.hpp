#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/orchestrator.hpp"
#include "kiln/utility.hpp"

#include <string>
#include <vector>

namespace kiln {

/** @brief Runs a generated orchestrator against a recipe and returns what it produced. */
class BootstrapLauncher {
public:
    virtual ~BootstrapLauncher() = default;

    /**
     * @brief Builds `generation` and has it regenerate `recipe`.
     * @return The next generation's artifacts, split into tests and implementation.
     */
    virtual Result<CandidateBuild> launch(const CandidateBuild &generation, const Recipe &recipe) = 0;
};

/**
 * @brief Launcher driven by the configured build and run commands.
 *
 * The generation is written to `<work_dir>/gen`, built there with `build_command`, and then run
 * with `run_command`, whose `{output}` directory is read back as the next generation.
 */
class CommandBootstrapLauncher final : public BootstrapLauncher {
public:
    explicit CommandBootstrapLauncher(SelfHostConfig config);

    Result<CandidateBuild> launch(const CandidateBuild &generation, const Recipe &recipe) override;

private:
    SelfHostConfig config_;
};

struct SelfHostResult {
    SingleBuildResult second;     ///< Generated by this orchestrator.
    CandidateBuild third;         ///< Generated by the second generation.
    std::vector<std::string> components;
};

/** @brief Reference components with no implementation path naming them. */
std::vector<std::string> missing_components(const CandidateBuild &candidate,
                                            const std::vector<std::string> &components);

/**
 * @brief Regenerates the orchestrator from its own recipe and checks the result can do the same.
 *
 * Uses the ordinary `execute_recipe` path for the second generation. Any failure is a
 * `SelfHosting` error whose phase names the step.
 */
class SelfHost {
public:
    SelfHost(Orchestrator &orchestrator, BootstrapLauncher &launcher, QualityTools &tools, SelfHostConfig config);

    Result<SelfHostResult> run(const Recipe &recipe);

private:
    Result<void> check_components(const CandidateBuild &candidate, std::string_view generation,
                                  const Recipe &recipe) const;

    Orchestrator &orchestrator_;
    BootstrapLauncher &launcher_;
    QualityTools &tools_;
    SelfHostConfig config_;
};

} // namespace kiln
