#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/oracle.hpp"
#include "kiln/quality.hpp"
#include "kiln/utility.hpp"

#include <cstdint>
#include <string_view>

namespace kiln {

enum class GenerationState : uint8_t {
    NotStarted,
    TestsGenerated,
    TestsConfirmedFailing,
    ImplementationGenerated,
    TestsPassing,
    FixExhausted,
};

std::string_view to_string(GenerationState state);

struct GenerationOutcome {
    CandidateBuild candidate;
    size_t fix_iterations = 0;    ///< Repair requests made by the fix loop.
    size_t stub_remediations = 0; ///< Repair requests made for unfinished-work markers.
};

/**
 * @brief Test-first generate/repair loop for one recipe.
 *
 * The pipeline holds no per-recipe state, so one instance may serve several workers.
 */
class GenerationPipeline {
public:
    GenerationPipeline(GenerationOracle &oracle, QualityTools &tools, GenerationConfig config);

    /**
     * @brief Runs NOT_STARTED through TESTS_PASSING.
     *
     * @param state Updated at every transition; left at the state the pipeline stopped in.
     * @return The candidate whose tests pass, or the error that stopped the pipeline:
     *         `Generation` when the oracle keeps failing, `Validation` when the generated tests pass
     *         against an empty implementation or stubs survive remediation, `TestFailure` when
     *         `max_fix_iterations` repairs did not make the tests pass.
     */
    Result<GenerationOutcome> run(const Recipe &recipe, GenerationState &state);

private:
    Result<ArtifactSet> request(const Recipe &recipe, std::string_view phase, auto &&call);

    GenerationOracle &oracle_;
    QualityTools &tools_;
    GenerationConfig config_;
};

/**
 * @brief Overlays a repair onto `implementation`.
 *
 * Files that belong to the test contract (present in `tests` or on a test path) are dropped from
 * the patch.
 */
ArtifactSet apply_patch(const ArtifactSet &implementation, const ArtifactSet &patch, const ArtifactSet &tests);

} // namespace kiln
