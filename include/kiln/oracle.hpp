#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief The external capability that turns specifications into candidate artifacts.
 *
 * Every call is a blocking request/response bounded by a deadline. Implementations do not retry;
 * callers do so within their own bounded loops. Calls for different recipes may run concurrently.
 */
class GenerationOracle {
public:
    virtual ~GenerationOracle() = default;

    /** @brief Tests covering every MUST requirement's validation criteria plus edge and error cases. */
    virtual Result<ArtifactSet> generate_tests(const RequirementSet &requirements, const Design &design) = 0;

    virtual Result<ArtifactSet> generate_implementation(const RequirementSet &requirements, const Design &design,
                                                        const ArtifactSet &fixed_tests) = 0;

    /** @brief A patch for the failures in `report`. Test files in the result are not applied. */
    virtual Result<ArtifactSet> repair(const ArtifactSet &artifacts, const FailureReport &report) = 0;

    virtual Result<ReviewReport> review(const ArtifactSet &artifacts, const RequirementSet &requirements) = 0;

    virtual Result<ArtifactSet> revise_for_review(const ArtifactSet &artifacts,
                                                  const std::vector<ReviewFinding> &critical) = 0;

    /** @brief Corrected requirements and design texts that no longer show `violations`. */
    virtual Result<SeparationCorrection> correct_separation(std::string_view requirements, std::string_view design,
                                                            const std::vector<SeparationViolation> &violations) = 0;
};

} // namespace kiln
