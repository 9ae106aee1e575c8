#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/oracle.hpp"
#include "kiln/utility.hpp"

#include <vector>

namespace kiln {

struct ReviewOutcome {
    CandidateBuild candidate;
    std::vector<ReviewFinding> suggestions; ///< Recorded, never blocking.
    size_t revisions = 0;
};

/**
 * @brief Review/revise loop over a generated candidate. Tests are never revised, and unfinished-work
 *        markers in the implementation count as critical findings.
 */
class ReviewPipeline {
public:
    ReviewPipeline(GenerationOracle &oracle, ReviewConfig config);

    /**
     * @brief Reviews `candidate` and requests revisions while critical findings remain.
     * @return The revised candidate, or a `Review` error once `max_review_iterations` revisions
     *         left critical findings (the subjects are their messages).
     */
    Result<ReviewOutcome> run(const Recipe &recipe, CandidateBuild candidate);

private:
    GenerationOracle &oracle_;
    ReviewConfig config_;
};

} // namespace kiln
