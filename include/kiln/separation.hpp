#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/oracle.hpp"
#include "kiln/utility.hpp"

#include <vector>

namespace kiln {

struct SeparationReport {
    std::vector<SeparationViolation> violations;

    bool clean() const {
        return violations.empty();
    }
};

/**
 * @brief Checks that requirements stay free of implementation detail and designs free of
 *        requirement statements.
 */
class SeparationValidator {
public:
    explicit SeparationValidator(SeparationConfig config);

    SeparationReport check(const Recipe &recipe) const;

    /** @brief Asks the oracle for a corrected pair of texts. Does not modify `recipe`. */
    Result<SeparationCorrection> request_correction(GenerationOracle &oracle, const Recipe &recipe,
                                                   const SeparationReport &report) const;

    /**
     * @brief Applies the configured policy.
     *
     * `Report` logs and returns `recipe` unchanged, `Fail` raises a `Validation` error, and
     * `AutoApply` re-parses the oracle's correction into a new recipe that must pass a second check.
     */
    Result<Recipe> enforce(const Recipe &recipe, GenerationOracle *oracle) const;

private:
    SeparationConfig config_;
};

} // namespace kiln
