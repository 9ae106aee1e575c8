#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kiln {

struct ComplianceRecord {
    std::string requirement_id;
    Priority priority = Priority::Must;
    std::string implementation_ref; ///< "path:line", empty when no evidence was found.
    std::string test_ref;
    bool satisfied = false; ///< The requirement's `implemented` flag.
};

struct ComplianceMatrix {
    std::vector<ComplianceRecord> records;

    const ComplianceRecord *find(std::string_view id) const;
    std::vector<std::string> unmet_musts() const;
};

/**
 * @brief Locates implementing and covering-test evidence for every requirement.
 *
 * Evidence is a file that names the requirement id, or failing that, one that mentions every
 * significant keyword of the requirement's description.
 */
class ComplianceValidator {
public:
    ComplianceMatrix build_matrix(const RequirementSet &requirements, const CandidateBuild &candidate) const;

    /** @brief The matrix, or a `Compliance` error whose subjects are the unmet MUST ids. */
    Result<ComplianceMatrix> validate(const Recipe &recipe, const CandidateBuild &candidate) const;
};

} // namespace kiln
