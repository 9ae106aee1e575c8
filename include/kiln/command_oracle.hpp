#pragma once

#include "kiln/config.hpp"
#include "kiln/oracle.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string_view>

namespace kiln {

/**
 * @brief Oracle backed by an external command.
 *
 * Each call writes a JSON request (`{"operation": ..., ...}`) to a scratch file, runs
 * `config.command <request-file>` under the configured deadline and reads a JSON response from the
 * command's stdout: `{"files": {path: content}}` for artifact operations, `{"findings": [...]}` for
 * reviews and `{"requirements": ..., "design": ...}` for separation corrections.
 */
class CommandOracle final : public GenerationOracle {
public:
    CommandOracle(OracleConfig config, std::filesystem::path scratch_dir);

    Result<ArtifactSet> generate_tests(const RequirementSet &requirements, const Design &design) override;
    Result<ArtifactSet> generate_implementation(const RequirementSet &requirements, const Design &design,
                                                const ArtifactSet &fixed_tests) override;
    Result<ArtifactSet> repair(const ArtifactSet &artifacts, const FailureReport &report) override;
    Result<ReviewReport> review(const ArtifactSet &artifacts, const RequirementSet &requirements) override;
    Result<ArtifactSet> revise_for_review(const ArtifactSet &artifacts,
                                          const std::vector<ReviewFinding> &critical) override;
    Result<SeparationCorrection> correct_separation(std::string_view requirements, std::string_view design,
                                                    const std::vector<SeparationViolation> &violations) override;

private:
    Result<nlohmann::json> call(std::string_view operation, nlohmann::json request);

    OracleConfig config_;
    std::filesystem::path scratch_dir_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace kiln
