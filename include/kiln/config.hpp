#pragma once

#include "kiln/utility.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class SeparationPolicy : uint8_t { Report, AutoApply, Fail };

std::string_view to_string(SeparationPolicy policy);
std::optional<SeparationPolicy> parse_separation_policy(std::string_view token);

struct SeparationConfig {
    SeparationPolicy policy = SeparationPolicy::Report;
    /// Named technologies, algorithms and integration calls that do not belong in requirements.
    std::vector<std::string> technology_terms = default_technology_terms();
    /// Requirement-shaped phrases that do not belong in a design.
    std::vector<std::string> requirement_terms = default_requirement_terms();

    static std::vector<std::string> default_technology_terms();
    static std::vector<std::string> default_requirement_terms();
};

struct ComplexityConfig {
    size_t component_threshold = 5;
    size_t must_threshold = 10;
    double component_weight = 1.0;
    double must_weight = 0.5;
    double area_weight = 0.5;
    double boundary = 4.0;
    size_t max_depth = 3;
};

struct GenerationConfig {
    size_t max_fix_iterations = 5;
    size_t max_stub_remediations = 2;
    size_t oracle_attempts = 2; ///< Tries per test or implementation generation request.
};

struct ReviewConfig {
    size_t max_review_iterations = 3;
};

struct OracleConfig {
    std::vector<std::string> command; ///< The request file path is appended as the last argument.
    std::chrono::seconds timeout{300};
};

struct QualityConfig {
    std::vector<std::string> type_check_command; ///< Empty skips the gate.
    std::vector<std::string> lint_command;       ///< Empty skips the gate.
    std::vector<std::string> test_command;
    double min_coverage = 80.0;
    std::chrono::seconds timeout{600};
    std::filesystem::path work_dir = ".kiln/work";
};

struct SelfHostConfig {
    std::string recipe = "kiln";
    std::vector<std::string> build_command;
    /// Placeholders: {recipe}, {output}, {workdir}.
    std::vector<std::string> run_command;
    std::vector<std::string> components = default_components();
    std::filesystem::path work_dir = ".kiln/bootstrap";
    std::chrono::seconds timeout{1800};

    static std::vector<std::string> default_components();
};

struct LogConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] %v";
};

struct KilnConfig {
    SeparationConfig separation;
    ComplexityConfig complexity;
    GenerationConfig generation;
    ReviewConfig review;
    OracleConfig oracle;
    QualityConfig quality;
    SelfHostConfig self_host;
    LogConfig log;

    size_t jobs = 0; // 0 means auto-detect
    std::filesystem::path output_dir = "out";
    std::filesystem::path state_dir = ".kiln";
    /// The running orchestrator's own source tree, guarded against being overwritten.
    std::filesystem::path source_root;
    bool allow_self_overwrite = false;
    bool force = false;
    bool dry_run = false;
};

inline constexpr std::string_view kDefaultConfigFile = "kiln.yaml";

/**
 * @brief Parses a YAML configuration document over the defaults.
 *
 * Unknown keys are ignored. A value of the wrong type is a `Config` error naming its key.
 */
Result<KilnConfig> parse_config(std::string_view yaml);

/** @brief Reads and parses a configuration file. */
Result<KilnConfig> load_config(const std::filesystem::path &path);

} // namespace kiln
