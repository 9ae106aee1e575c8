#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class Priority : uint8_t { Must, Should, Could };

enum class ComponentType : uint8_t { Service, Agent, Library, Tool, Core };

struct Requirement {
    std::string id;
    std::string description;
    Priority priority = Priority::Must;
    std::vector<std::string> validation_criteria;
    bool functional = true;
    size_t line = 0; ///< 1-based line in requirements.md, 0 when synthesized.
};

struct RequirementSet {
    std::string purpose;
    std::vector<Requirement> requirements;
    std::vector<std::string> success_criteria;
    std::string source; ///< Text the set was parsed from.

    const Requirement *find(std::string_view id) const;
    size_t count(Priority priority) const;
};

struct ComponentDesign {
    std::string name;
    std::string file;
    std::string responsibility;
    std::vector<std::string> signatures;
};

struct Interface {
    std::string name;
    std::string description;
};

struct Design {
    std::string architecture_summary;
    std::vector<ComponentDesign> components;
    std::vector<Interface> interfaces;
    std::string source;
};

struct ComponentMetadata {
    std::string name;
    std::string version = "1.0.0";
    ComponentType type = ComponentType::Library;
    std::vector<std::string> dependencies; ///< Build-order dependencies by recipe name.
    std::string description;
    std::map<std::string, std::string> attributes;
    std::string source;

    bool attribute_enabled(std::string_view key) const;
};

/**
 * @brief A parsed recipe.
 *
 * Immutable for the duration of a build invocation: transformations (separation correction,
 * decomposition) produce new values.
 */
struct Recipe {
    std::string name;
    std::string location;
    RequirementSet requirements;
    Design design;
    ComponentMetadata metadata;
    std::string checksum;

    const std::vector<std::string> &dependencies() const {
        return metadata.dependencies;
    }
    /** @brief True for a parent whose work was split into child recipes. */
    bool is_aggregate() const {
        return metadata.attribute_enabled("aggregate");
    }
    bool is_self_hosting() const {
        return metadata.attribute_enabled("selfHosting");
    }
};

using RecipeSet = std::map<std::string, Recipe>;

/** @brief Relative path to content, produced by the oracle. Every repair yields a new value. */
struct ArtifactSet {
    std::map<std::string, std::string> files;
    std::chrono::system_clock::time_point generated_at{};

    bool empty() const {
        return files.empty();
    }
    /** @brief Returns a copy of `*this` overlaid with `other`; `other` wins on collisions. */
    ArtifactSet merged_with(const ArtifactSet &other) const;
};

/** @brief The fixed test contract and the implementation generated against it. */
struct CandidateBuild {
    ArtifactSet tests;
    ArtifactSet implementation;

    ArtifactSet merged() const {
        return implementation.merged_with(tests);
    }
};

struct TestCaseResult {
    std::string name;
    bool passed = false;
    std::string message;
};

struct FailureReport {
    std::string summary;
    std::vector<TestCaseResult> failures;
    std::string raw_output;
};

enum class Severity : uint8_t { Critical, Suggestion };

struct ReviewFinding {
    Severity severity = Severity::Suggestion;
    std::string location;
    std::string message;
};

struct ReviewReport {
    std::vector<ReviewFinding> findings;

    std::vector<ReviewFinding> critical() const;
    std::vector<ReviewFinding> suggestions() const;
};

/** @brief Requirement-shaped text in a design, or implementation detail in requirements. */
struct SeparationViolation {
    std::string artifact; ///< "requirements" or "design".
    size_t line = 0;
    std::string phrase;
    std::string excerpt;
};

struct SeparationCorrection {
    std::string requirements;
    std::string design;
};

std::string_view to_string(Priority priority);
std::string_view to_string(ComponentType type);
std::string_view to_string(Severity severity);
std::optional<Priority> parse_priority(std::string_view token);
std::optional<ComponentType> parse_component_type(std::string_view token);

/** @brief Path convention for test artifacts: a `tests/` or `test/` segment, or a `test_` / `_test.` name. */
bool is_test_path(std::string_view path);

/** @brief Splits a flat artifact set into tests and implementation by `is_test_path`. */
CandidateBuild split_candidate(const ArtifactSet &artifacts);

} // namespace kiln
