#include "kiln/domain.hpp"

#include "kiln/utility.hpp"

#include <algorithm>
#include <iterator>

namespace kiln {

const Requirement *RequirementSet::find(std::string_view id) const {
    auto it = std::ranges::find(requirements, id, &Requirement::id);
    return it == requirements.end() ? nullptr : &*it;
}

size_t RequirementSet::count(Priority priority) const {
    return static_cast<size_t>(std::ranges::count(requirements, priority, &Requirement::priority));
}

bool ComponentMetadata::attribute_enabled(std::string_view key) const {
    auto it = attributes.find(std::string(key));
    if (it == attributes.end())
        return false;
    std::string value = to_lower(trim(it->second));
    return value == "true" || value == "1" || value == "yes";
}

ArtifactSet ArtifactSet::merged_with(const ArtifactSet &other) const {
    ArtifactSet out = *this;
    for (const auto &[path, content] : other.files) {
        out.files.insert_or_assign(path, content);
    }
    out.generated_at = std::max(generated_at, other.generated_at);
    return out;
}

std::vector<ReviewFinding> ReviewReport::critical() const {
    std::vector<ReviewFinding> out;
    std::ranges::copy_if(findings, std::back_inserter(out),
                         [](const ReviewFinding &f) { return f.severity == Severity::Critical; });
    return out;
}

std::vector<ReviewFinding> ReviewReport::suggestions() const {
    std::vector<ReviewFinding> out;
    std::ranges::copy_if(findings, std::back_inserter(out),
                         [](const ReviewFinding &f) { return f.severity == Severity::Suggestion; });
    return out;
}

std::string_view to_string(Priority priority) {
    switch (priority) {
    case Priority::Must:
        return "MUST";
    case Priority::Should:
        return "SHOULD";
    case Priority::Could:
        return "COULD";
    }
    return "MUST";
}

std::string_view to_string(ComponentType type) {
    switch (type) {
    case ComponentType::Service:
        return "service";
    case ComponentType::Agent:
        return "agent";
    case ComponentType::Library:
        return "library";
    case ComponentType::Tool:
        return "tool";
    case ComponentType::Core:
        return "core";
    }
    return "library";
}

std::string_view to_string(Severity severity) {
    return severity == Severity::Critical ? "CRITICAL" : "SUGGESTION";
}

std::optional<Priority> parse_priority(std::string_view token) {
    if (token == "MUST")
        return Priority::Must;
    if (token == "SHOULD")
        return Priority::Should;
    if (token == "COULD")
        return Priority::Could;
    return std::nullopt;
}

std::optional<ComponentType> parse_component_type(std::string_view token) {
    const std::string t = to_lower(trim(token));
    if (t == "service")
        return ComponentType::Service;
    if (t == "agent")
        return ComponentType::Agent;
    if (t == "library")
        return ComponentType::Library;
    if (t == "tool")
        return ComponentType::Tool;
    if (t == "core")
        return ComponentType::Core;
    return std::nullopt;
}

bool is_test_path(std::string_view path) {
    const std::string p = to_lower(path);
    if (p.starts_with("tests/") || p.starts_with("test/") || p.find("/tests/") != std::string::npos ||
        p.find("/test/") != std::string::npos) {
        return true;
    }
    size_t slash = p.find_last_of('/');
    std::string_view name = std::string_view(p).substr(slash == std::string::npos ? 0 : slash + 1);
    return name.starts_with("test_") || name.find("_test.") != std::string_view::npos;
}

CandidateBuild split_candidate(const ArtifactSet &artifacts) {
    CandidateBuild candidate;
    candidate.tests.generated_at = artifacts.generated_at;
    candidate.implementation.generated_at = artifacts.generated_at;
    for (const auto &[path, content] : artifacts.files) {
        if (is_test_path(path))
            candidate.tests.files.emplace(path, content);
        else
            candidate.implementation.files.emplace(path, content);
    }
    return candidate;
}

} // namespace kiln
