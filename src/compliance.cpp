#include "kiln/compliance.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <spdlog/spdlog.h>

namespace kiln {

namespace {

constexpr size_t kMaxKeywords = 5;

// Ids match inside identifiers such as `test_req_3_rejects`, but never as a prefix of `req_30`.
bool mentions_id(std::string_view line, std::string_view id) {
    const std::string hay = to_lower(line);
    const std::string needle = to_lower(id);
    for (size_t pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) {
        size_t end = pos + needle.size();
        bool left = pos == 0 || !std::isalnum(static_cast<unsigned char>(hay[pos - 1]));
        bool right = end >= hay.size() || !std::isalnum(static_cast<unsigned char>(hay[end]));
        if (left && right)
            return true;
    }
    return false;
}

std::string find_evidence(const ArtifactSet &artifacts, const Requirement &req) {
    for (const auto &[path, content] : artifacts.files) {
        const auto lines = split_lines(content);
        for (size_t i = 0; i < lines.size(); ++i) {
            if (mentions_id(lines[i], req.id))
                return std::format("{}:{}", path, i + 1);
        }
    }

    const auto keywords = significant_keywords(req.description, kMaxKeywords);
    if (keywords.empty())
        return {};
    for (const auto &[path, content] : artifacts.files) {
        if (!std::ranges::all_of(keywords, [&](const std::string &kw) { return contains_word(content, kw); }))
            continue;
        const auto lines = split_lines(content);
        for (size_t i = 0; i < lines.size(); ++i) {
            if (contains_word(lines[i], keywords.front()))
                return std::format("{}:{}", path, i + 1);
        }
        return path;
    }
    return {};
}

} // namespace

const ComplianceRecord *ComplianceMatrix::find(std::string_view id) const {
    auto it = std::ranges::find(records, id, &ComplianceRecord::requirement_id);
    return it == records.end() ? nullptr : &*it;
}

std::vector<std::string> ComplianceMatrix::unmet_musts() const {
    std::vector<std::string> unmet;
    for (const auto &r : records) {
        if (r.priority == Priority::Must && !r.satisfied)
            unmet.push_back(r.requirement_id);
    }
    return unmet;
}

ComplianceMatrix ComplianceValidator::build_matrix(const RequirementSet &requirements,
                                                   const CandidateBuild &candidate) const {
    ComplianceMatrix matrix;
    for (const auto &req : requirements.requirements) {
        ComplianceRecord record;
        record.requirement_id = req.id;
        record.priority = req.priority;
        record.implementation_ref = find_evidence(candidate.implementation, req);
        record.test_ref = find_evidence(candidate.tests, req);
        record.satisfied = !record.implementation_ref.empty() && !record.test_ref.empty();
        matrix.records.push_back(std::move(record));
    }
    return matrix;
}

Result<ComplianceMatrix> ComplianceValidator::validate(const Recipe &recipe, const CandidateBuild &candidate) const {
    ComplianceMatrix matrix = build_matrix(recipe.requirements, candidate);
    auto unmet = matrix.unmet_musts();
    if (!unmet.empty()) {
        Error err{.kind = ErrorKind::Compliance,
                  .message = std::format("{} MUST requirement(s) lack implementation or test evidence", unmet.size()),
                  .recipe = recipe.name,
                  .phase = "compliance",
                  .subjects = std::move(unmet)};
        return fail(std::move(err));
    }
    const auto satisfied = std::ranges::count_if(matrix.records, &ComplianceRecord::satisfied);
    spdlog::debug("{}: compliance {}/{} requirements evidenced", recipe.name, satisfied, matrix.records.size());
    return matrix;
}

} // namespace kiln
