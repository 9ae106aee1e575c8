#include "kiln/command_oracle.hpp"

#include "kiln/process_exec.hpp"

#include <chrono>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kiln {

namespace {

// Request payloads carry raw tool output; invalid UTF-8 is replaced rather than thrown on.
std::string serialize(const json &doc, int indent = -1) {
    return doc.dump(indent, ' ', false, json::error_handler_t::replace);
}

json requirements_json(const RequirementSet &set) {
    json reqs = json::array();
    for (const auto &req : set.requirements) {
        reqs.push_back({{"id", req.id},
                        {"description", req.description},
                        {"priority", to_string(req.priority)},
                        {"functional", req.functional},
                        {"validation_criteria", req.validation_criteria}});
    }
    return {{"purpose", set.purpose},
            {"requirements", std::move(reqs)},
            {"success_criteria", set.success_criteria},
            {"text", set.source}};
}

json design_json(const Design &design) {
    json components = json::array();
    for (const auto &c : design.components) {
        components.push_back(
            {{"name", c.name}, {"file", c.file}, {"responsibility", c.responsibility}, {"signatures", c.signatures}});
    }
    json interfaces = json::array();
    for (const auto &i : design.interfaces)
        interfaces.push_back({{"name", i.name}, {"description", i.description}});
    return {{"architecture", design.architecture_summary},
            {"components", std::move(components)},
            {"interfaces", std::move(interfaces)},
            {"text", design.source}};
}

json findings_json(const std::vector<ReviewFinding> &findings) {
    json out = json::array();
    for (const auto &f : findings)
        out.push_back({{"severity", to_string(f.severity)}, {"location", f.location}, {"message", f.message}});
    return out;
}

std::unexpected<Error> bad_response(std::string_view operation, std::string what, std::string diagnostic = {}) {
    Error err{.kind = ErrorKind::Generation,
              .message = std::format("Oracle {} returned an unusable response: {}", operation, what),
              .phase = std::string(operation),
              .diagnostic = std::move(diagnostic)};
    return fail(std::move(err));
}

Result<ArtifactSet> artifacts_from(std::string_view operation, const json &response) {
    auto it = response.find("files");
    if (it == response.end() || !it->is_object())
        return bad_response(operation, "missing 'files' object", serialize(response));

    ArtifactSet set;
    set.generated_at = std::chrono::system_clock::now();
    for (const auto &[path, content] : it->items()) {
        if (!content.is_string())
            return bad_response(operation, std::format("content of '{}' is not a string", path));
        set.files.emplace(path, content.get<std::string>());
    }
    return set;
}

} // namespace

CommandOracle::CommandOracle(OracleConfig config, fs::path scratch_dir)
    : config_(std::move(config)), scratch_dir_(std::move(scratch_dir)) {
}

Result<json> CommandOracle::call(std::string_view operation, json request) {
    if (config_.command.empty()) {
        Error err{.kind = ErrorKind::Generation, .message = "No oracle command configured", .phase = std::string(operation)};
        return fail(std::move(err));
    }

    request["operation"] = operation;
    const fs::path request_file =
        scratch_dir_ / std::format("request-{}-{}-{}.json", operation, ::getpid(), sequence_.fetch_add(1));
    if (auto res = write_file_atomic(request_file, serialize(request, 2)); !res)
        return std::unexpected(res.error());

    std::vector<std::string> args = config_.command;
    args.push_back(request_file.string());

    spdlog::debug("oracle {}: {}", operation, request_file.string());
    auto output = process_exec(std::move(args), {.timeout = config_.timeout});

    std::error_code ec;
    fs::remove(request_file, ec);

    if (!output) {
        Error err = std::move(output.error());
        err.kind = ErrorKind::Generation;
        err.phase = std::string(operation);
        return fail(std::move(err));
    }
    if (output->exit_code != 0) {
        Error err{.kind = ErrorKind::Generation,
                  .message = std::format("Oracle {} exited with code {}", operation, output->exit_code),
                  .phase = std::string(operation),
                  .diagnostic = output->err.empty() ? output->out : output->err};
        return fail(std::move(err));
    }

    json response;
    try {
        response = json::parse(output->out);
    } catch (const json::parse_error &e) {
        return bad_response(operation, e.what(), output->out);
    }
    if (!response.is_object())
        return bad_response(operation, "expected a JSON object", output->out);
    if (auto it = response.find("error"); it != response.end() && it->is_string())
        return bad_response(operation, it->get<std::string>(), output->err);
    return response;
}

Result<ArtifactSet> CommandOracle::generate_tests(const RequirementSet &requirements, const Design &design) {
    auto response = call("generate_tests", {{"requirements", requirements_json(requirements)},
                                            {"design", design_json(design)}});
    if (!response)
        return std::unexpected(response.error());
    return artifacts_from("generate_tests", *response);
}

Result<ArtifactSet> CommandOracle::generate_implementation(const RequirementSet &requirements, const Design &design,
                                                           const ArtifactSet &fixed_tests) {
    auto response = call("generate_implementation", {{"requirements", requirements_json(requirements)},
                                                     {"design", design_json(design)},
                                                     {"tests", fixed_tests.files}});
    if (!response)
        return std::unexpected(response.error());
    return artifacts_from("generate_implementation", *response);
}

Result<ArtifactSet> CommandOracle::repair(const ArtifactSet &artifacts, const FailureReport &report) {
    json failures = json::array();
    for (const auto &f : report.failures)
        failures.push_back({{"name", f.name}, {"message", f.message}});
    auto response = call("repair", {{"artifacts", artifacts.files},
                                    {"failures", {{"summary", report.summary},
                                                  {"cases", std::move(failures)},
                                                  {"output", report.raw_output}}}});
    if (!response)
        return std::unexpected(response.error());
    return artifacts_from("repair", *response);
}

Result<ReviewReport> CommandOracle::review(const ArtifactSet &artifacts, const RequirementSet &requirements) {
    auto response = call("review", {{"artifacts", artifacts.files}, {"requirements", requirements_json(requirements)}});
    if (!response)
        return std::unexpected(response.error());

    auto it = response->find("findings");
    if (it == response->end() || !it->is_array())
        return bad_response("review", "missing 'findings' array", serialize(*response));

    ReviewReport report;
    for (const auto &entry : *it) {
        if (!entry.is_object())
            return bad_response("review", "finding is not an object", serialize(*response));
        auto text = [&entry](const char *key) -> std::optional<std::string> {
            auto field = entry.find(key);
            if (field == entry.end())
                return std::string{};
            if (!field->is_string())
                return std::nullopt;
            return field->get<std::string>();
        };
        auto severity = text("severity");
        auto location = text("location");
        auto message = text("message");
        if (!severity || !location || !message)
            return bad_response("review", "finding fields must be strings", serialize(*response));

        ReviewFinding finding;
        finding.severity = to_lower(*severity) == "critical" ? Severity::Critical : Severity::Suggestion;
        finding.location = std::move(*location);
        finding.message = std::move(*message);
        report.findings.push_back(std::move(finding));
    }
    return report;
}

Result<ArtifactSet> CommandOracle::revise_for_review(const ArtifactSet &artifacts,
                                                     const std::vector<ReviewFinding> &critical) {
    auto response = call("revise_for_review", {{"artifacts", artifacts.files}, {"findings", findings_json(critical)}});
    if (!response)
        return std::unexpected(response.error());
    return artifacts_from("revise_for_review", *response);
}

Result<SeparationCorrection> CommandOracle::correct_separation(std::string_view requirements, std::string_view design,
                                                               const std::vector<SeparationViolation> &violations) {
    json list = json::array();
    for (const auto &v : violations) {
        list.push_back(
            {{"artifact", v.artifact}, {"line", v.line}, {"phrase", v.phrase}, {"excerpt", v.excerpt}});
    }
    auto response = call("correct_separation",
                         {{"requirements", requirements}, {"design", design}, {"violations", std::move(list)}});
    if (!response)
        return std::unexpected(response.error());

    auto req = response->find("requirements");
    auto des = response->find("design");
    if (req == response->end() || !req->is_string() || des == response->end() || !des->is_string())
        return bad_response("correct_separation", "expected 'requirements' and 'design' strings", serialize(*response));
    return SeparationCorrection{req->get<std::string>(), des->get<std::string>()};
}

} // namespace kiln
