#include "kiln/config.hpp"

#include <format>
#include <yaml-cpp/yaml.h>

namespace kiln {

namespace {

std::string key_name(std::string_view section, std::string_view key) {
    return section.empty() ? std::string(key) : std::format("{}.{}", section, key);
}

std::unexpected<Error> bad_value(std::string_view section, std::string_view key, std::string_view expected) {
    return fail(ErrorKind::Config, std::format("Invalid value for '{}': expected {}", key_name(section, key), expected));
}

template <typename T>
Result<void> read_value(const YAML::Node &parent, std::string_view section, const char *key, T &dst,
                        std::string_view expected) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull())
        return {};
    if (!node.IsScalar())
        return bad_value(section, key, expected);
    try {
        dst = node.as<T>();
    } catch (const YAML::Exception &) {
        return bad_value(section, key, expected);
    }
    return {};
}

Result<void> read_size(const YAML::Node &parent, std::string_view section, const char *key, size_t &dst) {
    long long value = 0;
    bool present = parent[key] && !parent[key].IsNull();
    if (auto res = read_value(parent, section, key, value, "a non-negative integer"); !res)
        return res;
    if (!present)
        return {};
    if (value < 0)
        return bad_value(section, key, "a non-negative integer");
    dst = static_cast<size_t>(value);
    return {};
}

Result<void> read_seconds(const YAML::Node &parent, std::string_view section, const char *key,
                          std::chrono::seconds &dst) {
    size_t value = static_cast<size_t>(dst.count());
    if (auto res = read_size(parent, section, key, value); !res)
        return res;
    dst = std::chrono::seconds(static_cast<long long>(value));
    return {};
}

Result<void> read_path(const YAML::Node &parent, std::string_view section, const char *key,
                       std::filesystem::path &dst) {
    std::string value = dst.string();
    if (auto res = read_value(parent, section, key, value, "a path"); !res)
        return res;
    dst = value;
    return {};
}

// Accepts a sequence of strings or a single whitespace-separated string.
Result<void> read_list(const YAML::Node &parent, std::string_view section, const char *key,
                       std::vector<std::string> &dst) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull())
        return {};
    try {
        if (node.IsScalar()) {
            dst.clear();
            for (auto word : split_words(node.as<std::string>()))
                dst.emplace_back(word);
        } else if (node.IsSequence()) {
            dst = node.as<std::vector<std::string>>();
        } else {
            return bad_value(section, key, "a list of strings");
        }
    } catch (const YAML::Exception &) {
        return bad_value(section, key, "a list of strings");
    }
    return {};
}

Result<YAML::Node> section_of(const YAML::Node &root, const char *name) {
    YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap())
        return fail(ErrorKind::Config, std::format("Section '{}' must be a mapping", name));
    return node;
}

#define KILN_TRY(expr)                                                                                                 \
    if (auto res_ = (expr); !res_)                                                                                     \
        return std::unexpected(res_.error());

Result<void> apply(const YAML::Node &root, KilnConfig &config) {
    KILN_TRY(read_size(root, "", "jobs", config.jobs));
    KILN_TRY(read_path(root, "", "output_dir", config.output_dir));
    KILN_TRY(read_path(root, "", "state_dir", config.state_dir));
    KILN_TRY(read_path(root, "", "source_root", config.source_root));
    KILN_TRY(read_value(root, "", "allow_self_overwrite", config.allow_self_overwrite, "a boolean"));
    KILN_TRY(read_value(root, "", "force", config.force, "a boolean"));
    KILN_TRY(read_value(root, "", "dry_run", config.dry_run, "a boolean"));

    auto separation = section_of(root, "separation");
    if (!separation)
        return std::unexpected(separation.error());
    if (*separation) {
        std::string policy;
        KILN_TRY(read_value(*separation, "separation", "policy", policy, "report, auto_apply or fail"));
        if (!policy.empty()) {
            auto parsed = parse_separation_policy(policy);
            if (!parsed)
                return bad_value("separation", "policy", "report, auto_apply or fail");
            config.separation.policy = *parsed;
        }
        KILN_TRY(read_list(*separation, "separation", "technology_terms", config.separation.technology_terms));
        KILN_TRY(read_list(*separation, "separation", "requirement_terms", config.separation.requirement_terms));
    }

    auto complexity = section_of(root, "complexity");
    if (!complexity)
        return std::unexpected(complexity.error());
    if (*complexity) {
        auto &c = config.complexity;
        KILN_TRY(read_size(*complexity, "complexity", "component_threshold", c.component_threshold));
        KILN_TRY(read_size(*complexity, "complexity", "must_threshold", c.must_threshold));
        KILN_TRY(read_value(*complexity, "complexity", "component_weight", c.component_weight, "a number"));
        KILN_TRY(read_value(*complexity, "complexity", "must_weight", c.must_weight, "a number"));
        KILN_TRY(read_value(*complexity, "complexity", "area_weight", c.area_weight, "a number"));
        KILN_TRY(read_value(*complexity, "complexity", "boundary", c.boundary, "a number"));
        KILN_TRY(read_size(*complexity, "complexity", "max_depth", c.max_depth));
    }

    auto generation = section_of(root, "generation");
    if (!generation)
        return std::unexpected(generation.error());
    if (*generation) {
        auto &g = config.generation;
        KILN_TRY(read_size(*generation, "generation", "max_fix_iterations", g.max_fix_iterations));
        KILN_TRY(read_size(*generation, "generation", "max_stub_remediations", g.max_stub_remediations));
        KILN_TRY(read_size(*generation, "generation", "oracle_attempts", g.oracle_attempts));
        if (g.oracle_attempts == 0)
            return bad_value("generation", "oracle_attempts", "at least 1");
    }

    auto review = section_of(root, "review");
    if (!review)
        return std::unexpected(review.error());
    if (*review)
        KILN_TRY(read_size(*review, "review", "max_review_iterations", config.review.max_review_iterations));

    auto oracle = section_of(root, "oracle");
    if (!oracle)
        return std::unexpected(oracle.error());
    if (*oracle) {
        KILN_TRY(read_list(*oracle, "oracle", "command", config.oracle.command));
        KILN_TRY(read_seconds(*oracle, "oracle", "timeout", config.oracle.timeout));
    }

    auto quality = section_of(root, "quality");
    if (!quality)
        return std::unexpected(quality.error());
    if (*quality) {
        auto &q = config.quality;
        KILN_TRY(read_list(*quality, "quality", "type_check", q.type_check_command));
        KILN_TRY(read_list(*quality, "quality", "lint", q.lint_command));
        KILN_TRY(read_list(*quality, "quality", "test", q.test_command));
        KILN_TRY(read_value(*quality, "quality", "min_coverage", q.min_coverage, "a number"));
        KILN_TRY(read_seconds(*quality, "quality", "timeout", q.timeout));
        KILN_TRY(read_path(*quality, "quality", "work_dir", q.work_dir));
        if (q.min_coverage < 0.0 || q.min_coverage > 100.0)
            return bad_value("quality", "min_coverage", "a percentage between 0 and 100");
    }

    auto self_host = section_of(root, "self_host");
    if (!self_host)
        return std::unexpected(self_host.error());
    if (*self_host) {
        auto &s = config.self_host;
        KILN_TRY(read_value(*self_host, "self_host", "recipe", s.recipe, "a recipe name"));
        KILN_TRY(read_list(*self_host, "self_host", "build", s.build_command));
        KILN_TRY(read_list(*self_host, "self_host", "run", s.run_command));
        KILN_TRY(read_list(*self_host, "self_host", "components", s.components));
        KILN_TRY(read_path(*self_host, "self_host", "work_dir", s.work_dir));
        KILN_TRY(read_seconds(*self_host, "self_host", "timeout", s.timeout));
    }

    auto log = section_of(root, "log");
    if (!log)
        return std::unexpected(log.error());
    if (*log) {
        KILN_TRY(read_value(*log, "log", "level", config.log.level, "a log level"));
        KILN_TRY(read_value(*log, "log", "pattern", config.log.pattern, "a pattern string"));
    }
    return {};
}

#undef KILN_TRY

} // namespace

std::string_view to_string(SeparationPolicy policy) {
    switch (policy) {
    case SeparationPolicy::Report:
        return "report";
    case SeparationPolicy::AutoApply:
        return "auto_apply";
    case SeparationPolicy::Fail:
        return "fail";
    }
    return "report";
}

std::optional<SeparationPolicy> parse_separation_policy(std::string_view token) {
    const std::string t = to_lower(trim(token));
    if (t == "report")
        return SeparationPolicy::Report;
    if (t == "auto_apply" || t == "auto-apply")
        return SeparationPolicy::AutoApply;
    if (t == "fail")
        return SeparationPolicy::Fail;
    return std::nullopt;
}

std::vector<std::string> SeparationConfig::default_technology_terms() {
    return {"python",  "java",     "javascript", "typescript", "c++",       "rust",     "golang",
            "postgres", "postgresql", "mysql",   "sqlite",     "mongodb",   "redis",    "kafka",
            "rabbitmq", "react",    "django",    "flask",      "fastapi",   "spring",   "docker",
            "kubernetes", "grpc",   "graphql",   "sql",        "http",      "rest api", "quicksort",
            "mergesort", "dijkstra", "a*",       "bloom filter", "b-tree",  "subprocess", "asyncio",
            "pydantic", "numpy",    "pandas"};
}

std::vector<std::string> SeparationConfig::default_requirement_terms() {
    return {"shall", "must", "should", "could", "business rule"};
}

std::vector<std::string> SelfHostConfig::default_components() {
    return {"recipe_store", "separation", "complexity", "graph",      "build_cache", "generation",
            "review",       "quality",    "compliance", "orchestrator", "self_host"};
}

Result<KilnConfig> parse_config(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException &e) {
        return fail(ErrorKind::Config, std::format("Failed to parse configuration: {}", e.what()));
    }

    KilnConfig config;
    if (!root || root.IsNull())
        return config;
    if (!root.IsMap())
        return fail(ErrorKind::Config, "Configuration must be a mapping");
    if (auto res = apply(root, config); !res)
        return std::unexpected(res.error());
    return config;
}

Result<KilnConfig> load_config(const std::filesystem::path &path) {
    auto text = read_file(path);
    if (!text)
        return std::unexpected(Error{.kind = ErrorKind::Config, .message = text.error().message});
    auto config = parse_config(*text);
    if (!config)
        config.error().message = std::format("{}: {}", path.string(), config.error().message);
    return config;
}

} // namespace kiln
