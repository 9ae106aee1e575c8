#include "kiln/complexity.hpp"

#include "kiln/recipe_store.hpp"

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace kiln {

namespace {

struct FunctionalArea {
    std::string_view name;
    std::vector<std::string_view> keywords;
};

const std::vector<FunctionalArea> &functional_areas() {
    static const std::vector<FunctionalArea> areas = {
        {"data", {"data", "storage", "database", "persistence", "persist", "repository", "cache", "schema"}},
        {"interface", {"api", "endpoint", "protocol", "contract", "interface"}},
        {"presentation", {"ui", "view", "display", "render", "presentation", "frontend", "screen", "dashboard"}},
        {"security", {"security", "auth", "authentication", "authorization", "permission", "credential", "encryption"}},
        {"networking", {"network", "networking", "messaging", "message", "queue", "socket", "transport", "broker"}},
        {"processing", {"processing", "logic", "algorithm", "compute", "engine", "workflow", "pipeline"}},
        {"configuration", {"config", "configuration", "settings", "options"}},
        {"observability", {"logging", "metrics", "monitoring", "tracing", "telemetry", "observability"}},
    };
    return areas;
}

const FunctionalArea &area(std::string_view name) {
    return *std::ranges::find(functional_areas(), name, &FunctionalArea::name);
}

bool mentions(std::string_view text, const FunctionalArea &a) {
    return std::ranges::any_of(a.keywords, [&](std::string_view kw) { return contains_word(text, kw); });
}

std::string requirement_text(const Requirement &req) {
    std::string text = req.description;
    for (const auto &criterion : req.validation_criteria) {
        text += '\n';
        text += criterion;
    }
    return text;
}

Recipe make_child(const Recipe &parent, std::string_view suffix, std::vector<Requirement> requirements,
                  Design design, DecompositionStrategy strategy, const std::vector<std::string> &extra_deps) {
    Recipe child;
    child.name = std::format("{}-{}", parent.name, suffix);
    child.location = std::format("{}#{}", parent.location, child.name);

    child.requirements.purpose = parent.requirements.purpose;
    child.requirements.requirements = std::move(requirements);
    child.requirements.source = render_requirements(child.requirements);

    child.design = std::move(design);
    child.design.source = render_design(child.design);

    child.metadata = parent.metadata;
    child.metadata.name = child.name;
    child.metadata.description = std::format("{} part of {}", suffix, parent.name);
    child.metadata.source.clear();
    child.metadata.attributes.erase("aggregate");
    child.metadata.attributes.erase("selfHosting");
    child.metadata.attributes.insert_or_assign("parent", parent.name);
    child.metadata.attributes.insert_or_assign("strategy", std::string(to_string(strategy)));
    for (const auto &dep : extra_deps) {
        if (std::ranges::find(child.metadata.dependencies, dep) == child.metadata.dependencies.end())
            child.metadata.dependencies.push_back(dep);
    }

    uint64_t hash = fnv1a(parent.checksum);
    hash = fnv1a(child.name, hash);
    for (const auto &req : child.requirements.requirements)
        hash = fnv1a(req.id, hash);
    child.checksum = to_hex(hash);
    return child;
}

size_t smallest_bucket(const std::vector<std::vector<Requirement>> &buckets) {
    auto it = std::ranges::min_element(buckets, {}, [](const auto &bucket) { return bucket.size(); });
    return static_cast<size_t>(it - buckets.begin());
}

std::vector<Recipe> functional_split(const Recipe &recipe) {
    const auto &components = recipe.design.components;
    std::vector<std::vector<std::string>> keywords;
    for (const auto &c : components)
        keywords.push_back(significant_keywords(c.name + " " + c.responsibility));

    std::vector<std::vector<Requirement>> buckets(components.size());
    for (const auto &req : recipe.requirements.requirements) {
        const std::string text = requirement_text(req);
        size_t best = 0;
        size_t best_score = 0;
        for (size_t i = 0; i < components.size(); ++i) {
            size_t score = static_cast<size_t>(
                std::ranges::count_if(keywords[i], [&](const std::string &kw) { return contains_word(text, kw); }));
            if (score > best_score) {
                best = i;
                best_score = score;
            }
        }
        buckets[best_score > 0 ? best : smallest_bucket(buckets)].push_back(req);
    }

    std::vector<Recipe> children;
    for (size_t i = 0; i < components.size(); ++i) {
        if (buckets[i].empty()) {
            spdlog::debug("{}: component '{}' received no requirements", recipe.name, components[i].name);
            continue;
        }
        Design design;
        design.architecture_summary =
            components[i].responsibility.empty() ? recipe.design.architecture_summary : components[i].responsibility;
        design.components.push_back(components[i]);
        for (const auto &iface : recipe.design.interfaces) {
            if (contains_word(iface.name, components[i].name) || contains_word(iface.description, components[i].name))
                design.interfaces.push_back(iface);
        }
        children.push_back(make_child(recipe, slugify(components[i].name), std::move(buckets[i]), std::move(design),
                                      DecompositionStrategy::Functional, {}));
    }
    return children;
}

std::vector<Recipe> risk_split(const Recipe &recipe, size_t chunk) {
    chunk = std::max<size_t>(chunk, 1);
    std::vector<Requirement> musts;
    std::vector<Requirement> rest;
    for (const auto &req : recipe.requirements.requirements)
        (req.priority == Priority::Must ? musts : rest).push_back(req);

    std::vector<Recipe> children;
    std::vector<std::string> core_names;
    for (size_t start = 0, k = 1; start < musts.size(); start += chunk, ++k) {
        const size_t end = std::min(musts.size(), start + chunk);
        std::vector<Requirement> part(musts.begin() + static_cast<ptrdiff_t>(start),
                                      musts.begin() + static_cast<ptrdiff_t>(end));
        children.push_back(make_child(recipe, std::format("core-{}", k), std::move(part), recipe.design,
                                      DecompositionStrategy::RiskBased, {}));
        core_names.push_back(children.back().name);
    }
    if (!rest.empty()) {
        children.push_back(make_child(recipe, "extensions", std::move(rest), recipe.design,
                                      DecompositionStrategy::RiskBased, core_names));
    }
    return children;
}

std::vector<Recipe> layered_split(const Recipe &recipe) {
    enum Layer : size_t { Data, Logic, Presentation, LayerCount };
    static constexpr std::string_view kNames[LayerCount] = {"data", "logic", "presentation"};

    auto classify = [](std::string_view text) -> Layer {
        if (mentions(text, area("presentation")))
            return Presentation;
        if (mentions(text, area("data")))
            return Data;
        return Logic;
    };

    std::vector<Requirement> reqs[LayerCount];
    for (const auto &req : recipe.requirements.requirements)
        reqs[classify(requirement_text(req))].push_back(req);

    Design designs[LayerCount];
    for (const auto &c : recipe.design.components)
        designs[classify(c.name + " " + c.responsibility)].components.push_back(c);
    designs[Logic].interfaces = recipe.design.interfaces;

    std::vector<Recipe> children;
    std::vector<std::string> below;
    for (size_t layer = Data; layer < LayerCount; ++layer) {
        if (reqs[layer].empty())
            continue;
        designs[layer].architecture_summary = std::format("The {} layer of {}.", kNames[layer], recipe.name);
        children.push_back(make_child(recipe, kNames[layer], std::move(reqs[layer]), std::move(designs[layer]),
                                      DecompositionStrategy::Layered, below));
        below = {children.back().name};
    }
    return children;
}

} // namespace

std::string_view to_string(DecompositionStrategy strategy) {
    switch (strategy) {
    case DecompositionStrategy::None:
        return "none";
    case DecompositionStrategy::Functional:
        return "functional";
    case DecompositionStrategy::Layered:
        return "layered";
    case DecompositionStrategy::RiskBased:
        return "risk";
    }
    return "none";
}

std::vector<std::string> detect_functional_areas(const Design &design) {
    std::string text = design.architecture_summary;
    for (const auto &c : design.components) {
        text += '\n';
        text += c.name;
        text += '\n';
        text += c.responsibility;
    }
    for (const auto &i : design.interfaces) {
        text += '\n';
        text += i.description;
    }

    std::vector<std::string> found;
    for (const auto &a : functional_areas()) {
        if (mentions(text, a))
            found.emplace_back(a.name);
    }
    return found;
}

ComplexityEvaluator::ComplexityEvaluator(ComplexityConfig config) : config_(config) {
}

ComplexityScore ComplexityEvaluator::evaluate(const Recipe &recipe) const {
    ComplexityScore score;
    score.components = recipe.design.components.size();
    score.musts = recipe.requirements.count(Priority::Must);
    score.areas = detect_functional_areas(recipe.design);

    auto over = [](size_t value, size_t threshold) {
        return value > threshold ? static_cast<double>(value - threshold) : 0.0;
    };
    score.score = config_.component_weight * over(score.components, config_.component_threshold) +
                  config_.must_weight * over(score.musts, config_.must_threshold) +
                  config_.area_weight * static_cast<double>(score.areas.size());
    score.exceeds = score.score > config_.boundary;

    if (score.exceeds) {
        if (score.components > config_.component_threshold)
            score.strategy = DecompositionStrategy::Functional;
        else if (score.musts > config_.must_threshold)
            score.strategy = DecompositionStrategy::RiskBased;
        else
            score.strategy = DecompositionStrategy::Layered;
    }
    return score;
}

Decomposition ComplexityEvaluator::decompose(const Recipe &recipe, DecompositionStrategy strategy) const {
    Decomposition out;
    switch (strategy) {
    case DecompositionStrategy::Functional:
        out.children = functional_split(recipe);
        break;
    case DecompositionStrategy::RiskBased:
        out.children = risk_split(recipe, config_.must_threshold);
        break;
    case DecompositionStrategy::Layered:
        out.children = layered_split(recipe);
        break;
    case DecompositionStrategy::None:
        break;
    }

    out.parent = recipe;
    out.parent.metadata.attributes.insert_or_assign("aggregate", "true");
    out.parent.metadata.attributes.insert_or_assign("strategy", std::string(to_string(strategy)));
    for (const auto &child : out.children)
        out.parent.metadata.dependencies.push_back(child.name);
    return out;
}

Result<void> ComplexityEvaluator::expand_one(const Recipe &recipe, size_t depth, RecipeSet &out) const {
    // Aggregates were split by an earlier pass.
    const ComplexityScore score = recipe.is_aggregate() ? ComplexityScore{} : evaluate(recipe);
    if (!score.exceeds) {
        if (!out.emplace(recipe.name, recipe).second)
            return fail(ErrorKind::Validation, std::format("Decomposition produced duplicate recipe '{}'", recipe.name));
        return {};
    }

    auto exceeded = [&](std::string why) {
        Error err{.kind = ErrorKind::ComplexityExceeded,
                  .message = std::format("Score {:.1f} exceeds {:.1f}: {}", score.score, config_.boundary, why),
                  .recipe = recipe.name,
                  .phase = "decomposition",
                  .subjects = {recipe.name}};
        return fail(std::move(err));
    };
    if (depth >= config_.max_depth)
        return exceeded(std::format("maximum decomposition depth {} reached", config_.max_depth));

    Decomposition split = decompose(recipe, score.strategy);
    if (split.children.size() < 2)
        return exceeded(std::format("{} split produced fewer than two children", to_string(score.strategy)));

    spdlog::info("{}: score {:.1f}, {} split into {} recipes", recipe.name, score.score, to_string(score.strategy),
                 split.children.size());
    for (const auto &child : split.children) {
        if (auto res = expand_one(child, depth + 1, out); !res)
            return res;
    }
    if (!out.emplace(split.parent.name, std::move(split.parent)).second)
        return fail(ErrorKind::Validation, std::format("Decomposition produced duplicate recipe '{}'", recipe.name));
    return {};
}

Result<RecipeSet> ComplexityEvaluator::expand(const RecipeSet &recipes) const {
    RecipeSet out;
    for (const auto &[name, recipe] : recipes) {
        if (auto res = expand_one(recipe, 0, out); !res)
            return std::unexpected(res.error());
    }
    return out;
}

} // namespace kiln
