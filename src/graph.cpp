#include "kiln/graph.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>
#include <set>

namespace kiln {

Result<RecipeGraph> RecipeGraph::build(const RecipeSet &recipes) {
    RecipeGraph graph;
    for (const auto &[name, recipe] : recipes)
        graph.get_or_create_node(name);

    std::set<std::string> missing;
    std::vector<std::string> details;
    for (const auto &[name, recipe] : recipes) {
        const size_t dependent = *graph.find(name);
        for (const auto &dep : recipe.dependencies()) {
            auto dependency = graph.find(dep);
            if (!dependency) {
                missing.insert(dep);
                details.push_back(std::format("{} -> {}", name, dep));
                continue;
            }
            graph.add_edge(*dependency, dependent);
        }
    }

    if (!missing.empty()) {
        Error err{.kind = ErrorKind::MissingDependency,
                  .message = std::format("Unknown dependencies: {}", join(details, ", ")),
                  .phase = "resolution",
                  .subjects = {missing.begin(), missing.end()}};
        return fail(std::move(err));
    }
    return graph;
}

size_t RecipeGraph::get_or_create_node(std::string_view name) {
    if (auto it = index_.find(name); it != index_.end()) {
        return it->second;
    }

    size_t id = nodes_.size();
    nodes_.push_back({std::string(name), {}, {}});
    index_.emplace(std::string(name), id);
    return id;
}

void RecipeGraph::add_edge(size_t dependency, size_t dependent) {
    auto &deps = nodes_[dependent].in_edges;
    if (std::ranges::find(deps, dependency) != deps.end())
        return;
    deps.push_back(dependency);
    nodes_[dependency].out_edges.push_back(dependent);
}

std::optional<size_t> RecipeGraph::find(std::string_view name) const {
    if (auto it = index_.find(name); it != index_.end())
        return it->second;
    return std::nullopt;
}

Result<std::vector<size_t>> RecipeGraph::topo_sort() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(nodes_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    std::vector<size_t> stack;
    order.reserve(nodes_.size());

    // Walks dependency edges; post-order puts dependencies first.
    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        stack.push_back(u);
        for (size_t v : nodes_[u].in_edges) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                auto start = std::ranges::find(stack, v);
                std::vector<std::string> cycle;
                for (auto it = start; it != stack.end(); ++it)
                    cycle.push_back(nodes_[*it].name);
                cycle.push_back(nodes_[v].name);
                Error err{.kind = ErrorKind::CircularDependency,
                          .message = std::format("Circular dependency: {}", join(cycle, " -> ")),
                          .phase = "resolution",
                          .subjects = std::move(cycle)};
                return fail(std::move(err));
            }
        }
        stack.pop_back();
        status[u] = STATUS::FINISHED;
        order.push_back(u);
        return {};
    };

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return std::unexpected(res.error());
        }
    }
    return order;
}

Result<std::vector<std::vector<size_t>>> RecipeGraph::parallel_groups() const {
    if (auto res = topo_sort(); !res)
        return std::unexpected(res.error());

    std::vector<size_t> remaining(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i)
        remaining[i] = nodes_[i].in_edges.size();

    std::vector<std::vector<size_t>> groups;
    std::vector<size_t> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (remaining[i] == 0)
            ready.push_back(i);
    }

    while (!ready.empty()) {
        std::ranges::sort(ready, {}, [&](size_t i) -> const std::string & { return nodes_[i].name; });
        std::vector<size_t> next;
        for (size_t u : ready) {
            for (size_t v : nodes_[u].out_edges) {
                if (--remaining[v] == 0)
                    next.push_back(v);
            }
        }
        groups.push_back(std::move(ready));
        ready = std::move(next);
    }
    return groups;
}

std::vector<std::string> RecipeGraph::reachable(std::string_view name, std::vector<size_t> Node::*edges) const {
    auto start = find(name);
    if (!start)
        return {};

    std::vector<bool> seen(nodes_.size(), false);
    std::vector<size_t> pending{*start};
    std::vector<std::string> out;
    while (!pending.empty()) {
        size_t u = pending.back();
        pending.pop_back();
        for (size_t v : nodes_[u].*edges) {
            if (seen[v] || v == *start)
                continue;
            seen[v] = true;
            out.push_back(nodes_[v].name);
            pending.push_back(v);
        }
    }
    std::ranges::sort(out);
    return out;
}

std::vector<std::string> RecipeGraph::transitive_dependents(std::string_view name) const {
    return reachable(name, &Node::out_edges);
}

std::vector<std::string> RecipeGraph::transitive_dependencies(std::string_view name) const {
    return reachable(name, &Node::in_edges);
}

Result<Resolution> resolve(const RecipeSet &recipes) {
    auto graph = RecipeGraph::build(recipes);
    if (!graph)
        return std::unexpected(graph.error());

    auto order = graph->topo_sort();
    if (!order)
        return std::unexpected(order.error());
    auto groups = graph->parallel_groups();
    if (!groups)
        return std::unexpected(groups.error());

    Resolution resolution;
    for (size_t i : *order)
        resolution.order.push_back(graph->nodes()[i].name);
    for (const auto &group : *groups) {
        auto &names = resolution.groups.emplace_back();
        for (size_t i : group)
            names.push_back(graph->nodes()[i].name);
    }
    return resolution;
}

} // namespace kiln
