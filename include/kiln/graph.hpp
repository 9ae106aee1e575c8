#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

/**
 * @brief Dependency graph over a recipe set.
 *
 * Nodes are recipe names; an edge runs from a dependency to each recipe that depends on it, so a
 * node's `out_edges` must all be built after it.
 */
class RecipeGraph {
public:
    struct Node {
        std::string name;
        std::vector<size_t> out_edges; ///< Indices of recipes that depend on this one.
        std::vector<size_t> in_edges;  ///< Indices of this recipe's dependencies, in declaration order.
    };

    /**
     * @brief Builds the graph for `recipes`.
     * @return The graph, or a `MissingDependency` error whose subjects are the unknown names.
     */
    static Result<RecipeGraph> build(const RecipeSet &recipes);

    /**
     * @brief Retrieves the index of an existing node or creates a new one.
     * @param name The recipe name associated with the node.
     * @return The index of the node in the `nodes_` vector.
     */
    size_t get_or_create_node(std::string_view name);

    /** @brief Records that `dependency` must be built before `dependent`. */
    void add_edge(size_t dependency, size_t dependent);

    std::optional<size_t> find(std::string_view name) const;

    const std::vector<Node> &nodes() const {
        return nodes_;
    }

    /**
     * @brief Performs a topological sort of the graph.
     * @return Node indices with dependencies first, or a `CircularDependency` error whose subjects
     *         are the cycle path, closed by repeating its first name.
     */
    Result<std::vector<size_t>> topo_sort() const;

    /**
     * @brief Groups nodes into build waves by repeatedly removing every node whose dependencies are
     *        already removed. Names inside a group are sorted.
     */
    Result<std::vector<std::vector<size_t>>> parallel_groups() const;

    /** @brief Every recipe that depends on `name`, directly or transitively, sorted. */
    std::vector<std::string> transitive_dependents(std::string_view name) const;

    /** @brief Every recipe `name` depends on, directly or transitively, sorted. */
    std::vector<std::string> transitive_dependencies(std::string_view name) const;

private:
    std::vector<std::string> reachable(std::string_view name, std::vector<size_t> Node::*edges) const;

    std::vector<Node> nodes_;
    std::map<std::string, size_t, std::less<>> index_;
};

/** @brief Output of dependency resolution. */
struct Resolution {
    std::vector<std::string> order;               ///< Total order, dependencies first.
    std::vector<std::vector<std::string>> groups; ///< Group i depends only on groups < i.
};

/**
 * @brief Validates and orders a post-decomposition recipe set.
 *
 * Fails before any build activity with `MissingDependency` or `CircularDependency`.
 */
Result<Resolution> resolve(const RecipeSet &recipes);

} // namespace kiln
