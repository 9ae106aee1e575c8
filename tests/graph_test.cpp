#include "fakes.hpp"

#include "kiln/graph.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::testing;

namespace {

size_t position(const std::vector<std::string> &order, std::string_view name) {
    return static_cast<size_t>(std::ranges::find(order, name) - order.begin());
}

} // namespace

TEST(Graph, OrdersDependenciesFirst) {
    auto set = make_set({make_recipe("app", {"net", "store"}), make_recipe("net", {"core"}),
                         make_recipe("store", {"core"}), make_recipe("core")});
    auto res = resolve(set);
    ASSERT_TRUE(res) << res.error().message;

    const auto &order = res->order;
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(position(order, "core"), position(order, "net"));
    EXPECT_LT(position(order, "core"), position(order, "store"));
    EXPECT_LT(position(order, "net"), position(order, "app"));
    EXPECT_LT(position(order, "store"), position(order, "app"));
}

TEST(Graph, GroupsAreMaximalWaves) {
    auto set = make_set({make_recipe("app", {"net", "store"}), make_recipe("net", {"core"}),
                         make_recipe("store", {"core"}), make_recipe("core"), make_recipe("docs")});
    auto res = resolve(set);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->groups, (std::vector<std::vector<std::string>>{{"core", "docs"}, {"net", "store"}, {"app"}}));
}

TEST(Graph, IndependentRecipesShareOneGroup) {
    auto set = make_set({make_recipe("x"), make_recipe("y")});
    auto res = resolve(set);
    ASSERT_TRUE(res);
    ASSERT_EQ(res->groups.size(), 1u);
    EXPECT_EQ(res->groups[0], (std::vector<std::string>{"x", "y"}));
}

TEST(Graph, CycleReportsItsPath) {
    auto set = make_set({make_recipe("a", {"b"}), make_recipe("b", {"c"}), make_recipe("c", {"a"})});
    auto res = resolve(set);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::CircularDependency);
    EXPECT_EQ(res.error().subjects, (std::vector<std::string>{"a", "b", "c", "a"}));
}

TEST(Graph, SelfDependencyIsACycle) {
    auto set = make_set({make_recipe("loop", {"loop"})});
    auto res = resolve(set);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::CircularDependency);
    EXPECT_EQ(res.error().subjects, (std::vector<std::string>{"loop", "loop"}));
}

TEST(Graph, MissingDependencyNamesEveryUnknownRecipe) {
    auto set = make_set({make_recipe("app", {"ghost", "lib"}), make_recipe("lib", {"phantom"})});
    auto res = resolve(set);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::MissingDependency);
    EXPECT_EQ(res.error().subjects, (std::vector<std::string>{"ghost", "phantom"}));
    EXPECT_TRUE(is_structural(res.error().kind));
}

TEST(Graph, TransitiveQueries) {
    auto set = make_set({make_recipe("app", {"lib"}), make_recipe("lib", {"core"}), make_recipe("core"),
                         make_recipe("tool", {"core"})});
    auto graph = RecipeGraph::build(set);
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph->transitive_dependents("core"), (std::vector<std::string>{"app", "lib", "tool"}));
    EXPECT_EQ(graph->transitive_dependencies("app"), (std::vector<std::string>{"core", "lib"}));
    EXPECT_TRUE(graph->transitive_dependents("app").empty());
    EXPECT_TRUE(graph->transitive_dependencies("nope").empty());
}

TEST(Graph, DuplicateEdgesAreIgnored) {
    RecipeGraph graph;
    size_t a = graph.get_or_create_node("a");
    size_t b = graph.get_or_create_node("b");
    graph.add_edge(a, b);
    graph.add_edge(a, b);
    EXPECT_EQ(graph.get_or_create_node("a"), a);
    EXPECT_EQ(graph.nodes()[a].out_edges.size(), 1u);
    EXPECT_EQ(graph.nodes()[b].in_edges.size(), 1u);
}
