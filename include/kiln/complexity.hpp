#pragma once

#include "kiln/config.hpp"
#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class DecompositionStrategy : uint8_t { None, Functional, Layered, RiskBased };

std::string_view to_string(DecompositionStrategy strategy);

struct ComplexityScore {
    size_t components = 0;
    size_t musts = 0;
    std::vector<std::string> areas; ///< Distinct functional areas named in the design.
    double score = 0.0;
    bool exceeds = false;
    DecompositionStrategy strategy = DecompositionStrategy::None;
};

/** @brief A parent turned aggregate and the children that now carry its requirements. */
struct Decomposition {
    Recipe parent;
    std::vector<Recipe> children;
};

/** @brief Functional areas (data, interface, presentation, ...) named anywhere in `design`. */
std::vector<std::string> detect_functional_areas(const Design &design);

class ComplexityEvaluator {
public:
    explicit ComplexityEvaluator(ComplexityConfig config);

    ComplexityScore evaluate(const Recipe &recipe) const;

    /**
     * @brief Splits `recipe` once using `strategy`.
     *
     * Every requirement lands in exactly one child. Children inherit the parent's dependencies; the
     * parent gains `aggregate = true` and depends on all children.
     */
    Decomposition decompose(const Recipe &recipe, DecompositionStrategy strategy) const;

    /**
     * @brief Decomposes every recipe of `recipes` that exceeds the boundary, recursively, until no
     *        recipe does.
     * @return The expanded set, or `ComplexityExceeded` once `max_depth` is reached.
     */
    Result<RecipeSet> expand(const RecipeSet &recipes) const;

private:
    Result<void> expand_one(const Recipe &recipe, size_t depth, RecipeSet &out) const;

    ComplexityConfig config_;
};

} // namespace kiln
