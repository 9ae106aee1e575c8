#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace kiln {

inline constexpr std::string_view kRequirementsFile = "requirements.md";
inline constexpr std::string_view kDesignFile = "design.md";
inline constexpr std::string_view kMetadataFile = "components.json";

/**
 * @brief Parses requirements.md.
 *
 * Requirements are bullets starting with MUST, SHOULD or COULD (optionally preceded by an explicit
 * `[id]`) inside the "Functional Requirements" and "Non-Functional Requirements" sections; indented
 * sub-bullets are validation criteria.
 *
 * @param text The document.
 * @param origin Name used in error messages (the artifact path).
 * @return The requirement set, or a `Parse` error naming `origin` and the line.
 */
Result<RequirementSet> parse_requirements(std::string_view text, std::string_view origin);

/** @brief Parses design.md into a summary, component list and interface list. */
Result<Design> parse_design(std::string_view text, std::string_view origin);

/** @brief Parses components.json. `fallback_name` is used when the record has no name. */
Result<ComponentMetadata> parse_metadata(std::string_view text, std::string_view origin,
                                         std::string_view fallback_name);

/** @brief FNV-1a over the concatenation of the three source texts. */
std::string compute_checksum(std::string_view requirements, std::string_view design, std::string_view metadata);

/**
 * @brief Builds a Recipe from the three source texts.
 * @param location Opaque handle stored on the recipe (the directory for on-disk recipes).
 */
Result<Recipe> parse_recipe(std::string_view requirements, std::string_view design, std::string_view metadata,
                            std::string location, std::string_view fallback_name);

/**
 * @brief Loads a single recipe directory.
 * @return The recipe, or a `Parse` error if an artifact is absent or malformed.
 */
Result<Recipe> load_recipe(const std::filesystem::path &location);

/**
 * @brief Loads every immediate sub-directory of `root` that holds a components.json.
 *
 * Fails on the first malformed recipe and on duplicate recipe names.
 */
Result<RecipeSet> load_collection(const std::filesystem::path &root);

/**
 * @brief Loads `location` and, transitively, the dependencies it names from siblings under `root`.
 *
 * Dependencies that have no directory under `root` are left out; the resolver reports them.
 */
Result<RecipeSet> discover_recipes(const std::filesystem::path &location, const std::filesystem::path &root);

/** @brief Renders a requirement set back into the requirements.md format. */
std::string render_requirements(const RequirementSet &requirements);

/** @brief Renders a design back into the design.md format. */
std::string render_design(const Design &design);

} // namespace kiln
