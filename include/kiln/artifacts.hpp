#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <filesystem>

namespace kiln {

/**
 * @brief Writes every file of `artifacts` below `dir`.
 *
 * Paths are relative; absolute paths and paths escaping `dir` through `..` are rejected.
 */
Result<void> write_artifacts(const std::filesystem::path &dir, const ArtifactSet &artifacts);

/** @brief Reads every regular file below `dir` into an artifact set keyed by relative path. */
Result<ArtifactSet> read_artifacts(const std::filesystem::path &dir);

/** @brief Removes `dir` and everything below it. */
Result<void> remove_tree(const std::filesystem::path &dir);

} // namespace kiln
