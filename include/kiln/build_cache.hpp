#pragma once

#include "kiln/domain.hpp"
#include "kiln/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class BuildOutcome : uint8_t { Success, Failure };

std::string_view to_string(BuildOutcome outcome);

struct BuildRecord {
    std::string last_checksum;
    BuildOutcome outcome = BuildOutcome::Failure;
    int64_t timestamp = 0; ///< Seconds since the epoch.
    /// Bumped on every recorded attempt; dependents compare it against what they were built with.
    uint64_t generation = 0;
    std::map<std::string, uint64_t> dependency_generations;
    std::vector<std::string> outputs;
    std::vector<std::string> errors;
};

struct CacheStatistics {
    size_t total = 0;
    size_t successful = 0;
    size_t failed = 0;
    std::vector<std::string> recipes;
};

/**
 * @brief Persistent recipe name -> BuildRecord store; the only authority on skip/rebuild.
 *
 * Safe for concurrent use: lookups take a shared lock, `record` and `clear` take the writer lock
 * and flush the whole store while holding it.
 */
class BuildCache {
public:
    /** @param state_dir Directory holding `state.json`; empty keeps the cache in memory. */
    explicit BuildCache(std::filesystem::path state_dir = {});

    /** @brief Reads `state.json` if it exists. */
    Result<void> load();

    /**
     * @brief Decides whether `recipe` must be rebuilt.
     *
     * True if forced, unrecorded, changed, last failed, built against an older generation of a
     * dependency, or if any transitive dependency in `recipes` needs a rebuild.
     */
    bool needs_rebuild(const Recipe &recipe, const RecipeSet &recipes, bool force = false) const;

    /** @brief Upserts the record for `recipe`, bumping its generation, and flushes. */
    Result<void> record(const Recipe &recipe, BuildOutcome outcome, std::vector<std::string> outputs = {},
                        std::vector<std::string> errors = {});

    std::optional<BuildRecord> last_build(std::string_view name) const;
    CacheStatistics statistics() const;

    /** @brief Removes one record, or every record when `name` is empty. */
    Result<void> clear(std::optional<std::string> name = std::nullopt);

    std::filesystem::path state_file() const;

private:
    bool stale(const Recipe &recipe, const RecipeSet &recipes, std::map<std::string, bool> &memo,
               std::set<std::string> &visiting) const;
    Result<void> flush() const;

    std::filesystem::path state_dir_;
    std::map<std::string, BuildRecord, std::less<>> records_;
    mutable std::shared_mutex mtx_;
};

} // namespace kiln
