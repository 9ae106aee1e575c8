#include "kiln/build_cache.hpp"

#include <chrono>
#include <format>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kiln {

namespace {

constexpr int kStateVersion = 1;

json to_json(const BuildRecord &record) {
    return json{{"checksum", record.last_checksum},
                {"outcome", to_string(record.outcome)},
                {"timestamp", record.timestamp},
                {"generation", record.generation},
                {"dependencies", record.dependency_generations},
                {"outputs", record.outputs},
                {"errors", record.errors}};
}

BuildRecord from_json(const json &j) {
    BuildRecord record;
    record.last_checksum = j.at("checksum").get<std::string>();
    record.outcome = j.at("outcome").get<std::string>() == "success" ? BuildOutcome::Success : BuildOutcome::Failure;
    record.timestamp = j.value("timestamp", int64_t{0});
    record.generation = j.value("generation", uint64_t{0});
    record.dependency_generations = j.value("dependencies", std::map<std::string, uint64_t>{});
    record.outputs = j.value("outputs", std::vector<std::string>{});
    record.errors = j.value("errors", std::vector<std::string>{});
    return record;
}

} // namespace

std::string_view to_string(BuildOutcome outcome) {
    return outcome == BuildOutcome::Success ? "success" : "failure";
}

BuildCache::BuildCache(fs::path state_dir) : state_dir_(std::move(state_dir)) {
}

fs::path BuildCache::state_file() const {
    return state_dir_.empty() ? fs::path{} : state_dir_ / "state.json";
}

Result<void> BuildCache::load() {
    if (state_dir_.empty())
        return {};
    const fs::path file = state_file();
    std::error_code ec;
    if (!fs::exists(file, ec))
        return {};

    auto text = read_file(file);
    if (!text)
        return std::unexpected(text.error());

    std::map<std::string, BuildRecord, std::less<>> loaded;
    try {
        const json doc = json::parse(*text);
        for (const auto &[name, entry] : doc.at("records").items())
            loaded.emplace(name, from_json(entry));
    } catch (const json::exception &e) {
        return fail(ErrorKind::Io, std::format("Corrupt build cache {}: {}", file.string(), e.what()));
    }

    std::unique_lock lock(mtx_);
    records_ = std::move(loaded);
    spdlog::debug("Loaded {} build records from {}", records_.size(), file.string());
    return {};
}

bool BuildCache::stale(const Recipe &recipe, const RecipeSet &recipes, std::map<std::string, bool> &memo,
                       std::set<std::string> &visiting) const {
    if (auto it = memo.find(recipe.name); it != memo.end())
        return it->second;
    if (!visiting.insert(recipe.name).second)
        return true;

    bool result = false;
    auto it = records_.find(recipe.name);
    if (it == records_.end()) {
        spdlog::debug("{}: no previous build", recipe.name);
        result = true;
    } else if (it->second.last_checksum != recipe.checksum) {
        spdlog::debug("{}: checksum changed", recipe.name);
        result = true;
    } else if (it->second.outcome == BuildOutcome::Failure) {
        spdlog::debug("{}: previous build failed", recipe.name);
        result = true;
    } else {
        for (const auto &dep : recipe.dependencies()) {
            auto dep_record = records_.find(dep);
            auto seen = it->second.dependency_generations.find(dep);
            if (dep_record == records_.end() || seen == it->second.dependency_generations.end() ||
                seen->second != dep_record->second.generation) {
                spdlog::debug("{}: dependency {} changed", recipe.name, dep);
                result = true;
                break;
            }
            auto dep_recipe = recipes.find(dep);
            if (dep_recipe != recipes.end() && stale(dep_recipe->second, recipes, memo, visiting)) {
                spdlog::debug("{}: dependency {} needs a rebuild", recipe.name, dep);
                result = true;
                break;
            }
        }
    }

    visiting.erase(recipe.name);
    memo.emplace(recipe.name, result);
    return result;
}

bool BuildCache::needs_rebuild(const Recipe &recipe, const RecipeSet &recipes, bool force) const {
    if (force)
        return true;
    std::shared_lock lock(mtx_);
    std::map<std::string, bool> memo;
    std::set<std::string> visiting;
    return stale(recipe, recipes, memo, visiting);
}

Result<void> BuildCache::record(const Recipe &recipe, BuildOutcome outcome, std::vector<std::string> outputs,
                                std::vector<std::string> errors) {
    std::unique_lock lock(mtx_);
    BuildRecord &record = records_[recipe.name];
    record.last_checksum = recipe.checksum;
    record.outcome = outcome;
    record.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    record.generation += 1;
    record.dependency_generations.clear();
    for (const auto &dep : recipe.dependencies()) {
        auto it = records_.find(dep);
        record.dependency_generations[dep] = it == records_.end() ? 0 : it->second.generation;
    }
    record.outputs = std::move(outputs);
    record.errors = std::move(errors);
    spdlog::debug("Recorded {} for {} (generation {})", to_string(outcome), recipe.name, record.generation);
    return flush();
}

std::optional<BuildRecord> BuildCache::last_build(std::string_view name) const {
    std::shared_lock lock(mtx_);
    if (auto it = records_.find(name); it != records_.end())
        return it->second;
    return std::nullopt;
}

CacheStatistics BuildCache::statistics() const {
    std::shared_lock lock(mtx_);
    CacheStatistics stats;
    stats.total = records_.size();
    for (const auto &[name, record] : records_) {
        if (record.outcome == BuildOutcome::Success)
            ++stats.successful;
        else
            ++stats.failed;
        stats.recipes.push_back(name);
    }
    return stats;
}

Result<void> BuildCache::clear(std::optional<std::string> name) {
    std::unique_lock lock(mtx_);
    if (name) {
        if (records_.erase(*name) == 0)
            return fail(ErrorKind::Io, std::format("No build record for '{}'", *name));
    } else {
        records_.clear();
    }
    return flush();
}

// Caller holds the writer lock.
Result<void> BuildCache::flush() const {
    if (state_dir_.empty())
        return {};
    json records = json::object();
    for (const auto &[name, record] : records_)
        records[name] = to_json(record);
    json doc{{"version", kStateVersion}, {"records", std::move(records)}};
    // Recorded errors may quote raw tool output.
    return write_file_atomic(state_file(), doc.dump(2, ' ', false, json::error_handler_t::replace));
}

} // namespace kiln
