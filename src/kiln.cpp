#include "kiln/artifacts.hpp"
#include "kiln/build_cache.hpp"
#include "kiln/command_oracle.hpp"
#include "kiln/config.hpp"
#include "kiln/log.hpp"
#include "kiln/orchestrator.hpp"
#include "kiln/quality.hpp"
#include "kiln/recipe_store.hpp"
#include "kiln/self_host.hpp"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <spdlog/spdlog.h>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_help() {
    std::println("Usage: kiln [options] <recipe-location>");
    std::println("Options:");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version");
    std::println("  -d <dir>                Change working directory before doing anything");
    std::println("  -c <file>               Read configuration from <file> (default: kiln.yaml)");
    std::println("  -j, --jobs <N>          Set number of parallel recipe builds (default: auto)");
    std::println("  -o <dir>                Write generated artifacts below <dir> (default: out)");
    std::println("  --force                 Rebuild every recipe regardless of the build cache");
    std::println("  --dry-run               Print the build plan without generating anything");
    std::println("  --verbosity <0-3>       Log level: 0 errors, 1 info, 2 debug, 3 trace");
    std::println("  -q, --quiet             Same as --verbosity 0");
    std::println("  --analyze <name>        Show dependencies, plan and issues for one recipe");
    std::println("  --graph                 Generate DOT graph of the recipe set");
    std::println("  --clean [name]          Forget cached build records");
    std::println("  --stats                 Show build cache statistics");
    std::println("  --self-host             Regenerate kiln from its own recipe, twice");
    std::println("  --generate-only <dir>   Build one recipe and write its artifacts to <dir>");
}

void print_version() {
    std::println("kiln {}", KILN_PROJ_VER);
}

struct Options {
    std::optional<fs::path> config_file;
    fs::path work_dir = ".";
    std::optional<size_t> jobs;
    std::optional<fs::path> output_dir;
    std::optional<int> verbosity;
    std::optional<fs::path> generate_only;
    std::optional<std::string> analyze;
    std::optional<std::string> location;
    bool force = false;
    bool dry_run = false;
    bool graph = false;
    bool clean = false;
    bool stats = false;
    bool self_host = false;
};

bool parse_number(const char *text, auto &out) {
    auto res = std::from_chars(text, text + strlen(text), out);
    return res.ec == std::errc() && res.ptr == text + strlen(text);
}

int report_error(std::string_view what, const kiln::Error &err) {
    std::println(std::cerr, "{}: {}", what, err);
    if (!err.diagnostic.empty())
        spdlog::debug("diagnostic output:\n{}", err.diagnostic);
    return kiln::exit_code(err.kind);
}

kiln::Result<kiln::RecipeSet> load_recipes(const fs::path &location) {
    if (fs::exists(location / kiln::kMetadataFile)) {
        fs::path dir = location.lexically_normal();
        if (dir.filename().empty())
            dir = dir.parent_path();
        return kiln::discover_recipes(dir, dir.parent_path());
    }
    return kiln::load_collection(location);
}

int print_summary(const kiln::BuildResult &result) {
    size_t succeeded = 0, failed = 0, skipped = 0, current = 0, planned = 0;
    for (const auto &r : result.results) {
        switch (r.status) {
        case kiln::BuildStatus::Succeeded:
        case kiln::BuildStatus::Aggregated:
            ++succeeded;
            break;
        case kiln::BuildStatus::Failed:
            ++failed;
            break;
        case kiln::BuildStatus::SkippedDependencyFailure:
            ++skipped;
            break;
        case kiln::BuildStatus::UpToDate:
            ++current;
            break;
        case kiln::BuildStatus::Planned:
            ++planned;
            break;
        }
    }
    if (planned != 0)
        std::println("{} recipe(s) would be built, {} up to date", planned, current);
    else
        std::println("{} succeeded, {} failed, {} skipped, {} up to date", succeeded, failed, skipped, current);
    return result.success() ? 0 : 3;
}

int run_analyze(kiln::Orchestrator &orchestrator, const kiln::RecipeSet &recipes, std::string_view name) {
    auto res = orchestrator.analyze(recipes, name);
    if (!res)
        return report_error("Analysis failed", res.error());
    const auto &a = *res;
    std::println("Recipe: {}", a.name);
    std::println("  dependencies: {}", a.dependencies.empty() ? "(none)" : kiln::join(a.dependencies, ", "));
    std::println("  dependents:   {}", a.dependents.empty() ? "(none)" : kiln::join(a.dependents, ", "));
    std::println("  build order:  {}", kiln::join(a.plan, " -> "));
    std::println("  complexity:   {:.1f} ({} components, {} MUST, {} areas)", a.complexity.score,
                 a.complexity.components, a.complexity.musts, a.complexity.areas.size());
    std::println("  rebuild:      {}", a.needs_rebuild ? "needed" : "up to date");
    if (a.issues.empty()) {
        std::println("  issues:       none");
    } else {
        std::println("  issues:");
        for (const auto &issue : a.issues)
            std::println("    - {}", issue);
    }
    return 0;
}

int run_stats(const kiln::BuildCache &cache) {
    auto stats = cache.statistics();
    std::println("Build cache: {}", cache.state_file().string());
    std::println("  total:      {}", stats.total);
    std::println("  successful: {}", stats.successful);
    std::println("  failed:     {}", stats.failed);
    for (const auto &name : stats.recipes) {
        auto record = cache.last_build(name);
        if (record)
            std::println("  {} [{}] {}", name, kiln::to_string(record->outcome), record->last_checksum);
    }
    return 0;
}

int run_generate_only(kiln::Orchestrator &orchestrator, const fs::path &location, const fs::path &dir) {
    auto recipe = kiln::load_recipe(location);
    if (!recipe)
        return report_error("Failed to load recipe", recipe.error());
    auto result = orchestrator.execute_recipe(*recipe);
    if (!result.ok())
        return report_error("Generation failed", *result.error);
    if (auto res = kiln::write_artifacts(dir, result.candidate.merged()); !res)
        return report_error("Failed to write artifacts", res.error());
    std::println("{} -> {} ({} files)", recipe->name, dir.string(), result.candidate.merged().files.size());
    return 0;
}

int run_self_host(kiln::Orchestrator &orchestrator, kiln::QualityTools &tools, const kiln::KilnConfig &config,
                  const kiln::RecipeSet &recipes) {
    auto it = recipes.find(config.self_host.recipe);
    if (it == recipes.end()) {
        std::println(std::cerr, "No recipe named '{}' to self-host", config.self_host.recipe);
        return 1;
    }
    if (!it->second.is_self_hosting())
        spdlog::warn("{}: recipe is not marked selfHosting", it->first);

    kiln::CommandBootstrapLauncher launcher(config.self_host);
    kiln::SelfHost bootstrap(orchestrator, launcher, tools, config.self_host);
    auto res = bootstrap.run(it->second);
    if (!res)
        return report_error("Self-hosting failed", res.error());
    std::println("Self-hosting succeeded: {} components in both generations", res->components.size());
    return 0;
}

} // namespace

int main(const int argc, const char *const *argv) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&](std::string_view flag) -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(std::cerr, "Missing argument for {}", flag);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            const char *value = next(arg);
            if (!value)
                return 1;
            opts.work_dir = value;
        } else if (arg == "-c") {
            const char *value = next(arg);
            if (!value)
                return 1;
            opts.config_file = value;
        } else if (arg == "-o") {
            const char *value = next(arg);
            if (!value)
                return 1;
            opts.output_dir = value;
        } else if (arg == "-j" || arg == "--jobs") {
            const char *value = next(arg);
            if (!value)
                return 1;
            size_t jobs = 0;
            if (!parse_number(value, jobs)) {
                std::println(std::cerr, "Invalid job count: {}", value);
                return 1;
            }
            opts.jobs = jobs;
        } else if (arg == "--verbosity") {
            const char *value = next(arg);
            if (!value)
                return 1;
            int level = 0;
            if (!parse_number(value, level) || level < 0 || level > 3) {
                std::println(std::cerr, "Invalid verbosity: {}", value);
                return 1;
            }
            opts.verbosity = level;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.verbosity = 0;
        } else if (arg == "--force") {
            opts.force = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--graph") {
            opts.graph = true;
        } else if (arg == "--clean") {
            opts.clean = true;
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--self-host") {
            opts.self_host = true;
        } else if (arg == "--analyze") {
            const char *value = next(arg);
            if (!value)
                return 1;
            opts.analyze = value;
        } else if (arg == "--generate-only") {
            const char *value = next(arg);
            if (!value)
                return 1;
            opts.generate_only = value;
        } else if (!arg.starts_with('-') && !opts.location) {
            opts.location = std::string(arg);
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (opts.work_dir != ".") {
        std::error_code ec;
        fs::current_path(opts.work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", opts.work_dir.string(), ec.message());
            return 1;
        }
    }

    kiln::KilnConfig config;
    const fs::path config_file = opts.config_file.value_or(fs::path(kiln::kDefaultConfigFile));
    if (opts.config_file || fs::exists(config_file)) {
        auto loaded = kiln::load_config(config_file);
        if (!loaded)
            return report_error("Failed to load configuration", loaded.error());
        config = std::move(*loaded);
    }
    if (opts.jobs)
        config.jobs = *opts.jobs;
    if (opts.output_dir)
        config.output_dir = *opts.output_dir;
    if (opts.verbosity)
        config.log.level = kiln::verbosity_level(*opts.verbosity);
    config.force = config.force || opts.force || opts.generate_only.has_value();
    config.dry_run = config.dry_run || opts.dry_run;
    if (config.source_root.empty())
        config.source_root = KILN_SOURCE_DIR;

    kiln::init_logging(config.log);

    kiln::BuildCache cache(config.state_dir);
    if (auto res = cache.load(); !res)
        return report_error("Failed to load build cache", res.error());

    if (opts.stats)
        return run_stats(cache);
    if (opts.clean) {
        // With --clean the positional argument names the record to drop.
        if (auto res = cache.clear(opts.location); !res)
            return report_error("Clean failed", res.error());
        std::println("Cleared {}", opts.location ? *opts.location : std::string("all build records"));
        return 0;
    }

    if (!opts.location && opts.self_host)
        opts.location = (config.source_root / "recipes").string();
    if (!opts.location) {
        std::println(std::cerr, "Missing recipe location");
        print_help();
        return 1;
    }
    const fs::path location = *opts.location;
    if (!fs::exists(location)) {
        std::println(std::cerr, "Recipe location: {} does not exist.", location.string());
        return 1;
    }

    kiln::CommandOracle oracle(config.oracle, config.state_dir / "oracle");
    kiln::CommandQualityTools tools(config.quality);
    kiln::Orchestrator orchestrator(config, oracle, tools, cache);

    if (opts.generate_only)
        return run_generate_only(orchestrator, location, *opts.generate_only);

    auto recipes = load_recipes(location);
    if (!recipes)
        return report_error("Failed to load recipes", recipes.error());
    spdlog::debug("loaded {} recipe(s) from {}", recipes->size(), location.string());

    if (opts.analyze)
        return run_analyze(orchestrator, *recipes, *opts.analyze);
    if (opts.graph) {
        auto dot = orchestrator.emit_graph(*recipes);
        if (!dot)
            return report_error("Failed to plan build", dot.error());
        std::print("{}", *dot);
        return 0;
    }
    if (opts.self_host)
        return run_self_host(orchestrator, tools, config, *recipes);

    auto result = orchestrator.execute_collection(*recipes);
    if (!result)
        return report_error("Build failed", result.error());
    int code = print_summary(*result);
    kiln::shutdown_logging();
    return code;
}
