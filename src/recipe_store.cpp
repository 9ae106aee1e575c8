#include "kiln/recipe_store.hpp"

#include "kiln/utility.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace kiln {

namespace {

struct Heading {
    size_t level;
    std::string title; // lowercased
};

std::optional<Heading> heading_of(std::string_view line) {
    if (!line.starts_with('#'))
        return std::nullopt;
    size_t level = 0;
    while (level < line.size() && line[level] == '#')
        ++level;
    if (level < line.size() && line[level] != ' ' && line[level] != '\t')
        return std::nullopt;
    return Heading{level, to_lower(trim(line.substr(level)))};
}

size_t indent_of(std::string_view line) {
    size_t indent = 0;
    for (char c : line) {
        if (c == ' ')
            indent += 1;
        else if (c == '\t')
            indent += 4;
        else
            break;
    }
    return indent;
}

std::optional<std::string_view> bullet_body(std::string_view line) {
    std::string_view t = trim(line);
    if (t.size() >= 2 && (t[0] == '-' || t[0] == '*' || t[0] == '+') && (t[1] == ' ' || t[1] == '\t'))
        return trim(t.substr(2));
    return std::nullopt;
}

std::optional<std::string_view> numbered_body(std::string_view line) {
    std::string_view t = trim(line);
    size_t i = 0;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i])))
        ++i;
    if (i > 0 && i < t.size() && (t[i] == '.' || t[i] == ')'))
        return trim(t.substr(i + 1));
    return std::nullopt;
}

// "**MUST**" and "MUST:" both name a priority.
std::string strip_emphasis(std::string_view token) {
    std::string out;
    for (char c : token) {
        if (c != '*' && c != '_' && c != ':')
            out += c;
    }
    return out;
}

std::unexpected<Error> parse_error(std::string_view origin, size_t line, std::string_view what) {
    if (line == 0)
        return fail(ErrorKind::Parse, std::format("{}: {}", origin, what));
    return fail(ErrorKind::Parse, std::format("{}:{}: {}", origin, line, what));
}

// A bullet that does not start with a priority marker is ordinary prose.
Result<std::optional<Requirement>> parse_requirement_bullet(std::string_view body, std::string_view origin,
                                                            size_t line) {
    Requirement req;
    req.line = line;

    if (body.starts_with('[')) {
        size_t close = body.find(']');
        if (close == std::string_view::npos)
            return parse_error(origin, line, "unterminated requirement id");
        req.id = std::string(trim(body.substr(1, close - 1)));
        if (req.id.empty())
            return parse_error(origin, line, "empty requirement id");
        body = trim(body.substr(close + 1));
    }

    size_t space = body.find_first_of(" \t");
    std::string_view first = body.substr(0, space);
    auto priority = parse_priority(strip_emphasis(first));
    if (!priority) {
        if (!req.id.empty()) {
            return parse_error(origin, line,
                               std::format("requirement [{}] has no MUST/SHOULD/COULD marker", req.id));
        }
        return std::optional<Requirement>{};
    }
    req.priority = *priority;
    req.description = space == std::string_view::npos ? std::string{} : std::string(trim(body.substr(space)));
    if (req.description.empty())
        return parse_error(origin, line, "requirement has no description");
    return std::optional<Requirement>{std::move(req)};
}

enum class ReqSection : uint8_t { None, Purpose, Functional, NonFunctional, Success, Other };

ReqSection requirement_section(const Heading &h, ReqSection current) {
    if (h.title == "purpose" || h.title == "core purpose" || h.title.starts_with("purpose"))
        return ReqSection::Purpose;
    if (h.title.starts_with("non-functional requirements") || h.title.starts_with("non functional requirements"))
        return ReqSection::NonFunctional;
    if (h.title.starts_with("functional requirements"))
        return ReqSection::Functional;
    if (h.title.starts_with("success criteria"))
        return ReqSection::Success;
    // Sub-headings group requirements without leaving the section.
    return h.level <= 2 ? ReqSection::Other : current;
}

enum class DesignSection : uint8_t { None, Architecture, Components, Interfaces, Other };

DesignSection design_section(const Heading &h, DesignSection current) {
    if (h.title.starts_with("architecture") || h.title == "overview")
        return DesignSection::Architecture;
    if (h.title.starts_with("components") || h.title.starts_with("component design"))
        return DesignSection::Components;
    if (h.title.starts_with("interfaces"))
        return DesignSection::Interfaces;
    return h.level <= 2 ? DesignSection::Other : current;
}

// "1. Dependency Resolver (`dependency_resolver.cpp`)" -> name, file
std::pair<std::string, std::string> component_heading(std::string_view title) {
    if (auto numbered = numbered_body(title))
        title = *numbered;
    std::string file;
    size_t open = title.find("(`");
    if (open != std::string_view::npos) {
        size_t close = title.find("`)", open + 2);
        if (close != std::string_view::npos)
            file = std::string(title.substr(open + 2, close - open - 2));
        title = trim(title.substr(0, open));
    }
    return {std::string(trim(title)), file};
}

std::string original_case_title(std::string_view line) {
    size_t level = 0;
    while (level < line.size() && line[level] == '#')
        ++level;
    return std::string(trim(line.substr(level)));
}

void append_text(std::string &dst, std::string_view text) {
    if (!dst.empty())
        dst += ' ';
    dst += text;
}

fs::path normalized_dir(const fs::path &p) {
    fs::path norm = p.lexically_normal();
    if (norm.filename().empty())
        norm = norm.parent_path();
    return norm;
}

} // namespace

Result<RequirementSet> parse_requirements(std::string_view text, std::string_view origin) {
    RequirementSet set;
    set.source = std::string(text);

    ReqSection section = ReqSection::None;
    std::optional<size_t> current;
    std::unordered_set<std::string> ids;
    size_t next_number = 1;
    std::string fallback_purpose;

    const auto lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t lineno = i + 1;
        const std::string_view line = lines[i];

        if (auto h = heading_of(line)) {
            section = requirement_section(*h, section);
            current.reset();
            continue;
        }
        if (trim(line).empty())
            continue;
        if (fallback_purpose.empty())
            fallback_purpose = std::string(trim(line));

        switch (section) {
        case ReqSection::Purpose:
            append_text(set.purpose, trim(line));
            break;
        case ReqSection::Functional:
        case ReqSection::NonFunctional: {
            auto body = bullet_body(line);
            if (!body)
                break;
            if (indent_of(line) >= 2 && current) {
                set.requirements[*current].validation_criteria.emplace_back(*body);
                break;
            }
            auto parsed = parse_requirement_bullet(*body, origin, lineno);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (!parsed->has_value()) {
                current.reset();
                break;
            }
            Requirement req = std::move(**parsed);
            req.functional = section == ReqSection::Functional;
            if (req.id.empty()) {
                do {
                    req.id = std::format("req_{}", next_number++);
                } while (ids.contains(req.id));
            }
            if (!ids.insert(req.id).second)
                return parse_error(origin, lineno, std::format("duplicate requirement id '{}'", req.id));
            set.requirements.push_back(std::move(req));
            current = set.requirements.size() - 1;
            break;
        }
        case ReqSection::Success:
            if (auto item = numbered_body(line))
                set.success_criteria.emplace_back(*item);
            else if (auto bullet = bullet_body(line))
                set.success_criteria.emplace_back(*bullet);
            break;
        default:
            break;
        }
    }

    if (set.requirements.empty())
        return parse_error(origin, 0, "no MUST/SHOULD/COULD requirements found");
    if (set.purpose.empty())
        set.purpose = std::move(fallback_purpose);
    return set;
}

Result<Design> parse_design(std::string_view text, std::string_view origin) {
    Design design;
    design.source = std::string(text);

    DesignSection section = DesignSection::None;
    std::optional<size_t> current;
    bool responsibility_done = false;
    bool in_fence = false;
    size_t fence_line = 0;

    const auto lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t lineno = i + 1;
        const std::string_view line = lines[i];
        const std::string_view t = trim(line);

        if (t.starts_with("```")) {
            in_fence = !in_fence;
            fence_line = lineno;
            continue;
        }
        if (in_fence) {
            if (current && !t.empty())
                design.components[*current].signatures.emplace_back(t);
            continue;
        }

        if (auto h = heading_of(line)) {
            const std::string title = original_case_title(line);
            const bool file_suffix = title.find("(`") != std::string::npos;
            if (h->level >= 3 && (section == DesignSection::Components || file_suffix)) {
                auto [name, file] = component_heading(title);
                if (name.empty())
                    return parse_error(origin, lineno, "component heading has no name");
                design.components.push_back({.name = std::move(name), .file = std::move(file)});
                current = design.components.size() - 1;
                responsibility_done = false;
                continue;
            }
            section = design_section(*h, section);
            current.reset();
            continue;
        }

        switch (section) {
        case DesignSection::Architecture:
            if (!t.empty())
                append_text(design.architecture_summary, t);
            break;
        case DesignSection::Interfaces:
            if (auto body = bullet_body(line)) {
                Interface iface;
                size_t colon = body->find(':');
                if (colon == std::string_view::npos) {
                    iface.name = std::string(strip_emphasis(*body));
                } else {
                    iface.name = strip_emphasis(trim(body->substr(0, colon)));
                    iface.description = std::string(trim(body->substr(colon + 1)));
                }
                if (!iface.name.empty())
                    design.interfaces.push_back(std::move(iface));
            }
            break;
        default:
            break;
        }

        if (current && section != DesignSection::Interfaces) {
            auto &component = design.components[*current];
            if (t.empty()) {
                responsibility_done = !component.responsibility.empty();
            } else if (!responsibility_done) {
                append_text(component.responsibility, t);
            }
        }
    }

    if (in_fence)
        return parse_error(origin, fence_line, "unterminated code block");
    return design;
}

Result<ComponentMetadata> parse_metadata(std::string_view text, std::string_view origin,
                                         std::string_view fallback_name) {
    using json = nlohmann::json;

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error &e) {
        return parse_error(origin, 0, std::format("invalid JSON at byte {}: {}", e.byte, e.what()));
    }
    if (!doc.is_object())
        return parse_error(origin, 0, "expected a JSON object");

    ComponentMetadata meta;
    meta.source = std::string(text);
    auto string_field = [&](const char *key, std::string &dst) -> Result<void> {
        auto it = doc.find(key);
        if (it == doc.end() || it->is_null())
            return {};
        if (!it->is_string())
            return parse_error(origin, 0, std::format("field '{}' must be a string", key));
        dst = it->get<std::string>();
        return {};
    };

    if (auto res = string_field("name", meta.name); !res)
        return std::unexpected(res.error());
    if (auto res = string_field("version", meta.version); !res)
        return std::unexpected(res.error());
    if (auto res = string_field("description", meta.description); !res)
        return std::unexpected(res.error());
    if (meta.name.empty())
        meta.name = std::string(fallback_name);

    std::string type_name;
    if (auto res = string_field("type", type_name); !res)
        return std::unexpected(res.error());
    if (!type_name.empty()) {
        auto type = parse_component_type(type_name);
        if (!type)
            return parse_error(origin, 0, std::format("unknown component type '{}'", type_name));
        meta.type = *type;
    }

    if (auto it = doc.find("dependencies"); it != doc.end() && !it->is_null()) {
        if (!it->is_array())
            return parse_error(origin, 0, "field 'dependencies' must be an array");
        std::set<std::string> seen;
        for (const auto &dep : *it) {
            if (!dep.is_string())
                return parse_error(origin, 0, "dependency names must be strings");
            auto name = dep.get<std::string>();
            if (seen.insert(name).second)
                meta.dependencies.push_back(std::move(name));
        }
    }

    for (const char *key : {"metadata", "attributes"}) {
        auto it = doc.find(key);
        if (it == doc.end() || it->is_null())
            continue;
        if (!it->is_object())
            return parse_error(origin, 0, std::format("field '{}' must be an object", key));
        for (const auto &[k, v] : it->items()) {
            meta.attributes.insert_or_assign(k, v.is_string() ? v.get<std::string>() : v.dump());
        }
    }

    if (meta.name.empty())
        return parse_error(origin, 0, "recipe has no name");
    return meta;
}

std::string compute_checksum(std::string_view requirements, std::string_view design, std::string_view metadata) {
    uint64_t hash = fnv1a(requirements);
    hash = fnv1a(design, hash);
    hash = fnv1a(metadata, hash);
    return to_hex(hash);
}

Result<Recipe> parse_recipe(std::string_view requirements, std::string_view design, std::string_view metadata,
                            std::string location, std::string_view fallback_name) {
    const fs::path base(location);
    const std::string req_origin = (base / kRequirementsFile).string();
    const std::string design_origin = (base / kDesignFile).string();
    const std::string meta_origin = (base / kMetadataFile).string();

    auto meta = parse_metadata(metadata, meta_origin, fallback_name);
    if (!meta)
        return std::unexpected(meta.error());
    auto reqs = parse_requirements(requirements, req_origin);
    if (!reqs)
        return std::unexpected(std::move(reqs.error()).in_recipe(meta->name));
    auto des = parse_design(design, design_origin);
    if (!des)
        return std::unexpected(std::move(des.error()).in_recipe(meta->name));

    Recipe recipe;
    recipe.name = meta->name;
    recipe.location = std::move(location);
    recipe.requirements = std::move(*reqs);
    recipe.design = std::move(*des);
    recipe.metadata = std::move(*meta);
    recipe.checksum = compute_checksum(requirements, design, metadata);
    return recipe;
}

Result<Recipe> load_recipe(const fs::path &location) {
    const fs::path dir = normalized_dir(location);
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return parse_error(dir.string(), 0, "recipe location is not a directory");

    std::string texts[3];
    const std::string_view names[3] = {kRequirementsFile, kDesignFile, kMetadataFile};
    for (size_t i = 0; i < 3; ++i) {
        const fs::path file = dir / names[i];
        if (!fs::exists(file, ec))
            return parse_error(file.string(), 0, "required recipe artifact is missing");
        auto content = read_file(file);
        if (!content)
            return std::unexpected(content.error());
        texts[i] = std::move(*content);
    }
    return parse_recipe(texts[0], texts[1], texts[2], dir.string(), dir.filename().string());
}

Result<RecipeSet> load_collection(const fs::path &root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return parse_error(root.string(), 0, "recipe collection root is not a directory");

    std::vector<fs::path> dirs;
    for (auto it = fs::directory_iterator(root, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && fs::exists(it->path() / kMetadataFile, entry_ec))
            dirs.push_back(it->path());
    }
    if (ec)
        return fail(ErrorKind::Io, std::format("Failed to list {}: {}", root.string(), ec.message()));
    std::ranges::sort(dirs);

    RecipeSet recipes;
    for (const auto &dir : dirs) {
        auto recipe = load_recipe(dir);
        if (!recipe)
            return std::unexpected(recipe.error());
        std::string name = recipe->name;
        if (!recipes.emplace(name, std::move(*recipe)).second)
            return parse_error(dir.string(), 0, std::format("duplicate recipe name '{}'", name));
    }
    return recipes;
}

Result<RecipeSet> discover_recipes(const fs::path &location, const fs::path &root) {
    RecipeSet recipes;
    std::deque<fs::path> pending{location};
    std::set<std::string> visited;

    while (!pending.empty()) {
        fs::path current = normalized_dir(pending.front());
        pending.pop_front();
        if (!visited.insert(current.string()).second)
            continue;

        auto recipe = load_recipe(current);
        if (!recipe)
            return std::unexpected(recipe.error());
        for (const auto &dep : recipe->dependencies()) {
            fs::path dep_dir = root / dep;
            std::error_code ec;
            if (!recipes.contains(dep) && fs::exists(dep_dir / kMetadataFile, ec))
                pending.push_back(dep_dir);
        }
        std::string name = recipe->name;
        recipes.insert_or_assign(name, std::move(*recipe));
    }
    return recipes;
}

std::string render_requirements(const RequirementSet &requirements) {
    std::string out = std::format("# Purpose\n\n{}\n", requirements.purpose);
    auto section = [&](std::string_view title, bool functional) {
        bool header = false;
        for (const auto &req : requirements.requirements) {
            if (req.functional != functional)
                continue;
            if (!header) {
                out += std::format("\n## {}\n\n", title);
                header = true;
            }
            out += std::format("- [{}] {} {}\n", req.id, to_string(req.priority), req.description);
            for (const auto &criterion : req.validation_criteria)
                out += std::format("  - {}\n", criterion);
        }
    };
    section("Functional Requirements", true);
    section("Non-Functional Requirements", false);
    if (!requirements.success_criteria.empty()) {
        out += "\n## Success Criteria\n\n";
        for (size_t i = 0; i < requirements.success_criteria.size(); ++i)
            out += std::format("{}. {}\n", i + 1, requirements.success_criteria[i]);
    }
    return out;
}

std::string render_design(const Design &design) {
    std::string out = std::format("# Architecture Overview\n\n{}\n", design.architecture_summary);
    if (!design.components.empty()) {
        out += "\n## Components\n";
        for (const auto &component : design.components) {
            if (component.file.empty())
                out += std::format("\n### {}\n\n", component.name);
            else
                out += std::format("\n### {} (`{}`)\n\n", component.name, component.file);
            out += std::format("{}\n", component.responsibility);
            if (!component.signatures.empty()) {
                out += "\n```\n";
                for (const auto &sig : component.signatures)
                    out += std::format("{}\n", sig);
                out += "```\n";
            }
        }
    }
    if (!design.interfaces.empty()) {
        out += "\n## Interfaces\n\n";
        for (const auto &iface : design.interfaces) {
            if (iface.description.empty())
                out += std::format("- {}\n", iface.name);
            else
                out += std::format("- {}: {}\n", iface.name, iface.description);
        }
    }
    return out;
}

} // namespace kiln
