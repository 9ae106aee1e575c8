#include "fakes.hpp"

#include "kiln/recipe_store.hpp"

#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace kiln;
using namespace kiln::testing;

namespace {

void write(const fs::path &path, std::string_view content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void write_recipe(const fs::path &dir, std::string_view name, const std::vector<std::string> &deps = {}) {
    write(dir / "requirements.md", kRequirements);
    write(dir / "design.md", kDesign);
    write(dir / "components.json", metadata_json(name, deps));
}

} // namespace

TEST(RecipeStore, ParsesRequirementsWithCriteriaAndIds) {
    constexpr std::string_view text = R"(# Purpose

Tracks parcels through a depot.

## Functional Requirements

- MUST accept a parcel at intake
  - the parcel receives a tracking number
  - duplicate intake is rejected
- [lookup] SHOULD find a parcel by tracking number
- COULD print a label

### Extras

- **MUST**: keep a history of every move

## Non-Functional Requirements

- MUST answer lookups within one second

## Success Criteria

1. Every parcel is traceable
2. No parcel is lost
)";
    auto set = parse_requirements(text, "requirements.md");
    ASSERT_TRUE(set) << set.error().message;

    EXPECT_EQ(set->purpose, "Tracks parcels through a depot.");
    ASSERT_EQ(set->requirements.size(), 5u);

    const auto &intake = set->requirements[0];
    EXPECT_EQ(intake.id, "req_1");
    EXPECT_EQ(intake.priority, Priority::Must);
    EXPECT_EQ(intake.description, "accept a parcel at intake");
    EXPECT_EQ(intake.validation_criteria,
              (std::vector<std::string>{"the parcel receives a tracking number", "duplicate intake is rejected"}));
    EXPECT_EQ(intake.line, 7u);

    EXPECT_EQ(set->requirements[1].id, "lookup");
    EXPECT_EQ(set->requirements[1].priority, Priority::Should);
    EXPECT_EQ(set->requirements[2].id, "req_2");
    EXPECT_EQ(set->requirements[3].description, "keep a history of every move");
    EXPECT_TRUE(set->requirements[3].functional);
    EXPECT_FALSE(set->requirements[4].functional);

    EXPECT_EQ(set->count(Priority::Must), 3u);
    EXPECT_EQ(set->success_criteria, (std::vector<std::string>{"Every parcel is traceable", "No parcel is lost"}));
}

TEST(RecipeStore, DuplicateRequirementIdNamesTheLine) {
    constexpr std::string_view text = "## Functional Requirements\n\n- [a] MUST do one thing\n- [a] MUST do another\n";
    auto set = parse_requirements(text, "reqs.md");
    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().kind, ErrorKind::Parse);
    EXPECT_NE(set.error().message.find("reqs.md:4"), std::string::npos);
}

TEST(RecipeStore, DocumentWithoutRequirementsIsRejected) {
    auto set = parse_requirements("# Purpose\n\nNothing to do.\n", "reqs.md");
    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().kind, ErrorKind::Parse);
}

TEST(RecipeStore, ExplicitIdWithoutPriorityIsRejected) {
    auto set = parse_requirements("## Functional Requirements\n\n- [x] do a thing\n", "reqs.md");
    ASSERT_FALSE(set);
    EXPECT_NE(set.error().message.find("[x]"), std::string::npos);
}

TEST(RecipeStore, ParsesDesignComponentsAndInterfaces) {
    constexpr std::string_view text = R"(# Architecture Overview

Two stages joined by a queue.

## Components

### 1. Intake (`intake.cpp`)

Accepts parcels and assigns
tracking numbers.

More prose that is not the responsibility.

```
TrackingNumber accept(const Parcel &parcel);
```

### Router

Moves parcels between bays.

## Interfaces

- Intake API: accepts parcels from the counter
- Router
)";
    auto design = parse_design(text, "design.md");
    ASSERT_TRUE(design) << design.error().message;

    EXPECT_EQ(design->architecture_summary, "Two stages joined by a queue.");
    ASSERT_EQ(design->components.size(), 2u);
    EXPECT_EQ(design->components[0].name, "Intake");
    EXPECT_EQ(design->components[0].file, "intake.cpp");
    EXPECT_EQ(design->components[0].responsibility, "Accepts parcels and assigns tracking numbers.");
    EXPECT_EQ(design->components[0].signatures,
              (std::vector<std::string>{"TrackingNumber accept(const Parcel &parcel);"}));
    EXPECT_EQ(design->components[1].name, "Router");
    EXPECT_TRUE(design->components[1].file.empty());

    ASSERT_EQ(design->interfaces.size(), 2u);
    EXPECT_EQ(design->interfaces[0].name, "Intake API");
    EXPECT_EQ(design->interfaces[0].description, "accepts parcels from the counter");
    EXPECT_EQ(design->interfaces[1].name, "Router");
}

TEST(RecipeStore, UnterminatedFenceIsRejected) {
    auto design = parse_design("## Components\n\n### A\n\n```\nvoid f();\n", "design.md");
    ASSERT_FALSE(design);
    EXPECT_NE(design.error().message.find("design.md:5"), std::string::npos);
}

TEST(RecipeStore, ParsesMetadata) {
    constexpr std::string_view text = R"({
        "version": "2.1.0",
        "type": "core",
        "dependencies": ["store", "graph", "store"],
        "metadata": {"selfHosting": true, "owner": "build-team"}
    })";
    auto meta = parse_metadata(text, "components.json", "kiln");
    ASSERT_TRUE(meta) << meta.error().message;
    EXPECT_EQ(meta->name, "kiln");
    EXPECT_EQ(meta->version, "2.1.0");
    EXPECT_EQ(meta->type, ComponentType::Core);
    EXPECT_EQ(meta->dependencies, (std::vector<std::string>{"store", "graph"}));
    EXPECT_TRUE(meta->attribute_enabled("selfHosting"));
    EXPECT_EQ(meta->attributes.at("owner"), "build-team");
}

TEST(RecipeStore, MetadataErrors) {
    EXPECT_EQ(parse_metadata("{not json", "c.json", "x").error().kind, ErrorKind::Parse);
    EXPECT_EQ(parse_metadata(R"({"type": "widget"})", "c.json", "x").error().kind, ErrorKind::Parse);
    EXPECT_EQ(parse_metadata(R"({"dependencies": "a"})", "c.json", "x").error().kind, ErrorKind::Parse);
    EXPECT_EQ(parse_metadata("[]", "c.json", "x").error().kind, ErrorKind::Parse);
}

TEST(RecipeStore, ChecksumTracksEveryArtifact) {
    const auto base = compute_checksum("r", "d", "m");
    EXPECT_EQ(base.size(), 16u);
    EXPECT_EQ(base, compute_checksum("r", "d", "m"));
    EXPECT_NE(base, compute_checksum("r2", "d", "m"));
    EXPECT_NE(base, compute_checksum("r", "d2", "m"));
    EXPECT_NE(base, compute_checksum("r", "d", "m2"));
}

TEST(RecipeStore, LoadsRecipeDirectory) {
    TempDir tmp;
    write_recipe(tmp.path() / "ledger", "ledger");

    auto recipe = load_recipe(tmp.path() / "ledger");
    ASSERT_TRUE(recipe) << recipe.error().message;
    EXPECT_EQ(recipe->name, "ledger");
    EXPECT_EQ(recipe->requirements.requirements.size(), 2u);
    EXPECT_EQ(recipe->design.components.size(), 1u);
    EXPECT_EQ(recipe->checksum, compute_checksum(kRequirements, kDesign, metadata_json("ledger")));
}

TEST(RecipeStore, MissingArtifactIsAParseError) {
    TempDir tmp;
    write(tmp.path() / "half" / "requirements.md", kRequirements);
    write(tmp.path() / "half" / "components.json", metadata_json("half"));

    auto recipe = load_recipe(tmp.path() / "half");
    ASSERT_FALSE(recipe);
    EXPECT_EQ(recipe.error().kind, ErrorKind::Parse);
    EXPECT_NE(recipe.error().message.find("design.md"), std::string::npos);
}

TEST(RecipeStore, LoadsCollectionAndRejectsDuplicateNames) {
    TempDir tmp;
    write_recipe(tmp.path() / "a", "a");
    write_recipe(tmp.path() / "b", "b", {"a"});
    fs::create_directories(tmp.path() / "not-a-recipe");

    auto set = load_collection(tmp.path());
    ASSERT_TRUE(set) << set.error().message;
    EXPECT_EQ(set->size(), 2u);
    EXPECT_EQ(set->at("b").dependencies(), (std::vector<std::string>{"a"}));

    write_recipe(tmp.path() / "c", "a");
    auto dup = load_collection(tmp.path());
    ASSERT_FALSE(dup);
    EXPECT_NE(dup.error().message.find("duplicate recipe name 'a'"), std::string::npos);
}

TEST(RecipeStore, DiscoversDependenciesFromSiblings) {
    TempDir tmp;
    write_recipe(tmp.path() / "app", "app", {"lib"});
    write_recipe(tmp.path() / "lib", "lib", {"base"});
    write_recipe(tmp.path() / "base", "base");
    write_recipe(tmp.path() / "unrelated", "unrelated");

    auto set = discover_recipes(tmp.path() / "app", tmp.path());
    ASSERT_TRUE(set) << set.error().message;
    EXPECT_EQ(set->size(), 3u);
    EXPECT_TRUE(set->contains("base"));
    EXPECT_FALSE(set->contains("unrelated"));
}

TEST(RecipeStore, UnreadableEntriesAreSkipped) {
    TempDir tmp;
    write_recipe(tmp.path() / "app", "app", {"loop"});
    fs::create_symlink("loop", tmp.path() / "loop");

    auto set = load_collection(tmp.path());
    ASSERT_TRUE(set) << set.error().message;
    EXPECT_EQ(set->size(), 1u);

    auto discovered = discover_recipes(tmp.path() / "app", tmp.path());
    ASSERT_TRUE(discovered) << discovered.error().message;
    EXPECT_EQ(discovered->size(), 1u);
}

TEST(RecipeStore, RenderedDocumentsParseBack) {
    auto reqs = parse_requirements(kRequirements, "r.md");
    auto design = parse_design(kDesign, "d.md");
    ASSERT_TRUE(reqs);
    ASSERT_TRUE(design);

    auto again = parse_requirements(render_requirements(*reqs), "r.md");
    ASSERT_TRUE(again) << again.error().message;
    ASSERT_EQ(again->requirements.size(), reqs->requirements.size());
    EXPECT_EQ(again->requirements[0].id, reqs->requirements[0].id);
    EXPECT_EQ(again->requirements[0].validation_criteria, reqs->requirements[0].validation_criteria);

    auto design_again = parse_design(render_design(*design), "d.md");
    ASSERT_TRUE(design_again) << design_again.error().message;
    ASSERT_EQ(design_again->components.size(), 1u);
    EXPECT_EQ(design_again->components[0].file, "ledger.txt");
}
