// nexus_skill SkillTree tests
//
// Tests for the skill catalog:
// - JSON catalog parsing and validation
// - requirements_of deduplication and ordering
// - Name lookup and reverse dependencies
// - Requirement listing and debug formatting

#include <catch2/catch_test_macros.hpp>
#include <nexus/skill/skill_tree.hpp>

#include <filesystem>
#include <fstream>

using namespace nexus_skill;
using namespace nexus_core;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

/// Small catalog:
///   Spaceship Command (10) <- Navigation (20) L3, Mechanics (30) L1
///   Navigation (20) <- Mechanics (30) L2
///   Mechanics (30) has no prerequisites
const char* kCatalogJson = R"({
  "skills": [
    { "id": 10, "name": "Spaceship Command",
      "requires": [ { "skill": 20, "level": 3 }, { "skill": 30, "level": 1 } ] },
    { "id": 20, "name": "Navigation",
      "requires": [ { "skill": 30, "level": 2 } ] },
    { "id": 30, "name": "Mechanics" }
  ]
})";

SkillTree make_tree() {
    auto tree = SkillTree::from_json_string(kCatalogJson);
    REQUIRE(tree.is_ok());
    return std::move(*tree);
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("SkillTree JSON parsing", "[skill][tree]") {
    SECTION("valid catalog") {
        auto tree = make_tree();
        REQUIRE(tree.size() == 3);
        REQUIRE(tree.has_skill(10));
        REQUIRE(tree.skill_name(20) == "Navigation");
        REQUIRE(tree.get(30) != nullptr);
        REQUIRE(tree.get(30)->requirements.empty());
        REQUIRE(tree.skill_ids() == std::vector<SkillId>{10, 20, 30});
    }

    SECTION("malformed JSON") {
        auto tree = SkillTree::from_json_string("{ not json");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().code() == ErrorCode::ParseError);
    }

    SECTION("missing skills array") {
        auto tree = SkillTree::from_json_string(R"({ "skill": [] })");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().code() == ErrorCode::ParseError);
    }

    SECTION("skill without id") {
        auto tree = SkillTree::from_json_string(R"({ "skills": [ { "name": "Gunnery" } ] })");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().message().find("'id'") != std::string::npos);
    }

    SECTION("skill without name") {
        auto tree = SkillTree::from_json_string(R"({ "skills": [ { "id": 1 } ] })");
        REQUIRE(tree.is_err());
    }

    SECTION("requires must be an array") {
        auto tree = SkillTree::from_json_string(
            R"({ "skills": [ { "id": 1, "name": "A", "requires": 5 } ] })");
        REQUIRE(tree.is_err());
    }

    SECTION("requirement level out of range") {
        auto tree = SkillTree::from_json_string(
            R"({ "skills": [ { "id": 1, "name": "A", "requires": [ { "skill": 2, "level": 6 } ] } ] })");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().message().find("outside 1-5") != std::string::npos);
    }

    SECTION("duplicate id") {
        auto tree = SkillTree::from_json_string(R"({ "skills": [
            { "id": 1, "name": "Gunnery" },
            { "id": 1, "name": "Gunnery II" } ] })");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().code() == ErrorCode::ParseError);
        REQUIRE(tree.error().message().find("duplicate skill id 1") != std::string::npos);
    }

    SECTION("duplicate name") {
        auto tree = SkillTree::from_json_string(R"({ "skills": [
            { "id": 1, "name": "Gunnery" },
            { "id": 2, "name": "Gunnery" } ] })");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().code() == ErrorCode::ParseError);
        REQUIRE(tree.error().message().find("'Gunnery'") != std::string::npos);
    }

    SECTION("empty catalog") {
        auto tree = SkillTree::from_json_string(R"({ "skills": [] })");
        REQUIRE(tree.is_ok());
        REQUIRE(tree->empty());
    }
}

TEST_CASE("SkillTree file loading", "[skill][tree]") {
    auto dir = std::filesystem::temp_directory_path() / "nexus_skill_tree_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "skills.json";

    SECTION("existing file") {
        {
            std::ofstream out(path);
            out << kCatalogJson;
        }
        auto tree = SkillTree::load(path);
        REQUIRE(tree.is_ok());
        REQUIRE(tree->size() == 3);
    }

    SECTION("missing file") {
        auto tree = SkillTree::load(dir / "does_not_exist.json");
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().code() == ErrorCode::NotFound);
    }

    std::filesystem::remove_all(dir);
}

// =============================================================================
// SkillRequirementProvider
// =============================================================================

TEST_CASE("SkillTree requirements_of", "[skill][tree]") {
    SECTION("sorted by level descending") {
        auto tree = make_tree();
        auto reqs = tree.requirements_of(10);
        REQUIRE(reqs.is_ok());
        REQUIRE(reqs->size() == 2);
        REQUIRE((*reqs)[0] == SkillRequirement{20, 3});
        REQUIRE((*reqs)[1] == SkillRequirement{30, 1});
    }

    SECTION("repeated rows keep the highest level") {
        SkillTree tree;
        tree.add_skill(SkillInfo{1, "A", {{2, 1}, {3, 2}, {2, 4}, {3, 2}}});
        auto reqs = tree.requirements_of(1);
        REQUIRE(reqs.is_ok());
        REQUIRE(reqs->size() == 2);
        REQUIRE((*reqs)[0] == SkillRequirement{2, 4});
        REQUIRE((*reqs)[1] == SkillRequirement{3, 2});
    }

    SECTION("equal levels break ties by id descending") {
        SkillTree tree;
        tree.add_skill(SkillInfo{1, "A", {{2, 3}, {5, 3}, {4, 3}}});
        auto reqs = tree.requirements_of(1);
        REQUIRE(reqs.is_ok());
        REQUIRE((*reqs)[0].skill_id == 5);
        REQUIRE((*reqs)[1].skill_id == 4);
        REQUIRE((*reqs)[2].skill_id == 2);
    }

    SECTION("no prerequisites") {
        auto tree = make_tree();
        auto reqs = tree.requirements_of(30);
        REQUIRE(reqs.is_ok());
        REQUIRE(reqs->empty());
    }

    SECTION("unknown skill") {
        auto tree = make_tree();
        auto reqs = tree.requirements_of(999);
        REQUIRE(reqs.is_err());
        REQUIRE(reqs.error().code() == ErrorCode::NotFound);
        REQUIRE(reqs.error().skill_error() != nullptr);
        REQUIRE_FALSE(tree.skill_name(999).has_value());
    }
}

// =============================================================================
// Queries
// =============================================================================

TEST_CASE("SkillTree queries", "[skill][tree]") {
    auto tree = make_tree();

    SECTION("find_by_name") {
        REQUIRE(tree.find_by_name("Navigation") == SkillId{20});
        REQUIRE_FALSE(tree.find_by_name("navigation").has_value());
        REQUIRE_FALSE(tree.find_by_name("Gunnery").has_value());
    }

    SECTION("rename updates the name index") {
        tree.add_skill(SkillInfo{30, "Engineering", {}});
        REQUIRE_FALSE(tree.find_by_name("Mechanics").has_value());
        REQUIRE(tree.find_by_name("Engineering") == SkillId{30});
    }

    SECTION("remove_skill") {
        REQUIRE(tree.remove_skill(20));
        REQUIRE_FALSE(tree.remove_skill(20));
        REQUIRE_FALSE(tree.find_by_name("Navigation").has_value());
        REQUIRE(tree.size() == 2);
    }

    SECTION("shared name survives removing the older skill") {
        tree.add_skill(SkillInfo{40, "Mechanics", {}});
        REQUIRE(tree.find_by_name("Mechanics") == SkillId{40});

        REQUIRE(tree.remove_skill(30));
        REQUIRE(tree.find_by_name("Mechanics") == SkillId{40});
    }

    SECTION("shared name survives renaming the older skill") {
        tree.add_skill(SkillInfo{40, "Mechanics", {}});
        tree.add_skill(SkillInfo{30, "Engineering", {}});
        REQUIRE(tree.find_by_name("Mechanics") == SkillId{40});
        REQUIRE(tree.find_by_name("Engineering") == SkillId{30});
    }

    SECTION("shared name falls back when the newer skill is removed") {
        tree.add_skill(SkillInfo{40, "Mechanics", {}});
        REQUIRE(tree.remove_skill(40));
        REQUIRE(tree.find_by_name("Mechanics") == SkillId{30});
    }

    SECTION("dependents_of") {
        REQUIRE(tree.dependents_of(30) == std::vector<SkillId>{10, 20});
        REQUIRE(tree.dependents_of(10).empty());
    }

    SECTION("all_requirements") {
        auto entries = tree.all_requirements(10);
        REQUIRE(entries.size() == 3);

        REQUIRE(entries[0].skill_id == 20);
        REQUIRE(entries[0].name == "Navigation");
        REQUIRE(entries[0].level == 3);
        REQUIRE_FALSE(entries[0].parent_id.has_value());

        // Mechanics is first reached through Navigation
        REQUIRE(entries[1].skill_id == 30);
        REQUIRE(entries[1].level == 2);
        REQUIRE(entries[1].parent_id == SkillId{20});

        // Direct edge is listed again, its subtree is not
        REQUIRE(entries[2].skill_id == 30);
        REQUIRE(entries[2].level == 1);
        REQUIRE_FALSE(entries[2].parent_id.has_value());
    }

    SECTION("all_requirements skips unknown skills") {
        tree.add_skill(SkillInfo{40, "Drones", {{999, 1}, {30, 1}}});
        auto entries = tree.all_requirements(40);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].skill_id == 30);
    }

    SECTION("all_requirements of a leaf") {
        REQUIRE(tree.all_requirements(30).empty());
        REQUIRE(tree.all_requirements(999).empty());
    }
}

// =============================================================================
// Debugging
// =============================================================================

TEST_CASE("SkillTree debug output", "[skill][tree]") {
    auto tree = make_tree();

    SECTION("requirement tree") {
        std::string expected =
            "Spaceship Command [10]\n"
            "|-Navigation [20 L3]\n"
            "| `-Mechanics [30 L2]\n"
            "`-Mechanics [30 L1] (see above)\n";
        REQUIRE(tree.format_requirement_tree(10) == expected);
    }

    SECTION("missing skill in tree") {
        tree.add_skill(SkillInfo{40, "Drones", {{999, 2}}});
        std::string expected =
            "Drones [40]\n"
            "`-999 L2 (NOT FOUND)\n";
        REQUIRE(tree.format_requirement_tree(40) == expected);
    }

    SECTION("dot graph") {
        std::string dot = tree.to_dot_graph();
        REQUIRE(dot.find("digraph skills {") == 0);
        REQUIRE(dot.find("\"10\" -> \"20\" [label=\"3\"]") != std::string::npos);
        REQUIRE(dot.find("\"30\" [label=\"Mechanics\", style=filled, fillcolor=lightgreen]")
            != std::string::npos);
    }
}
