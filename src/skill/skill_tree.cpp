/// @file skill_tree.cpp
/// @brief Skill catalog implementation

#include <nexus/skill/skill_tree.hpp>
#include <nexus/core/log.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace nexus_skill {

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

/// Parse a single requirement row from JSON
nexus_core::Result<SkillRequirement> parse_requirement(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("skill") || !j["skill"].is_number_integer()) {
        return nexus_core::Err<SkillRequirement>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Requirement missing integer 'skill' field"));
    }
    if (!j.contains("level") || !j["level"].is_number_integer()) {
        return nexus_core::Err<SkillRequirement>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Requirement missing integer 'level' field"));
    }

    SkillRequirement req;
    req.skill_id = j["skill"].get<SkillId>();
    req.level = j["level"].get<int>();

    if (!is_valid_target_level(req.level)) {
        return nexus_core::Err<SkillRequirement>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Requirement on skill " + std::to_string(req.skill_id) +
                " has level " + std::to_string(req.level) + " outside 1-5"));
    }

    return nexus_core::Ok(req);
}

/// Parse a single skill entry from JSON
nexus_core::Result<SkillInfo> parse_skill(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_number_integer()) {
        return nexus_core::Err<SkillInfo>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Skill missing integer 'id' field"));
    }

    SkillInfo info;
    info.id = j["id"].get<SkillId>();

    if (!j.contains("name") || !j["name"].is_string()) {
        return nexus_core::Err<SkillInfo>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Skill " + std::to_string(info.id) + " missing 'name' field"));
    }
    info.name = j["name"].get<std::string>();

    if (j.contains("requires")) {
        const auto& arr = j["requires"];
        if (!arr.is_array()) {
            return nexus_core::Err<SkillInfo>(
                nexus_core::Error(nexus_core::ErrorCode::ParseError,
                    "Skill '" + info.name + "': 'requires' must be an array"));
        }

        info.requirements.reserve(arr.size());
        for (const auto& item : arr) {
            auto req = parse_requirement(item);
            if (!req) {
                return nexus_core::Err<SkillInfo>(
                    nexus_core::Error(nexus_core::ErrorCode::ParseError,
                        "Skill '" + info.name + "': " + req.error().message()));
            }
            info.requirements.push_back(*req);
        }
    }

    return nexus_core::Ok(std::move(info));
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

nexus_core::Result<SkillTree> SkillTree::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return nexus_core::Err<SkillTree>(
            nexus_core::Error(nexus_core::ErrorCode::NotFound,
                "Skill catalog not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return nexus_core::Err<SkillTree>(
            nexus_core::Error(nexus_core::ErrorCode::IOError,
                "Failed to open skill catalog: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return from_json_string(buffer.str(), path);
}

nexus_core::Result<SkillTree> SkillTree::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    const std::string source = source_path.empty() ? "<string>" : source_path.string();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return nexus_core::Err<SkillTree>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "JSON parse error in " + source + ": " + e.what()));
    }

    if (!j.is_object() || !j.contains("skills") || !j["skills"].is_array()) {
        return nexus_core::Err<SkillTree>(
            nexus_core::Error(nexus_core::ErrorCode::ParseError,
                "Missing 'skills' array in " + source));
    }

    SkillTree tree;
    for (const auto& item : j["skills"]) {
        auto info = parse_skill(item);
        if (!info) {
            return nexus_core::Err<SkillTree>(
                nexus_core::Error(nexus_core::ErrorCode::ParseError,
                    source + ": " + info.error().message()));
        }
        if (tree.has_skill(info->id)) {
            return nexus_core::Err<SkillTree>(
                nexus_core::Error(nexus_core::ErrorCode::ParseError,
                    source + ": duplicate skill id " + std::to_string(info->id)));
        }
        if (auto existing = tree.find_by_name(info->name)) {
            return nexus_core::Err<SkillTree>(
                nexus_core::Error(nexus_core::ErrorCode::ParseError,
                    source + ": skill name '" + info->name + "' used by both " +
                    std::to_string(*existing) + " and " + std::to_string(info->id)));
        }
        tree.add_skill(std::move(*info));
    }

    nexus_core::skill_logger()->debug("Skill catalog loaded from {}: {} skills", source, tree.size());
    return nexus_core::Ok(std::move(tree));
}

// =============================================================================
// Registration
// =============================================================================

void SkillTree::add_skill(SkillInfo info) {
    auto existing = m_skills.find(info.id);
    if (existing != m_skills.end()) {
        unindex_name(existing->second.name, info.id);
    }

    SkillId id = info.id;
    m_name_index[info.name] = id;
    m_skills[id] = std::move(info);
}

bool SkillTree::remove_skill(SkillId id) {
    auto it = m_skills.find(id);
    if (it == m_skills.end()) {
        return false;
    }
    unindex_name(it->second.name, id);
    m_skills.erase(it);
    return true;
}

void SkillTree::clear() {
    m_skills.clear();
    m_name_index.clear();
}

// =============================================================================
// SkillRequirementProvider
// =============================================================================

nexus_core::Result<std::vector<SkillRequirement>> SkillTree::requirements_of(SkillId id) const {
    auto it = m_skills.find(id);
    if (it == m_skills.end()) {
        return nexus_core::Err<std::vector<SkillRequirement>>(
            nexus_core::SkillError::unknown_skill(id));
    }

    // Keep the highest level per prerequisite skill
    std::map<SkillId, int> max_levels;
    for (const auto& req : it->second.requirements) {
        auto& level = max_levels[req.skill_id];
        level = std::max(level, req.level);
    }

    std::vector<SkillRequirement> result;
    result.reserve(max_levels.size());
    for (const auto& [skill_id, level] : max_levels) {
        result.push_back(SkillRequirement{skill_id, level});
    }

    std::sort(result.begin(), result.end(),
        [](const SkillRequirement& a, const SkillRequirement& b) {
            if (a.level != b.level) return a.level > b.level;
            return a.skill_id > b.skill_id;
        });

    return nexus_core::Ok(std::move(result));
}

std::optional<std::string> SkillTree::skill_name(SkillId id) const {
    auto it = m_skills.find(id);
    if (it == m_skills.end()) {
        return std::nullopt;
    }
    return it->second.name;
}

bool SkillTree::has_skill(SkillId id) const {
    return m_skills.count(id) > 0;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<SkillId> SkillTree::find_by_name(const std::string& name) const {
    auto it = m_name_index.find(name);
    if (it == m_name_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

const SkillInfo* SkillTree::get(SkillId id) const {
    auto it = m_skills.find(id);
    if (it == m_skills.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<SkillId> SkillTree::skill_ids() const {
    std::vector<SkillId> ids;
    ids.reserve(m_skills.size());
    for (const auto& [id, _] : m_skills) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<SkillId> SkillTree::dependents_of(SkillId id) const {
    std::vector<SkillId> dependents;

    for (const auto& [skill_id, info] : m_skills) {
        for (const auto& req : info.requirements) {
            if (req.skill_id == id) {
                dependents.push_back(skill_id);
                break;
            }
        }
    }

    return dependents;
}

std::vector<RequirementEntry> SkillTree::all_requirements(SkillId id) const {
    std::vector<RequirementEntry> result;
    std::set<SkillId> visited;
    collect_requirements(id, result, visited);

    // Direct needs of the root carry no parent
    for (auto& entry : result) {
        if (entry.parent_id && *entry.parent_id == id) {
            entry.parent_id.reset();
        }
    }
    return result;
}

// =============================================================================
// Debugging
// =============================================================================

std::string SkillTree::to_dot_graph() const {
    std::ostringstream oss;
    oss << "digraph skills {\n";
    oss << "  rankdir=BT;\n";
    oss << "  node [shape=box];\n\n";

    for (const auto& [id, info] : m_skills) {
        const char* color = info.requirements.empty() ? "lightgreen" : "white";
        oss << "  \"" << id << "\" [label=\"" << info.name
            << "\", style=filled, fillcolor=" << color << "];\n";
    }
    oss << "\n";

    for (const auto& [id, info] : m_skills) {
        for (const auto& req : info.requirements) {
            oss << "  \"" << id << "\" -> \"" << req.skill_id
                << "\" [label=\"" << req.level << "\"];\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

std::string SkillTree::format_requirement_tree(SkillId root) const {
    std::string output;
    std::set<SkillId> visited;
    format_tree_recursive(root, 0, output, "", visited);
    return output;
}

// =============================================================================
// Private Methods
// =============================================================================

void SkillTree::unindex_name(const std::string& name, SkillId id) {
    auto it = m_name_index.find(name);
    if (it == m_name_index.end() || it->second != id) {
        return;
    }
    m_name_index.erase(it);

    // Another skill with the same name takes over the lookup
    for (const auto& [other_id, other] : m_skills) {
        if (other_id != id && other.name == name) {
            m_name_index[name] = other_id;
            break;
        }
    }
}

void SkillTree::collect_requirements(
    SkillId id,
    std::vector<RequirementEntry>& out,
    std::set<SkillId>& visited) const {

    if (!visited.insert(id).second) {
        return;
    }

    auto it = m_skills.find(id);
    if (it == m_skills.end()) {
        return;
    }

    for (const auto& req : it->second.requirements) {
        auto name = skill_name(req.skill_id);
        if (!name) {
            continue;
        }
        out.push_back(RequirementEntry{req.skill_id, *name, req.level, id});
        collect_requirements(req.skill_id, out, visited);
    }
}

void SkillTree::format_tree_recursive(
    SkillId id,
    int level,
    std::string& output,
    const std::string& prefix,
    std::set<SkillId>& visited) const {

    bool already_visited = visited.count(id) > 0;
    visited.insert(id);

    std::string label = std::to_string(id);
    if (level > 0) {
        label += " L" + std::to_string(level);
    }

    auto it = m_skills.find(id);
    if (it == m_skills.end()) {
        output += label + " (NOT FOUND)\n";
        return;
    }

    output += it->second.name + " [" + label + "]";
    if (already_visited) {
        output += " (see above)\n";
        return;
    }
    output += "\n";

    auto reqs = requirements_of(id);
    if (!reqs) {
        return;
    }

    const auto& deps = *reqs;
    for (std::size_t i = 0; i < deps.size(); ++i) {
        bool is_last = (i == deps.size() - 1);
        std::string new_prefix = prefix + (is_last ? "  " : "| ");
        output += prefix + (is_last ? "`-" : "|-");
        format_tree_recursive(deps[i].skill_id, deps[i].level, output, new_prefix, visited);
    }
}

} // namespace nexus_skill
