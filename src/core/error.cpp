/// @file error.cpp
/// @brief SkillError factories and error formatting

#include <nexus/core/error.hpp>

#include <sstream>

namespace nexus_core {

// =============================================================================
// Names
// =============================================================================

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::CyclicDependency: return "CyclicDependency";
    }
    return "Unknown";
}

const char* skill_error_kind_name(SkillError::Kind kind) {
    switch (kind) {
        case SkillError::Kind::InvalidLevel: return "InvalidLevel";
        case SkillError::Kind::UnknownSkill: return "UnknownSkill";
        case SkillError::Kind::CyclicDependency: return "CyclicDependency";
    }
    return "Unknown";
}

// =============================================================================
// SkillError
// =============================================================================

SkillError SkillError::invalid_level(std::int64_t id, int lvl) {
    return SkillError{Kind::InvalidLevel,
        "Invalid level " + std::to_string(lvl) + " for skill " + std::to_string(id),
        id, lvl, {}};
}

SkillError SkillError::unknown_skill(std::int64_t id) {
    return SkillError{Kind::UnknownSkill, "Unknown skill: " + std::to_string(id), id, 0, {}};
}

SkillError SkillError::cyclic_dependency(std::vector<std::int64_t> path) {
    std::string msg = "Prerequisite cycle detected: ";
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += std::to_string(path[i]);
    }
    std::int64_t id = path.empty() ? 0 : path.front();
    return SkillError{Kind::CyclicDependency, std::move(msg), id, 0, std::move(path)};
}

ErrorCode SkillError::code() const {
    switch (kind) {
        case Kind::InvalidLevel: return ErrorCode::InvalidArgument;
        case Kind::UnknownSkill: return ErrorCode::NotFound;
        case Kind::CyclicDependency: return ErrorCode::CyclicDependency;
    }
    return ErrorCode::InvalidArgument;
}

// =============================================================================
// Formatting
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    if (const SkillError* skill = error.skill_error()) {
        oss << "[SkillError:" << skill_error_kind_name(skill->kind) << "] " << skill->message;
        switch (skill->kind) {
            case SkillError::Kind::InvalidLevel:
                oss << " (skill: " << skill->skill_id << ", level: " << skill->level << ")";
                break;
            case SkillError::Kind::UnknownSkill:
                oss << " (skill: " << skill->skill_id << ")";
                break;
            case SkillError::Kind::CyclicDependency:
                oss << " (cycle length: " << skill->cycle_path.size() << ")";
                break;
        }
    } else {
        oss << error.message();
    }

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

} // namespace nexus_core
