/// @file plan_reader.cpp
/// @brief SkillPlanReader implementation

#include <nexus/skill/plan_reader.hpp>
#include <nexus/core/log.hpp>

#include <regex>
#include <sstream>

namespace nexus_skill {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

PlanParseResult SkillPlanReader::parse(const std::string& text) const {
    static const std::regex line_regex(R"(^(.+?)\s+([1-5])$)");

    PlanParseResult result;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }

        std::smatch match;
        if (!std::regex_match(trimmed, match, line_regex)) {
            result.parse_errors.push_back(trimmed);
            continue;
        }

        std::string name = trim(match[1].str());
        int level = std::stoi(match[2].str());

        auto id = m_tree->find_by_name(name);
        if (!id) {
            result.not_found.push_back(name);
            continue;
        }

        result.requests.push_back(SkillRequest{*id, level});
    }

    nexus_core::skill_logger()->debug(
        "Parsed skill plan: {} request(s), {} unparsable line(s), {} unknown name(s)",
        result.requests.size(), result.parse_errors.size(), result.not_found.size());

    return result;
}

} // namespace nexus_skill
