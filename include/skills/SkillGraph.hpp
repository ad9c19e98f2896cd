#pragma once

#include "skills/Types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace skills {

using RoleTargets = std::map<std::string, double>;  // skill id -> target mastery

// Immutable prerequisite DAG plus per-role mastery targets.
// Validation runs once in the constructor; queries never re-validate.
class SkillGraph {
public:
    SkillGraph() = default;

    // throws GraphError on cycles, dangling prerequisites, duplicate ids,
    // or targets that are out of range / name unknown skills
    SkillGraph(std::vector<Skill> skills, std::map<std::string, RoleTargets> roles);

    bool contains(const std::string& skill_id) const;
    const Skill* find(const std::string& skill_id) const;
    const Skill& at(const std::string& skill_id) const;  // throws std::out_of_range

    // direct prerequisites; empty for unknown ids
    std::set<std::string> prerequisites_of(const std::string& skill_id) const;
    std::set<std::string> transitive_prerequisites(const std::string& skill_id) const;

    // skills that list skill_id as a direct prerequisite
    std::vector<std::string> dependents_of(const std::string& skill_id) const;

    // prerequisites first; ties by ascending tier, then skill id
    const std::vector<std::string>& topological_order() const { return m_order; }
    size_t position(const std::string& skill_id) const;  // index in topological_order()

    std::optional<double> target_mastery(const std::string& role, const std::string& skill_id) const;

    bool has_role(const std::string& role) const;
    const RoleTargets& role_targets(const std::string& role) const;  // throws UnknownRoleError
    std::vector<std::string> roles() const;

    size_t size() const { return m_skills.size(); }
    const std::vector<Skill>& skills() const { return m_skills; }

private:
    std::vector<Skill> m_skills;
    std::unordered_map<std::string, size_t> m_index;        // id -> m_skills slot
    std::unordered_map<std::string, std::vector<std::string>> m_dependents;
    std::map<std::string, RoleTargets> m_roles;

    std::vector<std::string> m_order;
    std::unordered_map<std::string, size_t> m_position;

    void build_order();
};

}  // namespace skills
