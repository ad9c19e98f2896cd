#include "skills/SkillGraph.hpp"
#include "skills/Errors.hpp"

#include <algorithm>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace skills {

SkillGraph::SkillGraph(std::vector<Skill> skills, std::map<std::string, RoleTargets> roles)
    : m_skills(std::move(skills)), m_roles(std::move(roles)) {
    m_index.reserve(m_skills.size() * 2 + 8);

    for (size_t i = 0; i < m_skills.size(); ++i) {
        const Skill& s = m_skills[i];
        if (s.id.empty()) {
            std::ostringstream oss;
            oss << "skill at index " << i << " has an empty id";
            throw GraphError(oss.str());
        }
        if (!m_index.emplace(s.id, i).second) {
            throw GraphError("duplicate skill id: " + s.id);
        }
    }

    for (const auto& s : m_skills) {
        for (const auto& p : s.prerequisites) {
            if (p == s.id) throw GraphError("skill " + s.id + " lists itself as a prerequisite");
            if (m_index.find(p) == m_index.end()) {
                throw GraphError("skill " + s.id + " has unknown prerequisite: " + p);
            }
            m_dependents[p].push_back(s.id);
        }
    }

    for (const auto& [role, targets] : m_roles) {
        if (targets.empty()) throw GraphError("role " + role + " has no target skills");
        for (const auto& [skill_id, target] : targets) {
            if (m_index.find(skill_id) == m_index.end()) {
                throw GraphError("role " + role + " targets unknown skill: " + skill_id);
            }
            if (!in_unit_range(target)) {
                std::ostringstream oss;
                oss << "role " << role << " target for " << skill_id << " outside [0,1]: " << target;
                throw GraphError(oss.str());
            }
        }
    }

    build_order();
}

// Kahn's algorithm with a min-heap keyed on (tier, id) so the order is deterministic.
void SkillGraph::build_order() {
    std::unordered_map<std::string, size_t> indegree;
    indegree.reserve(m_skills.size() * 2 + 8);
    for (const auto& s : m_skills) {
        // duplicate prerequisite entries count once
        std::set<std::string> uniq(s.prerequisites.begin(), s.prerequisites.end());
        indegree[s.id] = uniq.size();
    }

    using Key = std::tuple<int, std::string>;
    std::priority_queue<Key, std::vector<Key>, std::greater<Key>> ready;

    for (const auto& s : m_skills) {
        if (indegree[s.id] == 0) ready.emplace(static_cast<int>(s.tier), s.id);
    }

    m_order.clear();
    m_order.reserve(m_skills.size());

    while (!ready.empty()) {
        const std::string id = std::get<1>(ready.top());
        ready.pop();
        m_order.push_back(id);

        auto dit = m_dependents.find(id);
        if (dit == m_dependents.end()) continue;

        std::set<std::string> released(dit->second.begin(), dit->second.end());
        for (const auto& dep : released) {
            size_t& d = indegree[dep];
            if (d > 0 && --d == 0) {
                ready.emplace(static_cast<int>(at(dep).tier), dep);
            }
        }
    }

    if (m_order.size() != m_skills.size()) {
        std::vector<std::string> stuck;
        for (const auto& s : m_skills) {
            if (indegree[s.id] > 0) stuck.push_back(s.id);
        }
        std::sort(stuck.begin(), stuck.end());

        std::ostringstream oss;
        oss << "prerequisite cycle among skills:";
        for (const auto& id : stuck) oss << " " << id;
        throw GraphError(oss.str());
    }

    m_position.clear();
    m_position.reserve(m_order.size() * 2 + 8);
    for (size_t i = 0; i < m_order.size(); ++i) m_position[m_order[i]] = i;

    for (auto& [id, deps] : m_dependents) {
        std::sort(deps.begin(), deps.end(), [this](const std::string& a, const std::string& b) {
            return m_position.at(a) < m_position.at(b);
        });
        deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    }
}

bool SkillGraph::contains(const std::string& skill_id) const {
    return m_index.find(skill_id) != m_index.end();
}

const Skill* SkillGraph::find(const std::string& skill_id) const {
    auto it = m_index.find(skill_id);
    if (it == m_index.end()) return nullptr;
    return &m_skills[it->second];
}

const Skill& SkillGraph::at(const std::string& skill_id) const {
    const Skill* s = find(skill_id);
    if (!s) throw std::out_of_range("unknown skill: " + skill_id);
    return *s;
}

std::set<std::string> SkillGraph::prerequisites_of(const std::string& skill_id) const {
    const Skill* s = find(skill_id);
    if (!s) return {};
    return std::set<std::string>(s->prerequisites.begin(), s->prerequisites.end());
}

std::set<std::string> SkillGraph::transitive_prerequisites(const std::string& skill_id) const {
    std::set<std::string> out;
    std::vector<std::string> stack;

    const Skill* root = find(skill_id);
    if (!root) return out;
    stack.insert(stack.end(), root->prerequisites.begin(), root->prerequisites.end());

    while (!stack.empty()) {
        std::string cur = std::move(stack.back());
        stack.pop_back();
        if (!out.insert(cur).second) continue;
        const Skill& s = at(cur);
        stack.insert(stack.end(), s.prerequisites.begin(), s.prerequisites.end());
    }
    return out;
}

std::vector<std::string> SkillGraph::dependents_of(const std::string& skill_id) const {
    auto it = m_dependents.find(skill_id);
    if (it == m_dependents.end()) return {};
    return it->second;
}

size_t SkillGraph::position(const std::string& skill_id) const {
    auto it = m_position.find(skill_id);
    if (it == m_position.end()) throw std::out_of_range("unknown skill: " + skill_id);
    return it->second;
}

std::optional<double> SkillGraph::target_mastery(const std::string& role, const std::string& skill_id) const {
    auto rit = m_roles.find(role);
    if (rit == m_roles.end()) return std::nullopt;
    auto sit = rit->second.find(skill_id);
    if (sit == rit->second.end()) return std::nullopt;
    return sit->second;
}

bool SkillGraph::has_role(const std::string& role) const {
    return m_roles.find(role) != m_roles.end();
}

const RoleTargets& SkillGraph::role_targets(const std::string& role) const {
    auto it = m_roles.find(role);
    if (it == m_roles.end()) throw UnknownRoleError(role);
    return it->second;
}

std::vector<std::string> SkillGraph::roles() const {
    std::vector<std::string> out;
    out.reserve(m_roles.size());
    for (const auto& [role, targets] : m_roles) out.push_back(role);
    return out;
}

}  // namespace skills
