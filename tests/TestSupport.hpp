#pragma once

#include "llm/LLMClient.hpp"
#include "skills/Errors.hpp"
#include "skills/SkillGraph.hpp"

#include <cmath>
#include <deque>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace testing_support {

struct TestSuite {
    bool ok = true;
    void require(bool condition, const std::string& message) {
        if (!condition) {
            std::cerr << "[FAIL] " << message << std::endl;
            ok = false;
        }
    }
};

inline bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

inline skills::Skill make_skill(const std::string& id,
                                skills::Tier tier,
                                std::vector<std::string> prereqs = {},
                                std::vector<std::string> aliases = {}) {
    skills::Skill s;
    s.id = id;
    s.name = id;
    s.tier = tier;
    s.prerequisites = std::move(prereqs);
    s.aliases = std::move(aliases);
    return s;
}

// networking-basics -> http, sql standalone; role backend-engineer {http:0.7, sql:0.6}
inline skills::SkillGraph backend_graph() {
    using skills::Tier;
    std::vector<skills::Skill> s{
        make_skill("networking-basics", Tier::Foundational, {}, {"networking", "tcp/ip"}),
        make_skill("http", Tier::Intermediate, {"networking-basics"}, {"rest"}),
        make_skill("sql", Tier::Intermediate, {}, {"postgres", "mysql"}),
    };
    std::map<std::string, skills::RoleTargets> roles{
        {"backend-engineer", {{"http", 0.7}, {"sql", 0.6}}},
    };
    return skills::SkillGraph(std::move(s), std::move(roles));
}

// programming -> data-structures -> algorithms -> system-design
//             \-> http (needs networking-basics)
inline skills::SkillGraph ladder_graph() {
    using skills::Tier;
    std::vector<skills::Skill> s{
        make_skill("programming", Tier::Foundational),
        make_skill("networking-basics", Tier::Foundational),
        make_skill("data-structures", Tier::Intermediate, {"programming"}),
        make_skill("http", Tier::Intermediate, {"networking-basics", "programming"}),
        make_skill("algorithms", Tier::Advanced, {"data-structures"}),
        make_skill("system-design", Tier::Advanced, {"algorithms", "http"}),
    };
    std::map<std::string, skills::RoleTargets> roles{
        {"backend-engineer", {{"http", 0.7}, {"algorithms", 0.6}, {"system-design", 0.5}}},
        {"data-engineer", {{"data-structures", 0.8}}},
    };
    return skills::SkillGraph(std::move(s), std::move(roles));
}

// Deterministic capability: canned mentions for analyze, a queue of judgments for judge.
class ScriptedLLMClient final : public llm::LLMClient {
public:
    std::vector<llm::SkillMention> mentions;
    std::deque<llm::Judgment> judgments;
    llm::Judgment fallback_judgment{0.5, 0.5};

    int analyze_timeouts = 0;  // first N analyze calls time out
    int judge_timeouts = 0;    // first N judge calls time out
    int analyze_calls = 0;
    int judge_calls = 0;
    std::vector<std::string> judged_skills;

    std::vector<llm::SkillMention> analyze(const std::string&) override {
        ++analyze_calls;
        if (analyze_timeouts > 0) {
            --analyze_timeouts;
            throw skills::CapabilityTimeoutError("scripted analyze timeout");
        }
        return mentions;
    }

    llm::Judgment judge(const std::string&, const std::string& target_skill) override {
        ++judge_calls;
        if (judge_timeouts > 0) {
            --judge_timeouts;
            throw skills::CapabilityTimeoutError("scripted judge timeout");
        }
        judged_skills.push_back(target_skill);
        if (judgments.empty()) return fallback_judgment;
        llm::Judgment j = judgments.front();
        judgments.pop_front();
        return j;
    }
};

}  // namespace testing_support
