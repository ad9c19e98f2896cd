#include "interview/QuestionBank.hpp"

#include <algorithm>
#include <cstdlib>

namespace interview {

static std::vector<std::string> default_fallback() {
    return {
        "Walk me through a problem you solved using {skill}.",
        "What trade-offs do you weigh when applying {skill}?",
        "Explain a mistake people commonly make with {skill} and how to avoid it.",
    };
}

static std::string fill_template(const std::string& tmpl, const std::string& name) {
    static const std::string token = "{skill}";
    std::string out = tmpl;
    size_t pos = 0;
    while ((pos = out.find(token, pos)) != std::string::npos) {
        out.replace(pos, token.size(), name);
        pos += name.size();
    }
    return out;
}

QuestionBank::QuestionBank() : m_fallback(default_fallback()) {}

QuestionBank::QuestionBank(std::map<std::string, std::vector<Question>> by_skill, std::vector<std::string> fallback)
    : m_by_skill(std::move(by_skill)), m_fallback(std::move(fallback)) {
    if (m_fallback.empty()) m_fallback = default_fallback();
}

std::string QuestionBank::pick(const skills::Skill& skill,
                               int difficulty_cursor,
                               const std::vector<std::string>& already_asked) const {
    auto used = [&already_asked](const std::string& q) {
        return std::find(already_asked.begin(), already_asked.end(), q) != already_asked.end();
    };

    const int target = std::max(0, std::min(2, static_cast<int>(skill.tier) + difficulty_cursor));

    auto it = m_by_skill.find(skill.id);
    if (it != m_by_skill.end()) {
        const Question* best = nullptr;
        int best_dist = 0;
        for (const auto& q : it->second) {
            if (used(q.text)) continue;
            const int dist = std::abs(static_cast<int>(q.level) - target);
            if (!best || dist < best_dist) {
                best = &q;
                best_dist = dist;
            }
        }
        if (best) return best->text;
    }

    const std::string name = skill.name.empty() ? skill.id : skill.name;
    for (const auto& t : m_fallback) {
        std::string q = fill_template(t, name);
        if (!used(q)) return q;
    }
    return fill_template(m_fallback.front(), name);
}

bool QuestionBank::has_questions(const std::string& skill_id) const {
    auto it = m_by_skill.find(skill_id);
    return it != m_by_skill.end() && !it->second.empty();
}

size_t QuestionBank::size() const {
    size_t n = 0;
    for (const auto& kv : m_by_skill) n += kv.second.size();
    return n;
}

}  // namespace interview
