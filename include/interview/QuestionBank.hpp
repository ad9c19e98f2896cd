#pragma once

#include "skills/Types.hpp"

#include <map>
#include <string>
#include <vector>

namespace interview {

struct Question {
    std::string text;
    skills::Tier level = skills::Tier::Foundational;
};

// Question wording per skill. Picks the unused question whose level is closest to
// the skill's tier shifted by the difficulty cursor; otherwise a fallback template
// with "{skill}" replaced by the skill name.
class QuestionBank {
public:
    QuestionBank();
    QuestionBank(std::map<std::string, std::vector<Question>> by_skill, std::vector<std::string> fallback);

    std::string pick(const skills::Skill& skill,
                     int difficulty_cursor,
                     const std::vector<std::string>& already_asked) const;

    bool has_questions(const std::string& skill_id) const;
    size_t size() const;  // total skill-specific questions

private:
    std::map<std::string, std::vector<Question>> m_by_skill;
    std::vector<std::string> m_fallback;
};

}  // namespace interview
