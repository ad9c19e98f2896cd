#pragma once

#include <string>

namespace skills {

struct SkillMatch {
    bool ok = false;
    std::string skill_id;
    float similarity = 0;
};

// Fallback resolution of a free-text skill mention onto a graph skill id,
// used only when exact/alias lookup fails.
class SkillMatcher {
public:
    virtual ~SkillMatcher() = default;
    virtual SkillMatch best_match(const std::string& mention) const = 0;
};

}  // namespace skills
