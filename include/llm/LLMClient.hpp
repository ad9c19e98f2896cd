#pragma once
#include <string>
#include <vector>

namespace llm {

struct SkillMention {
    std::string raw;        // surface form as it appeared in the text
    std::string canonical;  // capability's own normalization, may be empty
    double salience = 0.0;  // 0..1
};

struct Judgment {
    double score = 0.0;       // 0..1
    double confidence = 0.0;  // 0..1
};

// The two external black-box capabilities. Implementations may block; a call that
// does not answer in time throws skills::CapabilityTimeoutError.
class LLMClient {
public:
    virtual ~LLMClient() = default;

    // best effort; an empty result means "no recognizable skills", not failure
    virtual std::vector<SkillMention> analyze(const std::string& text) = 0;

    virtual Judgment judge(const std::string& response_text, const std::string& target_skill) = 0;
};

} // namespace llm
