#pragma once

#include "llm/LLMClient.hpp"
#include "skills/SkillGraph.hpp"

#include <string>
#include <vector>

namespace llm {

struct HeuristicConfig {
    double judge_confidence = 0.4;  // length heuristics are weak evidence
};

// Offline stand-in for both capabilities.
// analyze(): phrase lexicon built from the graph's skill ids, names and aliases;
//            salience = 1 - 0.5^occurrences.
// judge():   answer length bands (1..5) plus one band for naming the skill or
//            concrete technical wording; score = band / 5.
class HeuristicLLMClient final : public LLMClient {
public:
    explicit HeuristicLLMClient(const skills::SkillGraph& graph, HeuristicConfig cfg = {});

    std::vector<SkillMention> analyze(const std::string& text) override;
    Judgment judge(const std::string& response_text, const std::string& target_skill) override;

private:
    struct Entry {
        std::string skill_id;
        std::string phrase;  // normalized
        std::string raw;
    };

    const skills::SkillGraph& graph_;
    HeuristicConfig cfg_;
    std::vector<Entry> lexicon_;
};

} // namespace llm
