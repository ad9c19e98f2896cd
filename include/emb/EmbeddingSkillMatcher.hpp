#pragma once

#include "emb/SkillIndex.hpp"
#include "emb/TextEmbedder.hpp"
#include "skills/SkillGraph.hpp"
#include "skills/SkillMatcher.hpp"

#include <memory>
#include <string>

struct SkillMatcherConfig {
    float threshold = 0.66f; // accept match if similarity >= threshold
    std::string cache_path;  // optional: load/save the skill index
};

// Embeds every skill's display name and aliases once; a mention resolves to the
// skill of its nearest vector when the cosine similarity clears the threshold.
class EmbeddingSkillMatcher final : public skills::SkillMatcher {
public:
    EmbeddingSkillMatcher(SkillIndex idx, const TextEmbedder& embedder, SkillMatcherConfig cfg);

    skills::SkillMatch best_match(const std::string& mention) const override;

private:
    SkillIndex m_idx;
    const TextEmbedder* m_emb;
    SkillMatcherConfig m_cfg;
};

std::unique_ptr<skills::SkillMatcher> build_embedding_skill_matcher(
    const skills::SkillGraph& graph,
    const TextEmbedder& embedder,
    const SkillMatcherConfig& cfg
);
