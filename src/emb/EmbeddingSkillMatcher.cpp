#include "emb/EmbeddingSkillMatcher.hpp"
#include "skills/TextUtil.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

EmbeddingSkillMatcher::EmbeddingSkillMatcher(SkillIndex idx, const TextEmbedder& embedder, SkillMatcherConfig cfg)
    : m_idx(std::move(idx)), m_emb(&embedder), m_cfg(std::move(cfg)) {}

skills::SkillMatch EmbeddingSkillMatcher::best_match(const std::string& mention) const {
    if (m_idx.size() == 0) return skills::SkillMatch{};

    const std::string q = textutil::normalize(mention);
    if (q.empty()) return skills::SkillMatch{};

    std::vector<float> qv = m_emb->embed(q);
    if (qv.empty()) return skills::SkillMatch{};

    auto hits = m_idx.topk(qv, 1);
    if (hits.empty()) return skills::SkillMatch{};

    skills::SkillMatch out;
    out.similarity = hits[0].score;
    out.skill_id = hits[0].skill_id;
    out.ok = hits[0].score >= m_cfg.threshold;
    if (!out.ok) out.skill_id.clear();
    return out;
}

static SkillIndex build_index(const skills::SkillGraph& graph, const TextEmbedder& embedder) {
    SkillIndex idx;
    for (const auto& s : graph.skills()) {
        // one vector per surface form; the index may hold several rows per skill
        std::vector<std::string> forms{s.name.empty() ? s.id : s.name};
        forms.insert(forms.end(), s.aliases.begin(), s.aliases.end());

        for (const auto& f : forms) {
            const std::string norm = textutil::normalize(f);
            if (norm.empty()) continue;
            idx.add(s.id, embedder.embed(norm));
        }
    }
    return idx;
}

std::unique_ptr<skills::SkillMatcher> build_embedding_skill_matcher(
    const skills::SkillGraph& graph,
    const TextEmbedder& embedder,
    const SkillMatcherConfig& cfg
) {
    if (!cfg.cache_path.empty()) {
        SkillIndex cached;
        if (cached.load(cfg.cache_path)) {
            return std::make_unique<EmbeddingSkillMatcher>(std::move(cached), embedder, cfg);
        }
    }

    SkillIndex idx = build_index(graph, embedder);

    if (!cfg.cache_path.empty()) {
        const fs::path p(cfg.cache_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        if (!idx.save(cfg.cache_path)) {
            std::cerr << "EmbeddingSkillMatcher: could not write index cache " << cfg.cache_path << "\n";
        }
    }

    return std::make_unique<EmbeddingSkillMatcher>(std::move(idx), embedder, cfg);
}
