#include "llm/HeuristicLLMClient.hpp"
#include "skills/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>

namespace llm {

HeuristicLLMClient::HeuristicLLMClient(const skills::SkillGraph& graph, HeuristicConfig cfg)
    : graph_(graph), cfg_(cfg) {
    for (const auto& s : graph_.skills()) {
        std::unordered_set<std::string> seen;
        auto add = [&](const std::string& surface) {
            std::string phrase = textutil::normalize(surface);
            if (phrase.empty() || !seen.insert(phrase).second) return;
            lexicon_.push_back(Entry{s.id, std::move(phrase), surface});
        };

        add(s.id);
        add(s.name);
        for (const auto& a : s.aliases) add(a);
    }
}

std::vector<SkillMention> HeuristicLLMClient::analyze(const std::string& text) {
    const std::string norm = textutil::normalize(text);

    // skill id -> (occurrences, first raw surface form that hit)
    std::map<std::string, std::pair<size_t, std::string>> hits;
    for (const auto& e : lexicon_) {
        const size_t n = textutil::count_phrase(norm, e.phrase);
        if (n == 0) continue;
        auto& h = hits[e.skill_id];
        if (h.first == 0) h.second = e.raw;
        h.first += n;
    }

    std::vector<SkillMention> out;
    out.reserve(hits.size());
    for (const auto& [skill_id, h] : hits) {
        SkillMention m;
        m.raw = h.second;
        m.canonical = skill_id;
        m.salience = 1.0 - std::pow(0.5, static_cast<double>(h.first));
        out.push_back(std::move(m));
    }
    return out;
}

Judgment HeuristicLLMClient::judge(const std::string& response_text, const std::string& target_skill) {
    const size_t words = textutil::word_count(response_text);

    int band = 5;
    if (words < 10) band = 1;
    else if (words < 30) band = 2;
    else if (words < 60) band = 3;
    else if (words < 100) band = 4;

    const std::string norm = textutil::normalize(response_text);

    bool technical = false;
    if (const skills::Skill* s = graph_.find(target_skill)) {
        for (const auto& e : lexicon_) {
            if (e.skill_id == s->id && textutil::count_phrase(norm, e.phrase) > 0) {
                technical = true;
                break;
            }
        }
    }
    if (!technical) {
        static const char* kWords[] = {
            "i used", "i implemented", "code", "algorithm", "optimized", "debugged", "framework"
        };
        for (const char* w : kWords) {
            if (textutil::count_phrase(norm, textutil::normalize(w)) > 0) {
                technical = true;
                break;
            }
        }
    }
    if (technical) band = std::min(5, band + 1);

    Judgment j;
    j.score = band / 5.0;
    j.confidence = cfg_.judge_confidence;
    return j;
}

} // namespace llm
