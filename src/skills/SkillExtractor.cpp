#include "skills/SkillExtractor.hpp"
#include "skills/Errors.hpp"
#include "skills/TextUtil.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>

namespace skills {

double ExtractorConfig::confidence_for(SourceTag tag) const {
    switch (tag) {
        case SourceTag::Resume: return resume_confidence;
        case SourceTag::Repository: return repository_confidence;
        case SourceTag::Interview: return interview_confidence;
        case SourceTag::Manual: return manual_confidence;
        default: return 0.0;
    }
}

void ExtractorConfig::validate() const {
    const std::pair<const char*, double> fields[] = {
        {"resume_confidence", resume_confidence},
        {"repository_confidence", repository_confidence},
        {"manual_confidence", manual_confidence},
        {"interview_confidence", interview_confidence},
        {"min_salience", min_salience},
    };
    for (const auto& [name, v] : fields) {
        if (!in_unit_range(v)) {
            std::ostringstream oss;
            oss << "extractor." << name << " outside [0,1]: " << v;
            throw ValidationError(oss.str());
        }
    }
    if (!(resume_confidence < repository_confidence && repository_confidence < manual_confidence)) {
        throw ValidationError("extractor confidences must satisfy resume < repository < manual");
    }
}

SkillExtractor::SkillExtractor(const SkillGraph& graph,
                               llm::LLMClient& analyzer,
                               ExtractorConfig cfg,
                               const SkillMatcher* semantic)
    : m_graph(graph), m_analyzer(analyzer), m_cfg(cfg), m_semantic(semantic) {
    m_cfg.validate();

    // ids win over names, names over aliases, when two skills share a surface form
    for (const auto& s : m_graph.skills()) m_lookup.emplace(textutil::normalize(s.id), s.id);
    for (const auto& s : m_graph.skills()) m_lookup.emplace(textutil::normalize(s.name), s.id);
    for (const auto& s : m_graph.skills()) {
        for (const auto& a : s.aliases) m_lookup.emplace(textutil::normalize(a), s.id);
    }
    m_lookup.erase("");
}

std::string SkillExtractor::resolve(const std::string& surface) const {
    const std::string key = textutil::normalize(surface);
    if (key.empty()) return "";

    auto it = m_lookup.find(key);
    if (it != m_lookup.end()) return it->second;

    if (m_semantic) {
        SkillMatch hit = m_semantic->best_match(surface);
        if (hit.ok && m_graph.contains(hit.skill_id)) return hit.skill_id;
    }
    return "";
}

void SkillExtractor::collect(const std::vector<llm::SkillMention>& mentions,
                             std::unordered_map<std::string, double>& best) const {
    for (const auto& m : mentions) {
        if (!in_unit_range(m.salience)) {
            std::cerr << "SkillExtractor: dropped mention '" << m.raw << "' with salience " << m.salience << "\n";
            continue;
        }
        if (m.salience < m_cfg.min_salience) continue;

        std::string skill_id;
        if (!m.canonical.empty()) skill_id = resolve(m.canonical);
        if (skill_id.empty() && !m.raw.empty()) skill_id = resolve(m.raw);
        if (skill_id.empty()) continue;

        double& slot = best[skill_id];
        slot = std::max(slot, m.salience);
    }
}

std::vector<Observation> SkillExtractor::to_observations(const std::unordered_map<std::string, double>& best,
                                                         SourceTag source,
                                                         TimePoint now) const {
    // emit in topological order so callers see a stable sequence
    std::vector<std::string> ids;
    ids.reserve(best.size());
    for (const auto& kv : best) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end(), [this](const std::string& a, const std::string& b) {
        return m_graph.position(a) < m_graph.position(b);
    });

    const double conf = m_cfg.confidence_for(source);

    std::vector<Observation> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        out.push_back(make_observation(id, best.at(id), conf, source, now));
    }
    return out;
}

std::vector<Observation> SkillExtractor::extract(const std::string& evidence_text, SourceTag source, TimePoint now) const {
    if (textutil::trim(evidence_text).empty()) return {};

    std::unordered_map<std::string, double> best;
    collect(m_analyzer.analyze(evidence_text), best);
    return to_observations(best, source, now);
}

std::vector<Observation> SkillExtractor::extract_repository(const RepositoryActivity& activity, TimePoint now) const {
    std::unordered_map<std::string, double> best;
    if (activity.repositories.empty()) return {};

    std::map<std::string, size_t> language_counts;
    std::ostringstream text;

    for (const auto& r : activity.repositories) {
        if (!r.language.empty()) language_counts[r.language] += 1;
        for (const auto& t : r.topics) text << t << "\n";
        if (!r.description.empty()) text << r.description << "\n";
    }

    const double total = static_cast<double>(activity.repositories.size());
    std::vector<llm::SkillMention> language_mentions;
    for (const auto& [lang, count] : language_counts) {
        language_mentions.push_back(llm::SkillMention{lang, "", static_cast<double>(count) / total});
    }
    collect(language_mentions, best);

    const std::string metadata = text.str();
    if (!textutil::trim(metadata).empty()) {
        collect(m_analyzer.analyze(metadata), best);
    }

    return to_observations(best, SourceTag::Repository, now);
}

}  // namespace skills
