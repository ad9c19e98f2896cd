#pragma once

#include "llm/LLMClient.hpp"
#include "skills/SkillGraph.hpp"
#include "skills/SkillMatcher.hpp"
#include "skills/Types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace skills {

// Fixed confidence assigned to every observation of a given source.
// Calibrated so that resume < repository < manual attestation.
struct ExtractorConfig {
    double resume_confidence = 0.3;
    double repository_confidence = 0.5;
    double manual_confidence = 0.8;
    double interview_confidence = 0.9;

    // mentions below this salience are ignored
    double min_salience = 0.05;

    double confidence_for(SourceTag tag) const;
    void validate() const;  // throws ValidationError
};

struct Repository {
    std::string name;
    std::string language;              // primary language, may be empty
    std::vector<std::string> topics;
    std::string description;
};

struct RepositoryActivity {
    std::string account;
    std::vector<Repository> repositories;
};

// Turns raw learner evidence into observations over graph skills.
// Stateless apart from its lookup tables; safe to share across threads when the
// capability client is.
class SkillExtractor {
public:
    SkillExtractor(const SkillGraph& graph,
                   llm::LLMClient& analyzer,
                   ExtractorConfig cfg = {},
                   const SkillMatcher* semantic = nullptr);

    // Zero observations when nothing is recognized. Capability timeouts propagate
    // as CapabilityTimeoutError.
    std::vector<Observation> extract(const std::string& evidence_text, SourceTag source, TimePoint now) const;

    // language share across repositories, plus topics/descriptions through the analyzer;
    // the stronger salience per skill wins
    std::vector<Observation> extract_repository(const RepositoryActivity& activity, TimePoint now) const;

    // graph skill id for a surface form, or "" when unresolved
    std::string resolve(const std::string& surface) const;

private:
    const SkillGraph& m_graph;
    llm::LLMClient& m_analyzer;
    ExtractorConfig m_cfg;
    const SkillMatcher* m_semantic;

    std::unordered_map<std::string, std::string> m_lookup;  // normalized surface -> skill id

    // skill id -> strongest salience
    void collect(const std::vector<llm::SkillMention>& mentions, std::unordered_map<std::string, double>& best) const;

    std::vector<Observation> to_observations(const std::unordered_map<std::string, double>& best,
                                             SourceTag source,
                                             TimePoint now) const;
};

}  // namespace skills
