#include "roadmap/RoadmapGenerator.hpp"
#include "skills/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace roadmap {

void RoadmapConfig::validate() const {
    if (!(max_unit_delta > 0.0) || max_unit_delta > 1.0) {
        std::ostringstream oss;
        oss << "roadmap.max_unit_delta must be in (0,1]: " << max_unit_delta;
        throw skills::ValidationError(oss.str());
    }
    if (!(effort_per_mastery > 0.0)) {
        throw skills::ValidationError("roadmap.effort_per_mastery must be positive");
    }
    for (size_t i = 0; i < tier_multipliers.size(); ++i) {
        if (!(tier_multipliers[i] > 0.0)) {
            throw skills::ValidationError("roadmap.tier_multipliers must be positive");
        }
        if (i > 0 && tier_multipliers[i] < tier_multipliers[i - 1]) {
            throw skills::ValidationError("roadmap.tier_multipliers must be non-decreasing");
        }
    }
    if (!skills::in_unit_range(review_confidence_threshold)) {
        throw skills::ValidationError("roadmap.review_confidence_threshold outside [0,1]");
    }
}

bool RoadmapUnit::operator==(const RoadmapUnit& o) const {
    return id == o.id && skill == o.skill && kind == o.kind &&
           target_delta == o.target_delta && start_mastery == o.start_mastery &&
           effort == o.effort && part == o.part && parts == o.parts && position == o.position;
}

const char* unit_kind_str(UnitKind k) {
    switch (k) {
        case UnitKind::Learn: return "learn";
        case UnitKind::Review: return "review";
        default: return "unknown";
    }
}

UnitKind parse_unit_kind(const std::string& s) {
    if (s == "learn") return UnitKind::Learn;
    if (s == "review") return UnitKind::Review;
    throw skills::ValidationError("unknown roadmap unit kind: " + s);
}

RoadmapGenerator::RoadmapGenerator(RoadmapConfig cfg) : m_cfg(cfg) {
    m_cfg.validate();
}

double RoadmapGenerator::effort_for(double delta, skills::Tier tier) const {
    return delta * m_cfg.effort_per_mastery * m_cfg.tier_multipliers[static_cast<size_t>(tier)];
}

static std::string unit_id(const std::string& skill, int part) {
    return skill + "#" + std::to_string(part);
}

std::vector<RoadmapUnit> RoadmapGenerator::generate(const std::string& role,
                                                    const skills::MasteryModel& model,
                                                    const skills::SkillGraph& graph,
                                                    skills::TimePoint now) const {
    const skills::RoleTargets& targets = graph.role_targets(role);

    // gaps and start points come from one snapshot so a concurrent merge cannot tear them
    const std::map<std::string, skills::MasteryEstimate> snap = model.snapshot(now);
    std::map<std::string, double> gaps;
    for (const auto& [skill_id, target] : targets) {
        auto sit = snap.find(skill_id);
        const double g = target - (sit == snap.end() ? 0.0 : sit->second.mastery);
        if (g > 0.0) gaps[skill_id] = g;
    }

    std::vector<RoadmapUnit> out;

    // walking the full-graph order keeps prerequisites ahead of dependents even when
    // the prerequisite itself is already met and therefore absent from the plan
    for (const auto& skill_id : graph.topological_order()) {
        const skills::Skill& skill = graph.at(skill_id);

        double mastery = 0.0;
        double confidence = 0.0;
        auto sit = snap.find(skill_id);
        if (sit != snap.end()) {
            mastery = sit->second.mastery;
            confidence = sit->second.confidence;
        }

        auto git = gaps.find(skill_id);
        if (git != gaps.end()) {
            const double gap = git->second;
            // tolerance keeps 0.5/0.25 from becoming three parts through rounding
            const int parts = std::max(1, static_cast<int>(std::ceil(gap / m_cfg.max_unit_delta - 1e-9)));
            const double delta = gap / parts;

            for (int p = 1; p <= parts; ++p) {
                RoadmapUnit u;
                u.id = unit_id(skill_id, p);
                u.skill = skill_id;
                u.kind = UnitKind::Learn;
                u.target_delta = delta;
                u.start_mastery = mastery + delta * (p - 1);
                u.effort = effort_for(delta, skill.tier);
                u.part = p;
                u.parts = parts;
                u.position = static_cast<int>(out.size());
                out.push_back(std::move(u));
            }
            continue;
        }

        if (m_cfg.review_confidence_threshold <= 0.0) continue;

        auto tit = targets.find(skill_id);
        if (tit == targets.end()) continue;
        if (confidence >= m_cfg.review_confidence_threshold) continue;

        RoadmapUnit u;
        u.id = unit_id(skill_id, 1);
        u.skill = skill_id;
        u.kind = UnitKind::Review;
        u.target_delta = 0.0;
        u.start_mastery = mastery;
        u.effort = effort_for(std::min(tit->second, m_cfg.max_unit_delta), skill.tier);
        u.position = static_cast<int>(out.size());
        out.push_back(std::move(u));
    }

    return out;
}

}  // namespace roadmap
