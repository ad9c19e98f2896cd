#pragma once

#include "skills/MasteryModel.hpp"
#include "skills/SkillGraph.hpp"
#include "skills/Types.hpp"

#include <array>
#include <string>
#include <vector>

namespace roadmap {

struct RoadmapConfig {
    // no single unit asks for more than this much mastery gain
    double max_unit_delta = 0.25;

    // effort (hours) for a full 0 -> 1 mastery climb at foundational tier
    double effort_per_mastery = 20.0;

    // indexed by skills::Tier; must be non-decreasing
    std::array<double, 3> tier_multipliers{{1.0, 1.5, 2.25}};

    // > 0 enables review units for met skills whose confidence decayed below it
    double review_confidence_threshold = 0.0;

    void validate() const;  // throws skills::ValidationError
};

enum class UnitKind {
    Learn,
    Review
};

struct RoadmapUnit {
    std::string id;             // "<skill>#<part>"
    std::string skill;
    UnitKind kind = UnitKind::Learn;
    double target_delta = 0.0;  // mastery gain this unit aims for
    double start_mastery = 0.0; // mastery expected when the unit begins
    double effort = 0.0;        // hours
    int part = 1;               // 1-based part of a split skill
    int parts = 1;
    int position = 0;           // 0-based sequence position

    bool operator==(const RoadmapUnit& o) const;
    bool operator!=(const RoadmapUnit& o) const { return !(*this == o); }
};

const char* unit_kind_str(UnitKind k);
UnitKind parse_unit_kind(const std::string& s);  // throws skills::ValidationError

// Builds the ordered learning plan for a role. Stateless: the same mastery and graph
// state always yields the same sequence.
class RoadmapGenerator {
public:
    explicit RoadmapGenerator(RoadmapConfig cfg = {});

    // throws skills::UnknownRoleError
    std::vector<RoadmapUnit> generate(const std::string& role,
                                      const skills::MasteryModel& model,
                                      const skills::SkillGraph& graph,
                                      skills::TimePoint now) const;

    // monotonic in both gap size and tier
    double effort_for(double delta, skills::Tier tier) const;

    const RoadmapConfig& config() const { return m_cfg; }

private:
    RoadmapConfig m_cfg;
};

}  // namespace roadmap
