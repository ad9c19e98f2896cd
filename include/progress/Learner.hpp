#pragma once

#include "progress/ProgressTracker.hpp"
#include "roadmap/RoadmapGenerator.hpp"
#include "skills/MasteryModel.hpp"
#include "skills/SkillGraph.hpp"

#include <map>
#include <string>
#include <vector>

namespace progress {

// Serializable record of one learner, as kept by a profile store.
struct LearnerState {
    std::string learner_id;
    std::string role;  // role the roadmap is generated for; may be empty
    std::map<std::string, skills::MasteryEstimate> estimates;
    std::map<std::string, std::vector<skills::MasteryPoint>> history;
    std::vector<ProgressEvent> events;
    std::vector<roadmap::RoadmapUnit> roadmap;
};

// Everything that belongs to one learner. Passed explicitly; nothing is global.
class Learner {
public:
    Learner(std::string learner_id,
            std::string role,
            const skills::SkillGraph& graph,
            const skills::MasteryConfig& mastery_cfg,
            const roadmap::RoadmapGenerator& generator);

    // throws skills::ValidationError when the record does not fit the graph
    Learner(const LearnerState& state,
            const skills::SkillGraph& graph,
            const skills::MasteryConfig& mastery_cfg,
            const roadmap::RoadmapGenerator& generator);

    const std::string& id() const { return m_id; }
    const std::string& role() const { return m_tracker.role(); }

    skills::MasteryModel& mastery() { return m_model; }
    const skills::MasteryModel& mastery() const { return m_model; }

    ProgressTracker& progress() { return m_tracker; }
    const ProgressTracker& progress() const { return m_tracker; }

    // Records progress on a unit of the current roadmap and feeds it back as manual
    // evidence: the unit's skill is observed at start_mastery + completion * target_delta.
    // Returns the unit. Throws skills::ValidationError for an unknown unit id.
    roadmap::RoadmapUnit record_unit_progress(const std::string& unit_id,
                                              double completion,
                                              skills::TimePoint at,
                                              double manual_confidence);

    LearnerState to_state() const;

private:
    std::string m_id;
    skills::MasteryModel m_model;
    ProgressTracker m_tracker;
};

}  // namespace progress
