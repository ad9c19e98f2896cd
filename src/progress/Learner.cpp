#include "progress/Learner.hpp"
#include "skills/Errors.hpp"

#include <algorithm>

namespace progress {

static const std::string& require_id(const std::string& id) {
    if (id.empty()) throw skills::ValidationError("learner id must not be empty");
    return id;
}

Learner::Learner(std::string learner_id,
                 std::string role,
                 const skills::SkillGraph& graph,
                 const skills::MasteryConfig& mastery_cfg,
                 const roadmap::RoadmapGenerator& generator)
    : m_id(require_id(learner_id)),
      m_model(m_id, graph, mastery_cfg),
      m_tracker(std::move(role), generator) {}

Learner::Learner(const LearnerState& state,
                 const skills::SkillGraph& graph,
                 const skills::MasteryConfig& mastery_cfg,
                 const roadmap::RoadmapGenerator& generator)
    : m_id(require_id(state.learner_id)),
      m_model(m_id, graph, mastery_cfg, state.estimates, state.history),
      m_tracker(state.role, generator, state.events, state.roadmap) {}

roadmap::RoadmapUnit Learner::record_unit_progress(const std::string& unit_id,
                                                  double completion,
                                                  skills::TimePoint at,
                                                  double manual_confidence) {
    const ProgressEvent e = make_event(unit_id, SubjectKind::Unit, completion, at);

    // bring the roadmap up to date so the id names a unit the learner can see
    m_tracker.snapshot(m_model, at);
    const roadmap::RoadmapUnit unit = *m_tracker.record_completion(e);

    if (completion > 0.0) {
        const double reached = std::min(1.0, unit.start_mastery + completion * unit.target_delta);
        m_model.merge(skills::make_observation(unit.skill, reached, manual_confidence, skills::SourceTag::Manual, at));
    }
    return unit;
}

LearnerState Learner::to_state() const {
    LearnerState st;
    st.learner_id = m_id;
    st.role = m_tracker.role();
    st.estimates = m_model.raw_estimates();
    st.history = m_model.raw_history();
    st.events = m_tracker.events();
    st.roadmap = m_tracker.roadmap();
    return st;
}

}  // namespace progress
