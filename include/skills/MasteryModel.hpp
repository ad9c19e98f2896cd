#pragma once

#include "skills/SkillGraph.hpp"
#include "skills/Types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skills {

struct MasteryConfig {
    // confidence halves its distance to the floor every half_life_days
    double half_life_days = 90.0;
    double confidence_floor = 0.1;
};

struct MasteryPoint {
    TimePoint at{};
    double mastery = 0.0;
    double confidence = 0.0;
    SourceTag source = SourceTag::Manual;
};

// Confidence after `elapsed` without updates. Monotonically non-increasing in elapsed time,
// never below the floor (and never raised if already below it).
double decayed_confidence(double confidence, Clock::duration elapsed, const MasteryConfig& cfg);

// Pure merge rule:
//   m' = (m*c + s*cs) / (c + cs)
//   c' = min(1, c + cs*(1-c))
// where c is the old confidence decayed up to the observation time.
MasteryEstimate merge_estimate(const std::optional<MasteryEstimate>& prior,
                               const Observation& o,
                               const MasteryConfig& cfg);

// One learner's mastery estimates. The only writer of MasteryEstimate values;
// merges are serialized, each one a full read-modify-write.
class MasteryModel {
public:
    MasteryModel(std::string learner_id, const SkillGraph& graph, MasteryConfig cfg = {});

    // Restores persisted state. Every estimate is validated (known skill, values in range).
    MasteryModel(std::string learner_id,
                 const SkillGraph& graph,
                 MasteryConfig cfg,
                 std::map<std::string, MasteryEstimate> estimates,
                 std::map<std::string, std::vector<MasteryPoint>> history = {});

    MasteryModel(const MasteryModel&) = delete;
    MasteryModel& operator=(const MasteryModel&) = delete;

    const std::string& learner_id() const { return m_learner_id; }
    const SkillGraph& graph() const { return *m_graph; }
    const MasteryConfig& config() const { return m_cfg; }

    // throws ValidationError (range, unknown skill); prior estimate untouched on failure
    MasteryEstimate merge(const Observation& o);

    // all observations are validated before any is applied; applied in order
    std::vector<MasteryEstimate> merge_all(const std::vector<Observation>& obs);

    // confidence is decayed up to `now`
    std::optional<MasteryEstimate> estimate(const std::string& skill_id, TimePoint now) const;
    std::map<std::string, MasteryEstimate> snapshot(TimePoint now) const;

    // stored values, undecayed (for persistence)
    std::map<std::string, MasteryEstimate> raw_estimates() const;
    std::map<std::string, std::vector<MasteryPoint>> raw_history() const;

    // skill -> max(0, target - mastery) for every target of `role` not yet met.
    // throws UnknownRoleError
    std::map<std::string, double> gap(const std::string& role) const;

    // n skills with the lowest mastery*confidence, ties by topological position.
    // Skills without an estimate rank as 0.
    std::vector<std::string> weakest_uncertain(size_t n, TimePoint now) const;
    std::vector<std::string> weakest_uncertain(size_t n, TimePoint now, const std::string& role) const;

    std::vector<MasteryPoint> history(const std::string& skill_id) const;

    // bumped on every successful merge
    std::uint64_t version() const;

private:
    std::string m_learner_id;
    const SkillGraph* m_graph;
    MasteryConfig m_cfg;

    mutable std::mutex m_mu;
    std::map<std::string, MasteryEstimate> m_estimates;
    std::map<std::string, std::vector<MasteryPoint>> m_history;
    std::uint64_t m_version = 0;

    void check_known(const std::string& skill_id) const;
    std::vector<std::string> rank_weakest(const std::vector<std::string>& candidates, size_t n, TimePoint now) const;
};

}  // namespace skills
