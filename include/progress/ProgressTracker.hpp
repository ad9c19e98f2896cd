#pragma once

#include "roadmap/RoadmapGenerator.hpp"
#include "skills/MasteryModel.hpp"
#include "skills/Types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace progress {

enum class SubjectKind {
    Unit,
    Session
};

// The roadmap unit an event was recorded against. Unit ids repeat across
// regenerations, so an event only counts for a unit with the same basis.
struct UnitBasis {
    double start_mastery = 0.0;
    double target_delta = 0.0;
};

struct ProgressEvent {
    std::string subject_id;  // roadmap unit id ("<skill>#<part>") or interview session id
    SubjectKind kind = SubjectKind::Unit;
    double completion = 0.0;  // 0..1
    skills::TimePoint at{};
    std::optional<UnitBasis> basis;  // stamped by the tracker for unit events
};

// throws skills::ValidationError on an empty subject or completion outside [0,1]
ProgressEvent make_event(const std::string& subject_id,
                         SubjectKind kind,
                         double completion,
                         skills::TimePoint at);

const char* subject_kind_str(SubjectKind k);
SubjectKind parse_subject_kind(const std::string& s);  // throws skills::ValidationError

struct UnitStatus {
    roadmap::RoadmapUnit unit;
    double completion = 0.0;  // latest recorded completion for this unit

    bool done() const { return completion >= 1.0; }
};

struct ProgressSnapshot {
    std::vector<UnitStatus> units;
    size_t completed = 0;
    double overall = 0.0;  // completed / total, 0 for an empty roadmap
};

// Append-only event log for one learner plus a lazily regenerated roadmap.
// Recording marks the roadmap stale; the next snapshot regenerates it once.
// Unit events count only toward the unit they were recorded against: after a
// mastery change re-splits a gap, the new units start incomplete.
class ProgressTracker {
public:
    ProgressTracker(std::string role,
                    const roadmap::RoadmapGenerator& generator,
                    std::vector<ProgressEvent> events = {},
                    std::vector<roadmap::RoadmapUnit> roadmap = {});

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    // Unit events must name a unit of the current roadmap (throws skills::ValidationError
    // otherwise) and return that unit; session events return nullopt.
    std::optional<roadmap::RoadmapUnit> record_completion(const ProgressEvent& e);

    // throws skills::UnknownRoleError
    ProgressSnapshot snapshot(const skills::MasteryModel& model, skills::TimePoint now);

    std::vector<ProgressEvent> events() const;
    std::vector<roadmap::RoadmapUnit> roadmap() const;  // as of the last regeneration
    size_t regenerations() const;
    bool stale() const;

    const std::string& role() const { return m_role; }

private:
    std::string m_role;
    const roadmap::RoadmapGenerator* m_generator;

    mutable std::mutex m_mu;
    std::vector<ProgressEvent> m_events;
    std::vector<roadmap::RoadmapUnit> m_roadmap;
    bool m_stale = true;
    std::optional<std::uint64_t> m_model_version;
    size_t m_regenerations = 0;

    double completion_of(const roadmap::RoadmapUnit& unit) const;
};

}  // namespace progress
