#include "progress/ProgressTracker.hpp"
#include "skills/Errors.hpp"

#include <cmath>
#include <sstream>

namespace progress {

ProgressEvent make_event(const std::string& subject_id,
                         SubjectKind kind,
                         double completion,
                         skills::TimePoint at) {
    if (subject_id.empty()) throw skills::ValidationError("progress event needs a subject id");
    if (!skills::in_unit_range(completion)) {
        std::ostringstream oss;
        oss << "progress completion outside [0,1] for " << subject_id << ": " << completion;
        throw skills::ValidationError(oss.str());
    }
    return ProgressEvent{subject_id, kind, completion, at, std::nullopt};
}

static bool same_basis(const UnitBasis& b, const roadmap::RoadmapUnit& u) {
    return std::fabs(b.start_mastery - u.start_mastery) <= 1e-9 && std::fabs(b.target_delta - u.target_delta) <= 1e-9;
}

const char* subject_kind_str(SubjectKind k) {
    switch (k) {
        case SubjectKind::Unit: return "unit";
        case SubjectKind::Session: return "session";
        default: return "unknown";
    }
}

SubjectKind parse_subject_kind(const std::string& s) {
    if (s == "unit") return SubjectKind::Unit;
    if (s == "session") return SubjectKind::Session;
    throw skills::ValidationError("unknown progress subject kind: " + s);
}

ProgressTracker::ProgressTracker(std::string role,
                                 const roadmap::RoadmapGenerator& generator,
                                 std::vector<ProgressEvent> events,
                                 std::vector<roadmap::RoadmapUnit> roadmap)
    : m_role(std::move(role)), m_generator(&generator), m_roadmap(std::move(roadmap)) {
    for (const auto& e : events) {
        ProgressEvent checked = make_event(e.subject_id, e.kind, e.completion, e.at);
        checked.basis = e.basis;
        m_events.push_back(std::move(checked));
    }
}

std::optional<roadmap::RoadmapUnit> ProgressTracker::record_completion(const ProgressEvent& e) {
    ProgressEvent checked = make_event(e.subject_id, e.kind, e.completion, e.at);

    std::lock_guard<std::mutex> lock(m_mu);
    std::optional<roadmap::RoadmapUnit> unit;
    if (checked.kind == SubjectKind::Unit) {
        for (const auto& u : m_roadmap) {
            if (u.id == checked.subject_id) {
                unit = u;
                break;
            }
        }
        if (!unit) {
            throw skills::ValidationError("no unit " + checked.subject_id + " in the current roadmap");
        }
        checked.basis = UnitBasis{unit->start_mastery, unit->target_delta};
    }

    m_events.push_back(std::move(checked));
    m_stale = true;
    return unit;
}

double ProgressTracker::completion_of(const roadmap::RoadmapUnit& unit) const {
    const ProgressEvent* latest = nullptr;
    for (const auto& e : m_events) {
        if (e.kind != SubjectKind::Unit || e.subject_id != unit.id) continue;
        if (!e.basis || !same_basis(*e.basis, unit)) continue;
        // later appends win ties
        if (!latest || e.at >= latest->at) latest = &e;
    }
    return latest ? latest->completion : 0.0;
}

ProgressSnapshot ProgressTracker::snapshot(const skills::MasteryModel& model, skills::TimePoint now) {
    std::lock_guard<std::mutex> lock(m_mu);

    const std::uint64_t version = model.version();
    if (m_stale || !m_model_version || *m_model_version != version) {
        m_roadmap = m_generator->generate(m_role, model, model.graph(), now);
        m_model_version = version;
        m_stale = false;
        ++m_regenerations;
    }

    ProgressSnapshot snap;
    snap.units.reserve(m_roadmap.size());
    for (const auto& u : m_roadmap) {
        UnitStatus st;
        st.unit = u;
        st.completion = completion_of(u);
        if (st.done()) ++snap.completed;
        snap.units.push_back(std::move(st));
    }
    snap.overall = snap.units.empty() ? 0.0 : static_cast<double>(snap.completed) / snap.units.size();
    return snap;
}

std::vector<ProgressEvent> ProgressTracker::events() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_events;
}

std::vector<roadmap::RoadmapUnit> ProgressTracker::roadmap() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_roadmap;
}

size_t ProgressTracker::regenerations() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_regenerations;
}

bool ProgressTracker::stale() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_stale;
}

}  // namespace progress
