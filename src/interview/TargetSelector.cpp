#include "interview/TargetSelector.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace interview {

double recent_average(const std::vector<QuestionRecord>& records, size_t window) {
    std::vector<double> scores;
    for (const auto& r : records) {
        if (r.answered) scores.push_back(r.score);
    }
    if (window == 0 || scores.size() < window) return -1.0;

    double sum = 0.0;
    for (size_t i = scores.size() - window; i < scores.size(); ++i) sum += scores[i];
    return sum / static_cast<double>(window);
}

static std::set<std::string> asked_skills(const InterviewSession& s) {
    std::set<std::string> out;
    for (const auto& r : s.records) out.insert(r.skill);
    return out;
}

static std::string harder_than(const std::string& current,
                               const std::set<std::string>& asked,
                               const skills::SkillGraph& graph) {
    for (const auto& d : graph.dependents_of(current)) {
        if (!asked.count(d)) return d;
    }

    const skills::Skill* cur = graph.find(current);
    if (!cur) return "";
    for (const auto& id : graph.topological_order()) {
        if (asked.count(id)) continue;
        if (graph.at(id).tier > cur->tier) return id;
    }
    return "";
}

static std::string easier_than(const std::string& current,
                               const std::set<std::string>& asked,
                               const skills::SkillGraph& graph) {
    std::vector<std::string> prereqs;
    for (const auto& p : graph.transitive_prerequisites(current)) {
        if (!asked.count(p)) prereqs.push_back(p);
    }
    if (prereqs.empty()) return "";

    std::sort(prereqs.begin(), prereqs.end(), [&graph](const std::string& a, const std::string& b) {
        const skills::Tier ta = graph.at(a).tier;
        const skills::Tier tb = graph.at(b).tier;
        if (ta != tb) return ta < tb;
        return graph.position(a) < graph.position(b);
    });
    return prereqs.front();
}

static TargetDecision planned_pick(const InterviewSession& s, const std::set<std::string>& asked) {
    if (s.planned.empty()) throw std::logic_error("interview session has no planned targets");

    // skip plan entries already reached through branching, unless everything was asked
    const size_t n = s.planned.size();
    for (size_t step = 0; step < n; ++step) {
        const size_t idx = (s.planned_cursor + step) % n;
        if (!asked.count(s.planned[idx])) {
            return TargetDecision{s.planned[idx], Branch::Planned, s.difficulty_cursor, s.planned_cursor + step + 1};
        }
    }
    const size_t idx = s.planned_cursor % n;
    return TargetDecision{s.planned[idx], Branch::Planned, s.difficulty_cursor, s.planned_cursor + 1};
}

TargetDecision next_target(const InterviewSession& session,
                           const skills::SkillGraph& graph,
                           const InterviewConfig& cfg) {
    const std::set<std::string> asked = asked_skills(session);
    const double avg = recent_average(session.records, cfg.window);

    if (avg >= 0.0 && !session.records.empty()) {
        const std::string& current = session.records.back().skill;

        if (avg >= cfg.confident_threshold) {
            std::string next = harder_than(current, asked, graph);
            if (!next.empty()) {
                const int cursor = std::min(session.difficulty_cursor + 1, cfg.max_difficulty_shift);
                return TargetDecision{next, Branch::Escalate, cursor, session.planned_cursor};
            }
        } else if (avg <= cfg.struggling_threshold) {
            std::string next = easier_than(current, asked, graph);
            if (!next.empty()) {
                const int cursor = std::max(session.difficulty_cursor - 1, -cfg.max_difficulty_shift);
                return TargetDecision{next, Branch::DeEscalate, cursor, session.planned_cursor};
            }
        }
    }

    return planned_pick(session, asked);
}

}  // namespace interview
