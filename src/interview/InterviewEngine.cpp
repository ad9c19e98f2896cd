#include "interview/InterviewEngine.hpp"
#include "interview/TargetSelector.hpp"
#include "skills/Errors.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace interview {

static void require_state(const InterviewSession& s, SessionState expected, const char* op) {
    if (s.state != expected) {
        std::ostringstream oss;
        oss << "interview " << op << ": session " << s.id << " is " << state_str(s.state)
            << ", expected " << state_str(expected);
        throw std::logic_error(oss.str());
    }
}

static void require_learner(const InterviewSession& s, const skills::MasteryModel& model) {
    if (s.learner_id != model.learner_id()) {
        throw skills::ValidationError("session " + s.id + " belongs to learner " + s.learner_id +
                                      ", not " + model.learner_id());
    }
}

InterviewEngine::InterviewEngine(const skills::SkillGraph& graph,
                                 llm::LLMClient& judge,
                                 InterviewConfig cfg,
                                 QuestionBank bank)
    : m_graph(graph), m_judge(judge), m_cfg(cfg), m_bank(std::move(bank)) {
    m_cfg.validate();
}

InterviewSession InterviewEngine::create_session(const std::string& learner_id,
                                                 skills::TimePoint now,
                                                 const std::string& role) const {
    if (learner_id.empty()) throw skills::ValidationError("learner id must not be empty");
    if (!role.empty() && !m_graph.has_role(role)) throw skills::UnknownRoleError(role);

    std::uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        seq = ++m_seq;
    }

    InterviewSession s;
    s.id = learner_id + "-" + std::to_string(skills::to_epoch_ms(now)) + "-" + std::to_string(seq);
    s.learner_id = learner_id;
    s.role = role;
    s.created_at = now;
    s.last_activity = now;
    return s;
}

bool InterviewEngine::idle_expired(skills::TimePoint last_activity, skills::TimePoint now) const {
    return now - last_activity > m_cfg.timeout;
}

void InterviewEngine::start(InterviewSession& session,
                            const skills::MasteryModel& model,
                            size_t n_questions,
                            skills::TimePoint now) {
    require_state(session, SessionState::Created, "start");
    require_learner(session, model);
    if (n_questions == 0) throw skills::ValidationError("interview needs at least one question");

    std::vector<std::string> planned = session.role.empty()
        ? model.weakest_uncertain(n_questions, now)
        : model.weakest_uncertain(n_questions, now, session.role);
    if (planned.empty()) {
        throw skills::ValidationError("no skills available to interview learner " + session.learner_id);
    }

    {
        std::lock_guard<std::mutex> lock(m_mu);
        auto it = m_active.find(session.learner_id);
        if (it != m_active.end()) {
            if (!idle_expired(it->second.last_activity, now)) {
                throw skills::SessionConflictError(session.learner_id, it->second.session_id);
            }
            std::cerr << "InterviewEngine: evicted idle session " << it->second.session_id
                      << " of learner " << session.learner_id << "\n";
            m_active.erase(it);
        }
        m_active[session.learner_id] = ActiveEntry{session.id, now};
    }

    session.planned = std::move(planned);
    session.planned_cursor = 0;
    session.difficulty_cursor = 0;
    session.n_questions = n_questions;
    session.records.clear();
    session.last_activity = now;
    session.state = SessionState::InProgress;

    open_next_question(session);
}

void InterviewEngine::open_next_question(InterviewSession& session) {
    const TargetDecision d = next_target(session, m_graph, m_cfg);

    std::vector<std::string> asked;
    asked.reserve(session.records.size());
    for (const auto& r : session.records) asked.push_back(r.question);

    QuestionRecord q;
    q.skill = d.skill;
    q.branch = d.branch;
    q.difficulty = d.difficulty_cursor;
    q.question = m_bank.pick(m_graph.at(d.skill), d.difficulty_cursor, asked);

    session.planned_cursor = d.planned_cursor;
    session.difficulty_cursor = d.difficulty_cursor;
    session.records.push_back(std::move(q));
}

SessionState InterviewEngine::submit_response(InterviewSession& session,
                                              const std::string& response,
                                              skills::MasteryModel& model,
                                              skills::TimePoint now) {
    require_state(session, SessionState::InProgress, "submit_response");
    require_learner(session, model);

    if (expire_if_idle(session, now)) return session.state;

    const QuestionRecord* open = session.current();
    if (!open) throw std::logic_error("interview submit_response: session " + session.id + " has no open question");

    const llm::Judgment j = m_judge.judge(response, open->skill);
    if (!skills::in_unit_range(j.score) || !skills::in_unit_range(j.confidence)) {
        std::ostringstream oss;
        oss << "judgment out of range for skill " << open->skill << ": score=" << j.score
            << " confidence=" << j.confidence;
        throw skills::ValidationError(oss.str());
    }

    QuestionRecord& rec = session.records.back();
    rec.response = response;
    rec.score = j.score;
    rec.confidence = j.confidence;
    rec.answered = true;
    session.last_activity = now;
    touch(session);

    if (session.answered() >= session.n_questions) {
        session.state = SessionState::Scoring;
        complete(session, model);
        return session.state;
    }

    open_next_question(session);
    return session.state;
}

void InterviewEngine::complete(InterviewSession& session, skills::MasteryModel& model) {
    require_state(session, SessionState::Scoring, "complete");
    require_learner(session, model);

    std::vector<skills::Observation> obs;
    obs.reserve(session.records.size());
    for (const auto& r : session.records) {
        if (!r.answered) continue;
        obs.push_back(skills::make_observation(r.skill, r.score, r.confidence,
                                               skills::SourceTag::Interview, session.last_activity));
    }

    model.merge_all(obs);

    session.emitted = std::move(obs);
    session.state = SessionState::Completed;
    session.end_reason = "completed";
    release(session);
}

void InterviewEngine::cancel(InterviewSession& session, skills::TimePoint now) {
    if (session.state != SessionState::Created && session.state != SessionState::InProgress) {
        throw std::logic_error("interview cancel: session " + session.id + " is " + state_str(session.state));
    }
    abandon(session, now, "cancelled");
}

bool InterviewEngine::expire_if_idle(InterviewSession& session, skills::TimePoint now) {
    if (session.state != SessionState::InProgress) return false;
    if (!idle_expired(session.last_activity, now)) return false;
    abandon(session, now, "timeout");
    return true;
}

void InterviewEngine::abandon(InterviewSession& session, skills::TimePoint now, const char* reason) {
    // partial answers never reach the mastery model
    session.emitted.clear();
    session.state = SessionState::Abandoned;
    session.end_reason = reason;
    session.last_activity = now;
    release(session);
}

std::optional<std::string> InterviewEngine::active_session(const std::string& learner_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_active.find(learner_id);
    if (it == m_active.end()) return std::nullopt;
    return it->second.session_id;
}

void InterviewEngine::release(const InterviewSession& session) {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_active.find(session.learner_id);
    if (it != m_active.end() && it->second.session_id == session.id) m_active.erase(it);
}

void InterviewEngine::touch(const InterviewSession& session) {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_active.find(session.learner_id);
    if (it != m_active.end() && it->second.session_id == session.id) {
        it->second.last_activity = session.last_activity;
    }
}

}  // namespace interview
