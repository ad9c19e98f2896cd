#pragma once

#include "interview/QuestionBank.hpp"
#include "interview/Session.hpp"
#include "llm/LLMClient.hpp"
#include "skills/MasteryModel.hpp"
#include "skills/SkillGraph.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace interview {

// Drives mock interview sessions:
//   created -> in_progress -> scoring -> completed
//   created | in_progress -> abandoned (cancel or idle timeout)
//
// Sessions are plain values owned by the caller. The engine keeps one registry entry
// per learner while a session is running so a second start() fails instead of
// silently replacing the first. Invalid transitions throw std::logic_error.
class InterviewEngine {
public:
    InterviewEngine(const skills::SkillGraph& graph,
                    llm::LLMClient& judge,
                    InterviewConfig cfg = {},
                    QuestionBank bank = {});

    InterviewEngine(const InterviewEngine&) = delete;
    InterviewEngine& operator=(const InterviewEngine&) = delete;

    InterviewSession create_session(const std::string& learner_id,
                                    skills::TimePoint now,
                                    const std::string& role = "") const;

    // Plans targets from the model's weakest/uncertain skills and opens the first question.
    // throws SessionConflictError, UnknownRoleError, ValidationError
    void start(InterviewSession& session,
               const skills::MasteryModel& model,
               size_t n_questions,
               skills::TimePoint now);

    // Judges the open question, then either opens the next one or scores the session.
    // Returns the resulting state. A judgment failure (e.g. CapabilityTimeoutError)
    // propagates with the session unchanged.
    SessionState submit_response(InterviewSession& session,
                                 const std::string& response,
                                 skills::MasteryModel& model,
                                 skills::TimePoint now);

    // scoring -> completed: one interview observation per answered question, merged
    // as a batch. Safe to call again if a previous attempt threw.
    void complete(InterviewSession& session, skills::MasteryModel& model);

    void cancel(InterviewSession& session, skills::TimePoint now);

    // in_progress past the idle timeout -> abandoned. Returns true if it expired.
    bool expire_if_idle(InterviewSession& session, skills::TimePoint now);

    std::optional<std::string> active_session(const std::string& learner_id) const;

    const InterviewConfig& config() const { return m_cfg; }
    const QuestionBank& questions() const { return m_bank; }

private:
    struct ActiveEntry {
        std::string session_id;
        skills::TimePoint last_activity{};
    };

    const skills::SkillGraph& m_graph;
    llm::LLMClient& m_judge;
    InterviewConfig m_cfg;
    QuestionBank m_bank;

    mutable std::mutex m_mu;
    std::map<std::string, ActiveEntry> m_active;  // learner id -> running session
    mutable std::uint64_t m_seq = 0;

    void open_next_question(InterviewSession& session);
    void release(const InterviewSession& session);
    void touch(const InterviewSession& session);
    void abandon(InterviewSession& session, skills::TimePoint now, const char* reason);
    bool idle_expired(skills::TimePoint last_activity, skills::TimePoint now) const;
};

}  // namespace interview
