#pragma once

#include "skills/Types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace interview {

enum class SessionState {
    Created,
    InProgress,
    Scoring,
    Completed,
    Abandoned
};

// why a question targets its skill
enum class Branch {
    Planned,     // next of the weakest/uncertain plan
    Escalate,    // recent answers confident: harder skill
    DeEscalate   // recent answers struggling: foundational prerequisite
};

struct InterviewConfig {
    size_t window = 2;                  // k: answers in the running average
    double confident_threshold = 0.75;  // average >= this escalates
    double struggling_threshold = 0.4;  // average <= this de-escalates
    int max_difficulty_shift = 2;       // cursor stays within [-shift, +shift]
    std::chrono::minutes timeout{30};   // idle time before an in-progress session is abandoned

    void validate() const;  // throws skills::ValidationError
};

struct QuestionRecord {
    std::string skill;
    std::string question;
    Branch branch = Branch::Planned;
    int difficulty = 0;  // difficulty cursor when the question was asked

    bool answered = false;
    std::string response;
    double score = 0.0;       // judgment, 0..1
    double confidence = 0.0;  // judgment confidence, 0..1
};

struct InterviewSession {
    std::string id;
    std::string learner_id;
    std::string role;  // optional: restricts the initial plan to this role's skills

    SessionState state = SessionState::Created;
    size_t n_questions = 0;

    std::vector<std::string> planned;  // weakest/uncertain skills at start
    size_t planned_cursor = 0;
    int difficulty_cursor = 0;

    // answered questions, followed by the open one while in progress
    std::vector<QuestionRecord> records;

    // observations handed to the mastery model; empty unless completed
    std::vector<skills::Observation> emitted;

    skills::TimePoint created_at{};
    skills::TimePoint last_activity{};
    std::string end_reason;  // "completed" | "cancelled" | "timeout"

    size_t answered() const;
    const QuestionRecord* current() const;  // open question, nullptr if none
    double average_score() const;           // over answered questions, 0 if none
};

const char* state_str(SessionState s);
SessionState parse_state(const std::string& s);  // throws skills::ValidationError
const char* branch_str(Branch b);
Branch parse_branch(const std::string& s);       // throws skills::ValidationError

}  // namespace interview
