#include "interview/Session.hpp"
#include "skills/Errors.hpp"

#include <sstream>

namespace interview {

void InterviewConfig::validate() const {
    if (window == 0) throw skills::ValidationError("interview.window must be at least 1");
    if (!skills::in_unit_range(confident_threshold) || !skills::in_unit_range(struggling_threshold)) {
        throw skills::ValidationError("interview thresholds must be in [0,1]");
    }
    if (struggling_threshold >= confident_threshold) {
        std::ostringstream oss;
        oss << "interview.struggling_threshold (" << struggling_threshold
            << ") must be below confident_threshold (" << confident_threshold << ")";
        throw skills::ValidationError(oss.str());
    }
    if (max_difficulty_shift < 0) throw skills::ValidationError("interview.max_difficulty_shift must be >= 0");
    if (timeout.count() <= 0) throw skills::ValidationError("interview.timeout_minutes must be positive");
}

size_t InterviewSession::answered() const {
    size_t n = 0;
    for (const auto& r : records) {
        if (r.answered) ++n;
    }
    return n;
}

const QuestionRecord* InterviewSession::current() const {
    if (state != SessionState::InProgress) return nullptr;
    if (records.empty() || records.back().answered) return nullptr;
    return &records.back();
}

double InterviewSession::average_score() const {
    double sum = 0.0;
    size_t n = 0;
    for (const auto& r : records) {
        if (!r.answered) continue;
        sum += r.score;
        ++n;
    }
    return n ? sum / n : 0.0;
}

const char* state_str(SessionState s) {
    switch (s) {
        case SessionState::Created: return "created";
        case SessionState::InProgress: return "in_progress";
        case SessionState::Scoring: return "scoring";
        case SessionState::Completed: return "completed";
        case SessionState::Abandoned: return "abandoned";
        default: return "unknown";
    }
}

SessionState parse_state(const std::string& s) {
    if (s == "created") return SessionState::Created;
    if (s == "in_progress") return SessionState::InProgress;
    if (s == "scoring") return SessionState::Scoring;
    if (s == "completed") return SessionState::Completed;
    if (s == "abandoned") return SessionState::Abandoned;
    throw skills::ValidationError("unknown session state: " + s);
}

const char* branch_str(Branch b) {
    switch (b) {
        case Branch::Planned: return "planned";
        case Branch::Escalate: return "escalate";
        case Branch::DeEscalate: return "de-escalate";
        default: return "unknown";
    }
}

Branch parse_branch(const std::string& s) {
    if (s == "planned") return Branch::Planned;
    if (s == "escalate") return Branch::Escalate;
    if (s == "de-escalate") return Branch::DeEscalate;
    throw skills::ValidationError("unknown interview branch: " + s);
}

}  // namespace interview
