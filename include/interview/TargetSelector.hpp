#pragma once

#include "interview/Session.hpp"
#include "skills/SkillGraph.hpp"

#include <string>
#include <vector>

namespace interview {

struct TargetDecision {
    std::string skill;
    Branch branch = Branch::Planned;
    int difficulty_cursor = 0;
    size_t planned_cursor = 0;  // cursor after this pick
};

// Mean score of the last `window` answered questions; -1 when fewer exist.
double recent_average(const std::vector<QuestionRecord>& records, size_t window);

// Pure: chooses the next question target from the answered history.
//   fewer than `window` answers -> next planned skill
//   average >= confident        -> unasked dependent of the current skill, else an
//                                  unasked skill of a higher tier (topological order)
//   average <= struggling       -> unasked prerequisite of the current skill,
//                                  lowest tier first
// Falls back to the plan when no branch candidate is left; the plan cycles once exhausted.
TargetDecision next_target(const InterviewSession& session,
                           const skills::SkillGraph& graph,
                           const InterviewConfig& cfg);

}  // namespace interview
