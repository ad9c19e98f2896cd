#include "interview/InterviewReport.hpp"

#include <fstream>
#include <stdexcept>

namespace interview {

static nlohmann::json record_to_json(const QuestionRecord& r, const skills::SkillGraph& graph) {
    nlohmann::json j;
    j["skill"] = r.skill;
    const skills::Skill* s = graph.find(r.skill);
    j["skill_name"] = s ? s->name : r.skill;
    j["question"] = r.question;
    j["branch"] = branch_str(r.branch);
    j["difficulty"] = r.difficulty;
    j["answered"] = r.answered;
    if (r.answered) {
        j["response"] = r.response;
        j["score"] = r.score;
        j["confidence"] = r.confidence;
        j["level"] = skills::level_str(skills::level_for(r.score));
    }
    return j;
}

nlohmann::json InterviewReport::to_json(const skills::SkillGraph& graph) const {
    nlohmann::json j;
    j["session_id"] = session.id;
    j["learner_id"] = session.learner_id;
    j["role"] = session.role;
    j["graph_path"] = graph_path;
    j["state"] = state_str(session.state);
    j["end_reason"] = session.end_reason;
    j["n_questions"] = session.n_questions;
    j["answered"] = session.answered();
    j["average_score"] = session.average_score();
    j["created_at_ms"] = skills::to_epoch_ms(session.created_at);
    j["last_activity_ms"] = skills::to_epoch_ms(session.last_activity);
    j["planned"] = session.planned;

    nlohmann::json questions = nlohmann::json::array();
    for (const auto& r : session.records) {
        questions.push_back(record_to_json(r, graph));
    }
    j["questions"] = questions;

    nlohmann::json emitted = nlohmann::json::array();
    for (const auto& o : session.emitted) {
        emitted.push_back({
            {"skill", o.skill},
            {"strength", o.strength},
            {"source_confidence", o.source_confidence},
            {"source", skills::source_tag_str(o.source)},
            {"observed_at_ms", skills::to_epoch_ms(o.observed_at)}
        });
    }
    j["observations"] = emitted;

    return j;
}

void InterviewReport::write_to(const std::filesystem::path& out_path, const skills::SkillGraph& graph) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json(graph).dump(2) << "\n";
}

}  // namespace interview
