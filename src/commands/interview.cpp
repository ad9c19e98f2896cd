#include "commands/interview.hpp"
#include "commands/CliSupport.hpp"

#include "interview/InterviewEngine.hpp"
#include "interview/InterviewReport.hpp"
#include "llm/RetryingLLMClient.hpp"
#include "skills/Errors.hpp"
#include "skills/TextUtil.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// one answer per non-empty line
static std::vector<std::string> read_responses(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open responses file: " + path);

    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        line = textutil::trim(line);
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

int cmd_interview(int argc, char** argv) {
    try {
        const io::EngineConfig cfg = cli::load_config(argc, argv);
        const skills::SkillGraph graph = cli::load_graph(argc, argv);
        const std::string learner_id = cli::require_learner(argc, argv);
        io::FileProfileStore store(cli::get_arg(argc, argv, "--store", "out/profiles"));

        const std::string responses_path = cli::get_arg(argc, argv, "--responses", "");
        if (responses_path.empty()) throw skills::ValidationError("--responses <file> is required");
        const std::vector<std::string> responses = read_responses(responses_path);

        const int n = cli::get_arg_int(argc, argv, "--n", 3);
        if (n <= 0) throw skills::ValidationError("--n must be positive");

        const std::string role = cli::get_arg(argc, argv, "--role", "");

        interview::QuestionBank bank;
        const std::string questions_path = cli::get_arg(argc, argv, "--questions", "");
        if (!questions_path.empty()) bank = io::loadQuestionBank(questions_path);

        std::unique_ptr<llm::LLMClient> base = cli::make_capability(argc, argv, graph);
        llm::RetryingLLMClient client(*base, cfg.retry);

        const roadmap::RoadmapGenerator generator(cfg.roadmap);
        std::unique_ptr<progress::Learner> learner = cli::open_learner(store, learner_id, role, graph, cfg, generator);

        interview::InterviewEngine engine(graph, client, cfg.interview, std::move(bank));
        interview::InterviewSession session = engine.create_session(learner_id, skills::Clock::now(), role);
        engine.start(session, learner->mastery(), static_cast<size_t>(n), skills::Clock::now());

        size_t next = 0;
        while (session.state == interview::SessionState::InProgress) {
            const interview::QuestionRecord* q = session.current();
            std::cout << "QUESTION: [" << q->skill << "] " << q->question << "\n";

            if (next >= responses.size()) {
                std::cerr << "interview: ran out of responses after " << next << " answers\n";
                engine.cancel(session, skills::Clock::now());
                break;
            }
            const interview::SessionState st =
                engine.submit_response(session, responses[next++], learner->mastery(), skills::Clock::now());
            if (st == interview::SessionState::Abandoned) {
                std::cerr << "interview: session timed out\n";
                break;
            }

            const interview::QuestionRecord& answered = session.records[session.answered() - 1];
            std::cout << "SCORE: " << answered.skill << " " << answered.score
                      << " (" << interview::branch_str(answered.branch) << ")\n";
        }

        const double completion = session.state == interview::SessionState::Completed
            ? 1.0
            : static_cast<double>(session.answered()) / static_cast<double>(session.n_questions);
        learner->progress().record_completion(
            progress::make_event(session.id, progress::SubjectKind::Session, completion, session.last_activity));
        store.save(learner_id, learner->to_state());

        interview::InterviewReport report;
        report.session = session;
        report.graph_path = cli::get_arg(argc, argv, "--graph", "data/skill_graph.json");

        const fs::path out_path = cli::get_arg(argc, argv, "--out", "out/interview_" + session.id + ".json");
        report.write_to(out_path, graph);

        std::cout << "SESSION: " << session.id << "\n";
        std::cout << "STATE: " << interview::state_str(session.state) << "\n";
        std::cout << "ANSWERED: " << session.answered() << "/" << session.n_questions << "\n";
        std::cout << "AVERAGE: " << session.average_score() << "\n";
        std::cout << "OBSERVATIONS: " << session.emitted.size() << "\n";
        std::cout << "OUT_REPORT: " << out_path.string() << "\n";
        std::cout << "OUT_PROFILE: " << store.path_for(learner_id).string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
