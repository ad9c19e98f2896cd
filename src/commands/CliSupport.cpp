#include "commands/CliSupport.hpp"

#include "llm/HeuristicLLMClient.hpp"
#include "llm/MockLLMClient.hpp"
#include "skills/Errors.hpp"

#include <stdexcept>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size()) throw skills::ValidationError(key + " expects an integer, got '" + s + "'");
        return v;
    } catch (const std::logic_error&) {
        throw skills::ValidationError(key + " expects an integer, got '" + s + "'");
    }
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t used = 0;
        const double v = std::stod(s, &used);
        if (used != s.size()) throw skills::ValidationError(key + " expects a number, got '" + s + "'");
        return v;
    } catch (const std::logic_error&) {
        throw skills::ValidationError(key + " expects a number, got '" + s + "'");
    }
}

io::EngineConfig load_config(int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--config", "");
    if (path.empty()) {
        io::EngineConfig cfg;
        cfg.validate();
        return cfg;
    }
    return io::loadEngineConfig(path);
}

skills::SkillGraph load_graph(int argc, char** argv) {
    return io::loadSkillGraph(get_arg(argc, argv, "--graph", "data/skill_graph.json"));
}

std::string require_learner(int argc, char** argv) {
    const std::string id = get_arg(argc, argv, "--learner", "");
    if (id.empty()) throw skills::ValidationError("--learner <id> is required");
    return id;
}

std::unique_ptr<llm::LLMClient> make_capability(int argc, char** argv, const skills::SkillGraph& graph) {
    const std::string mock_dir = get_arg(argc, argv, "--llm_mock", "");
    if (!mock_dir.empty()) return std::make_unique<llm::MockLLMClient>(mock_dir);

    llm::HeuristicConfig hcfg;
    hcfg.judge_confidence = get_arg_double(argc, argv, "--judge_confidence", hcfg.judge_confidence);
    return std::make_unique<llm::HeuristicLLMClient>(graph, hcfg);
}

std::unique_ptr<progress::Learner> open_learner(io::ProfileStore& store,
                                                const std::string& learner_id,
                                                const std::string& role,
                                                const skills::SkillGraph& graph,
                                                const io::EngineConfig& cfg,
                                                const roadmap::RoadmapGenerator& generator) {
    progress::LearnerState st;
    st.learner_id = learner_id;
    if (auto stored = store.load(learner_id)) st = std::move(*stored);

    if (!role.empty() && role != st.role) {
        if (!graph.has_role(role)) throw skills::UnknownRoleError(role);
        st.role = role;
        st.roadmap.clear();
    }

    return std::make_unique<progress::Learner>(st, graph, cfg.mastery, generator);
}

}  // namespace cli
