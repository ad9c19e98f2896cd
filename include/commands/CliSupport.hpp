#pragma once

#include "io/JsonIO.hpp"
#include "io/ProfileStore.hpp"
#include "llm/LLMClient.hpp"
#include "progress/Learner.hpp"
#include "roadmap/RoadmapGenerator.hpp"
#include "skills/SkillGraph.hpp"

#include <memory>
#include <string>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// throw skills::ValidationError on a value that is not a number
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// --config <path>; defaults when absent
io::EngineConfig load_config(int argc, char** argv);

// --graph <path>, default data/skill_graph.json
skills::SkillGraph load_graph(int argc, char** argv);

// --learner <id>, required
std::string require_learner(int argc, char** argv);

// --llm_mock <dir> replays fixtures; otherwise the offline heuristic client
std::unique_ptr<llm::LLMClient> make_capability(int argc, char** argv, const skills::SkillGraph& graph);

// Stored record of the learner, or a fresh one. A non-empty role replaces the stored
// role (and drops the roadmap generated for the old one).
std::unique_ptr<progress::Learner> open_learner(io::ProfileStore& store,
                                                const std::string& learner_id,
                                                const std::string& role,
                                                const skills::SkillGraph& graph,
                                                const io::EngineConfig& cfg,
                                                const roadmap::RoadmapGenerator& generator);

}  // namespace cli
