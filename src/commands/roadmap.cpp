#include "commands/roadmap.hpp"
#include "commands/CliSupport.hpp"

#include "skills/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static void write_roadmap_json(const fs::path& out_path,
                               const std::string& learner_id,
                               const std::string& role,
                               const progress::ProgressSnapshot& snap) {
    nlohmann::json j;
    j["learner_id"] = learner_id;
    j["role"] = role;
    j["overall_progress"] = snap.overall;

    double total_effort = 0.0;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& st : snap.units) {
        const roadmap::RoadmapUnit& u = st.unit;
        total_effort += u.effort;
        arr.push_back({
            {"id", u.id},
            {"skill", u.skill},
            {"kind", roadmap::unit_kind_str(u.kind)},
            {"part", u.part},
            {"parts", u.parts},
            {"start_mastery", u.start_mastery},
            {"target_delta", u.target_delta},
            {"effort_hours", u.effort},
            {"completion", st.completion}
        });
    }
    j["total_effort_hours"] = total_effort;
    j["units"] = arr;

    if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path());
    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());
    out << j.dump(2) << "\n";
}

int cmd_roadmap(int argc, char** argv) {
    try {
        const io::EngineConfig cfg = cli::load_config(argc, argv);
        const skills::SkillGraph graph = cli::load_graph(argc, argv);
        const std::string learner_id = cli::require_learner(argc, argv);
        io::FileProfileStore store(cli::get_arg(argc, argv, "--store", "out/profiles"));

        const roadmap::RoadmapGenerator generator(cfg.roadmap);
        std::unique_ptr<progress::Learner> learner =
            cli::open_learner(store, learner_id, cli::get_arg(argc, argv, "--role", ""), graph, cfg, generator);
        if (learner->role().empty()) {
            throw skills::ValidationError("learner " + learner_id + " has no role; pass --role <role>");
        }

        const progress::ProgressSnapshot snap = learner->progress().snapshot(learner->mastery(), skills::Clock::now());
        store.save(learner_id, learner->to_state());

        std::cout << "LEARNER: " << learner_id << "\n";
        std::cout << "ROLE: " << learner->role() << "\n";
        std::cout << "ROADMAP_UNITS: " << snap.units.size() << "\n";
        for (const auto& st : snap.units) {
            const roadmap::RoadmapUnit& u = st.unit;
            std::cout << "UNIT: " << u.position << " " << u.id << " " << roadmap::unit_kind_str(u.kind)
                      << " delta=" << u.target_delta << " effort=" << u.effort
                      << " done=" << st.completion << "\n";
        }

        const std::string out = cli::get_arg(argc, argv, "--out", "");
        if (!out.empty()) {
            write_roadmap_json(out, learner_id, learner->role(), snap);
            std::cout << "OUT_ROADMAP: " << out << "\n";
        }
        std::cout << "OUT_PROFILE: " << store.path_for(learner_id).string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
