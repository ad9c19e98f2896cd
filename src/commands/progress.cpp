#include "commands/progress.hpp"
#include "commands/CliSupport.hpp"

#include "skills/Errors.hpp"

#include <iostream>
#include <string>

int cmd_progress(int argc, char** argv) {
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

        const skills::TimePoint now = skills::Clock::now();

        const std::string unit = cli::get_arg(argc, argv, "--unit", "");
        if (!unit.empty()) {
            const double completion = cli::get_arg_double(argc, argv, "--completion", 1.0);
            const roadmap::RoadmapUnit done = learner->record_unit_progress(
                unit, completion, now, cfg.extractor.confidence_for(skills::SourceTag::Manual));
            std::cout << "RECORDED: " << unit << " " << completion << " skill=" << done.skill << "\n";
        }

        // explicit self-attestation feeds the mastery model like any other evidence
        const std::string attest = cli::get_arg(argc, argv, "--attest", "");
        if (!attest.empty()) {
            const double strength = cli::get_arg_double(argc, argv, "--strength", 1.0);
            learner->mastery().merge(skills::make_observation(
                attest, strength, cfg.extractor.confidence_for(skills::SourceTag::Manual), skills::SourceTag::Manual, now));
            std::cout << "ATTESTED: " << attest << " " << strength << "\n";
        }

        const progress::ProgressSnapshot snap = learner->progress().snapshot(learner->mastery(), now);
        store.save(learner_id, learner->to_state());

        std::cout << "LEARNER: " << learner_id << "\n";
        std::cout << "ROLE: " << learner->role() << "\n";
        for (const auto& st : snap.units) {
            std::cout << "UNIT: " << st.unit.id << " " << st.completion << (st.done() ? " done" : "") << "\n";
        }
        std::cout << "COMPLETED: " << snap.completed << "/" << snap.units.size() << "\n";
        std::cout << "PROGRESS: " << snap.overall << "\n";

        for (const auto& [skill, est] : learner->mastery().snapshot(now)) {
            std::cout << "MASTERY: " << skill << " " << est.mastery << " confidence=" << est.confidence
                      << " level=" << skills::level_str(skills::level_for(est.mastery)) << "\n";
        }
        std::cout << "OUT_PROFILE: " << store.path_for(learner_id).string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
