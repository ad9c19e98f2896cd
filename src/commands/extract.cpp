#include "commands/extract.hpp"
#include "commands/CliSupport.hpp"

#include "emb/EmbeddingSkillMatcher.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "llm/RetryingLLMClient.hpp"
#include "skills/Errors.hpp"
#include "skills/SkillExtractor.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

static std::string read_text_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open evidence file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int cmd_extract(int argc, char** argv) {
    try {
        const io::EngineConfig cfg = cli::load_config(argc, argv);
        const skills::SkillGraph graph = cli::load_graph(argc, argv);
        const std::string learner_id = cli::require_learner(argc, argv);
        io::FileProfileStore store(cli::get_arg(argc, argv, "--store", "out/profiles"));

        const std::string text_path = cli::get_arg(argc, argv, "--text", "");
        const std::string repos_path = cli::get_arg(argc, argv, "--repos", "");
        if (text_path.empty() == repos_path.empty()) {
            throw skills::ValidationError("extract needs exactly one of --text <file> or --repos <file>");
        }

        std::unique_ptr<llm::LLMClient> base = cli::make_capability(argc, argv, graph);
        llm::RetryingLLMClient client(*base, cfg.retry);

        // optional embedding fallback for mentions with no exact or alias match
        const bool semantic = cli::has_flag(argc, argv, "--semantic");
        std::unique_ptr<MiniLmEmbedder> embedder;
        std::unique_ptr<skills::SkillMatcher> matcher;
        if (semantic) {
            embedder = std::make_unique<MiniLmEmbedder>(
                cli::get_arg(argc, argv, "--emb_model", "models/emb/model.onnx"),
                cli::get_arg(argc, argv, "--emb_vocab", "models/emb/vocab.txt"));

            SkillMatcherConfig mcfg;
            mcfg.threshold = static_cast<float>(cli::get_arg_double(argc, argv, "--semantic_threshold", mcfg.threshold));
            mcfg.cache_path = cli::get_arg(argc, argv, "--semantic_cache", "");
            matcher = build_embedding_skill_matcher(graph, *embedder, mcfg);
        }

        const skills::SkillExtractor extractor(graph, client, cfg.extractor, matcher.get());
        const roadmap::RoadmapGenerator generator(cfg.roadmap);
        std::unique_ptr<progress::Learner> learner =
            cli::open_learner(store, learner_id, cli::get_arg(argc, argv, "--role", ""), graph, cfg, generator);

        const skills::TimePoint now = skills::Clock::now();
        std::vector<skills::Observation> obs;
        skills::SourceTag source = skills::SourceTag::Repository;

        if (!repos_path.empty()) {
            obs = extractor.extract_repository(io::loadRepositoryActivity(repos_path), now);
        } else {
            source = skills::parse_source_tag(cli::get_arg(argc, argv, "--source", "resume"));
            obs = extractor.extract(read_text_file(text_path), source, now);
        }

        learner->mastery().merge_all(obs);
        store.save(learner_id, learner->to_state());

        std::cout << "LEARNER: " << learner_id << "\n";
        std::cout << "SOURCE: " << skills::source_tag_str(source) << "\n";
        std::cout << "SEMANTIC: " << (semantic ? "on" : "off") << "\n";
        std::cout << "OBSERVATIONS: " << obs.size() << "\n";
        for (const auto& o : obs) {
            const auto est = learner->mastery().estimate(o.skill, now);
            std::cout << "OBS: " << o.skill << " strength=" << o.strength
                      << " confidence=" << o.source_confidence;
            if (est) std::cout << " -> mastery=" << est->mastery << " (" << skills::level_str(skills::level_for(est->mastery)) << ")";
            std::cout << "\n";
        }
        std::cout << "OUT_PROFILE: " << store.path_for(learner_id).string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
