#include "commands/extract.hpp"
#include "commands/graph.hpp"
#include "commands/interview.hpp"
#include "commands/progress.hpp"
#include "commands/roadmap.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  skillpath graph [args]\n"
        << "  skillpath extract [args]\n"
        << "  skillpath roadmap [args]\n"
        << "  skillpath interview [args]\n"
        << "  skillpath progress [args]\n"
        << "  skillpath help\n"
        << "\n"
        << "common:\n"
        << "  --graph <path>               default: data/skill_graph.json\n"
        << "  --config <path>              optional engine config (defaults otherwise)\n"
        << "  --store <dir>                default: out/profiles\n"
        << "  --learner <id>               required except for graph\n"
        << "  --role <str>                 target role (stored with the learner)\n";
    return 1;
}

static int print_extract_help() {
    std::cerr
        << "usage:\n"
        << "  skillpath extract --learner <id> (--text <file> | --repos <file>) [options]\n"
        << "\n"
        << "evidence:\n"
        << "  --text <file>                free text (resume, notes)\n"
        << "  --source <tag>               resume|manual|interview, default: resume\n"
        << "  --repos <file>               repository activity JSON (source: repository)\n"
        << "\n"
        << "llm:\n"
        << "  --llm_mock <dir>             replay fixtures from dir (default: offline heuristics)\n"
        << "\n"
        << "semantic matching:\n"
        << "  --semantic                   embedding fallback for unmatched mentions\n"
        << "  --emb_model <path>           default: models/emb/model.onnx\n"
        << "  --emb_vocab <path>           default: models/emb/vocab.txt\n"
        << "  --semantic_threshold <f>     default: 0.66\n"
        << "  --semantic_cache <path>      default: (none)\n";
    return 0;
}

static int print_roadmap_help() {
    std::cerr
        << "usage:\n"
        << "  skillpath roadmap --learner <id> [--role <str>] [--out <path>]\n";
    return 0;
}

static int print_interview_help() {
    std::cerr
        << "usage:\n"
        << "  skillpath interview --learner <id> --responses <file> [options]\n"
        << "\n"
        << "options:\n"
        << "  --n <n>                      questions, default: 3\n"
        << "  --role <str>                 restrict targets to the role's skills\n"
        << "  --questions <path>           question bank JSON\n"
        << "  --llm_mock <dir>             replay judgments from dir\n"
        << "  --judge_confidence <f>       heuristic judge confidence, default: 0.4\n"
        << "  --out <path>                 default: out/interview_<session>.json\n";
    return 0;
}

static int print_progress_help() {
    std::cerr
        << "usage:\n"
        << "  skillpath progress --learner <id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --unit <id> [--completion f] record progress on a roadmap unit (default 1.0)\n"
        << "  --attest <skill> [--strength f] manual attestation of a skill (default 1.0)\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "extract"   && wants_help) return print_extract_help();
    if (cmd == "roadmap"   && wants_help) return print_roadmap_help();
    if (cmd == "interview" && wants_help) return print_interview_help();
    if (cmd == "progress"  && wants_help) return print_progress_help();

    if (cmd == "graph")     return cmd_graph(argc - 1, argv + 1);
    if (cmd == "extract")   return cmd_extract(argc - 1, argv + 1);
    if (cmd == "roadmap")   return cmd_roadmap(argc - 1, argv + 1);
    if (cmd == "interview") return cmd_interview(argc - 1, argv + 1);
    if (cmd == "progress")  return cmd_progress(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
