#include "commands/graph.hpp"
#include "commands/CliSupport.hpp"

#include <iostream>
#include <string>

int cmd_graph(int argc, char** argv) {
    try {
        const skills::SkillGraph graph = cli::load_graph(argc, argv);
        const std::string role = cli::get_arg(argc, argv, "--role", "");

        std::cout << "SKILLS: " << graph.size() << "\n";
        std::cout << "ROLES: " << graph.roles().size() << "\n";

        for (const auto& id : graph.topological_order()) {
            const skills::Skill& s = graph.at(id);
            std::cout << "SKILL: " << s.id << " tier=" << skills::tier_str(s.tier) << " prereqs=";
            bool first = true;
            for (const auto& p : graph.prerequisites_of(id)) {
                std::cout << (first ? "" : ",") << p;
                first = false;
            }
            if (first) std::cout << "-";
            std::cout << "\n";
        }

        if (!role.empty()) {
            for (const auto& [skill, target] : graph.role_targets(role)) {
                std::cout << "TARGET: " << role << " " << skill << " " << target << "\n";
            }
        } else {
            for (const auto& r : graph.roles()) std::cout << "ROLE: " << r << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
