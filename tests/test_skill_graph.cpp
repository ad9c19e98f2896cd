#include "TestSupport.hpp"

#include "skills/Errors.hpp"
#include "skills/SkillGraph.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

using testing_support::TestSuite;
using testing_support::make_skill;
using skills::Tier;

namespace {

template <typename Fn>
bool throws_graph_error(Fn&& fn) {
    try {
        fn();
    } catch (const skills::GraphError&) {
        return true;
    }
    return false;
}

bool order_respects_prerequisites(const skills::SkillGraph& g) {
    for (const auto& id : g.topological_order()) {
        for (const auto& p : g.transitive_prerequisites(id)) {
            if (g.position(p) >= g.position(id)) return false;
        }
    }
    return true;
}

void test_backend_order(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    const auto& order = g.topological_order();

    suite.require(order.size() == 3, "backend graph has three skills");
    suite.require(order[0] == "networking-basics", "foundational prerequisite comes first");
    suite.require(order[1] == "http", "http precedes sql on the id tie-break");
    suite.require(order[2] == "sql", "sql is last");

    suite.require(g.prerequisites_of("http") == std::set<std::string>{"networking-basics"},
                  "http depends on networking-basics");
    suite.require(g.prerequisites_of("unknown").empty(), "unknown skill has no prerequisites");
    suite.require(g.dependents_of("networking-basics") == std::vector<std::string>{"http"},
                  "networking-basics unlocks http");
}

void test_targets_and_roles(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();

    auto http = g.target_mastery("backend-engineer", "http");
    suite.require(http && testing_support::near(*http, 0.7), "http target is 0.7");
    suite.require(!g.target_mastery("backend-engineer", "networking-basics"), "untargeted skill has no target");
    suite.require(!g.target_mastery("nobody", "http"), "unknown role yields no target");
    suite.require(g.has_role("backend-engineer"), "role is known");

    bool threw = false;
    std::string role;
    try {
        g.role_targets("frontend");
    } catch (const skills::UnknownRoleError& e) {
        threw = true;
        role = e.role();
    }
    suite.require(threw && role == "frontend", "role_targets of unknown role raises UnknownRoleError");
}

void test_tier_tie_break(TestSuite& suite) {
    std::vector<skills::Skill> s{
        make_skill("zeta", Tier::Foundational),
        make_skill("alpha", Tier::Advanced),
        make_skill("mid", Tier::Intermediate),
        make_skill("beta", Tier::Foundational),
    };
    const skills::SkillGraph g(std::move(s), {});
    const std::vector<std::string> expected{"beta", "zeta", "mid", "alpha"};
    suite.require(g.topological_order() == expected, "independent skills ordered by tier then id");
}

void test_transitive(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::ladder_graph();
    const std::set<std::string> expected{"algorithms", "data-structures", "programming", "http", "networking-basics"};
    suite.require(g.transitive_prerequisites("system-design") == expected,
                  "system-design pulls in its whole prerequisite closure");
    suite.require(order_respects_prerequisites(g), "ladder order respects transitive prerequisites");
}

void test_validation(TestSuite& suite) {
    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational, {"b"}), make_skill("b", Tier::Foundational, {"a"})}, {});
    }), "two-node cycle is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational, {"a"})}, {});
    }), "self loop is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational, {"ghost"})}, {});
    }), "dangling prerequisite is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational), make_skill("a", Tier::Advanced)}, {});
    }), "duplicate id is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational)}, {{"r", {{"ghost", 0.5}}}});
    }), "role targeting an unknown skill is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational)}, {{"r", {{"a", 1.5}}}});
    }), "target outside [0,1] is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational)}, {{"r", {}}});
    }), "role without targets is rejected");

    suite.require(throws_graph_error([] {
        skills::SkillGraph g({make_skill("a", Tier::Foundational, {"c"}),
                              make_skill("b", Tier::Foundational, {"a"}),
                              make_skill("c", Tier::Foundational, {"b"}),
                              make_skill("d", Tier::Foundational)}, {});
    }), "three-node cycle is rejected even with an independent skill present");
}

// random DAGs: edges only point from lower to higher creation index, ids shuffled
void test_random_dags(TestSuite& suite) {
    std::mt19937 rng(7);
    for (int round = 0; round < 50; ++round) {
        const int n = 2 + static_cast<int>(rng() % 12);
        std::vector<std::string> ids;
        for (int i = 0; i < n; ++i) ids.push_back("s" + std::to_string(rng() % 1000) + "_" + std::to_string(i));

        std::vector<skills::Skill> list;
        for (int i = 0; i < n; ++i) {
            std::vector<std::string> prereqs;
            for (int j = 0; j < i; ++j) {
                if (rng() % 3 == 0) prereqs.push_back(ids[j]);
            }
            list.push_back(make_skill(ids[i], static_cast<Tier>(rng() % 3), prereqs));
        }
        std::shuffle(list.begin(), list.end(), rng);

        const skills::SkillGraph g(list, {});
        suite.require(g.topological_order().size() == static_cast<size_t>(n), "order covers every skill");
        suite.require(order_respects_prerequisites(g), "random DAG order respects prerequisites");

        const skills::SkillGraph again(list, {});
        suite.require(again.topological_order() == g.topological_order(), "order is deterministic");
    }
}

}  // namespace

int main() {
    TestSuite suite;

    test_backend_order(suite);
    test_targets_and_roles(suite);
    test_tier_tie_break(suite);
    test_transitive(suite);
    test_validation(suite);
    test_random_dags(suite);

    if (!suite.ok) {
        std::cerr << "SkillGraph tests FAILED" << std::endl;
        return 1;
    }

    std::cout << "SkillGraph tests passed" << std::endl;
    return 0;
}
