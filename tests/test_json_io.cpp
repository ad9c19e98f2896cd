#include "TestSupport.hpp"

#include "io/JsonIO.hpp"
#include "io/ProfileStore.hpp"
#include "skills/Errors.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

using testing_support::TestSuite;
using testing_support::near;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

const skills::TimePoint kNow = skills::from_epoch_ms(1700000000000LL);

json graph_doc() {
    return json::parse(R"({
        "skills": [
            {"id": "networking-basics", "name": "Networking Basics", "aliases": ["tcp/ip"]},
            {"id": "http", "tier": "intermediate", "prerequisites": ["networking-basics"], "aliases": ["rest"]},
            {"id": "sql", "tier": "intermediate"}
        ],
        "roles": {
            "backend-engineer": {"http": 0.7, "sql": 0.6}
        }
    })");
}

template <typename Error, typename Fn>
std::string error_of(Fn&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.what();
    }
    return "";
}

void test_parse_skill_graph(TestSuite& suite) {
    const skills::SkillGraph g = io::parseSkillGraph(graph_doc());
    suite.require(g.size() == 3, "all skills are loaded");
    suite.require(g.at("networking-basics").name == "Networking Basics", "explicit name is kept");
    suite.require(g.at("sql").name == "sql", "name defaults to id");
    suite.require(g.at("networking-basics").tier == skills::Tier::Foundational, "tier defaults to foundational");
    suite.require(g.prerequisites_of("http").count("networking-basics") == 1, "prerequisites are loaded");
    suite.require(g.has_role("backend-engineer") && near(*g.target_mastery("backend-engineer", "sql"), 0.6),
                  "role targets are loaded");

    json missing_id = graph_doc();
    missing_id["skills"][1].erase("id");
    suite.require(error_of<skills::GraphError>([&] { io::parseSkillGraph(missing_id); }) ==
                      "root.skills[1] missing required field: id",
                  "missing field is reported with its path");

    json bad_tier = graph_doc();
    bad_tier["skills"][2]["tier"] = "expert";
    suite.require(error_of<skills::GraphError>([&] { io::parseSkillGraph(bad_tier); }).find("root.skills[2].tier") == 0,
                  "unknown tier is a graph error");

    json cyclic = graph_doc();
    cyclic["skills"][0]["prerequisites"] = json::array({"http"});
    suite.require(!error_of<skills::GraphError>([&] { io::parseSkillGraph(cyclic); }).empty(), "cycle is rejected");

    json bad_target = graph_doc();
    bad_target["roles"]["backend-engineer"]["kubernetes"] = 0.5;
    suite.require(!error_of<skills::GraphError>([&] { io::parseSkillGraph(bad_target); }).empty(),
                  "target on an unknown skill is rejected");

    suite.require(!error_of<skills::GraphError>([] { io::loadSkillGraph("/nonexistent/graph.json"); }).empty(),
                  "missing graph file is a graph error");
}

void test_parse_engine_config(TestSuite& suite) {
    const io::EngineConfig defaults = io::parseEngineConfig(json::object());
    suite.require(near(defaults.mastery.half_life_days, skills::MasteryConfig{}.half_life_days), "empty document keeps defaults");
    suite.require(defaults.retry.max_attempts == llm::RetryConfig{}.max_attempts, "retry defaults kept");

    const io::EngineConfig cfg = io::parseEngineConfig(json::parse(R"({
        "mastery": {"half_life_days": 30},
        "roadmap": {"max_unit_delta": 0.5, "tier_multipliers": [1.0, 2.0, 3.0]},
        "interview": {"window": 3, "timeout_minutes": 10},
        "retry": {"max_attempts": 5, "initial_backoff_ms": 50}
    })"));
    suite.require(near(cfg.mastery.half_life_days, 30.0), "mastery override");
    suite.require(near(cfg.roadmap.max_unit_delta, 0.5) && near(cfg.roadmap.tier_multipliers[2], 3.0), "roadmap override");
    suite.require(cfg.interview.window == 3 && cfg.interview.timeout == std::chrono::minutes(10), "interview override");
    suite.require(cfg.retry.max_attempts == 5 && cfg.retry.initial_backoff.count() == 50, "retry override");

    suite.require(!error_of<skills::ValidationError>([] {
                      io::parseEngineConfig(json::parse(R"({"interview": {"window": 0}})"));
                  }).empty(),
                  "zero window is rejected");
    suite.require(error_of<skills::ValidationError>([] {
                      io::parseEngineConfig(json::parse(R"({"mastery": {"half_life_days": "long"}})"));
                  }) == "root.mastery.half_life_days must be a number",
                  "wrong type is reported with its path");
    suite.require(!error_of<skills::ValidationError>([] {
                      io::parseEngineConfig(json::parse(R"({"interview": {"confident_threshold": 0.3}})"));
                  }).empty(),
                  "thresholds out of order are rejected");
    suite.require(!error_of<skills::ValidationError>([] {
                      io::parseEngineConfig(json::parse(R"({"roadmap": {"tier_multipliers": [1.0]}})"));
                  }).empty(),
                  "tier multipliers need one entry per tier");
}

void test_parse_inputs(TestSuite& suite) {
    const skills::RepositoryActivity activity = io::parseRepositoryActivity(json::parse(R"({
        "account": "ada",
        "repositories": [
            {"name": "ledger", "language": "SQL", "topics": ["database"], "description": "ledger"},
            {"name": "notes"}
        ]
    })"));
    suite.require(activity.account == "ada" && activity.repositories.size() == 2, "repositories are loaded");
    suite.require(activity.repositories[1].language.empty() && activity.repositories[1].topics.empty(),
                  "repository fields are optional");
    suite.require(!error_of<skills::ValidationError>([] {
                      io::parseRepositoryActivity(json::parse(R"({"repositories": [{"language": "Go"}]})"));
                  }).empty(),
                  "repository without a name is rejected");

    const interview::QuestionBank bank = io::parseQuestionBank(json::parse(R"({
        "fallback": ["Tell me about {skill}."],
        "questions": {
            "http": [
                {"text": "What is a status code?", "level": "foundational"},
                {"text": "Design a caching layer for an HTTP API.", "level": "intermediate"},
                "Explain idempotent methods."
            ]
        }
    })"));
    const skills::SkillGraph g = testing_support::backend_graph();
    suite.require(bank.size() == 3 && bank.has_questions("http") && !bank.has_questions("sql"), "questions are loaded");
    suite.require(bank.pick(g.at("http"), 0, {}) == "Design a caching layer for an HTTP API.",
                  "question at the skill tier is picked");
    suite.require(bank.pick(g.at("sql"), 0, {}) == "Tell me about sql.", "fallback template names the skill");
    suite.require(!error_of<skills::ValidationError>([] {
                      io::parseQuestionBank(json::parse(R"({"questions": {"http": [{"text": "x", "level": "guru"}]}})"));
                  }).empty(),
                  "unknown question level is rejected");
}

progress::LearnerState sample_state() {
    progress::LearnerState st;
    st.learner_id = "ada";
    st.role = "backend-engineer";
    st.estimates["http"] = skills::MasteryEstimate{0.4, 0.3, kNow};
    st.history["http"].push_back(skills::MasteryPoint{kNow, 0.4, 0.3, skills::SourceTag::Resume});
    st.events.push_back(progress::make_event("http#1", progress::SubjectKind::Unit, 0.5, kNow));
    st.events.back().basis = progress::UnitBasis{0.4, 0.25};

    roadmap::RoadmapUnit u;
    u.id = "http#1";
    u.skill = "http";
    u.target_delta = 0.25;
    u.start_mastery = 0.4;
    u.effort = 10.0;
    st.roadmap.push_back(u);
    return st;
}

void test_learner_record(TestSuite& suite) {
    const progress::LearnerState st = sample_state();
    const progress::LearnerState back = io::learner_state_from_json(io::learner_state_to_json(st));

    suite.require(back.learner_id == "ada" && back.role == "backend-engineer", "identity survives");
    suite.require(back.estimates.size() == 1 && back.estimates.at("http").updated_at == kNow, "estimates survive");
    suite.require(back.history.at("http").at(0).source == skills::SourceTag::Resume, "history survives");
    suite.require(back.events.size() == 1 && back.events[0].kind == progress::SubjectKind::Unit, "events survive");
    suite.require(back.events[0].basis && near(back.events[0].basis->target_delta, 0.25),
                  "the unit an event was recorded against survives");
    suite.require(back.roadmap == st.roadmap, "roadmap survives");

    json wrong_version = io::learner_state_to_json(st);
    wrong_version["version"] = 99;
    suite.require(!error_of<skills::ValidationError>([&] { io::learner_state_from_json(wrong_version); }).empty(),
                  "unknown record version is rejected");

    json text_version = io::learner_state_to_json(st);
    text_version["version"] = "1";
    suite.require(!error_of<skills::ValidationError>([&] { io::learner_state_from_json(text_version); }).empty(),
                  "non-integer record version is a validation error");

    json bad_event = io::learner_state_to_json(st);
    bad_event["events"][0]["completion"] = 2.0;
    suite.require(!error_of<skills::ValidationError>([&] { io::learner_state_from_json(bad_event); }).empty(),
                  "out-of-range completion in a record is rejected");
}

void test_profile_stores(TestSuite& suite) {
    io::MemoryProfileStore memory;
    suite.require(!memory.load("ada").has_value(), "unknown learner loads as nothing");
    memory.save("ada", sample_state());
    suite.require(memory.load("ada").has_value(), "memory store keeps records");
    suite.require(!error_of<skills::ValidationError>([&] { memory.save("bob", sample_state()); }).empty(),
                  "key must match the record");

    const fs::path dir = fs::temp_directory_path() / "skillpath_test_profiles";
    fs::remove_all(dir);
    io::FileProfileStore files(dir);

    suite.require(!files.load("ada").has_value(), "empty directory has no records");
    files.save("ada", sample_state());
    suite.require(fs::exists(dir / "ada.json") && !fs::exists(dir / "ada.json.tmp"), "save leaves only the record");

    auto loaded = files.load("ada");
    suite.require(loaded.has_value() && loaded->roadmap == sample_state().roadmap, "file store round trip");

    progress::LearnerState updated = sample_state();
    updated.role = "data-engineer";
    files.save("ada", updated);
    loaded = files.load("ada");
    suite.require(loaded.has_value() && loaded->role == "data-engineer", "save replaces the previous record");

    suite.require(!error_of<skills::ValidationError>([&] { files.path_for("../etc/passwd"); }).empty(),
                  "path traversal in ids is rejected");
    suite.require(!error_of<skills::ValidationError>([&] { files.path_for(".hidden"); }).empty(),
                  "hidden file ids are rejected");
    suite.require(files.path_for("ada_lovelace-1.0").filename() == "ada_lovelace-1.0.json", "safe ids map to files");

    fs::remove_all(dir);
}

}  // namespace

int main() {
    TestSuite suite;

    test_parse_skill_graph(suite);
    test_parse_engine_config(suite);
    test_parse_inputs(suite);
    test_learner_record(suite);
    test_profile_stores(suite);

    if (!suite.ok) {
        std::cerr << "JsonIO tests FAILED" << std::endl;
        return 1;
    }

    std::cout << "JsonIO tests passed" << std::endl;
    return 0;
}
