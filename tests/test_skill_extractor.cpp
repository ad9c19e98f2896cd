#include "TestSupport.hpp"

#include "skills/Errors.hpp"
#include "skills/SkillExtractor.hpp"

#include <iostream>
#include <string>
#include <vector>

using testing_support::TestSuite;
using testing_support::ScriptedLLMClient;
using testing_support::near;
using skills::SourceTag;

namespace {

const skills::TimePoint kNow = skills::from_epoch_ms(1700000000000LL);

class StubMatcher final : public skills::SkillMatcher {
public:
    skills::SkillMatch best_match(const std::string& mention) const override {
        if (mention == "web apis") return skills::SkillMatch{true, "http", 0.81f};
        if (mention == "query tuning") return skills::SkillMatch{false, "", 0.40f};
        return skills::SkillMatch{};
    }
};

const skills::Observation* find_obs(const std::vector<skills::Observation>& obs, const std::string& skill) {
    for (const auto& o : obs) {
        if (o.skill == skill) return &o;
    }
    return nullptr;
}

void test_mapping(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    ScriptedLLMClient llm;
    llm.mentions = {
        {"REST", "", 0.6},
        {"Postgres", "", 0.3},
        {"postgres", "sql", 0.5},
        {"cobol", "", 0.9},
        {"tcp/ip", "", 1.5},
        {"networking", "", 0.01},
    };

    const skills::SkillExtractor ex(g, llm);
    const auto obs = ex.extract("Built REST services on Postgres", SourceTag::Resume, kNow);

    suite.require(obs.size() == 2, "only resolvable, in-range, salient mentions become observations");
    suite.require(obs.size() == 2 && obs[0].skill == "http" && obs[1].skill == "sql",
                  "observations follow topological order");

    const auto* http = find_obs(obs, "http");
    suite.require(http && near(http->strength, 0.6), "alias maps to its skill with salience as strength");
    const auto* sql = find_obs(obs, "sql");
    suite.require(sql && near(sql->strength, 0.5), "strongest mention per skill wins");
    suite.require(sql && near(sql->source_confidence, skills::ExtractorConfig{}.resume_confidence),
                  "resume evidence carries the resume confidence");
    suite.require(sql && sql->source == SourceTag::Resume && sql->observed_at == kNow, "source tag and time are kept");
}

void test_source_confidence_ordering(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    ScriptedLLMClient llm;
    llm.mentions = {{"sql", "", 0.7}};

    skills::ExtractorConfig cfg;
    cfg.resume_confidence = 0.2;
    cfg.repository_confidence = 0.35;
    cfg.manual_confidence = 0.7;
    const skills::SkillExtractor ex(g, llm, cfg);

    const double resume = ex.extract("sql", SourceTag::Resume, kNow).at(0).source_confidence;
    const double repo = ex.extract("sql", SourceTag::Repository, kNow).at(0).source_confidence;
    const double manual = ex.extract("sql", SourceTag::Manual, kNow).at(0).source_confidence;
    suite.require(near(resume, 0.2) && near(repo, 0.35) && near(manual, 0.7), "confidences follow the config");
    suite.require(resume < repo && repo < manual, "resume < repository < manual");

    bool threw = false;
    try {
        skills::ExtractorConfig bad;
        bad.resume_confidence = 0.6;
        bad.repository_confidence = 0.5;
        skills::SkillExtractor rejected(g, llm, bad);
    } catch (const skills::ValidationError&) {
        threw = true;
    }
    suite.require(threw, "misordered source confidences are rejected");
}

void test_degradation(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    ScriptedLLMClient llm;
    const skills::SkillExtractor ex(g, llm);

    suite.require(ex.extract("   ", SourceTag::Resume, kNow).empty(), "blank text gives no observations");
    suite.require(llm.analyze_calls == 0, "blank text never reaches the capability");

    suite.require(ex.extract("nothing relevant", SourceTag::Resume, kNow).empty(), "no mentions is not an error");

    llm.analyze_timeouts = 1;
    bool timed_out = false;
    try {
        ex.extract("sql", SourceTag::Resume, kNow);
    } catch (const skills::CapabilityTimeoutError&) {
        timed_out = true;
    }
    suite.require(timed_out, "capability timeout surfaces instead of an empty result");
}

void test_semantic_fallback(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    ScriptedLLMClient llm;
    llm.mentions = {{"web apis", "", 0.5}, {"query tuning", "", 0.5}};

    const skills::SkillExtractor plain(g, llm);
    suite.require(plain.extract("x", SourceTag::Resume, kNow).empty(), "without a matcher unmatched mentions drop");

    StubMatcher matcher;
    const skills::SkillExtractor semantic(g, llm, skills::ExtractorConfig{}, &matcher);
    const auto obs = semantic.extract("x", SourceTag::Resume, kNow);
    suite.require(obs.size() == 1 && obs[0].skill == "http", "matcher resolves mentions above its threshold only");

    suite.require(semantic.resolve("HTTP") == "http", "exact id resolves case-insensitively");
    suite.require(semantic.resolve("MySQL") == "sql", "alias resolves");
    suite.require(semantic.resolve("") == "", "empty surface resolves to nothing");
}

void test_repository_activity(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    ScriptedLLMClient llm;
    llm.mentions = {{"rest", "", 0.4}};

    skills::RepositoryActivity activity;
    activity.account = "ada";
    activity.repositories = {
        {"ledger", "SQL", {"database"}, "double-entry ledger"},
        {"reports", "SQL", {}, ""},
        {"api", "Go", {"rest"}, "public REST gateway"},
    };

    const skills::SkillExtractor ex(g, llm);
    const auto obs = ex.extract_repository(activity, kNow);

    const auto* sql = find_obs(obs, "sql");
    suite.require(sql && near(sql->strength, 2.0 / 3.0), "language share across repositories becomes strength");
    const auto* http = find_obs(obs, "http");
    suite.require(http && near(http->strength, 0.4), "topics and descriptions go through the analyzer");
    suite.require(obs.size() == 2, "unknown languages are ignored");
    suite.require(sql && sql->source == SourceTag::Repository, "repository evidence is tagged repository");
    suite.require(llm.analyze_calls == 1, "metadata is analyzed in one call");

    suite.require(ex.extract_repository(skills::RepositoryActivity{}, kNow).empty(), "no repositories, no evidence");
}

}  // namespace

int main() {
    TestSuite suite;

    test_mapping(suite);
    test_source_confidence_ordering(suite);
    test_degradation(suite);
    test_semantic_fallback(suite);
    test_repository_activity(suite);

    if (!suite.ok) {
        std::cerr << "SkillExtractor tests FAILED" << std::endl;
        return 1;
    }

    std::cout << "SkillExtractor tests passed" << std::endl;
    return 0;
}
