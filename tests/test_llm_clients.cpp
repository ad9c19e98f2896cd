#include "TestSupport.hpp"

#include "llm/HeuristicLLMClient.hpp"
#include "llm/MockLLMClient.hpp"
#include "llm/RetryingLLMClient.hpp"
#include "skills/Errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using testing_support::TestSuite;
using testing_support::ScriptedLLMClient;
using testing_support::near;

namespace fs = std::filesystem;

namespace {

std::string repeat_words(const std::string& word, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        if (i) out += ' ';
        out += word;
    }
    return out;
}

void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p);
    f << content;
}

void test_retry_recovers(TestSuite& suite) {
    ScriptedLLMClient inner;
    inner.mentions = {{"sql", "", 0.7}};
    inner.analyze_timeouts = 2;

    std::vector<long long> sleeps;
    llm::RetryConfig cfg;
    cfg.max_attempts = 3;
    cfg.initial_backoff = std::chrono::milliseconds(200);
    cfg.backoff_multiplier = 2.0;
    llm::RetryingLLMClient client(inner, cfg, [&](std::chrono::milliseconds d) { sleeps.push_back(d.count()); });

    const auto mentions = client.analyze("sql");
    suite.require(mentions.size() == 1 && mentions[0].raw == "sql", "transient timeouts are retried to success");
    suite.require(inner.analyze_calls == 3, "one call per attempt");
    suite.require(sleeps == std::vector<long long>{200, 400}, "backoff doubles between attempts");
}

void test_retry_gives_up(TestSuite& suite) {
    ScriptedLLMClient inner;
    inner.judge_timeouts = 5;

    std::vector<long long> sleeps;
    llm::RetryConfig cfg;
    cfg.max_attempts = 3;
    llm::RetryingLLMClient client(inner, cfg, [&](std::chrono::milliseconds d) { sleeps.push_back(d.count()); });

    bool threw = false;
    try {
        client.judge("answer", "http");
    } catch (const skills::CapabilityTimeoutError&) {
        threw = true;
    }
    suite.require(threw, "last timeout propagates after max attempts");
    suite.require(inner.judge_calls == 3 && sleeps.size() == 2, "no sleep after the final attempt");

    ScriptedLLMClient once;
    once.judge_timeouts = 1;
    llm::RetryConfig zero;
    zero.max_attempts = 0;
    llm::RetryingLLMClient single(once, zero, [](std::chrono::milliseconds) {});
    bool single_threw = false;
    try {
        single.judge("answer", "http");
    } catch (const skills::CapabilityTimeoutError&) {
        single_threw = true;
    }
    suite.require(single_threw && once.judge_calls == 1, "attempts are clamped to at least one");
}

void test_heuristic_analyze(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    llm::HeuristicLLMClient client(g);

    const auto mentions = client.analyze("Built REST APIs over HTTP and tuned Postgres and SQL queries. REST everywhere.");
    suite.require(mentions.size() == 2, "only skills named in the text are mentioned");
    if (mentions.size() != 2) return;

    suite.require(mentions[0].canonical == "http" && near(mentions[0].salience, 0.875), "three http hits give 0.875");
    suite.require(mentions[1].canonical == "sql" && near(mentions[1].salience, 0.75), "two sql hits give 0.75");

    suite.require(client.analyze("").empty(), "empty text gives no mentions");
    suite.require(client.analyze("gardening and pottery").empty(), "unrelated text gives no mentions");
}

void test_heuristic_judge(TestSuite& suite) {
    const skills::SkillGraph g = testing_support::backend_graph();
    llm::HeuristicConfig cfg;
    cfg.judge_confidence = 0.3;
    llm::HeuristicLLMClient client(g, cfg);

    const auto short_technical = client.judge("I implemented an HTTP cache", "http");
    suite.require(near(short_technical.score, 0.4), "short answer naming the skill gets one extra band");
    suite.require(near(short_technical.confidence, 0.3), "confidence comes from the config");

    suite.require(near(client.judge("no idea", "http").score, 0.2), "short vague answer scores lowest");
    suite.require(near(client.judge(repeat_words("thing", 65), "sql").score, 0.8), "length alone reaches band four");
    suite.require(near(client.judge(repeat_words("sql", 120), "sql").score, 1.0), "bands cap at five");
}

void test_mock_fixtures(TestSuite& suite) {
    const fs::path root = fs::temp_directory_path() / "skillpath_test_mock_llm";
    fs::remove_all(root);

    const std::string text = "Ten years of Postgres";
    write_file(root / "analyze" / (llm::MockLLMClient::fixture_key(text) + ".json"),
               R"({"mentions":[{"raw":"Postgres","canonical":"sql","salience":0.8},{"raw":"","salience":0.9}]})");
    write_file(root / "analyze" / "default.json", R"({"mentions":[]})");
    write_file(root / "analyze" / (llm::MockLLMClient::fixture_key("slow") + ".json"), R"({"timeout":true})");
    write_file(root / "judge" / "http.json", R"({"score":0.9,"confidence":0.8})");
    write_file(root / "judge" / "default.json", R"({"score":0.5,"confidence":0.5})");
    write_file(root / "judge" / "sql.json", R"({"timeout":true})");

    llm::MockLLMClient client(root.string());

    const auto mentions = client.analyze(text);
    suite.require(mentions.size() == 1, "mentions without any surface form are skipped");
    suite.require(mentions.size() == 1 && mentions[0].canonical == "sql" && near(mentions[0].salience, 0.8),
                  "exact fixture is replayed");
    suite.require(client.analyze("something else").empty(), "default fixture covers other text");

    const auto j = client.judge("answer", "http");
    suite.require(near(j.score, 0.9) && near(j.confidence, 0.8), "per-skill judgment fixture");
    const auto d = client.judge("answer", "networking-basics");
    suite.require(near(d.score, 0.5) && near(d.confidence, 0.5), "default judgment fixture");

    bool analyze_timeout = false;
    try {
        client.analyze("slow");
    } catch (const skills::CapabilityTimeoutError&) {
        analyze_timeout = true;
    }
    suite.require(analyze_timeout, "timeout fixture throws on analyze");

    bool judge_timeout = false;
    try {
        client.judge("answer", "sql");
    } catch (const skills::CapabilityTimeoutError&) {
        judge_timeout = true;
    }
    suite.require(judge_timeout, "timeout fixture throws on judge");

    suite.require(llm::MockLLMClient::fixture_key("a") != llm::MockLLMClient::fixture_key("b"), "keys differ by text");
    suite.require(llm::MockLLMClient::fixture_key("a").size() == 16, "keys are 16 hex digits");

    fs::remove_all(root);
    llm::MockLLMClient empty(root.string());
    suite.require(empty.analyze(text).empty(), "missing fixture directory gives no mentions");
    const auto unanswered = empty.judge("answer", "http");
    suite.require(near(unanswered.score, 0.0) && near(unanswered.confidence, 0.0),
                  "missing judge fixtures score zero with no confidence");
}

}  // namespace

int main() {
    TestSuite suite;

    test_retry_recovers(suite);
    test_retry_gives_up(suite);
    test_heuristic_analyze(suite);
    test_heuristic_judge(suite);
    test_mock_fixtures(suite);

    if (!suite.ok) {
        std::cerr << "LLM client tests FAILED" << std::endl;
        return 1;
    }

    std::cout << "LLM client tests passed" << std::endl;
    return 0;
}
