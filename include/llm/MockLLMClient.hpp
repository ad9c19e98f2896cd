#pragma once

#include "llm/LLMClient.hpp"

#include <filesystem>
#include <string>

namespace llm {

// Replays canned capability answers from a fixture directory:
//   <root>/analyze/<fixture_key(text)>.json  {"mentions":[{"raw":..,"canonical":..,"salience":..}]}
//   <root>/analyze/default.json              fallback for any text
//   <root>/judge/<skill>.json                {"score":..,"confidence":..}
//   <root>/judge/default.json                fallback for any skill
// A fixture containing "timeout": true throws skills::CapabilityTimeoutError.
class MockLLMClient final : public LLMClient {
    std::filesystem::path root_;

public:
    explicit MockLLMClient(const std::string& root_dir);

    std::vector<SkillMention> analyze(const std::string& text) override;
    Judgment judge(const std::string& response_text, const std::string& target_skill) override;

    // deterministic file stem for a text (FNV-1a 64, hex)
    static std::string fixture_key(const std::string& text);

private:
    std::filesystem::path pick(const std::string& kind, const std::string& stem) const;
};

} // namespace llm
