#include "llm/MockLLMClient.hpp"
#include "skills/Errors.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llm {

static uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

static std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

static bool read_fixture(const fs::path& p, json& out) {
    std::ifstream f(p);
    if (!f) return false;
    try {
        f >> out;
    } catch (const json::exception& e) {
        std::cerr << "MockLLMClient: bad fixture " << p.string() << ": " << e.what() << "\n";
        return false;
    }
    return out.is_object();
}

static bool is_number(const json& j) {
    return j.is_number_float() || j.is_number_integer() || j.is_number_unsigned();
}

MockLLMClient::MockLLMClient(const std::string& root_dir) : root_(root_dir) {}

std::string MockLLMClient::fixture_key(const std::string& text) {
    return hex_u64(fnv1a64(text));
}

fs::path MockLLMClient::pick(const std::string& kind, const std::string& stem) const {
    fs::path exact = root_ / kind / (stem + ".json");
    if (fs::exists(exact)) return exact;
    return root_ / kind / "default.json";
}

std::vector<SkillMention> MockLLMClient::analyze(const std::string& text) {
    std::vector<SkillMention> out;

    const fs::path p = pick("analyze", fixture_key(text));
    json j;
    if (!read_fixture(p, j)) return out;

    if (j.value("timeout", false)) {
        throw skills::CapabilityTimeoutError("mock text analysis timed out (" + p.string() + ")");
    }
    if (!j.contains("mentions") || !j["mentions"].is_array()) return out;

    for (const auto& m : j["mentions"]) {
        if (!m.is_object()) continue;
        SkillMention sm;

        if (m.contains("raw") && m["raw"].is_string()) sm.raw = m["raw"].get<std::string>();
        if (m.contains("canonical") && m["canonical"].is_string()) sm.canonical = m["canonical"].get<std::string>();
        if (m.contains("salience") && is_number(m["salience"])) sm.salience = m["salience"].get<double>();

        if (!sm.raw.empty() || !sm.canonical.empty()) out.push_back(std::move(sm));
    }
    return out;
}

Judgment MockLLMClient::judge(const std::string&, const std::string& target_skill) {
    Judgment out;

    const fs::path p = pick("judge", target_skill);
    if (!fs::exists(p)) {
        std::cerr << "MockLLMClient: no judge fixture for " << target_skill << " under " << root_.string()
                  << ", scoring 0\n";
        return out;
    }
    json j;
    if (!read_fixture(p, j)) return out;

    if (j.value("timeout", false)) {
        throw skills::CapabilityTimeoutError("mock judgment timed out (" + p.string() + ")");
    }
    if (j.contains("score") && is_number(j["score"])) out.score = j["score"].get<double>();
    if (j.contains("confidence") && is_number(j["confidence"])) out.confidence = j["confidence"].get<double>();
    return out;
}

} // namespace llm
