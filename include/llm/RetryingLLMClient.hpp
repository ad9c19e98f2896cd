#pragma once

#include "llm/LLMClient.hpp"

#include <chrono>
#include <functional>

namespace llm {

struct RetryConfig {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    double backoff_multiplier = 2.0;
};

// Retries calls that fail with skills::CapabilityTimeoutError, sleeping with exponential
// backoff between attempts. After max_attempts the last timeout propagates.
class RetryingLLMClient final : public LLMClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingLLMClient(LLMClient& inner, RetryConfig cfg);
    RetryingLLMClient(LLMClient& inner, RetryConfig cfg, Sleeper sleeper);

    std::vector<SkillMention> analyze(const std::string& text) override;
    Judgment judge(const std::string& response_text, const std::string& target_skill) override;

private:
    LLMClient& inner_;
    RetryConfig cfg_;
    Sleeper sleep_;

    template <typename Fn>
    auto with_retry(const char* what, Fn&& fn) -> decltype(fn());
};

} // namespace llm
