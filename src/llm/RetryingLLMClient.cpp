#include "llm/RetryingLLMClient.hpp"
#include "skills/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace llm {

RetryingLLMClient::RetryingLLMClient(LLMClient& inner, RetryConfig cfg)
    : RetryingLLMClient(inner, cfg, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

RetryingLLMClient::RetryingLLMClient(LLMClient& inner, RetryConfig cfg, Sleeper sleeper)
    : inner_(inner), cfg_(cfg), sleep_(std::move(sleeper)) {
    cfg_.max_attempts = std::max(1, cfg_.max_attempts);
}

template <typename Fn>
auto RetryingLLMClient::with_retry(const char* what, Fn&& fn) -> decltype(fn()) {
    double backoff_ms = static_cast<double>(cfg_.initial_backoff.count());

    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const skills::CapabilityTimeoutError& e) {
            if (attempt >= cfg_.max_attempts) throw;

            std::cerr << "RetryingLLMClient: " << what << " attempt " << attempt << "/" << cfg_.max_attempts
                      << " timed out (" << e.what() << "), retrying\n";

            sleep_(std::chrono::milliseconds(static_cast<long long>(backoff_ms)));
            backoff_ms *= cfg_.backoff_multiplier;
        }
    }
}

std::vector<SkillMention> RetryingLLMClient::analyze(const std::string& text) {
    return with_retry("analyze", [&] { return inner_.analyze(text); });
}

Judgment RetryingLLMClient::judge(const std::string& response_text, const std::string& target_skill) {
    return with_retry("judge", [&] { return inner_.judge(response_text, target_skill); });
}

} // namespace llm
