#pragma once

#include "interview/QuestionBank.hpp"
#include "interview/Session.hpp"
#include "llm/RetryingLLMClient.hpp"
#include "roadmap/RoadmapGenerator.hpp"
#include "skills/MasteryModel.hpp"
#include "skills/SkillExtractor.hpp"
#include "skills/SkillGraph.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace io {

// Every tunable constant of the engine, loaded from one document.
struct EngineConfig {
    skills::MasteryConfig mastery;
    skills::ExtractorConfig extractor;
    roadmap::RoadmapConfig roadmap;
    interview::InterviewConfig interview;
    llm::RetryConfig retry;

    void validate() const;  // throws skills::ValidationError
};

// throw skills::GraphError
skills::SkillGraph parseSkillGraph(const nlohmann::json& j);
skills::SkillGraph loadSkillGraph(const std::string& path);

// every key optional; throw skills::ValidationError
EngineConfig parseEngineConfig(const nlohmann::json& j);
EngineConfig loadEngineConfig(const std::string& path);

// {"account": "...", "repositories": [{"name","language","topics","description"}]}
skills::RepositoryActivity parseRepositoryActivity(const nlohmann::json& j);
skills::RepositoryActivity loadRepositoryActivity(const std::string& path);

// {"fallback": ["... {skill} ..."], "questions": {"<skill>": [{"text", "level"}]}}
interview::QuestionBank parseQuestionBank(const nlohmann::json& j);
interview::QuestionBank loadQuestionBank(const std::string& path);

}  // namespace io
