// include/interview/InterviewReport.hpp
#pragma once

#include <filesystem>
#include <string>

#include "interview/Session.hpp"
#include "nlohmann/json.hpp"
#include "skills/SkillGraph.hpp"

namespace interview {

struct InterviewReport {
    InterviewSession session;
    std::string graph_path;

    nlohmann::json to_json(const skills::SkillGraph& graph) const;
    void write_to(const std::filesystem::path& out_path, const skills::SkillGraph& graph) const;
};

}  // namespace interview
