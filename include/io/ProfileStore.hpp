#pragma once

#include "progress/Learner.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace io {

// Key-value persistence of learner records. Each call is atomic.
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    // nullopt for a learner never saved
    virtual std::optional<progress::LearnerState> load(const std::string& learner_id) = 0;

    // throws skills::ValidationError if learner_id and state.learner_id differ
    virtual void save(const std::string& learner_id, const progress::LearnerState& state) = 0;
};

class MemoryProfileStore final : public ProfileStore {
public:
    std::optional<progress::LearnerState> load(const std::string& learner_id) override;
    void save(const std::string& learner_id, const progress::LearnerState& state) override;

private:
    std::mutex m_mu;
    std::map<std::string, progress::LearnerState> m_records;
};

// One JSON document per learner: <dir>/<learner>.json, replaced through a
// temporary file and a rename so readers never see a partial record.
class FileProfileStore final : public ProfileStore {
public:
    explicit FileProfileStore(std::filesystem::path dir);

    std::optional<progress::LearnerState> load(const std::string& learner_id) override;
    void save(const std::string& learner_id, const progress::LearnerState& state) override;

    std::filesystem::path path_for(const std::string& learner_id) const;  // throws on unsafe ids

private:
    std::filesystem::path m_dir;
    std::mutex m_mu;
};

nlohmann::json learner_state_to_json(const progress::LearnerState& st);
progress::LearnerState learner_state_from_json(const nlohmann::json& j);  // throws skills::ValidationError

}  // namespace io
