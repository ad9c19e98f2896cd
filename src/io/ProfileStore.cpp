#include "io/ProfileStore.hpp"
#include "skills/Errors.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace io {

static constexpr int kRecordVersion = 1;

static void check_same_learner(const std::string& learner_id, const progress::LearnerState& state) {
    if (learner_id != state.learner_id) {
        throw skills::ValidationError("profile key " + learner_id + " does not match record of " + state.learner_id);
    }
}

static json unit_to_json(const roadmap::RoadmapUnit& u) {
    return {
        {"id", u.id},
        {"skill", u.skill},
        {"kind", roadmap::unit_kind_str(u.kind)},
        {"target_delta", u.target_delta},
        {"start_mastery", u.start_mastery},
        {"effort", u.effort},
        {"part", u.part},
        {"parts", u.parts},
        {"position", u.position}
    };
}

json learner_state_to_json(const progress::LearnerState& st) {
    json j;
    j["version"] = kRecordVersion;
    j["learner_id"] = st.learner_id;
    j["role"] = st.role;

    json estimates = json::object();
    for (const auto& [skill, e] : st.estimates) {
        estimates[skill] = {
            {"mastery", e.mastery},
            {"confidence", e.confidence},
            {"updated_at_ms", skills::to_epoch_ms(e.updated_at)}
        };
    }
    j["estimates"] = estimates;

    json history = json::object();
    for (const auto& [skill, points] : st.history) {
        json arr = json::array();
        for (const auto& p : points) {
            arr.push_back({
                {"at_ms", skills::to_epoch_ms(p.at)},
                {"mastery", p.mastery},
                {"confidence", p.confidence},
                {"source", skills::source_tag_str(p.source)}
            });
        }
        history[skill] = arr;
    }
    j["history"] = history;

    json events = json::array();
    for (const auto& e : st.events) {
        json ej = {
            {"subject", e.subject_id},
            {"kind", progress::subject_kind_str(e.kind)},
            {"completion", e.completion},
            {"at_ms", skills::to_epoch_ms(e.at)}
        };
        if (e.basis) {
            ej["unit_start"] = e.basis->start_mastery;
            ej["unit_delta"] = e.basis->target_delta;
        }
        events.push_back(ej);
    }
    j["events"] = events;

    json units = json::array();
    for (const auto& u : st.roadmap) units.push_back(unit_to_json(u));
    j["roadmap"] = units;

    return j;
}

// The record is machine-written; any deviation is reported with the offending path.
template <typename T>
static T field(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw skills::ValidationError(where + " missing required field: " + std::string(key));
    }
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw skills::ValidationError(where + "." + key + ": " + e.what());
    }
}

static const json& section(const json& j, const char* key, bool want_array) {
    static const json empty_object = json::object();
    static const json empty_array = json::array();
    if (!j.contains(key)) return want_array ? empty_array : empty_object;

    const json& v = j.at(key);
    if (want_array ? !v.is_array() : !v.is_object()) {
        throw skills::ValidationError(std::string("root.") + key + (want_array ? " must be an array" : " must be an object"));
    }
    return v;
}

progress::LearnerState learner_state_from_json(const json& j) {
    if (!j.is_object()) throw skills::ValidationError("learner record must be an object");

    if (j.contains("version") && !j.at("version").is_number_integer()) {
        throw skills::ValidationError("root.version must be an integer");
    }
    const int version = j.contains("version") ? field<int>(j, "version", "root") : kRecordVersion;
    if (version != kRecordVersion) {
        throw skills::ValidationError("unsupported learner record version " + std::to_string(version));
    }

    progress::LearnerState st;
    st.learner_id = field<std::string>(j, "learner_id", "root");
    st.role = j.value("role", std::string());

    const json& estimates = section(j, "estimates", false);
    for (auto it = estimates.begin(); it != estimates.end(); ++it) {
        const std::string where = "root.estimates." + it.key();
        skills::MasteryEstimate e;
        e.mastery = field<double>(it.value(), "mastery", where);
        e.confidence = field<double>(it.value(), "confidence", where);
        e.updated_at = skills::from_epoch_ms(field<long long>(it.value(), "updated_at_ms", where));
        st.estimates[it.key()] = e;
    }

    const json& history = section(j, "history", false);
    for (auto it = history.begin(); it != history.end(); ++it) {
        const std::string where = "root.history." + it.key();
        if (!it.value().is_array()) throw skills::ValidationError(where + " must be an array");

        std::vector<skills::MasteryPoint>& points = st.history[it.key()];
        for (size_t i = 0; i < it.value().size(); ++i) {
            const json& pj = it.value().at(i);
            const std::string pw = where + "[" + std::to_string(i) + "]";
            skills::MasteryPoint p;
            p.at = skills::from_epoch_ms(field<long long>(pj, "at_ms", pw));
            p.mastery = field<double>(pj, "mastery", pw);
            p.confidence = field<double>(pj, "confidence", pw);
            p.source = skills::parse_source_tag(field<std::string>(pj, "source", pw));
            points.push_back(p);
        }
    }

    const json& events = section(j, "events", true);
    for (size_t i = 0; i < events.size(); ++i) {
        const json& ej = events.at(i);
        const std::string where = "root.events[" + std::to_string(i) + "]";
        progress::ProgressEvent e = progress::make_event(
            field<std::string>(ej, "subject", where),
            progress::parse_subject_kind(field<std::string>(ej, "kind", where)),
            field<double>(ej, "completion", where),
            skills::from_epoch_ms(field<long long>(ej, "at_ms", where)));
        if (ej.contains("unit_start")) {
            e.basis = progress::UnitBasis{field<double>(ej, "unit_start", where), field<double>(ej, "unit_delta", where)};
        }
        st.events.push_back(std::move(e));
    }

    const json& units = section(j, "roadmap", true);
    for (size_t i = 0; i < units.size(); ++i) {
        const json& uj = units.at(i);
        const std::string where = "root.roadmap[" + std::to_string(i) + "]";
        roadmap::RoadmapUnit u;
        u.id = field<std::string>(uj, "id", where);
        u.skill = field<std::string>(uj, "skill", where);
        u.kind = roadmap::parse_unit_kind(field<std::string>(uj, "kind", where));
        u.target_delta = field<double>(uj, "target_delta", where);
        u.start_mastery = field<double>(uj, "start_mastery", where);
        u.effort = field<double>(uj, "effort", where);
        u.part = field<int>(uj, "part", where);
        u.parts = field<int>(uj, "parts", where);
        u.position = field<int>(uj, "position", where);
        st.roadmap.push_back(std::move(u));
    }

    return st;
}

std::optional<progress::LearnerState> MemoryProfileStore::load(const std::string& learner_id) {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_records.find(learner_id);
    if (it == m_records.end()) return std::nullopt;
    return it->second;
}

void MemoryProfileStore::save(const std::string& learner_id, const progress::LearnerState& state) {
    check_same_learner(learner_id, state);
    std::lock_guard<std::mutex> lock(m_mu);
    m_records[learner_id] = state;
}

FileProfileStore::FileProfileStore(fs::path dir) : m_dir(std::move(dir)) {}

fs::path FileProfileStore::path_for(const std::string& learner_id) const {
    if (learner_id.empty() || learner_id[0] == '.') {
        throw skills::ValidationError("invalid learner id for file store: '" + learner_id + "'");
    }
    for (unsigned char c : learner_id) {
        if (!(std::isalnum(c) || c == '-' || c == '_' || c == '.')) {
            throw skills::ValidationError("invalid learner id for file store: '" + learner_id + "'");
        }
    }
    return m_dir / (learner_id + ".json");
}

std::optional<progress::LearnerState> FileProfileStore::load(const std::string& learner_id) {
    const fs::path p = path_for(learner_id);

    std::lock_guard<std::mutex> lock(m_mu);
    if (!fs::exists(p)) return std::nullopt;

    std::ifstream in(p);
    if (!in) throw std::runtime_error("failed to open profile: " + p.string());

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw skills::ValidationError("failed to parse profile " + p.string() + ": " + e.what());
    }

    progress::LearnerState st = learner_state_from_json(j);
    if (st.learner_id != learner_id) {
        throw skills::ValidationError("profile " + p.string() + " belongs to " + st.learner_id);
    }
    return st;
}

void FileProfileStore::save(const std::string& learner_id, const progress::LearnerState& state) {
    check_same_learner(learner_id, state);
    const fs::path p = path_for(learner_id);
    const std::string body = learner_state_to_json(state).dump(2);

    std::lock_guard<std::mutex> lock(m_mu);
    fs::create_directories(m_dir);

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("failed to open output file: " + tmp.string());
        out << body << "\n";
        out.flush();
        if (!out) throw std::runtime_error("failed to write profile: " + tmp.string());
    }
    fs::rename(tmp, p);
}

}  // namespace io
