#include "io/JsonIO.hpp"
#include "skills/Errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

namespace {

// Shape problems are collected under one type and rethrown as the error of the document kind.
class ShapeError : public std::runtime_error {
public:
    explicit ShapeError(const std::string& what) : std::runtime_error(what) {}
};

void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ShapeError(where + " must be an object");
    }
}

void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw ShapeError(where + " must be an array");
    }
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ShapeError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw ShapeError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

std::string optional_string(const json& j, const char* key, const std::string& where, const std::string& fallback) {
    if (!j.contains(key)) return fallback;
    if (!j.at(key).is_string()) {
        throw ShapeError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw ShapeError(where + "." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw ShapeError(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

double require_number(const json& j, const std::string& where) {
    if (!j.is_number()) {
        throw ShapeError(where + " must be a number");
    }
    return j.get<double>();
}

double optional_number(const json& j, const char* key, const std::string& where, double fallback) {
    if (!j.contains(key)) return fallback;
    return require_number(j.at(key), where + "." + key);
}

long long optional_integer(const json& j, const char* key, const std::string& where, long long fallback) {
    if (!j.contains(key)) return fallback;
    const json& v = j.at(key);
    if (!v.is_number_integer() && !v.is_number_unsigned()) {
        throw ShapeError(where + "." + std::string(key) + " must be an integer");
    }
    return v.get<long long>();
}

skills::Tier tier_field(const json& j, const std::string& where, skills::Tier fallback) {
    if (!j.contains("tier")) return fallback;
    const std::string t = require_string(j, "tier", where);
    try {
        return skills::parse_tier(t);
    } catch (const skills::ValidationError& e) {
        throw ShapeError(where + ".tier: " + e.what());
    }
}

std::string indexed(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw ShapeError(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw ShapeError(std::string("failed to parse JSON in ") + path + ": " + e.what());
    }
    return j;
}

skills::Skill parseSkill(const json& j, const std::string& where) {
    require_object(j, where);

    skills::Skill s;
    s.id            = require_string(j, "id", where);
    s.name          = optional_string(j, "name", where, s.id);
    s.tier          = tier_field(j, where, skills::Tier::Foundational);
    s.prerequisites = optional_string_array(j, "prerequisites", where);
    s.aliases       = optional_string_array(j, "aliases", where);
    return s;
}

skills::RoleTargets parseRoleTargets(const json& j, const std::string& where) {
    require_object(j, where);

    skills::RoleTargets targets;
    for (auto it = j.begin(); it != j.end(); ++it) {
        targets[it.key()] = require_number(it.value(), where + "." + it.key());
    }
    return targets;
}

}  // namespace

skills::SkillGraph parseSkillGraph(const json& j) {
    std::vector<skills::Skill> skill_list;
    std::map<std::string, skills::RoleTargets> roles;

    try {
        require_object(j, "root");

        if (!j.contains("skills")) {
            throw ShapeError("root missing required field: skills");
        }
        const json& arr = j.at("skills");
        require_array(arr, "root.skills");
        for (size_t i = 0; i < arr.size(); ++i) {
            skill_list.push_back(parseSkill(arr.at(i), indexed("root.skills", i)));
        }

        if (j.contains("roles")) {
            const json& rj = j.at("roles");
            require_object(rj, "root.roles");
            for (auto it = rj.begin(); it != rj.end(); ++it) {
                roles[it.key()] = parseRoleTargets(it.value(), "root.roles." + it.key());
            }
        }
    } catch (const ShapeError& e) {
        throw skills::GraphError(e.what());
    }

    return skills::SkillGraph(std::move(skill_list), std::move(roles));
}

skills::SkillGraph loadSkillGraph(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "skill graph");
    } catch (const ShapeError& e) {
        throw skills::GraphError(e.what());
    }
    return parseSkillGraph(j);
}

void EngineConfig::validate() const {
    if (!(mastery.half_life_days > 0.0)) {
        throw skills::ValidationError("mastery.half_life_days must be positive");
    }
    if (!skills::in_unit_range(mastery.confidence_floor)) {
        throw skills::ValidationError("mastery.confidence_floor outside [0,1]");
    }
    extractor.validate();
    roadmap.validate();
    interview.validate();
    if (retry.max_attempts < 1) {
        throw skills::ValidationError("retry.max_attempts must be at least 1");
    }
    if (retry.initial_backoff.count() < 0) {
        throw skills::ValidationError("retry.initial_backoff_ms must be >= 0");
    }
    if (retry.backoff_multiplier < 1.0) {
        throw skills::ValidationError("retry.backoff_multiplier must be >= 1");
    }
}

EngineConfig parseEngineConfig(const json& j) {
    EngineConfig cfg;

    try {
        require_object(j, "root");

        if (j.contains("mastery")) {
            const json& m = j.at("mastery");
            const std::string w = "root.mastery";
            require_object(m, w);
            cfg.mastery.half_life_days   = optional_number(m, "half_life_days", w, cfg.mastery.half_life_days);
            cfg.mastery.confidence_floor = optional_number(m, "confidence_floor", w, cfg.mastery.confidence_floor);
        }

        if (j.contains("extractor")) {
            const json& x = j.at("extractor");
            const std::string w = "root.extractor";
            require_object(x, w);
            auto& e = cfg.extractor;
            e.resume_confidence     = optional_number(x, "resume_confidence", w, e.resume_confidence);
            e.repository_confidence = optional_number(x, "repository_confidence", w, e.repository_confidence);
            e.manual_confidence     = optional_number(x, "manual_confidence", w, e.manual_confidence);
            e.interview_confidence  = optional_number(x, "interview_confidence", w, e.interview_confidence);
            e.min_salience          = optional_number(x, "min_salience", w, e.min_salience);
        }

        if (j.contains("roadmap")) {
            const json& r = j.at("roadmap");
            const std::string w = "root.roadmap";
            require_object(r, w);
            auto& rc = cfg.roadmap;
            rc.max_unit_delta     = optional_number(r, "max_unit_delta", w, rc.max_unit_delta);
            rc.effort_per_mastery = optional_number(r, "effort_per_mastery", w, rc.effort_per_mastery);
            rc.review_confidence_threshold =
                optional_number(r, "review_confidence_threshold", w, rc.review_confidence_threshold);

            if (r.contains("tier_multipliers")) {
                const json& tm = r.at("tier_multipliers");
                require_array(tm, w + ".tier_multipliers");
                if (tm.size() != rc.tier_multipliers.size()) {
                    throw ShapeError(w + ".tier_multipliers must have one entry per tier (3)");
                }
                for (size_t i = 0; i < tm.size(); ++i) {
                    rc.tier_multipliers[i] = require_number(tm.at(i), indexed(w + ".tier_multipliers", i));
                }
            }
        }

        if (j.contains("interview")) {
            const json& iv = j.at("interview");
            const std::string w = "root.interview";
            require_object(iv, w);
            auto& ic = cfg.interview;

            const long long window = optional_integer(iv, "window", w, static_cast<long long>(ic.window));
            if (window < 1) throw ShapeError(w + ".window must be at least 1");
            ic.window = static_cast<size_t>(window);

            ic.confident_threshold  = optional_number(iv, "confident_threshold", w, ic.confident_threshold);
            ic.struggling_threshold = optional_number(iv, "struggling_threshold", w, ic.struggling_threshold);
            ic.max_difficulty_shift =
                static_cast<int>(optional_integer(iv, "max_difficulty_shift", w, ic.max_difficulty_shift));
            ic.timeout = std::chrono::minutes(optional_integer(iv, "timeout_minutes", w, ic.timeout.count()));
        }

        if (j.contains("retry")) {
            const json& rt = j.at("retry");
            const std::string w = "root.retry";
            require_object(rt, w);
            auto& rc = cfg.retry;
            rc.max_attempts       = static_cast<int>(optional_integer(rt, "max_attempts", w, rc.max_attempts));
            rc.initial_backoff    = std::chrono::milliseconds(
                optional_integer(rt, "initial_backoff_ms", w, rc.initial_backoff.count()));
            rc.backoff_multiplier = optional_number(rt, "backoff_multiplier", w, rc.backoff_multiplier);
        }
    } catch (const ShapeError& e) {
        throw skills::ValidationError(e.what());
    }

    cfg.validate();
    return cfg;
}

EngineConfig loadEngineConfig(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "engine config");
    } catch (const ShapeError& e) {
        throw skills::ValidationError(e.what());
    }
    return parseEngineConfig(j);
}

skills::RepositoryActivity parseRepositoryActivity(const json& j) {
    skills::RepositoryActivity activity;

    try {
        require_object(j, "root");
        activity.account = optional_string(j, "account", "root", "");

        if (!j.contains("repositories")) {
            throw ShapeError("root missing required field: repositories");
        }
        const json& arr = j.at("repositories");
        require_array(arr, "root.repositories");

        for (size_t i = 0; i < arr.size(); ++i) {
            const std::string where = indexed("root.repositories", i);
            const json& rj = arr.at(i);
            require_object(rj, where);

            skills::Repository r;
            r.name        = require_string(rj, "name", where);
            r.language    = optional_string(rj, "language", where, "");
            r.topics      = optional_string_array(rj, "topics", where);
            r.description = optional_string(rj, "description", where, "");
            activity.repositories.push_back(std::move(r));
        }
    } catch (const ShapeError& e) {
        throw skills::ValidationError(e.what());
    }

    return activity;
}

skills::RepositoryActivity loadRepositoryActivity(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "repository activity");
    } catch (const ShapeError& e) {
        throw skills::ValidationError(e.what());
    }
    return parseRepositoryActivity(j);
}

interview::QuestionBank parseQuestionBank(const json& j) {
    std::map<std::string, std::vector<interview::Question>> by_skill;
    std::vector<std::string> fallback;

    try {
        require_object(j, "root");
        fallback = optional_string_array(j, "fallback", "root");

        if (j.contains("questions")) {
            const json& qs = j.at("questions");
            require_object(qs, "root.questions");

            for (auto it = qs.begin(); it != qs.end(); ++it) {
                const std::string where = "root.questions." + it.key();
                require_array(it.value(), where);

                std::vector<interview::Question>& list = by_skill[it.key()];
                for (size_t i = 0; i < it.value().size(); ++i) {
                    const json& qj = it.value().at(i);
                    const std::string qwhere = indexed(where, i);

                    interview::Question q;
                    if (qj.is_string()) {
                        q.text = qj.get<std::string>();
                    } else {
                        require_object(qj, qwhere);
                        q.text = require_string(qj, "text", qwhere);
                        if (qj.contains("level")) {
                            try {
                                q.level = skills::parse_tier(require_string(qj, "level", qwhere));
                            } catch (const skills::ValidationError& e) {
                                throw ShapeError(qwhere + ".level: " + e.what());
                            }
                        }
                    }
                    if (q.text.empty()) throw ShapeError(qwhere + " must not be empty");
                    list.push_back(std::move(q));
                }
            }
        }
    } catch (const ShapeError& e) {
        throw skills::ValidationError(e.what());
    }

    return interview::QuestionBank(std::move(by_skill), std::move(fallback));
}

interview::QuestionBank loadQuestionBank(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "question bank");
    } catch (const ShapeError& e) {
        throw skills::ValidationError(e.what());
    }
    return parseQuestionBank(j);
}

}  // namespace io
