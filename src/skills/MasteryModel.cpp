#include "skills/MasteryModel.hpp"
#include "skills/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace skills {

static double elapsed_days(Clock::duration d) {
    if (d <= Clock::duration::zero()) return 0.0;
    return std::chrono::duration<double, std::ratio<86400>>(d).count();
}

double decayed_confidence(double confidence, Clock::duration elapsed, const MasteryConfig& cfg) {
    if (confidence <= cfg.confidence_floor) return confidence;
    if (cfg.half_life_days <= 0.0) return confidence;

    const double days = elapsed_days(elapsed);
    if (days == 0.0) return confidence;

    const double keep = std::pow(0.5, days / cfg.half_life_days);
    return cfg.confidence_floor + (confidence - cfg.confidence_floor) * keep;
}

MasteryEstimate merge_estimate(const std::optional<MasteryEstimate>& prior,
                               const Observation& o,
                               const MasteryConfig& cfg) {
    double m_old = 0.0;
    double c_old = 0.0;
    TimePoint updated = o.observed_at;

    if (prior) {
        m_old = prior->mastery;
        // out-of-order observations see no elapsed time
        c_old = decayed_confidence(prior->confidence, o.observed_at - prior->updated_at, cfg);
        updated = std::max(prior->updated_at, o.observed_at);
    }

    const double c_src = o.source_confidence;
    const double denom = c_old + c_src;

    MasteryEstimate out;
    out.mastery = (denom > 0.0) ? (m_old * c_old + o.strength * c_src) / denom : m_old;
    out.confidence = std::min(1.0, c_old + c_src * (1.0 - c_old));
    out.updated_at = updated;

    // rounding guard: a convex combination of values in [0,1] stays in [0,1]
    out.mastery = std::min(1.0, std::max(0.0, out.mastery));
    return out;
}

MasteryModel::MasteryModel(std::string learner_id, const SkillGraph& graph, MasteryConfig cfg)
    : m_learner_id(std::move(learner_id)), m_graph(&graph), m_cfg(cfg) {}

MasteryModel::MasteryModel(std::string learner_id,
                           const SkillGraph& graph,
                           MasteryConfig cfg,
                           std::map<std::string, MasteryEstimate> estimates,
                           std::map<std::string, std::vector<MasteryPoint>> history)
    : m_learner_id(std::move(learner_id)), m_graph(&graph), m_cfg(cfg) {
    for (const auto& [skill_id, est] : estimates) {
        check_known(skill_id);
        if (!in_unit_range(est.mastery) || !in_unit_range(est.confidence)) {
            throw ValidationError("stored estimate for " + skill_id + " outside [0,1]");
        }
    }
    for (const auto& [skill_id, points] : history) check_known(skill_id);

    m_estimates = std::move(estimates);
    m_history = std::move(history);
}

void MasteryModel::check_known(const std::string& skill_id) const {
    if (!m_graph->contains(skill_id)) {
        throw ValidationError("observation names unknown skill: " + skill_id);
    }
}

MasteryEstimate MasteryModel::merge(const Observation& o) {
    validate_observation(o);
    check_known(o.skill);

    std::lock_guard<std::mutex> lock(m_mu);

    std::optional<MasteryEstimate> prior;
    auto it = m_estimates.find(o.skill);
    if (it != m_estimates.end()) prior = it->second;

    const MasteryEstimate next = merge_estimate(prior, o, m_cfg);

    m_estimates[o.skill] = next;
    m_history[o.skill].push_back(MasteryPoint{o.observed_at, next.mastery, next.confidence, o.source});
    ++m_version;
    return next;
}

std::vector<MasteryEstimate> MasteryModel::merge_all(const std::vector<Observation>& obs) {
    for (const auto& o : obs) {
        validate_observation(o);
        check_known(o.skill);
    }

    std::lock_guard<std::mutex> lock(m_mu);

    std::vector<MasteryEstimate> out;
    out.reserve(obs.size());

    for (const auto& o : obs) {
        std::optional<MasteryEstimate> prior;
        auto it = m_estimates.find(o.skill);
        if (it != m_estimates.end()) prior = it->second;

        const MasteryEstimate next = merge_estimate(prior, o, m_cfg);
        m_estimates[o.skill] = next;
        m_history[o.skill].push_back(MasteryPoint{o.observed_at, next.mastery, next.confidence, o.source});
        out.push_back(next);
    }

    if (!obs.empty()) ++m_version;
    return out;
}

std::optional<MasteryEstimate> MasteryModel::estimate(const std::string& skill_id, TimePoint now) const {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_estimates.find(skill_id);
    if (it == m_estimates.end()) return std::nullopt;

    MasteryEstimate e = it->second;
    e.confidence = decayed_confidence(e.confidence, now - e.updated_at, m_cfg);
    return e;
}

std::map<std::string, MasteryEstimate> MasteryModel::snapshot(TimePoint now) const {
    std::lock_guard<std::mutex> lock(m_mu);
    std::map<std::string, MasteryEstimate> out = m_estimates;
    for (auto& [skill_id, e] : out) {
        e.confidence = decayed_confidence(e.confidence, now - e.updated_at, m_cfg);
    }
    return out;
}

std::map<std::string, MasteryEstimate> MasteryModel::raw_estimates() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_estimates;
}

std::map<std::string, std::vector<MasteryPoint>> MasteryModel::raw_history() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_history;
}

std::map<std::string, double> MasteryModel::gap(const std::string& role) const {
    const RoleTargets& targets = m_graph->role_targets(role);

    std::lock_guard<std::mutex> lock(m_mu);
    std::map<std::string, double> out;
    for (const auto& [skill_id, target] : targets) {
        double mastery = 0.0;
        auto it = m_estimates.find(skill_id);
        if (it != m_estimates.end()) mastery = it->second.mastery;

        const double g = target - mastery;
        if (g > 0.0) out[skill_id] = g;
    }
    return out;
}

std::vector<std::string> MasteryModel::rank_weakest(const std::vector<std::string>& candidates,
                                                    size_t n,
                                                    TimePoint now) const {
    struct Ranked {
        double product;
        size_t position;
        std::string id;
    };

    std::vector<Ranked> ranked;
    ranked.reserve(candidates.size());
    {
        std::lock_guard<std::mutex> lock(m_mu);
        for (const auto& id : candidates) {
            double product = 0.0;
            auto it = m_estimates.find(id);
            if (it != m_estimates.end()) {
                const double c = decayed_confidence(it->second.confidence, now - it->second.updated_at, m_cfg);
                product = it->second.mastery * c;
            }
            ranked.push_back(Ranked{product, m_graph->position(id), id});
        }
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.product != b.product) return a.product < b.product;
        return a.position < b.position;
    });

    std::vector<std::string> out;
    out.reserve(std::min(n, ranked.size()));
    for (size_t i = 0; i < ranked.size() && out.size() < n; ++i) out.push_back(ranked[i].id);
    return out;
}

std::vector<std::string> MasteryModel::weakest_uncertain(size_t n, TimePoint now) const {
    return rank_weakest(m_graph->topological_order(), n, now);
}

std::vector<std::string> MasteryModel::weakest_uncertain(size_t n, TimePoint now, const std::string& role) const {
    const RoleTargets& targets = m_graph->role_targets(role);
    std::vector<std::string> candidates;
    candidates.reserve(targets.size());
    for (const auto& [skill_id, target] : targets) candidates.push_back(skill_id);
    return rank_weakest(candidates, n, now);
}

std::vector<MasteryPoint> MasteryModel::history(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_history.find(skill_id);
    if (it == m_history.end()) return {};
    return it->second;
}

std::uint64_t MasteryModel::version() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_version;
}

}  // namespace skills
