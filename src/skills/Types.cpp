#include "skills/Types.hpp"
#include "skills/Errors.hpp"

#include <cmath>
#include <sstream>

namespace skills {

bool in_unit_range(double x) {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

void validate_observation(const Observation& o) {
    if (o.skill.empty()) {
        throw ValidationError("observation has empty skill id");
    }
    if (!in_unit_range(o.strength)) {
        std::ostringstream oss;
        oss << "observation for " << o.skill << ": strength " << o.strength << " outside [0,1]";
        throw ValidationError(oss.str());
    }
    if (!in_unit_range(o.source_confidence)) {
        std::ostringstream oss;
        oss << "observation for " << o.skill << ": source confidence " << o.source_confidence << " outside [0,1]";
        throw ValidationError(oss.str());
    }
}

Observation make_observation(const std::string& skill,
                             double strength,
                             double source_confidence,
                             SourceTag source,
                             TimePoint observed_at) {
    Observation o;
    o.skill = skill;
    o.strength = strength;
    o.source_confidence = source_confidence;
    o.source = source;
    o.observed_at = observed_at;
    validate_observation(o);
    return o;
}

const char* tier_str(Tier t) {
    switch (t) {
        case Tier::Foundational: return "foundational";
        case Tier::Intermediate: return "intermediate";
        case Tier::Advanced: return "advanced";
        default: return "unknown";
    }
}

Tier parse_tier(const std::string& s) {
    if (s == "foundational") return Tier::Foundational;
    if (s == "intermediate") return Tier::Intermediate;
    if (s == "advanced") return Tier::Advanced;
    throw ValidationError("unknown difficulty tier: " + s);
}

const char* source_tag_str(SourceTag s) {
    switch (s) {
        case SourceTag::Resume: return "resume";
        case SourceTag::Repository: return "repository";
        case SourceTag::Interview: return "interview";
        case SourceTag::Manual: return "manual";
        default: return "unknown";
    }
}

SourceTag parse_source_tag(const std::string& s) {
    if (s == "resume") return SourceTag::Resume;
    if (s == "repository") return SourceTag::Repository;
    if (s == "interview") return SourceTag::Interview;
    if (s == "manual") return SourceTag::Manual;
    throw ValidationError("unknown source tag: " + s);
}

Level level_for(double mastery) {
    if (mastery >= 0.8) return Level::Expert;
    if (mastery >= 0.6) return Level::Advanced;
    if (mastery >= 0.4) return Level::Intermediate;
    return Level::Beginner;
}

const char* level_str(Level l) {
    switch (l) {
        case Level::Beginner: return "Beginner";
        case Level::Intermediate: return "Intermediate";
        case Level::Advanced: return "Advanced";
        case Level::Expert: return "Expert";
        default: return "Unknown";
    }
}

long long to_epoch_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_epoch_ms(long long ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace skills
