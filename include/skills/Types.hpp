#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace skills {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Tier {
    Foundational = 0,
    Intermediate = 1,
    Advanced = 2
};

enum class SourceTag {
    Resume,
    Repository,
    Interview,
    Manual
};

// Reporting bands over mastery (Beginner < 0.4 <= Intermediate < 0.6 <= Advanced < 0.8 <= Expert)
enum class Level {
    Beginner,
    Intermediate,
    Advanced,
    Expert
};

struct Skill {
    std::string id;
    std::string name;
    std::vector<std::string> prerequisites;  // skill ids
    std::vector<std::string> aliases;        // extra surface forms for extraction
    Tier tier = Tier::Foundational;
};

struct Observation {
    std::string skill;
    double strength = 0.0;           // 0..1
    double source_confidence = 0.0;  // 0..1
    SourceTag source = SourceTag::Manual;
    TimePoint observed_at{};
};

struct MasteryEstimate {
    double mastery = 0.0;     // 0..1
    double confidence = 0.0;  // 0..1
    TimePoint updated_at{};
};

// Builds an observation, rejecting out-of-range values (never clamps).
Observation make_observation(const std::string& skill,
                             double strength,
                             double source_confidence,
                             SourceTag source,
                             TimePoint observed_at);

void validate_observation(const Observation& o);

const char* tier_str(Tier t);
Tier parse_tier(const std::string& s);  // throws ValidationError

const char* source_tag_str(SourceTag s);
SourceTag parse_source_tag(const std::string& s);  // throws ValidationError

Level level_for(double mastery);
const char* level_str(Level l);

bool in_unit_range(double x);

// milliseconds since epoch, used for every serialized timestamp
long long to_epoch_ms(TimePoint t);
TimePoint from_epoch_ms(long long ms);

}  // namespace skills
