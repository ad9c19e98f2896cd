#pragma once

#include <stdexcept>
#include <string>

namespace skills {

// Malformed skill graph (cycle, dangling prerequisite, bad document). Fatal at load.
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& what) : std::runtime_error(what) {}
};

class UnknownRoleError : public std::runtime_error {
public:
    explicit UnknownRoleError(const std::string& role)
        : std::runtime_error("unknown role: " + role), m_role(role) {}

    const std::string& role() const { return m_role; }

private:
    std::string m_role;
};

// A learner already has an interview session in progress.
class SessionConflictError : public std::runtime_error {
public:
    SessionConflictError(const std::string& learner_id, const std::string& active_session_id)
        : std::runtime_error("learner " + learner_id + " already has session " + active_session_id + " in progress"),
          m_active(active_session_id) {}

    const std::string& active_session_id() const { return m_active; }

private:
    std::string m_active;
};

// An external capability (text analysis, response judgment) did not answer in time.
// Recoverable; never to be read as "no data".
class CapabilityTimeoutError : public std::runtime_error {
public:
    explicit CapabilityTimeoutError(const std::string& what) : std::runtime_error(what) {}
};

// Out-of-range or otherwise malformed value rejected at a boundary.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace skills
