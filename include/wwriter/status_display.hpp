#pragma once

#include "recording_session.hpp"
#include <string>

namespace wwriter {

// Shows session progress to the user. Called from session worker threads.
class StatusDisplay {
public:
    virtual ~StatusDisplay() = default;

    virtual void update(SessionState state, const std::string& text) = 0;
};

// Status lines on stdout
class ConsoleStatusDisplay : public StatusDisplay {
public:
    void update(SessionState state, const std::string& text) override;
};

} // namespace wwriter
