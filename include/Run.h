#pragma once

#include <chrono>
#include <optional>
#include <string>

/// Immutable record of one sonication run.
struct Run
{
    std::string id;
    std::string name;
    bool successFlag = false;
    std::string note;
    std::string sessionId;
    std::string solutionId;
};

/// Local time as YYYYmmdd_HHMMSS_ffffff (microseconds).
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/// id is `<session>_<timestamp>` (timestamp alone without a session), name
/// is `Run_<timestamp>`.
Run makeRun(bool success,
            const std::string& note,
            const std::optional<std::string>& sessionId,
            const std::string& solutionId,
            std::chrono::system_clock::time_point time);
