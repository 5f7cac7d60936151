#include "Run.h"

#include <cstdio>
#include <ctime>
#include <stdexcept>

std::string formatTimestamp(std::chrono::system_clock::time_point time)
{
    using namespace std::chrono;

    std::time_t seconds = system_clock::to_time_t(time);
    long long micros = duration_cast<microseconds>(time.time_since_epoch()).count() % 1000000;
    if (micros < 0)
        micros += 1000000;

    std::tm local{};
    if (!localtime_r(&seconds, &local))
        throw std::runtime_error("Cannot convert time to local time");

    char date[32];
    if (std::strftime(date, sizeof(date), "%Y%m%d_%H%M%S", &local) == 0)
        throw std::runtime_error("Cannot format timestamp");

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%s_%06lld", date, micros);
    return buffer;
}

Run makeRun(bool success,
            const std::string& note,
            const std::optional<std::string>& sessionId,
            const std::string& solutionId,
            std::chrono::system_clock::time_point time)
{
    std::string ts = formatTimestamp(time);

    Run run;
    run.id = sessionId ? *sessionId + "_" + ts : ts;
    run.name = "Run_" + ts;
    run.successFlag = success;
    run.note = note;
    run.sessionId = sessionId.value_or("");
    run.solutionId = solutionId;
    return run;
}
