#pragma once

#include <string>
#include <vector>

#include "Protocol.h"
#include "Run.h"
#include "Session.h"
#include "Solution.h"
#include "Transducer.h"
#include "Volume.h"

/// Persistence boundary.  Implementations throw on any failure; the planner
/// propagates those exceptions unmodified.
class Database
{
public:
    virtual ~Database() = default;

    virtual std::vector<std::string> subjectIds() const = 0;
    virtual std::vector<std::string> sessionIds(const std::string& subjectId) const = 0;

    virtual SessionDefinition loadSession(const std::string& subjectId,
                                          const std::string& sessionId) const = 0;

    /// Every readable-looking file that could hold the volume's data.  The
    /// caller decides what zero or several candidates mean.
    virtual std::vector<std::string> volumeFileCandidates(const std::string& subjectId,
                                                          const std::string& volumeId) const = 0;
    virtual Volume loadVolume(const std::string& path) const = 0;

    virtual TransducerDefinition loadTransducer(const std::string& transducerId) const = 0;
    virtual ProtocolDefinition loadProtocol(const std::string& protocolId) const = 0;

    virtual void writeSession(const SessionDefinition& session) = 0;
    virtual void writeSolution(const SessionDefinition& session, const Solution& solution) = 0;
    virtual void writeRun(const SessionDefinition& session, const Run& run) = 0;
};
