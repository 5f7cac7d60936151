#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "Database.h"
#include "Serialization.h"

/// Database laid out as a folder hierarchy of compact JSON records:
///
///   <root>/subjects/<subject>/<subject>.json
///   <root>/subjects/<subject>/sessions/<session>/<session>.json
///   <root>/subjects/<subject>/sessions/<session>/solutions/<id>/<id>.json
///   <root>/subjects/<subject>/sessions/<session>/runs/<id>/<id>.json
///   <root>/subjects/<subject>/volumes/<volume>/<volume>.json
///   <root>/transducers/<id>/<id>.json
///   <root>/protocols/<id>/<id>.json
///
/// Only MINC volume data (.mnc) can be read.
class DirectoryDatabase : public Database
{
public:
    /// @throws std::runtime_error if `root` is not a directory
    explicit DirectoryDatabase(const std::string& root);

    const std::filesystem::path& root() const { return root_; }

    /// Axis convention given to transducer records that name none.
    void setDefaultTransducerAxes(const std::string& axes) { defaultAxes_ = axes; }

    std::vector<std::string> subjectIds() const override;
    std::vector<std::string> sessionIds(const std::string& subjectId) const override;

    SessionDefinition loadSession(const std::string& subjectId,
                                  const std::string& sessionId) const override;

    std::vector<std::string> volumeFileCandidates(const std::string& subjectId,
                                                  const std::string& volumeId) const override;
    Volume loadVolume(const std::string& path) const override;

    TransducerDefinition loadTransducer(const std::string& transducerId) const override;
    ProtocolDefinition loadProtocol(const std::string& protocolId) const override;

    void writeSession(const SessionDefinition& session) override;
    void writeSolution(const SessionDefinition& session, const Solution& solution) override;
    void writeRun(const SessionDefinition& session, const Run& run) override;

    // --- Records not needed by the planner core, used to populate a database ---

    SubjectRecord loadSubject(const std::string& subjectId) const;
    VolumeRecord loadVolumeRecord(const std::string& subjectId, const std::string& volumeId) const;

    void writeSubject(const SubjectRecord& subject);
    void writeVolumeRecord(const std::string& subjectId, const VolumeRecord& volume);
    void writeTransducer(const TransducerDefinition& transducer);
    void writeProtocol(const ProtocolDefinition& protocol);

    /// True if `filename` ends in a volume extension this database recognises.
    static bool isVolumeFile(const std::string& filename);

private:
    std::filesystem::path subjectDir(const std::string& subjectId) const;
    std::filesystem::path sessionDir(const std::string& subjectId, const std::string& sessionId) const;
    std::filesystem::path volumeDir(const std::string& subjectId, const std::string& volumeId) const;

    std::filesystem::path root_;
    std::string defaultAxes_ = "LPS";
};
