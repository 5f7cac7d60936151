#include "DirectoryDatabase.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

static const char* const kVolumeExtensions[] = {
    ".mnc", ".nii", ".nii.gz", ".nrrd", ".nhdr", ".mha", ".mhd"
};

static std::string readTextFile(const fs::path& path)
{
    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open database record: " + path.string());
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static void writeTextFile(const fs::path& path, const std::string& content)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
        throw std::runtime_error("Cannot create database directory: " +
                                 path.parent_path().string() + " (" + ec.message() + ")");

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Cannot write database record: " + path.string());
    ofs << content;
}

template <class T>
static void readRecordFile(const fs::path& path, T& record)
{
    std::string json = readTextFile(path);
    try
    {
        fromJson(json, record);
    }
    catch (const std::runtime_error& e)
    {
        throw std::runtime_error(path.string() + ": " + e.what());
    }
}

/// Names of the subdirectories of `dir`, sorted.  Missing dir gives none.
static std::vector<std::string> childDirectories(const fs::path& dir)
{
    std::vector<std::string> names;
    if (!fs::is_directory(dir))
        return names;
    for (const auto& entry : fs::directory_iterator(dir))
    {
        if (entry.is_directory())
            names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

static bool endsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ---------------------------------------------------------------------------

DirectoryDatabase::DirectoryDatabase(const std::string& root)
    : root_(root)
{
    if (!fs::is_directory(root_))
        throw std::runtime_error("Database directory does not exist: " + root);
}

fs::path DirectoryDatabase::subjectDir(const std::string& subjectId) const
{
    return root_ / "subjects" / subjectId;
}

fs::path DirectoryDatabase::sessionDir(const std::string& subjectId, const std::string& sessionId) const
{
    return subjectDir(subjectId) / "sessions" / sessionId;
}

fs::path DirectoryDatabase::volumeDir(const std::string& subjectId, const std::string& volumeId) const
{
    return subjectDir(subjectId) / "volumes" / volumeId;
}

bool DirectoryDatabase::isVolumeFile(const std::string& filename)
{
    for (const char* ext : kVolumeExtensions)
    {
        if (endsWith(filename, ext))
            return true;
    }
    return false;
}

std::vector<std::string> DirectoryDatabase::subjectIds() const
{
    return childDirectories(root_ / "subjects");
}

std::vector<std::string> DirectoryDatabase::sessionIds(const std::string& subjectId) const
{
    return childDirectories(subjectDir(subjectId) / "sessions");
}

SessionDefinition DirectoryDatabase::loadSession(const std::string& subjectId,
                                                 const std::string& sessionId) const
{
    SessionDefinition session;
    readRecordFile(sessionDir(subjectId, sessionId) / (sessionId + ".json"), session);
    if (session.subjectId.empty())
        session.subjectId = subjectId;
    return session;
}

std::vector<std::string> DirectoryDatabase::volumeFileCandidates(const std::string& subjectId,
                                                                 const std::string& volumeId) const
{
    VolumeRecord record = loadVolumeRecord(subjectId, volumeId);
    fs::path dir = volumeDir(subjectId, volumeId);

    // Any file sharing the data file's stem up to its first '.'.
    std::string stem = record.dataFilename.substr(0, record.dataFilename.find('.'));
    std::string prefix = stem + ".";

    std::vector<std::string> candidates;
    if (!fs::is_directory(dir))
        return candidates;
    for (const auto& entry : fs::directory_iterator(dir))
    {
        if (!entry.is_regular_file())
            continue;
        std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0 && isVolumeFile(name))
            candidates.push_back(entry.path().string());
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

Volume DirectoryDatabase::loadVolume(const std::string& path) const
{
    if (!endsWith(path, ".mnc"))
        throw std::runtime_error("Unsupported volume format (only MINC .mnc is readable): " + path);

    Volume volume;
    volume.load(path);
    return volume;
}

TransducerDefinition DirectoryDatabase::loadTransducer(const std::string& transducerId) const
{
    TransducerDefinition transducer;
    transducer.axes = defaultAxes_;
    readRecordFile(root_ / "transducers" / transducerId / (transducerId + ".json"), transducer);
    return transducer;
}

ProtocolDefinition DirectoryDatabase::loadProtocol(const std::string& protocolId) const
{
    ProtocolDefinition protocol;
    readRecordFile(root_ / "protocols" / protocolId / (protocolId + ".json"), protocol);
    return protocol;
}

void DirectoryDatabase::writeSession(const SessionDefinition& session)
{
    if (session.subjectId.empty())
        throw std::invalid_argument("Session '" + session.id + "' has no subject id");
    fs::path path = sessionDir(session.subjectId, session.id) / (session.id + ".json");
    writeTextFile(path, toJson(session));
    std::cerr << "[database] wrote session " << path.string() << "\n";
}

void DirectoryDatabase::writeSolution(const SessionDefinition& session, const Solution& solution)
{
    fs::path path = sessionDir(session.subjectId, session.id) / "solutions" / solution.id /
                    (solution.id + ".json");
    writeTextFile(path, toJson(solutionToRecord(solution)));
    std::cerr << "[database] wrote solution " << path.string() << "\n";
}

void DirectoryDatabase::writeRun(const SessionDefinition& session, const Run& run)
{
    fs::path path = sessionDir(session.subjectId, session.id) / "runs" / run.id / (run.id + ".json");
    writeTextFile(path, toJson(run));
    std::cerr << "[database] wrote run " << path.string() << "\n";
}

SubjectRecord DirectoryDatabase::loadSubject(const std::string& subjectId) const
{
    SubjectRecord subject;
    readRecordFile(subjectDir(subjectId) / (subjectId + ".json"), subject);
    return subject;
}

VolumeRecord DirectoryDatabase::loadVolumeRecord(const std::string& subjectId,
                                                 const std::string& volumeId) const
{
    VolumeRecord record;
    readRecordFile(volumeDir(subjectId, volumeId) / (volumeId + ".json"), record);
    return record;
}

void DirectoryDatabase::writeSubject(const SubjectRecord& subject)
{
    writeTextFile(subjectDir(subject.id) / (subject.id + ".json"), toJson(subject));
}

void DirectoryDatabase::writeVolumeRecord(const std::string& subjectId, const VolumeRecord& volume)
{
    writeTextFile(volumeDir(subjectId, volume.id) / (volume.id + ".json"), toJson(volume));
}

void DirectoryDatabase::writeTransducer(const TransducerDefinition& transducer)
{
    writeTextFile(root_ / "transducers" / transducer.id / (transducer.id + ".json"), toJson(transducer));
}

void DirectoryDatabase::writeProtocol(const ProtocolDefinition& protocol)
{
    writeTextFile(root_ / "protocols" / protocol.id / (protocol.id + ".json"), toJson(protocol));
}
