#pragma once

#include <array>
#include <string>
#include <vector>

#include "Protocol.h"
#include "Run.h"
#include "Session.h"
#include "Solution.h"
#include "Transducer.h"

// Compact JSON forms of everything that crosses the persistence boundary.
// Writers throw std::runtime_error if glaze cannot serialize; readers throw
// std::runtime_error carrying glaze's formatted parse error.  Readers fill an
// existing object, so fields missing from the JSON keep their prior values.

struct SubjectRecord
{
    std::string id;
    std::string name;
};

struct VolumeRecord
{
    std::string id;
    std::string name;
    std::string dataFilename;
};

struct FocusRecord
{
    std::array<double, 3> position = {0.0, 0.0, 0.0};
    std::vector<double> delays;
    std::vector<double> apodization;
};

/// What is written for a solution; the raw fields stay in memory and are
/// summarised by their grid and peak values.
struct SolutionRecord
{
    std::string id;
    std::string name;
    std::string sessionId;
    std::string protocolId;
    std::string transducerId;
    std::string targetId;
    std::string units = "mm";
    bool approved = false;
    std::vector<FocusRecord> foci;
    std::array<int, 3> gridShape = {0, 0, 0};
    std::array<double, 3> gridOrigin = {0.0, 0.0, 0.0};
    std::array<double, 3> gridSpacing = {1.0, 1.0, 1.0};
    std::string gridUnits = "mm";
    double pnpMax = 0.0;
    double intensityMax = 0.0;
};

SolutionRecord solutionToRecord(const Solution& solution);

std::string toJson(const SessionDefinition& session);
std::string toJson(const TransducerDefinition& transducer);
std::string toJson(const ProtocolDefinition& protocol);
std::string toJson(const SolutionRecord& solution);
std::string toJson(const Run& run);
std::string toJson(const SubjectRecord& subject);
std::string toJson(const VolumeRecord& volume);

void fromJson(const std::string& json, SessionDefinition& session);
void fromJson(const std::string& json, TransducerDefinition& transducer);
void fromJson(const std::string& json, ProtocolDefinition& protocol);
void fromJson(const std::string& json, SolutionRecord& solution);
void fromJson(const std::string& json, Run& run);
void fromJson(const std::string& json, SubjectRecord& subject);
void fromJson(const std::string& json, VolumeRecord& volume);
