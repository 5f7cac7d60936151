#pragma once

#include <array>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "SceneHost.h"

/// A labelled point in world anatomical space (RAS, mm).
struct TargetPoint
{
    std::string id;
    std::string name;
    glm::dvec3 position{0.0};
    glm::dvec3 colour{1.0, 0.0, 0.0};
    double radius = 1.0;
};

/// Scene attribute holding the id of the target an artifact was made from.
/// The artifact's own name may differ when it had to be made unique.
constexpr const char* kTargetIdAttribute = "lifu.target_id";

/// Persisted form of a target.  `dims` are the axis labels the position is
/// expressed in and `units` its length unit.
struct TargetRecord
{
    std::string id;
    std::string name;
    std::array<double, 3> color = {1.0, 0.0, 0.0};
    double radius = 1.0;
    std::array<double, 3> position = {0.0, 0.0, 0.0};
    std::array<std::string, 3> dims = {"R", "A", "S"};
    std::string units = "mm";
};

/// Decode a record into world RAS mm.
/// @throws InvalidAxisLabel, UnknownUnit
TargetPoint targetFromRecord(const TargetRecord& record);

/// Encode a world target; always written as RAS mm.
TargetRecord targetToRecord(const TargetPoint& target);

/// A target artifact qualifies as a planning target only while it holds
/// exactly one control point.
bool isTargetCandidate(const SceneHost& scene, ArtifactId id);

std::vector<ArtifactId> targetCandidates(const SceneHost& scene);

/// Target id of an artifact: its id attribute, else the artifact name.
std::string targetIdOf(const SceneHost& scene, ArtifactId id);

/// Read a candidate artifact back as a target.  The name is the control
/// point label, falling back to the id.
/// @throws std::invalid_argument if the artifact is not a candidate.
TargetPoint targetFromArtifact(const SceneHost& scene, ArtifactId id);

/// Add a single-point target artifact.  Its scene name is the target id
/// made unique; the id itself is kept in kTargetIdAttribute and the name
/// becomes the point label.
ArtifactId addTargetArtifact(SceneHost& scene, const TargetPoint& target);
