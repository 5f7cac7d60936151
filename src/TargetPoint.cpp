#include "TargetPoint.h"

#include <optional>
#include <stdexcept>

#include "CoordinateFrame.h"

TargetPoint targetFromRecord(const TargetRecord& record)
{
    std::vector<std::string> labels(record.dims.begin(), record.dims.end());
    glm::dmat3 axes = axisFrameToAnatomicalMatrix(labels);
    double scale = unitScaleFactor(record.units);

    TargetPoint t;
    t.id = record.id;
    t.name = record.name.empty() ? record.id : record.name;
    t.position = axes * glm::dvec3(record.position[0], record.position[1], record.position[2]) * scale;
    t.colour = glm::dvec3(record.color[0], record.color[1], record.color[2]);
    t.radius = record.radius;
    return t;
}

TargetRecord targetToRecord(const TargetPoint& target)
{
    TargetRecord r;
    r.id = target.id;
    r.name = target.name;
    r.color = {target.colour.x, target.colour.y, target.colour.z};
    r.radius = target.radius;
    r.position = {target.position.x, target.position.y, target.position.z};
    r.dims = {"R", "A", "S"};
    r.units = "mm";
    return r;
}

bool isTargetCandidate(const SceneHost& scene, ArtifactId id)
{
    auto kind = scene.kindOf(id);
    if (!kind || *kind != ArtifactKind::Target)
        return false;
    return scene.targetPoints(id).size() == 1;
}

std::vector<ArtifactId> targetCandidates(const SceneHost& scene)
{
    std::vector<ArtifactId> ids;
    for (ArtifactId id : scene.artifactsOfKind(ArtifactKind::Target))
    {
        if (isTargetCandidate(scene, id))
            ids.push_back(id);
    }
    return ids;
}

TargetPoint targetFromArtifact(const SceneHost& scene, ArtifactId id)
{
    if (!isTargetCandidate(scene, id))
        throw std::invalid_argument("Artifact " + std::to_string(id) +
                                    " is not a target with exactly one point");

    TargetPoint t;
    t.id = targetIdOf(scene, id);
    t.name = scene.targetLabel(id);
    if (t.name.empty())
        t.name = t.id;
    t.position = scene.targetPoints(id).front();
    t.colour = scene.targetColour(id);
    t.radius = scene.targetRadius(id);
    return t;
}

std::string targetIdOf(const SceneHost& scene, ArtifactId id)
{
    std::optional<std::string> stored = scene.attribute(id, kTargetIdAttribute);
    return stored ? *stored : scene.nameOf(id);
}

ArtifactId addTargetArtifact(SceneHost& scene, const TargetPoint& target)
{
    ArtifactId id = scene.addTarget(scene.uniqueName(target.id), {target.position}, target.colour);
    scene.setAttribute(id, kTargetIdAttribute, target.id);
    scene.setTargetDisplay(id, target.name.empty() ? target.id : target.name, target.radius);
    return id;
}
