#include "Session.h"

#include <algorithm>
#include <utility>

#include "CoordinateFrame.h"
#include "Registry.h"
#include "Transducer.h"
#include "Volume.h"

Session::Session(SessionDefinition definition, ArtifactId volume, std::vector<ArtifactId> targets)
    : definition_(std::move(definition)), volume_(volume), targets_(std::move(targets))
{
}

bool Session::ownsTarget(ArtifactId id) const
{
    return std::find(targets_.begin(), targets_.end(), id) != targets_.end();
}

ArtifactId Session::findTarget(const SceneHost& scene, const std::string& targetId) const
{
    for (ArtifactId id : targets_)
    {
        if (scene.contains(id) && targetIdOf(scene, id) == targetId)
            return id;
    }
    return kNoArtifact;
}

void Session::addTargetArtifact(ArtifactId id)
{
    if (!ownsTarget(id))
        targets_.push_back(id);
}

bool Session::forgetArtifact(ArtifactId id)
{
    if (id == kNoArtifact)
        return false;
    if (id == volume_)
    {
        volume_ = kNoArtifact;
        return true;
    }
    auto it = std::find(targets_.begin(), targets_.end(), id);
    if (it == targets_.end())
        return false;
    targets_.erase(it);
    return true;
}

bool Session::isValid(const Registry& registry) const
{
    if (!registry.hasTransducer(definition_.transducerId))
        return false;
    if (!registry.hasProtocol(definition_.protocolId))
        return false;

    const SceneHost& scene = registry.scene();
    auto kind = scene.kindOf(volume_);
    if (!kind || *kind != ArtifactKind::Volume)
        return false;
    return scene.volume(volume_).id == definition_.volumeId;
}

void Session::approveVirtualFit(const std::optional<std::string>& targetId)
{
    definition_.virtualFitApprovalForTargetId = targetId;
}

bool Session::toggleTrackingApproval()
{
    definition_.transducerTrackingApproved = !definition_.transducerTrackingApproved;
    return definition_.transducerTrackingApproved;
}

SessionDefinition Session::syncFromScene(const SceneHost& scene,
                                         const Transducer& transducer,
                                         const std::vector<ArtifactId>& targets)
{
    std::vector<TargetRecord> records;
    for (ArtifactId id : targets)
    {
        if (isTargetCandidate(scene, id))
            records.push_back(targetToRecord(targetFromArtifact(scene, id)));
    }
    definition_.targets = std::move(records);

    definition_.transducerId = transducer.id();
    definition_.arrayTransform.matrix = matrixToRowMajor(transducer.nativePlacement(scene));
    definition_.arrayTransform.units = transducer.definition().units;
    return definition_;
}
