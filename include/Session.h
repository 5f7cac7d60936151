#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "SceneHost.h"
#include "TargetPoint.h"

class Registry;
class Transducer;

/// Transducer placement as persisted: row-major 4x4 plus the unit of its
/// translation column.
struct ArrayTransform
{
    std::array<double, 16> matrix = {1.0, 0.0, 0.0, 0.0,
                                     0.0, 1.0, 0.0, 0.0,
                                     0.0, 0.0, 1.0, 0.0,
                                     0.0, 0.0, 0.0, 1.0};
    std::string units = "mm";
};

/// Persisted session record.
struct SessionDefinition
{
    std::string id;
    std::string name;
    std::string subjectId;
    std::string protocolId;
    std::string transducerId;
    std::string volumeId;
    ArrayTransform arrayTransform;
    std::vector<TargetRecord> targets;
    std::optional<std::string> virtualFitApprovalForTargetId;
    bool transducerTrackingApproved = false;
};

/// The active session: its record plus the volume and target artifacts it
/// owns in the scene.  Everything else is referenced by id and resolved
/// through the Registry.
class Session
{
public:
    Session(SessionDefinition definition, ArtifactId volume, std::vector<ArtifactId> targets);

    const SessionDefinition& definition() const { return definition_; }
    const std::string& id() const { return definition_.id; }
    const std::string& subjectId() const { return definition_.subjectId; }
    const std::string& transducerId() const { return definition_.transducerId; }
    const std::string& protocolId() const { return definition_.protocolId; }
    const std::string& volumeId() const { return definition_.volumeId; }

    ArtifactId volumeArtifact() const { return volume_; }
    const std::vector<ArtifactId>& targetArtifacts() const { return targets_; }
    bool ownsTarget(ArtifactId id) const;

    /// The owned target artifact carrying `targetId`, or kNoArtifact.
    ArtifactId findTarget(const SceneHost& scene, const std::string& targetId) const;

    void addTargetArtifact(ArtifactId id);

    /// Drop an artifact that left the scene.  Returns true if it was ours.
    bool forgetArtifact(ArtifactId id);

    /// True iff the transducer and protocol are loaded in `registry` and the
    /// volume artifact is still in its scene under this session's volume id.
    bool isValid(const Registry& registry) const;

    // --- Approvals ---

    /// Set or clear the single virtual-fit approval.
    void approveVirtualFit(const std::optional<std::string>& targetId);
    const std::optional<std::string>& virtualFitApprovedTarget() const
    {
        return definition_.virtualFitApprovalForTargetId;
    }

    /// Returns the new state.
    bool toggleTrackingApproval();
    bool trackingApproved() const { return definition_.transducerTrackingApproved; }
    void revokeTrackingApproval() { definition_.transducerTrackingApproved = false; }

    /// Rewrite the record's targets from the given target artifacts and its
    /// array transform from the transducer's current placement, expressed in
    /// the transducer's native units.  Returns the updated record.
    SessionDefinition syncFromScene(const SceneHost& scene,
                                    const Transducer& transducer,
                                    const std::vector<ArtifactId>& targets);

private:
    SessionDefinition definition_;
    ArtifactId volume_ = kNoArtifact;
    std::vector<ArtifactId> targets_;
};
