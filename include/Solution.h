#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "Protocol.h"
#include "Resample.h"
#include "SceneHost.h"
#include "TargetPoint.h"
#include "Transducer.h"

struct BeamformResult
{
    std::vector<double> delays;       // s, one per element
    std::vector<double> apodization;  // 0..1, one per element
};

struct SimulationResult
{
    ScalarField pnp;        // peak negative pressure
    ScalarField intensity;  // time-averaged intensity
};

/// The opaque physics / beamforming library.  Calls may be long running and
/// are made synchronously; exceptions propagate to the caller unmodified.
class PlanningBackend
{
public:
    virtual ~PlanningBackend() = default;

    /// `focus` is in the transducer's native frame and units; `medium` is the
    /// subject volume resampled onto the protocol's simulation grid.
    virtual BeamformResult beamform(const TransducerDefinition& transducer,
                                    const glm::dvec3& focus,
                                    const ScalarField& medium,
                                    const ProtocolDefinition& protocol) = 0;

    virtual SimulationResult simulate(const TransducerDefinition& transducer,
                                      const ScalarField& medium,
                                      const BeamformResult& beamform,
                                      const ProtocolDefinition& protocol) = 0;
};

struct FocusResult
{
    glm::dvec3 focus{0.0};  // native transducer frame
    BeamformResult beamform;
    SimulationResult simulation;
};

/// Output of a planning computation.
struct Solution
{
    std::string id;
    std::string name;
    std::string sessionId;
    std::string protocolId;
    std::string transducerId;
    std::string targetId;
    std::string units = "mm";  // units of the focus positions

    std::vector<FocusResult> foci;
    ScalarField pnp;        // per-voxel max over foci
    ScalarField intensity;  // per-voxel mean over foci

    bool approved = false;

    /// Scene artifacts for the aggregated fields, once embedded.
    ArtifactId pnpArtifact = kNoArtifact;
    ArtifactId intensityArtifact = kNoArtifact;

    bool ownsArtifact(ArtifactId id) const
    {
        return id != kNoArtifact && (id == pnpArtifact || id == intensityArtifact);
    }
};

/// Fill solution.pnp (max) and solution.intensity (mean) from the foci.
/// @throws std::invalid_argument with no foci
/// @throws ShapeMismatch if the per-focus grids differ
void aggregateFields(Solution& solution);

/// Run the planning pipeline for one target.
///
/// The target is taken into the transducer frame with the inverse
/// placement, the volume is resampled onto the protocol grid riding on the
/// placement, the focal pattern is expanded around the target and each focus
/// is beamformed and simulated.  The id is `<session>_<timestamp>`.
Solution generateSolution(PlanningBackend& backend,
                          const TransducerDefinition& transducer,
                          const glm::dmat4& placement,
                          const TargetPoint& target,
                          const Volume& volume,
                          const glm::dmat4& worldToVolumeIndex,
                          const ProtocolDefinition& protocol,
                          BoundaryPolicy policy,
                          const std::optional<std::string>& sessionId,
                          std::chrono::system_clock::time_point time);
