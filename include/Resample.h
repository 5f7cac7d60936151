#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "Volume.h"

/// How samples outside the source volume are produced.
enum class BoundaryPolicy
{
    ClampToEdge,  ///< nearest edge sample (the default)
    Zero          ///< constant zero outside the volume
};

/// A regularly spaced grid living in a transducer's (or any local) frame.
/// Index (i, j, k) sits at origin + (i, j, k) * spacing, in `units`.
struct SimulationGrid
{
    glm::dvec3 origin{0.0};
    glm::dvec3 spacing{1.0};
    glm::ivec3 shape{0, 0, 0};
    std::string units = "mm";

    std::size_t size() const
    {
        return static_cast<std::size_t>(shape.x) * shape.y * shape.z;
    }

    /// Grid index to local coordinates expressed in `localUnits`.
    glm::dmat4 indexToLocal(const std::string& localUnits) const;

    bool sameGeometry(const SimulationGrid& other, double tol = 1e-9) const;
};

/// Samples on a SimulationGrid, X fastest like Volume::data.
struct ScalarField
{
    std::string name;
    SimulationGrid grid;
    std::vector<double> data;

    double at(int i, int j, int k) const
    {
        return data[(static_cast<std::size_t>(k) * grid.shape.y + j) * grid.shape.x + i];
    }
};

/// Trilinear (order-1) resampling.  For each output index p the source is
/// sampled at outputIndexToSourceIndex * p.  Samples at integer source
/// positions are reproduced exactly.
std::vector<double> resample(const Volume& source,
                             const glm::dmat4& outputIndexToSourceIndex,
                             const glm::ivec3& outputShape,
                             BoundaryPolicy policy = BoundaryPolicy::ClampToEdge);

/// Resample a volume onto a grid that lives in a local frame.
///
/// Composition, innermost first: grid index -> local (localUnits),
/// local -> world (`localToWorld`, e.g. a transducer placement), and
/// world -> source index (`worldToSourceIndex`, see worldToVolumeIndex).
ScalarField resampleVolumeToGrid(const Volume& volume,
                                 const glm::dmat4& worldToSourceIndex,
                                 const glm::dmat4& localToWorld,
                                 const std::string& localUnits,
                                 const SimulationGrid& grid,
                                 BoundaryPolicy policy = BoundaryPolicy::ClampToEdge);

/// The inverse direction: wrap a field already known to live in a local
/// frame as a Volume whose index-to-world matrix is the grid's index-to-local
/// map.  Parenting the result to the local frame's placement in the scene
/// makes it follow that placement.
Volume embedFieldInPlacedVolume(const ScalarField& field, const std::string& localUnits);
