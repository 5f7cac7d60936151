// Resample.cpp - trilinear resampling between index spaces.
//
// Array axis order is fixed everywhere in the planner: X fastest, then Y,
// then Z, for both Volume::data and ScalarField::data.  Both directions
// (volume -> grid field and field -> embedded volume) rely on it.

#include "Resample.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "CoordinateFrame.h"
#include "Errors.h"

glm::dmat4 SimulationGrid::indexToLocal(const std::string& localUnits) const
{
    double s = unitConversion(units, localUnits);
    glm::dmat4 m(1.0);
    m[0][0] = spacing.x * s;
    m[1][1] = spacing.y * s;
    m[2][2] = spacing.z * s;
    m[3] = glm::dvec4(origin * s, 1.0);
    return m;
}

bool SimulationGrid::sameGeometry(const SimulationGrid& other, double tol) const
{
    if (shape != other.shape || units != other.units)
        return false;
    for (int a = 0; a < 3; ++a)
    {
        if (std::abs(origin[a] - other.origin[a]) > tol ||
            std::abs(spacing[a] - other.spacing[a]) > tol)
            return false;
    }
    return true;
}

namespace
{

/// Value at an integer source index under the boundary policy.
double sampleAt(const Volume& v, int x, int y, int z, BoundaryPolicy policy)
{
    if (policy == BoundaryPolicy::ClampToEdge)
    {
        x = std::clamp(x, 0, v.dimensions.x - 1);
        y = std::clamp(y, 0, v.dimensions.y - 1);
        z = std::clamp(z, 0, v.dimensions.z - 1);
    }
    // Volume::get returns 0 outside, which is the Zero policy.
    return v.get(x, y, z);
}

double trilinear(const Volume& v, const glm::dvec3& p, BoundaryPolicy policy)
{
    glm::dvec3 q = p;
    if (policy == BoundaryPolicy::ClampToEdge)
    {
        // Clamping the position is equivalent to extending edge samples.
        q = glm::clamp(p, glm::dvec3(0.0), glm::dvec3(v.dimensions - 1));
    }

    int x0 = static_cast<int>(std::floor(q.x));
    int y0 = static_cast<int>(std::floor(q.y));
    int z0 = static_cast<int>(std::floor(q.z));
    double fx = q.x - x0;
    double fy = q.y - y0;
    double fz = q.z - z0;

    double result = 0.0;
    for (int dz = 0; dz < 2; ++dz)
    {
        double wz = dz ? fz : 1.0 - fz;
        if (wz == 0.0) continue;
        for (int dy = 0; dy < 2; ++dy)
        {
            double wy = dy ? fy : 1.0 - fy;
            if (wy == 0.0) continue;
            for (int dx = 0; dx < 2; ++dx)
            {
                double wx = dx ? fx : 1.0 - fx;
                if (wx == 0.0) continue;
                result += wx * wy * wz * sampleAt(v, x0 + dx, y0 + dy, z0 + dz, policy);
            }
        }
    }
    return result;
}

} // namespace

std::vector<double> resample(const Volume& source,
                             const glm::dmat4& outputIndexToSourceIndex,
                             const glm::ivec3& outputShape,
                             BoundaryPolicy policy)
{
    if (source.dimensions.x <= 0 || source.dimensions.y <= 0 || source.dimensions.z <= 0)
        throw ShapeMismatch("Cannot resample an empty volume");
    if (source.data.size() != source.voxelCount())
        throw ShapeMismatch("Volume data size does not match its dimensions");
    if (outputShape.x < 0 || outputShape.y < 0 || outputShape.z < 0)
        throw ShapeMismatch("Output shape must not be negative");
    if (!isAffine(outputIndexToSourceIndex))
        throw ShapeMismatch("Resampling transform is not affine");

    std::vector<double> out(static_cast<std::size_t>(outputShape.x) * outputShape.y * outputShape.z);
    std::size_t n = 0;
    for (int k = 0; k < outputShape.z; ++k)
    {
        for (int j = 0; j < outputShape.y; ++j)
        {
            for (int i = 0; i < outputShape.x; ++i)
            {
                glm::dvec3 p = transformPoint(outputIndexToSourceIndex, glm::dvec3(i, j, k));
                out[n++] = trilinear(source, p, policy);
            }
        }
    }
    return out;
}

ScalarField resampleVolumeToGrid(const Volume& volume,
                                 const glm::dmat4& worldToSourceIndex,
                                 const glm::dmat4& localToWorld,
                                 const std::string& localUnits,
                                 const SimulationGrid& grid,
                                 BoundaryPolicy policy)
{
    glm::dmat4 gridToSource = worldToSourceIndex * localToWorld * grid.indexToLocal(localUnits);

    ScalarField field;
    field.name = volume.name;
    field.grid = grid;
    field.data = resample(volume, gridToSource, grid.shape, policy);
    return field;
}

Volume embedFieldInPlacedVolume(const ScalarField& field, const std::string& localUnits)
{
    if (field.data.size() != field.grid.size())
        throw ShapeMismatch("Field '" + field.name + "' has " + std::to_string(field.data.size()) +
                            " samples for a grid of " + std::to_string(field.grid.size()));

    Volume v;
    v.id = field.name;
    v.name = field.name;
    v.allocate(field.grid.shape, field.grid.indexToLocal(localUnits));
    for (std::size_t i = 0; i < field.data.size(); ++i)
        v.data[i] = static_cast<float>(field.data[i]);
    return v;
}
