#include "Protocol.h"

#include <cmath>
#include <stdexcept>
#include <string>

#include "CoordinateFrame.h"
#include "Errors.h"

static constexpr double kPi = 3.14159265358979323846;

SimulationGrid SimSetup::grid() const
{
    if (!(spacing > 0.0))
        throw ShapeMismatch("Simulation spacing must be positive");

    const std::array<double, 2>* extents[3] = {&xExtent, &yExtent, &zExtent};

    SimulationGrid g;
    g.units = units;
    g.spacing = glm::dvec3(spacing);
    for (int axis = 0; axis < 3; ++axis)
    {
        double lo = (*extents[axis])[0];
        double hi = (*extents[axis])[1];
        if (hi < lo)
            throw ShapeMismatch("Simulation extent along axis " + std::to_string(axis) +
                                " has max < min");
        g.origin[axis] = lo;
        // Small slack so an extent that is an exact multiple keeps its end.
        g.shape[axis] = static_cast<int>(std::floor((hi - lo) / spacing + 1e-9)) + 1;
    }
    return g;
}

std::vector<glm::dvec3> FocalPattern::targets(const glm::dvec3& center,
                                              const std::string& localUnits) const
{
    if (type == "single")
        return {center};

    if (type != "wheel")
        throw std::invalid_argument("Unknown focal pattern type: '" + type + "'");
    if (numSpokes < 0)
        throw std::invalid_argument("Wheel focal pattern needs a non-negative spoke count");

    double radius = spokeRadius * unitConversion(units, localUnits);

    std::vector<glm::dvec3> points;
    if (includeCenter)
        points.push_back(center);
    for (int k = 0; k < numSpokes; ++k)
    {
        double angle = 2.0 * kPi * k / numSpokes;
        points.push_back(center + glm::dvec3(radius * std::cos(angle), radius * std::sin(angle), 0.0));
    }
    return points;
}
