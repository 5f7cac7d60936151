#pragma once

#include <array>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "Resample.h"

struct PulseSpec
{
    double frequency = 500e3;  // Hz
    double duration = 2e-5;    // s
};

/// Simulation grid and medium settings.  Extents are [min, max] along the
/// transducer's local x, y and z, in `units`.
struct SimSetup
{
    double spacing = 1.0;
    std::string units = "mm";
    std::array<double, 2> xExtent = {-30.0, 30.0};
    std::array<double, 2> yExtent = {-30.0, 30.0};
    std::array<double, 2> zExtent = {-4.0, 70.0};
    double dt = 0.0;     // 0 lets the backend choose
    double tEnd = 0.0;   // 0 lets the backend choose
    double speedOfSound = 1500.0;  // m/s, reference medium

    /// Regular grid covering the extents, both ends included.
    /// @throws ShapeMismatch on a non-positive spacing or an inverted extent
    SimulationGrid grid() const;
};

/// Where the foci go relative to a target.
struct FocalPattern
{
    std::string type = "single";  // "single" | "wheel"
    bool includeCenter = true;    // wheel only
    int numSpokes = 4;            // wheel only
    double spokeRadius = 1.0;     // wheel only, in `units`
    std::string units = "mm";

    /// Focus points around `center`, both in `localUnits` of the transducer
    /// frame.  Wheel spokes lie in the local x/y plane.
    /// @throws std::invalid_argument on an unknown pattern type
    std::vector<glm::dvec3> targets(const glm::dvec3& center, const std::string& localUnits) const;
};

struct ProtocolDefinition
{
    std::string id;
    std::string name;
    PulseSpec pulse;
    SimSetup sim;
    FocalPattern focalPattern;
};
