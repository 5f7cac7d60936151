#pragma once

#include <string>
#include <vector>

#include <glm/glm.hpp>

/// Minimum number of landmark pairs for a rigid fit.
constexpr int kMinTrackingLandmarks = 3;

/// Result of fitting a transducer placement to landmarks.
struct TrackingResult
{
    bool valid = false;          ///< False with too few or collinear landmarks.
    std::string message;         ///< Why the fit is invalid, if it is.

    /// Rigid part in frame-aligned millimetre space (rotation + translation).
    glm::dmat4 rigid{1.0};

    /// Transducer placement: rigid * composeFrameToWorld(axes, units).
    glm::dmat4 placement{1.0};

    /// Distance (mm) between each world landmark and its fitted counterpart.
    std::vector<double> perLandmarkError;

    /// Root mean square of perLandmarkError.
    double rms = 0.0;
};

/// Fit a transducer placement so that `transducerPoints` (native frame,
/// `units`, axis convention `axes`) land on `worldPoints` (RAS mm).  The fit
/// is a least-squares proper rotation plus translation (Procrustes via SVD).
///
/// @throws ShapeMismatch if the two lists differ in length
/// @throws InvalidAxisLabel, UnknownUnit
TrackingResult placementFromLandmarks(const std::vector<glm::dvec3>& worldPoints,
                                      const std::vector<glm::dvec3>& transducerPoints,
                                      const std::string& axes,
                                      const std::string& units);
