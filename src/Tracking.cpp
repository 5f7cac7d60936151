// Tracking.cpp - transducer placement from paired landmarks.
//
// Procrustes reference: Golub & Van Loan "Matrix Computations" pp. 425-426.

#include "Tracking.h"

#include <cmath>

#include <Eigen/Dense>

#include "CoordinateFrame.h"
#include "Errors.h"

static Eigen::Vector3d toEigen(const glm::dvec3& v)
{
    return {v.x, v.y, v.z};
}

TrackingResult placementFromLandmarks(const std::vector<glm::dvec3>& worldPoints,
                                      const std::vector<glm::dvec3>& transducerPoints,
                                      const std::string& axes,
                                      const std::string& units)
{
    if (worldPoints.size() != transducerPoints.size())
        throw ShapeMismatch("Landmark lists differ in length: " +
                            std::to_string(worldPoints.size()) + " world vs " +
                            std::to_string(transducerPoints.size()) + " transducer");

    glm::dmat4 frame = composeFrameToWorld(axes, units);

    TrackingResult result;
    int n = static_cast<int>(worldPoints.size());
    if (n < kMinTrackingLandmarks)
    {
        result.message = "Need at least " + std::to_string(kMinTrackingLandmarks) +
                         " landmark pairs, got " + std::to_string(n);
        return result;
    }

    // One landmark per column; transducer landmarks in frame-aligned mm.
    Eigen::Matrix3Xd world(3, n);
    Eigen::Matrix3Xd local(3, n);
    for (int i = 0; i < n; ++i)
    {
        world.col(i) = toEigen(worldPoints[i]);
        local.col(i) = toEigen(transformPoint(frame, transducerPoints[i]));
    }
    const Eigen::Vector3d worldMean = world.rowwise().mean();
    const Eigen::Vector3d localMean = local.rowwise().mean();
    world.colwise() -= worldMean;
    local.colwise() -= localMean;

    // Collinear (or coincident) landmarks leave the rotation about their
    // common line undetermined.
    Eigen::Vector3d spread = Eigen::JacobiSVD<Eigen::Matrix3Xd>(local).singularValues();
    if (spread(0) < 1e-9 || spread(1) < 1e-9 * spread(0))
    {
        result.message = "Transducer landmarks are collinear";
        return result;
    }

    // Kabsch: world ~ R * local, with det(R) = +1.
    Eigen::JacobiSVD<Eigen::Matrix3d> svd(world * local.transpose(),
                                          Eigen::ComputeFullU | Eigen::ComputeFullV);
    Eigen::Matrix3d flip = Eigen::Matrix3d::Identity();
    if ((svd.matrixU() * svd.matrixV().transpose()).determinant() < 0.0)
        flip(2, 2) = -1.0;
    const Eigen::Matrix3d R = svd.matrixU() * flip * svd.matrixV().transpose();
    const Eigen::Vector3d t = worldMean - R * localMean;

    glm::dmat4 rigid(1.0);
    for (int col = 0; col < 3; ++col)
        rigid[col] = glm::dvec4(R(0, col), R(1, col), R(2, col), 0.0);
    rigid[3] = glm::dvec4(t(0), t(1), t(2), 1.0);

    result.rigid = rigid;
    result.placement = rigid * frame;
    result.valid = true;

    result.perLandmarkError.resize(n);
    double sumSq = 0.0;
    for (int i = 0; i < n; ++i)
    {
        glm::dvec3 fitted = transformPoint(result.placement, transducerPoints[i]);
        double dist = glm::length(fitted - worldPoints[i]);
        result.perLandmarkError[i] = dist;
        sumSq += dist * dist;
    }
    result.rms = std::sqrt(sumSq / n);
    return result;
}
