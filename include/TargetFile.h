// TargetFile.h - MNI .tag files as targets and landmark pairs (minc2-simple)
#pragma once

#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "TargetPoint.h"

/// Paired landmarks from a two-volume .tag file: `first` holds the volume-1
/// points, `second` the volume-2 points, index aligned.
struct LandmarkPairs
{
    std::vector<glm::dvec3> first;
    std::vector<glm::dvec3> second;
    std::vector<std::string> labels;  // empty strings where unlabelled
};

/// Read the (first volume) points of a .tag file as world targets (RAS mm).
/// Labels become ids and names; unlabelled points are `target-N`, 1-based.
/// @throws std::runtime_error on failure
std::vector<TargetPoint> loadTargetsFromTagFile(const std::string& path);

/// @throws std::runtime_error on failure or if the file has one volume
LandmarkPairs loadLandmarkPairs(const std::string& path);

/// Write targets as a one-volume .tag file labelled with target ids.
/// @throws std::runtime_error on failure or with no targets
void saveTargetsToTagFile(const std::string& path, const std::vector<TargetPoint>& targets);

/// @throws std::runtime_error on failure or with mismatched or empty lists
void saveLandmarkPairs(const std::string& path, const LandmarkPairs& pairs);
