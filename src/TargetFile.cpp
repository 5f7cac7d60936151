// TargetFile.cpp - .tag file I/O on top of the minc2_simple tag API

#include "TargetFile.h"

extern "C" {
#include "minc2-simple.h"
}

#include <cstring>
#include <memory>
#include <stdexcept>

namespace
{

struct TagsDeleter
{
    void operator()(minc2_tags* tags) const { minc2_tags_free(tags); }
};

/// Owns a minc2_tags structure; minc2_tags_free releases it together with
/// its point arrays and label strings.
using TagsPtr = std::unique_ptr<minc2_tags, TagsDeleter>;

TagsPtr allocateTags()
{
    TagsPtr tags(minc2_tags_allocate0());
    if (!tags)
        throw std::runtime_error("Failed to allocate tag structure");
    return tags;
}

TagsPtr readTags(const std::string& path)
{
    TagsPtr tags = allocateTags();
    if (minc2_tags_load(tags.get(), path.c_str()) != MINC2_SUCCESS)
        throw std::runtime_error("Failed to load tag file: " + path);
    return tags;
}

std::vector<glm::dvec3> copyPoints(const double* values, int count)
{
    std::vector<glm::dvec3> points;
    points.reserve(count);
    for (int i = 0; i < count; ++i)
        points.emplace_back(values[i * 3 + 0], values[i * 3 + 1], values[i * 3 + 2]);
    return points;
}

std::vector<std::string> copyLabels(const minc2_tags* tags)
{
    std::vector<std::string> labels;
    labels.reserve(tags->n_tag_points);
    for (int i = 0; i < tags->n_tag_points; ++i)
    {
        const char* lbl = tags->labels ? tags->labels[i] : nullptr;
        labels.emplace_back(lbl ? lbl : "");
    }
    return labels;
}

void storePoints(double* dest, const std::vector<glm::dvec3>& points)
{
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        dest[i * 3 + 0] = points[i].x;
        dest[i * 3 + 1] = points[i].y;
        dest[i * 3 + 2] = points[i].z;
    }
}

void writeTags(const std::string& path,
               const std::vector<glm::dvec3>& first,
               const std::vector<glm::dvec3>* second,
               const std::vector<std::string>& labels)
{
    int count = static_cast<int>(first.size());
    int nVols = second ? 2 : 1;

    TagsPtr tags = allocateTags();
    if (minc2_tags_init(tags.get(), count, nVols, 0, 0, 0, 1) != MINC2_SUCCESS)
        throw std::runtime_error("Failed to initialize tag structure");

    storePoints(tags->tags_volume1, first);
    if (second)
        storePoints(tags->tags_volume2, *second);

    if (labels.size() == first.size())
    {
        for (int i = 0; i < count; ++i)
        {
            if (!labels[i].empty())
                tags->labels[i] = strdup(labels[i].c_str());
        }
    }

    if (minc2_tags_save(tags.get(), path.c_str()) != MINC2_SUCCESS)
        throw std::runtime_error("Failed to save tag file: " + path);
}

} // namespace

std::vector<TargetPoint> loadTargetsFromTagFile(const std::string& path)
{
    TagsPtr tags = readTags(path);
    std::vector<glm::dvec3> points = copyPoints(tags->tags_volume1, tags->n_tag_points);
    std::vector<std::string> labels = copyLabels(tags.get());

    std::vector<TargetPoint> targets;
    targets.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        TargetPoint t;
        t.id = labels[i].empty() ? "target-" + std::to_string(i + 1) : labels[i];
        t.name = t.id;
        t.position = points[i];
        targets.push_back(t);
    }
    return targets;
}

LandmarkPairs loadLandmarkPairs(const std::string& path)
{
    TagsPtr tags = readTags(path);
    if (tags->n_volumes < 2 || !tags->tags_volume2)
        throw std::runtime_error("Tag file holds a single volume, landmark pairs need two: " + path);

    LandmarkPairs pairs;
    pairs.first = copyPoints(tags->tags_volume1, tags->n_tag_points);
    pairs.second = copyPoints(tags->tags_volume2, tags->n_tag_points);
    pairs.labels = copyLabels(tags.get());
    return pairs;
}

void saveTargetsToTagFile(const std::string& path, const std::vector<TargetPoint>& targets)
{
    if (targets.empty())
        throw std::runtime_error("No targets to save");

    std::vector<glm::dvec3> points;
    std::vector<std::string> labels;
    for (const auto& t : targets)
    {
        points.push_back(t.position);
        labels.push_back(t.id);
    }
    writeTags(path, points, nullptr, labels);
}

void saveLandmarkPairs(const std::string& path, const LandmarkPairs& pairs)
{
    if (pairs.first.empty())
        throw std::runtime_error("No landmarks to save");
    if (pairs.first.size() != pairs.second.size())
        throw std::runtime_error("Landmark lists differ in length");
    writeTags(path, pairs.first, &pairs.second, pairs.labels);
}
