#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <glm/glm.hpp>

/// A scalar 3-D field with its own index-to-world affine.
///
/// `id` is the external identity tag: the logical volume id a session refers
/// to.  It is independent of whatever handle the scene stores the volume
/// under, so a volume can be reloaded under the same id.
class Volume {
public:
    std::string id;
    std::string name;

    glm::ivec3 dimensions{0, 0, 0};  // X, Y, Z voxel counts

    /// Samples, X fastest: data[(z * ny + y) * nx + x].
    std::vector<float> data;

    /// Voxel index (i, j, k) to world (anatomical mm).  The columns are the
    /// axis directions scaled by the voxel spacing; the last is the world
    /// position of voxel (0, 0, 0).
    glm::dmat4 indexToWorld{1.0};

    /// Read a MINC2 file: geometry from its spatial dimensions, samples as
    /// float in X-fastest order.
    /// @throws std::runtime_error on any failure
    void load(const std::string& filename);

    /// Zero-filled volume of the given shape.
    /// @throws std::invalid_argument on a non-positive dimension
    void allocate(const glm::ivec3& dims, const glm::dmat4& matrix);

    bool contains(int x, int y, int z) const
    {
        return x >= 0 && x < dimensions.x && y >= 0 && y < dimensions.y &&
               z >= 0 && z < dimensions.z;
    }

    /// 0 outside the volume.
    float get(int x, int y, int z) const;

    /// @throws std::out_of_range outside the volume
    void set(int x, int y, int z, float value);

    std::size_t voxelCount() const;

private:
    std::size_t offset(int x, int y, int z) const
    {
        return (static_cast<std::size_t>(z) * dimensions.y + y) * dimensions.x + x;
    }
};
