#include "Volume.h"

#include <memory>
#include <stdexcept>

#include <minc2-simple.h>

namespace
{

struct MincCloser
{
    void operator()(minc2_file_handle h) const
    {
        minc2_close(h);
        minc2_free(h);
    }
};

/// An open MINC2 file, closed and freed when the pointer goes away.
using MincFile = std::unique_ptr<minc2_file, MincCloser>;

MincFile openMinc(const std::string& filename)
{
    minc2_file_handle h = nullptr;
    if (minc2_allocate(&h) != MINC2_SUCCESS)
        throw std::runtime_error("Failed to allocate minc2 handle");
    if (minc2_open(h, filename.c_str()) != MINC2_SUCCESS)
    {
        minc2_free(h);
        throw std::runtime_error("Failed to open MINC file: " + filename);
    }
    return MincFile(h);
}

/// One spatial axis of the file: its length and its index-to-world column.
struct SpatialAxis
{
    int length = 0;
    glm::dvec3 direction{0.0};
    double step = 1.0;
    double start = 0.0;
};

SpatialAxis readAxis(const minc2_dimension& dim, int axis)
{
    SpatialAxis a;
    a.length = dim.length;
    a.step = dim.step;
    a.start = dim.start;
    if (dim.have_dir_cos)
        a.direction = glm::dvec3(dim.dir_cos[0], dim.dir_cos[1], dim.dir_cos[2]);
    else
        a.direction[axis] = 1.0;
    return a;
}

} // namespace

void Volume::load(const std::string& filename)
{
    if (filename.empty())
        throw std::runtime_error("Empty volume filename");

    MincFile file = openMinc(filename);
    if (minc2_setup_standard_order(file.get()) != MINC2_SUCCESS)
        throw std::runtime_error("Cannot set X-fastest dimension order: " + filename);

    int ndim = 0;
    minc2_dimension* dims = nullptr;
    if (minc2_ndim(file.get(), &ndim) != MINC2_SUCCESS ||
        minc2_get_representation_dimensions(file.get(), &dims) != MINC2_SUCCESS)
        throw std::runtime_error("Cannot read dimensions: " + filename);

    SpatialAxis axes[3];
    bool found[3] = {false, false, false};
    std::size_t total = 1;
    for (int i = 0; i < ndim; ++i)
    {
        total *= static_cast<std::size_t>(dims[i].length);
        int axis = dims[i].id == MINC2_DIM_X ? 0
                 : dims[i].id == MINC2_DIM_Y ? 1
                 : dims[i].id == MINC2_DIM_Z ? 2
                 : -1;
        if (axis < 0)
            continue;
        axes[axis] = readAxis(dims[i], axis);
        found[axis] = true;
    }
    if (!found[0] || !found[1] || !found[2])
        throw std::runtime_error("Volume lacks one of the x, y, z dimensions: " + filename);

    // MINC starts are along the direction cosines, not world axes.
    glm::dmat4 matrix(1.0);
    glm::dvec3 origin(0.0);
    for (int axis = 0; axis < 3; ++axis)
    {
        matrix[axis] = glm::dvec4(axes[axis].direction * axes[axis].step, 0.0);
        origin += axes[axis].direction * axes[axis].start;
        dimensions[axis] = axes[axis].length;
    }
    matrix[3] = glm::dvec4(origin, 1.0);
    indexToWorld = matrix;

    if (total == 0)
        throw std::runtime_error("Volume has no voxels: " + filename);
    data.resize(total);
    if (minc2_load_complete_volume(file.get(), data.data(), MINC2_FLOAT) != MINC2_SUCCESS)
        throw std::runtime_error("Failed to read volume samples: " + filename);
}

void Volume::allocate(const glm::ivec3& dims, const glm::dmat4& matrix)
{
    if (dims.x <= 0 || dims.y <= 0 || dims.z <= 0)
        throw std::invalid_argument("Volume dimensions must be positive");

    dimensions = dims;
    indexToWorld = matrix;
    data.assign(voxelCount(), 0.0f);
}

float Volume::get(int x, int y, int z) const
{
    return contains(x, y, z) ? data[offset(x, y, z)] : 0.0f;
}

void Volume::set(int x, int y, int z, float value)
{
    if (!contains(x, y, z))
        throw std::out_of_range("Voxel index outside volume");
    data[offset(x, y, z)] = value;
}

std::size_t Volume::voxelCount() const
{
    return static_cast<std::size_t>(dimensions.x) * dimensions.y * dimensions.z;
}
