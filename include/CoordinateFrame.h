#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

class Volume;

/// Length units known to the planner, as metres per unit.
/// The builtin registry covers SI prefixes of the metre plus inch and foot.
class UnitRegistry
{
public:
    UnitRegistry() = default;

    /// Register (or redefine) a unit by its size in metres.
    void define(const std::string& name, double metres);

    /// Size of one `name` in metres, or nullopt if unknown.
    std::optional<double> metres(const std::string& name) const;

    bool knows(const std::string& name) const { return metres(name).has_value(); }

    /// Process-wide registry holding the builtin units.
    static const UnitRegistry& builtin();

private:
    std::map<std::string, double> metres_;
};

/// Matrix whose columns are the anatomical (RAS) unit vectors of the three
/// given axis labels, e.g. "LPS" -> diag(-1, -1, 1).
/// @throws InvalidAxisLabel on an unknown label, a count other than three,
///         or an anatomical axis named twice.
glm::dmat3 axisFrameToAnatomicalMatrix(const std::string& axisLabels);
glm::dmat3 axisFrameToAnatomicalMatrix(const std::vector<std::string>& axisLabels);

/// Factor converting a length in `unitName` to millimetres.
/// Passing a null registry models an unavailable unit library.
/// @throws UnknownUnit
double unitScaleFactor(const std::string& unitName,
                       const UnitRegistry* registry = &UnitRegistry::builtin());

/// Factor converting a length in `fromUnit` to `toUnit`.
double unitConversion(const std::string& fromUnit, const std::string& toUnit);

/// Embed a 3x3 linear map into a homogeneous 4x4 affine.
glm::dmat4 toAffine(const glm::dmat3& linear,
                    const glm::dvec3& translation = glm::dvec3(0.0));

/// Row-major variant for untyped input.
/// @throws ShapeMismatch unless `rows` is 3x3 and `translation` is empty or 3 long.
glm::dmat4 toAffine(const std::vector<std::vector<double>>& rows,
                    const std::vector<double>& translation = {});

/// Affine taking coordinates of a frame defined by (axis convention, unit)
/// into anatomical millimetre space.
glm::dmat4 composeFrameToWorld(const std::string& axisLabels, const std::string& unitName);

/// World (anatomical mm) to volume index transform.  `placement` is the
/// matrix of the transform the volume is parented to, if any.  Evaluated on
/// every call so it always reflects the live placement.
glm::dmat4 worldToVolumeIndex(const Volume& volume,
                              const std::optional<glm::dmat4>& placement = std::nullopt);

// --- Boundary conversions (persisted forms are row-major) ---

glm::dmat4 matrixFromRowMajor(const std::array<double, 16>& values);
std::array<double, 16> matrixToRowMajor(const glm::dmat4& m);

/// @throws ShapeMismatch unless exactly 16 values are given.
glm::dmat4 matrixFromRowMajor(const std::vector<double>& values);

/// True if the bottom row is (0, 0, 0, 1) within `tol`.
bool isAffine(const glm::dmat4& m, double tol = 1e-12);

glm::dvec3 transformPoint(const glm::dmat4& m, const glm::dvec3& p);
