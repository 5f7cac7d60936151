// CoordinateFrame.cpp - axis conventions, length units and affine helpers.
//
// Every frame in the planner is described by an axis convention (three of
// R/L/A/P/S/I) and a length unit.  composeFrameToWorld() is the single place
// where that description turns into a matrix into anatomical (RAS) mm.

#include "CoordinateFrame.h"

#include <array>
#include <cmath>
#include <string>

#include <glm/glm.hpp>

#include "Errors.h"
#include "Volume.h"

// ---------------------------------------------------------------------------
// Unit registry
// ---------------------------------------------------------------------------

void UnitRegistry::define(const std::string& name, double metres)
{
    metres_[name] = metres;
}

std::optional<double> UnitRegistry::metres(const std::string& name) const
{
    auto it = metres_.find(name);
    if (it == metres_.end())
        return std::nullopt;
    return it->second;
}

const UnitRegistry& UnitRegistry::builtin()
{
    static const UnitRegistry registry = []
    {
        UnitRegistry r;
        r.define("km", 1e3);
        r.define("m", 1.0);
        r.define("dm", 1e-1);
        r.define("cm", 1e-2);
        r.define("mm", 1e-3);
        r.define("um", 1e-6);
        r.define("\xC2\xB5m", 1e-6);  // UTF-8 micro sign
        r.define("nm", 1e-9);
        r.define("in", 0.0254);
        r.define("ft", 0.3048);

        r.define("meter", 1.0);
        r.define("meters", 1.0);
        r.define("centimeter", 1e-2);
        r.define("centimeters", 1e-2);
        r.define("millimeter", 1e-3);
        r.define("millimeters", 1e-3);
        r.define("micrometer", 1e-6);
        r.define("micrometers", 1e-6);
        r.define("micron", 1e-6);
        r.define("microns", 1e-6);
        return r;
    }();
    return registry;
}

double unitScaleFactor(const std::string& unitName, const UnitRegistry* registry)
{
    if (!registry)
        throw UnknownUnit("No unit registry available to interpret unit '" + unitName + "'");

    auto unit = registry->metres(unitName);
    if (!unit)
        throw UnknownUnit("Unknown length unit: '" + unitName + "'");

    auto mm = registry->metres("mm");
    if (!mm)
        throw UnknownUnit("Unit registry does not define 'mm'");

    return *unit / *mm;
}

double unitConversion(const std::string& fromUnit, const std::string& toUnit)
{
    return unitScaleFactor(fromUnit) / unitScaleFactor(toUnit);
}

// ---------------------------------------------------------------------------
// Axis conventions
// ---------------------------------------------------------------------------

/// RAS unit vector for one axis label, plus which anatomical axis it names.
static glm::dvec3 directionForLabel(char label, int& anatomicalAxis)
{
    switch (label)
    {
    case 'R': anatomicalAxis = 0; return glm::dvec3( 1.0,  0.0,  0.0);
    case 'L': anatomicalAxis = 0; return glm::dvec3(-1.0,  0.0,  0.0);
    case 'A': anatomicalAxis = 1; return glm::dvec3( 0.0,  1.0,  0.0);
    case 'P': anatomicalAxis = 1; return glm::dvec3( 0.0, -1.0,  0.0);
    case 'S': anatomicalAxis = 2; return glm::dvec3( 0.0,  0.0,  1.0);
    case 'I': anatomicalAxis = 2; return glm::dvec3( 0.0,  0.0, -1.0);
    default:
        throw InvalidAxisLabel(std::string("Invalid axis label: '") + label +
                               "' (expected one of R, L, A, P, S, I)");
    }
}

glm::dmat3 axisFrameToAnatomicalMatrix(const std::vector<std::string>& axisLabels)
{
    if (axisLabels.size() != 3)
        throw InvalidAxisLabel("Expected exactly 3 axis labels, got " +
                               std::to_string(axisLabels.size()));

    std::array<bool, 3> seen = {false, false, false};
    glm::dmat3 result(0.0);
    for (int col = 0; col < 3; ++col)
    {
        const std::string& label = axisLabels[col];
        if (label.size() != 1)
            throw InvalidAxisLabel("Invalid axis label: '" + label + "'");

        int axis = -1;
        result[col] = directionForLabel(label[0], axis);
        if (seen[axis])
            throw InvalidAxisLabel("Axis labels name the same anatomical axis twice: '" +
                                   axisLabels[0] + axisLabels[1] + axisLabels[2] + "'");
        seen[axis] = true;
    }
    return result;
}

glm::dmat3 axisFrameToAnatomicalMatrix(const std::string& axisLabels)
{
    std::vector<std::string> labels;
    labels.reserve(axisLabels.size());
    for (char c : axisLabels)
        labels.emplace_back(1, c);
    return axisFrameToAnatomicalMatrix(labels);
}

// ---------------------------------------------------------------------------
// Affine helpers
// ---------------------------------------------------------------------------

glm::dmat4 toAffine(const glm::dmat3& linear, const glm::dvec3& translation)
{
    return glm::dmat4(
        glm::dvec4(linear[0], 0.0),
        glm::dvec4(linear[1], 0.0),
        glm::dvec4(linear[2], 0.0),
        glm::dvec4(translation, 1.0));
}

glm::dmat4 toAffine(const std::vector<std::vector<double>>& rows,
                    const std::vector<double>& translation)
{
    if (rows.size() != 3)
        throw ShapeMismatch("Linear part must be 3x3, got " + std::to_string(rows.size()) + " rows");
    for (const auto& row : rows)
    {
        if (row.size() != 3)
            throw ShapeMismatch("Linear part must be 3x3, got a row of length " +
                                std::to_string(row.size()));
    }
    if (!translation.empty() && translation.size() != 3)
        throw ShapeMismatch("Translation must have 3 components, got " +
                            std::to_string(translation.size()));

    glm::dmat3 linear(0.0);
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 3; ++c)
            linear[c][r] = rows[r][c];

    glm::dvec3 t(0.0);
    if (!translation.empty())
        t = glm::dvec3(translation[0], translation[1], translation[2]);
    return toAffine(linear, t);
}

glm::dmat4 composeFrameToWorld(const std::string& axisLabels, const std::string& unitName)
{
    return toAffine(axisFrameToAnatomicalMatrix(axisLabels) * unitScaleFactor(unitName));
}

glm::dmat4 worldToVolumeIndex(const Volume& volume, const std::optional<glm::dmat4>& placement)
{
    glm::dmat4 indexToWorld = volume.indexToWorld;
    if (placement)
        indexToWorld = *placement * indexToWorld;
    return glm::inverse(indexToWorld);
}

glm::dmat4 matrixFromRowMajor(const std::array<double, 16>& values)
{
    glm::dmat4 m(1.0);
    for (int row = 0; row < 4; ++row)
        for (int col = 0; col < 4; ++col)
            m[col][row] = values[row * 4 + col];
    return m;
}

glm::dmat4 matrixFromRowMajor(const std::vector<double>& values)
{
    if (values.size() != 16)
        throw ShapeMismatch("A 4x4 matrix needs 16 values, got " + std::to_string(values.size()));
    std::array<double, 16> a{};
    for (int i = 0; i < 16; ++i)
        a[i] = values[i];
    return matrixFromRowMajor(a);
}

std::array<double, 16> matrixToRowMajor(const glm::dmat4& m)
{
    std::array<double, 16> values{};
    for (int row = 0; row < 4; ++row)
        for (int col = 0; col < 4; ++col)
            values[row * 4 + col] = m[col][row];
    return values;
}

bool isAffine(const glm::dmat4& m, double tol)
{
    return std::abs(m[0][3]) <= tol && std::abs(m[1][3]) <= tol &&
           std::abs(m[2][3]) <= tol && std::abs(m[3][3] - 1.0) <= tol;
}

glm::dvec3 transformPoint(const glm::dmat4& m, const glm::dvec3& p)
{
    glm::dvec4 h = m * glm::dvec4(p, 1.0);
    return glm::dvec3(h);
}
