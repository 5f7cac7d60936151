// test_tracking.cpp - transducer placement from paired landmarks.

#include "CoordinateFrame.h"
#include "Errors.h"
#include "Tracking.h"

#include <cmath>
#include <iostream>

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

static bool matApproxEq(const glm::dmat4& a, const glm::dmat4& b, double tol = 1e-6)
{
    for (int c = 0; c < 4; ++c)
        for (int r = 0; r < 4; ++r)
            if (std::fabs(a[c][r] - b[c][r]) > tol)
                return false;
    return true;
}

/// 30 degrees about z, then 20 about x, plus a translation.
static glm::dmat4 knownRigid()
{
    const double a = 30.0 * M_PI / 180.0;
    const double b = 20.0 * M_PI / 180.0;
    glm::dmat4 rz(1.0);
    rz[0] = glm::dvec4(std::cos(a), std::sin(a), 0.0, 0.0);
    rz[1] = glm::dvec4(-std::sin(a), std::cos(a), 0.0, 0.0);
    glm::dmat4 rx(1.0);
    rx[1] = glm::dvec4(0.0, std::cos(b), std::sin(b), 0.0);
    rx[2] = glm::dvec4(0.0, -std::sin(b), std::cos(b), 0.0);
    glm::dmat4 m = rx * rz;
    m[3] = glm::dvec4(5.0, -12.0, 60.0, 1.0);
    return m;
}

static std::vector<glm::dvec3> transducerLandmarks()
{
    return {glm::dvec3(0.0, 0.0, 0.0), glm::dvec3(30.0, 0.0, 0.0),
            glm::dvec3(0.0, 25.0, 0.0), glm::dvec3(-10.0, -10.0, 8.0)};
}

static void testRecoversRigidTransform()
{
    std::cout << "  testRecoversRigidTransform...";

    glm::dmat4 placement = knownRigid() * composeFrameToWorld("LPS", "mm");
    std::vector<glm::dvec3> local = transducerLandmarks();
    std::vector<glm::dvec3> world;
    for (const auto& p : local)
        world.push_back(transformPoint(placement, p));

    TrackingResult r = placementFromLandmarks(world, local, "LPS", "mm");
    CHECK(r.valid, "fit is valid");
    CHECK(matApproxEq(r.rigid, knownRigid()), "rigid part recovered");
    CHECK(matApproxEq(r.placement, placement), "placement recovered");
    CHECK(r.perLandmarkError.size() == 4, "one error per landmark");
    CHECK(r.rms < 1e-6, "exact landmarks fit exactly");

    std::cout << " done\n";
}

static void testUnitsAndNoise()
{
    std::cout << "  testUnitsAndNoise...";

    // Landmarks in cm on an RAS transducer.
    std::vector<glm::dvec3> local = {glm::dvec3(0.0), glm::dvec3(3.0, 0.0, 0.0),
                                     glm::dvec3(0.0, 2.5, 0.0), glm::dvec3(-1.0, -1.0, 0.8)};
    glm::dmat4 placement = knownRigid() * composeFrameToWorld("RAS", "cm");
    std::vector<glm::dvec3> world;
    for (const auto& p : local)
        world.push_back(transformPoint(placement, p));
    world[3].x += 0.4;

    TrackingResult r = placementFromLandmarks(world, local, "RAS", "cm");
    CHECK(r.valid, "noisy fit is still valid");
    CHECK(r.rms > 0.0 && r.rms < 0.4, "residual reflects the perturbation");
    CHECK(r.perLandmarkError[3] > r.perLandmarkError[0], "perturbed landmark fits worst");

    std::cout << " done\n";
}

static void testDegenerateLandmarks()
{
    std::cout << "  testDegenerateLandmarks...";

    std::vector<glm::dvec3> two = {glm::dvec3(0.0), glm::dvec3(1.0, 0.0, 0.0)};
    TrackingResult few = placementFromLandmarks(two, two, "RAS", "mm");
    CHECK(!few.valid && !few.message.empty(), "two landmarks are too few");

    std::vector<glm::dvec3> line = {glm::dvec3(0.0), glm::dvec3(1.0, 0.0, 0.0),
                                    glm::dvec3(2.0, 0.0, 0.0), glm::dvec3(5.0, 0.0, 0.0)};
    TrackingResult collinear = placementFromLandmarks(line, line, "RAS", "mm");
    CHECK(!collinear.valid, "collinear landmarks leave the rotation open");

    bool threw = false;
    try { placementFromLandmarks(two, line, "RAS", "mm"); }
    catch (const ShapeMismatch&) { threw = true; }
    CHECK(threw, "lists of different length should throw");

    threw = false;
    try { placementFromLandmarks(line, line, "RAX", "mm"); }
    catch (const InvalidAxisLabel&) { threw = true; }
    CHECK(threw, "bad axes should throw");

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== Tracking Tests ===\n";

    try
    {
        testRecoversRigidTransform();
        testUnitsAndNoise();
        testDegenerateLandmarks();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected exception: " << e.what() << "\n";
        ++failures;
    }

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All Tracking tests PASSED.\n";
        return 0;
    }
    std::cout << failures << " Tracking test(s) FAILED.\n";
    return 1;
}
