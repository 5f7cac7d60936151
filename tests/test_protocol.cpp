// test_protocol.cpp - simulation grid and focal patterns.

#include "Errors.h"
#include "Protocol.h"

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

static bool approxEq(double a, double b, double tol = 1e-9)
{
    return std::fabs(a - b) < tol;
}

static void testDefaultGrid()
{
    std::cout << "  testDefaultGrid...";

    SimSetup sim;
    SimulationGrid g = sim.grid();
    CHECK(g.shape == glm::ivec3(61, 61, 75), "default extents at 1 mm include both ends");
    CHECK(approxEq(g.origin.x, -30.0) && approxEq(g.origin.z, -4.0), "origin at extent minimum");
    CHECK(g.units == "mm", "grid units follow the setup");
    CHECK(g.size() == 61u * 61u * 75u, "grid size");

    std::cout << " done\n";
}

static void testGridSpacing()
{
    std::cout << "  testGridSpacing...";

    SimSetup sim;
    sim.spacing = 0.3;
    sim.xExtent = {0.0, 0.9};
    sim.yExtent = {0.0, 1.0};
    sim.zExtent = {2.0, 2.0};
    SimulationGrid g = sim.grid();
    CHECK(g.shape.x == 4, "0.9 / 0.3 keeps its end despite rounding");
    CHECK(g.shape.y == 4, "partial last step is dropped");
    CHECK(g.shape.z == 1, "degenerate extent gives one sample");

    sim.spacing = 0.0;
    bool threw = false;
    try { sim.grid(); }
    catch (const ShapeMismatch&) { threw = true; }
    CHECK(threw, "zero spacing should throw");

    sim.spacing = 1.0;
    sim.zExtent = {5.0, 1.0};
    threw = false;
    try { sim.grid(); }
    catch (const ShapeMismatch&) { threw = true; }
    CHECK(threw, "inverted extent should throw");

    std::cout << " done\n";
}

static void testSingleFocus()
{
    std::cout << "  testSingleFocus...";

    FocalPattern p;
    std::vector<glm::dvec3> pts = p.targets({1.0, 2.0, 50.0}, "mm");
    CHECK(pts.size() == 1, "single pattern gives one focus");
    CHECK(pts[0] == glm::dvec3(1.0, 2.0, 50.0), "focus is the target");

    std::cout << " done\n";
}

static void testWheel()
{
    std::cout << "  testWheel...";

    FocalPattern p;
    p.type = "wheel";
    p.includeCenter = true;
    p.numSpokes = 4;
    p.spokeRadius = 2.0;
    p.units = "mm";

    glm::dvec3 c(0.0, 0.0, 40.0);
    std::vector<glm::dvec3> pts = p.targets(c, "mm");
    CHECK(pts.size() == 5, "center plus four spokes");
    CHECK(pts[0] == c, "center first");
    CHECK(approxEq(pts[1].x, 2.0) && approxEq(pts[1].y, 0.0), "first spoke on +x");
    CHECK(approxEq(pts[2].x, 0.0) && approxEq(pts[2].y, 2.0), "second spoke on +y");
    for (const auto& q : pts)
        CHECK(approxEq(q.z, 40.0), "spokes stay in the x/y plane");

    // Local frame in cm: the 2 mm radius becomes 0.2.
    std::vector<glm::dvec3> cm = p.targets(glm::dvec3(0.0), "cm");
    CHECK(approxEq(cm[1].x, 0.2), "radius converted to local units");

    p.includeCenter = false;
    p.numSpokes = 3;
    CHECK(p.targets(c, "mm").size() == 3, "spokes only");

    p.type = "spiral";
    bool threw = false;
    try { p.targets(c, "mm"); }
    catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "unknown pattern type should throw");

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== Protocol Tests ===\n";

    try
    {
        testDefaultGrid();
        testGridSpacing();
        testSingleFocus();
        testWheel();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected exception: " << e.what() << "\n";
        ++failures;
    }

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All Protocol tests PASSED.\n";
        return 0;
    }
    std::cout << failures << " Protocol test(s) FAILED.\n";
    return 1;
}
