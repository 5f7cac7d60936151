// test_session.cpp - session validity, approvals, targets and save-path sync.

#include "CoordinateFrame.h"
#include "Errors.h"
#include "MemoryScene.h"
#include "Registry.h"
#include "Session.h"
#include "TargetPoint.h"
#include "Volume.h"

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

static TransducerDefinition makeTransducer()
{
    TransducerDefinition def;
    def.id = "T1";
    def.units = "mm";
    def.axes = "LPS";
    def.elements.push_back(TransducerElement{});
    return def;
}

static ProtocolDefinition makeProtocol()
{
    ProtocolDefinition p;
    p.id = "P1";
    return p;
}

static ArtifactId addVolume(SceneHost& scene, const std::string& id)
{
    Volume v;
    v.allocate({2, 2, 2}, glm::dmat4(1.0));
    v.id = id;
    v.name = id;
    return scene.addVolume(id, std::move(v));
}

static SessionDefinition makeDefinition()
{
    SessionDefinition def;
    def.id = "S1";
    def.subjectId = "sub";
    def.transducerId = "T1";
    def.protocolId = "P1";
    def.volumeId = "V1";
    return def;
}

// ---------------------------------------------------------------------------
// Targets
// ---------------------------------------------------------------------------

static void testTargetRecords()
{
    std::cout << "  testTargetRecords...";

    TargetRecord r;
    r.id = "t-apex";
    r.position = {1.0, 2.0, 3.0};
    r.dims = {"L", "P", "S"};
    r.units = "cm";
    TargetPoint t = targetFromRecord(r);
    CHECK(approxEq(t.position.x, -10.0) && approxEq(t.position.y, -20.0) &&
              approxEq(t.position.z, 30.0),
          "LPS cm record lands in RAS mm");
    CHECK(t.name == "t-apex", "empty name falls back to the id");

    TargetRecord back = targetToRecord(t);
    CHECK(back.dims[0] == "R" && back.dims[2] == "S" && back.units == "mm",
          "records are written as RAS mm");
    CHECK(approxEq(back.position[1], -20.0), "position written in RAS mm");

    r.dims = {"L", "P", "Q"};
    bool threw = false;
    try { targetFromRecord(r); }
    catch (const InvalidAxisLabel&) { threw = true; }
    CHECK(threw, "bad dims should throw InvalidAxisLabel");

    std::cout << " done\n";
}

static void testTargetCandidates()
{
    std::cout << "  testTargetCandidates...";

    MemoryScene scene;
    TargetPoint t;
    t.id = "apex";
    t.position = glm::dvec3(4.0, 5.0, 6.0);
    ArtifactId a = addTargetArtifact(scene, t);
    ArtifactId b = addTargetArtifact(scene, t);
    ArtifactId multi = scene.addTarget("pair", {glm::dvec3(0.0), glm::dvec3(1.0)}, glm::dvec3(1.0));

    CHECK(scene.nameOf(b) == "apex_1", "colliding target name made unique");
    CHECK(isTargetCandidate(scene, a), "single point target is a candidate");
    CHECK(!isTargetCandidate(scene, multi), "two points is not a candidate");
    CHECK(targetCandidates(scene).size() == 2, "two candidates");

    TargetPoint read = targetFromArtifact(scene, a);
    CHECK(read.id == "apex" && read.position == t.position, "artifact reads back as target");
    CHECK(targetFromArtifact(scene, b).id == "apex", "renamed artifact keeps the target id");
    CHECK(read.name == "apex", "unnamed target labelled with its id");

    bool threw = false;
    try { targetFromArtifact(scene, multi); }
    catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "non-candidate should throw");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

static void testValidity()
{
    std::cout << "  testValidity...";

    MemoryScene scene;
    Registry registry(scene);
    ArtifactId vol = addVolume(scene, "V1");
    Session s(makeDefinition(), vol, {});

    CHECK(!s.isValid(registry), "nothing loaded yet");
    registry.loadTransducer(makeTransducer());
    CHECK(!s.isValid(registry), "protocol still missing");
    registry.loadProtocol(makeProtocol());
    CHECK(s.isValid(registry), "transducer, protocol and volume present");

    ArtifactId other = addVolume(scene, "V2");
    Session wrong(makeDefinition(), other, {});
    CHECK(!wrong.isValid(registry), "volume id must match");

    CHECK(s.forgetArtifact(vol), "volume forgotten");
    CHECK(s.volumeArtifact() == kNoArtifact, "volume handle cleared");
    CHECK(!s.isValid(registry), "no volume, not valid");

    std::cout << " done\n";
}

static void testApprovals()
{
    std::cout << "  testApprovals...";

    Session s(makeDefinition(), kNoArtifact, {});
    CHECK(!s.virtualFitApprovedTarget().has_value(), "no approval initially");

    s.approveVirtualFit(std::string("t-apex"));
    CHECK(s.virtualFitApprovedTarget() == std::string("t-apex"), "approved target");
    s.approveVirtualFit(std::string("t-base"));
    CHECK(s.virtualFitApprovedTarget() == std::string("t-base"), "at most one approved target");
    s.approveVirtualFit(std::nullopt);
    CHECK(!s.virtualFitApprovedTarget().has_value(), "approval cleared");

    CHECK(s.toggleTrackingApproval(), "toggle on");
    CHECK(s.trackingApproved(), "tracking approved");
    CHECK(!s.toggleTrackingApproval(), "toggle off");
    s.toggleTrackingApproval();
    s.revokeTrackingApproval();
    CHECK(!s.trackingApproved(), "revoked");

    std::cout << " done\n";
}

static void testSyncFromScene()
{
    std::cout << "  testSyncFromScene...";

    MemoryScene scene;
    Registry registry(scene);

    glm::dmat4 input(1.0);
    input[3] = glm::dvec4(3.0, 4.0, 5.0, 1.0);
    Transducer* t = registry.loadTransducer(makeTransducer(), input);

    TargetRecord record;
    record.id = "t-apex";
    record.name = "Left apex";
    record.radius = 3.0;
    record.position = {1.0, 2.0, 3.0};
    ArtifactId a = addTargetArtifact(scene, targetFromRecord(record));
    ArtifactId pair = scene.addTarget("pair", {glm::dvec3(0.0), glm::dvec3(1.0)}, glm::dvec3(1.0));

    Session s(makeDefinition(), kNoArtifact, {a, pair});
    scene.setTargetPoint(a, 0, glm::dvec3(7.0, 8.0, 9.0));

    SessionDefinition def = s.syncFromScene(scene, *t, s.targetArtifacts());
    CHECK(def.targets.size() == 1, "only candidates are persisted");
    CHECK(def.targets[0].id == "t-apex", "target id");
    CHECK(def.targets[0].name == "Left apex", "label persisted as the name");
    CHECK(approxEq(def.targets[0].radius, 3.0), "radius persisted");
    CHECK(approxEq(def.targets[0].position[0], 7.0), "moved position persisted");

    glm::dmat4 saved = matrixFromRowMajor(def.arrayTransform.matrix);
    CHECK(approxEq(saved[3][0], 3.0) && approxEq(saved[3][2], 5.0),
          "array transform is the native placement");
    CHECK(def.arrayTransform.units == "mm", "array transform in native units");
    CHECK(s.definition().targets.size() == 1, "session record updated too");

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== Session Tests ===\n";

    try
    {
        testTargetRecords();
        testTargetCandidates();
        testValidity();
        testApprovals();
        testSyncFromScene();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected exception: " << e.what() << "\n";
        ++failures;
    }

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All Session tests PASSED.\n";
        return 0;
    }
    std::cout << failures << " Session test(s) FAILED.\n";
    return 1;
}
