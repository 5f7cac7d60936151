// test_database.cpp - directory database layout and session loading through
// the registry.

#include "CoordinateFrame.h"
#include "DirectoryDatabase.h"
#include "Errors.h"
#include "MemoryScene.h"
#include "Registry.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

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

static bool matApproxEq(const glm::dmat4& a, const glm::dmat4& b, double tol = 1e-9)
{
    for (int c = 0; c < 4; ++c)
        for (int r = 0; r < 4; ++r)
            if (std::fabs(a[c][r] - b[c][r]) > tol)
                return false;
    return true;
}

/// RAII temp directory, removed with everything under it.
struct TmpDir
{
    fs::path path;

    explicit TmpDir(const std::string& name)
        : path(fs::temp_directory_path() / name)
    {
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TmpDir() { fs::remove_all(path); }
};

static void touch(const fs::path& path)
{
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::trunc);
    ofs << "\n";
}

/// Directory database whose volume files are never opened: every candidate
/// reads as a small synthetic volume.
class SyntheticVolumeDatabase : public DirectoryDatabase
{
public:
    using DirectoryDatabase::DirectoryDatabase;

    mutable int volumeLoads = 0;

    Volume loadVolume(const std::string&) const override
    {
        ++volumeLoads;
        Volume v;
        v.allocate({4, 4, 4}, glm::dmat4(1.0));
        return v;
    }
};

static TransducerDefinition sampleTransducer(const std::string& axes = "LPS")
{
    TransducerDefinition def;
    def.id = "evt1";
    def.units = "mm";
    def.axes = axes;
    for (int i = 0; i < 2; ++i)
    {
        TransducerElement el;
        el.index = i;
        el.position = {i * 3.0, 0.0, 0.0};
        def.elements.push_back(el);
    }
    return def;
}

static ProtocolDefinition sampleProtocol()
{
    ProtocolDefinition p;
    p.id = "single-500k";
    return p;
}

static SessionDefinition sampleSession()
{
    SessionDefinition s;
    s.id = "ses-01";
    s.name = "First visit";
    s.subjectId = "sub-01";
    s.transducerId = "evt1";
    s.protocolId = "single-500k";
    s.volumeId = "T1w";
    s.arrayTransform.matrix[3] = 2.0;   // row-major x translation
    s.arrayTransform.matrix[11] = 4.0;  // z
    s.arrayTransform.units = "cm";

    TargetRecord apex;
    apex.id = "t-apex";
    apex.name = "Left apex";
    apex.radius = 2.5;
    apex.position = {1.0, 2.0, 3.0};
    apex.dims = {"L", "P", "S"};
    apex.units = "cm";
    TargetRecord base;
    base.id = "t-base";
    base.position = {0.0, 0.0, 50.0};
    s.targets = {apex, base};
    return s;
}

/// Subject, volume record with one data file, transducer, protocol and one
/// session.
static void populate(DirectoryDatabase& db, const TransducerDefinition& transducer)
{
    db.writeSubject({"sub-01", "Subject one"});
    db.writeVolumeRecord("sub-01", {"T1w", "T1 weighted", "T1w.mnc"});
    touch(db.root() / "subjects" / "sub-01" / "volumes" / "T1w" / "T1w.mnc");
    db.writeTransducer(transducer);
    db.writeProtocol(sampleProtocol());
    db.writeSession(sampleSession());
}

// ---------------------------------------------------------------------------
// Directory layout
// ---------------------------------------------------------------------------

static void testMissingRoot()
{
    std::cout << "  testMissingRoot...";

    bool threw = false;
    try { DirectoryDatabase db("/nonexistent/lifu_db"); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "missing root should throw");

    std::cout << " done\n";
}

static void testRecordsRoundTrip()
{
    std::cout << "  testRecordsRoundTrip...";
    TmpDir tmp("lifu_db_records");

    DirectoryDatabase db(tmp.path.string());
    populate(db, sampleTransducer());
    db.writeSubject({"sub-02", ""});

    CHECK(db.subjectIds() == std::vector<std::string>({"sub-01", "sub-02"}), "subjects sorted");
    CHECK(db.sessionIds("sub-01") == std::vector<std::string>({"ses-01"}), "sessions");
    CHECK(db.sessionIds("sub-02").empty(), "subject without sessions");
    CHECK(fs::exists(tmp.path / "subjects" / "sub-01" / "sessions" / "ses-01" / "ses-01.json"),
          "session file layout");

    SessionDefinition s = db.loadSession("sub-01", "ses-01");
    CHECK(s.name == "First visit" && s.targets.size() == 2, "session read back");
    CHECK(s.arrayTransform.units == "cm", "transform units read back");

    CHECK(db.loadTransducer("evt1").elements.size() == 2, "transducer read back");
    CHECK(db.loadProtocol("single-500k").focalPattern.type == "single", "protocol read back");
    CHECK(db.loadSubject("sub-01").name == "Subject one", "subject read back");

    bool threw = false;
    try { db.loadSession("sub-01", "ses-99"); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "missing session should throw");

    SessionDefinition orphan = sampleSession();
    orphan.subjectId.clear();
    threw = false;
    try { db.writeSession(orphan); }
    catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "session without a subject cannot be written");

    std::cout << " done\n";
}

static void testDefaultTransducerAxes()
{
    std::cout << "  testDefaultTransducerAxes...";
    TmpDir tmp("lifu_db_axes");

    fs::path file = tmp.path / "transducers" / "bare" / "bare.json";
    fs::create_directories(file.parent_path());
    {
        std::ofstream ofs(file);
        ofs << R"({"id": "bare", "units": "mm", "elements": []})";
    }

    DirectoryDatabase db(tmp.path.string());
    CHECK(db.loadTransducer("bare").axes == "LPS", "LPS unless configured");
    db.setDefaultTransducerAxes("RAS");
    CHECK(db.loadTransducer("bare").axes == "RAS", "configured default applies");

    std::cout << " done\n";
}

static void testVolumeCandidates()
{
    std::cout << "  testVolumeCandidates...";
    TmpDir tmp("lifu_db_volumes");

    DirectoryDatabase db(tmp.path.string());
    db.writeVolumeRecord("sub-01", {"T1w", "", "T1w.mnc"});
    fs::path dir = tmp.path / "subjects" / "sub-01" / "volumes" / "T1w";
    touch(dir / "T1w.mnc");
    touch(dir / "T1w_mask.mnc");
    touch(dir / "T1w.txt");

    std::vector<std::string> one = db.volumeFileCandidates("sub-01", "T1w");
    CHECK(one.size() == 1 && fs::path(one[0]).filename() == "T1w.mnc", "single candidate");

    touch(dir / "T1w.nii.gz");
    CHECK(db.volumeFileCandidates("sub-01", "T1w").size() == 2, "second format is a candidate");

    CHECK(DirectoryDatabase::isVolumeFile("a.nrrd") && !DirectoryDatabase::isVolumeFile("a.json"),
          "volume extensions");

    bool threw = false;
    try { db.loadVolume((dir / "T1w.nii.gz").string()); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "only MINC data is readable");

    std::cout << " done\n";
}

static void testWriteSolutionAndRun()
{
    std::cout << "  testWriteSolutionAndRun...";
    TmpDir tmp("lifu_db_outputs");

    DirectoryDatabase db(tmp.path.string());
    SessionDefinition s = sampleSession();

    Solution solution;
    solution.id = "ses-01_20240301_101500_000001";
    solution.sessionId = s.id;
    db.writeSolution(s, solution);

    Run run = makeRun(true, "ok", s.id, solution.id,
                      std::chrono::system_clock::now());
    db.writeRun(s, run);

    fs::path sessionDir = tmp.path / "subjects" / "sub-01" / "sessions" / "ses-01";
    fs::path solutionFile = sessionDir / "solutions" / solution.id / (solution.id + ".json");
    fs::path runFile = sessionDir / "runs" / run.id / (run.id + ".json");
    CHECK(fs::exists(solutionFile), "solution file layout");
    CHECK(fs::exists(runFile), "run file layout");

    std::ifstream ifs(runFile);
    std::string json((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    Run back;
    fromJson(json, back);
    CHECK(back.solutionId == solution.id && back.successFlag, "run read back");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Registry::loadSession
// ---------------------------------------------------------------------------

struct LoadFixture
{
    TmpDir tmp;
    MemoryScene scene;
    Registry registry;
    SyntheticVolumeDatabase* db = nullptr;
    std::vector<Notification> notes;

    explicit LoadFixture(const std::string& name, const std::string& axes = "LPS")
        : tmp(name), registry(scene)
    {
        auto owned = std::make_unique<SyntheticVolumeDatabase>(tmp.path.string());
        db = owned.get();
        populate(*db, sampleTransducer(axes));
        registry.setDatabase(std::move(owned));
        registry.setNotificationHandler([this](const Notification& n) { notes.push_back(n); });
    }
};

static void testLoadSession()
{
    std::cout << "  testLoadSession...";
    LoadFixture f("lifu_db_load");

    Session* s = f.registry.loadSession("sub-01", "ses-01");
    CHECK(s != nullptr && s == f.registry.session(), "session active");
    CHECK(f.registry.sessionState() == SessionState::Active, "state active");
    CHECK(f.registry.sessionValid(), "valid after load");
    CHECK(f.scene.size() == 5, "volume, two targets, mesh and placement");
    CHECK(f.scene.nameOf(s->volumeArtifact()) == "T1w", "volume named after its id");
    CHECK(f.registry.hasProtocol("single-500k"), "protocol registered");

    // LPS (1, 2, 3) cm is RAS (-10, -20, 30) mm.
    TargetPoint apex = targetFromArtifact(f.scene, s->targetArtifacts()[0]);
    CHECK(apex.id == "t-apex" && glm::length(apex.position - glm::dvec3(-10, -20, 30)) < 1e-9,
          "target decoded into world RAS mm");
    CHECK(apex.name == "Left apex" && apex.radius == 2.5, "label and radius carried");

    glm::dmat4 matrix(1.0);
    matrix[3] = glm::dvec4(20.0, 0.0, 40.0, 1.0);  // 2 and 4 cm in native mm
    glm::dmat4 expected = composeFrameToWorld("LPS", "mm") * matrix;
    CHECK(matApproxEq(f.registry.transducer("evt1")->placement(f.scene), expected),
          "placement from the stored transform");

    std::cout << " done\n";
}

static void testAmbiguousVolume()
{
    std::cout << "  testAmbiguousVolume...";
    LoadFixture f("lifu_db_ambiguous");
    fs::path dir = f.tmp.path / "subjects" / "sub-01" / "volumes" / "T1w";

    touch(dir / "T1w.nii");
    bool threw = false;
    try { f.registry.loadSession("sub-01", "ses-01"); }
    catch (const AmbiguousVolumeFile&) { threw = true; }
    CHECK(threw, "two candidates should throw");
    CHECK(f.scene.size() == 0, "nothing added");
    CHECK(f.db->volumeLoads == 0, "no volume read");

    fs::remove(dir / "T1w.nii");
    fs::remove(dir / "T1w.mnc");
    threw = false;
    try { f.registry.loadSession("sub-01", "ses-01"); }
    catch (const AmbiguousVolumeFile&) { threw = true; }
    CHECK(threw, "no candidate should throw");
    CHECK(f.registry.sessionState() == SessionState::Unloaded, "still unloaded");

    std::cout << " done\n";
}

static void testReloadConfirmation()
{
    std::cout << "  testReloadConfirmation...";
    LoadFixture f("lifu_db_reload");

    Session* first = f.registry.loadSession("sub-01", "ses-01");
    ArtifactId volume = first->volumeArtifact();

    // No confirmation handler: the reload is declined.
    CHECK(f.registry.loadSession("sub-01", "ses-01") == nullptr, "declined reload");
    CHECK(f.notes.size() == 1 && f.notes[0].kind == NotificationKind::LoadAborted,
          "abort notice");
    CHECK(f.registry.session() == first && f.scene.contains(volume), "first session untouched");

    int asked = 0;
    f.registry.setConfirmationHandler([&](const std::string&, const std::string&) {
        ++asked;
        return true;
    });
    Session* second = f.registry.loadSession("sub-01", "ses-01");
    CHECK(asked == 1, "asked once");
    CHECK(second != nullptr && f.registry.sessionValid(), "reloaded");
    CHECK(!f.scene.contains(volume), "previous volume released");
    CHECK(f.scene.size() == 5, "no duplicate artifacts");

    Session* third = f.registry.loadSession("sub-01", "ses-01", true);
    CHECK(third != nullptr && asked == 1, "pre-confirmed reload does not ask");

    std::cout << " done\n";
}

static void testLoadRollback()
{
    std::cout << "  testLoadRollback...";
    LoadFixture f("lifu_db_rollback", "LPQ");

    bool threw = false;
    try { f.registry.loadSession("sub-01", "ses-01"); }
    catch (const InvalidAxisLabel&) { threw = true; }
    CHECK(threw, "bad transducer axes should throw");
    CHECK(f.scene.size() == 0, "volume and targets rolled back");
    CHECK(f.registry.session() == nullptr, "no session");
    CHECK(f.registry.sessionState() == SessionState::Unloaded, "unloaded");
    CHECK(!f.registry.hasTransducer("evt1"), "no transducer");

    std::cout << " done\n";
}

static void testSaveSession()
{
    std::cout << "  testSaveSession...";
    LoadFixture f("lifu_db_save");

    Session* s = f.registry.loadSession("sub-01", "ses-01");
    f.scene.setTargetPoint(s->targetArtifacts()[1], 0, glm::dvec3(1.0, 2.0, 60.0));
    f.registry.approveVirtualFit(std::string("t-base"));

    glm::dmat4 moved = f.registry.transducer("evt1")->placement(f.scene);
    moved[3] += glm::dvec4(0.0, 0.0, 5.0, 0.0);
    f.registry.transducer("evt1")->setPlacement(f.scene, moved);

    f.registry.saveSession();

    SessionDefinition stored = f.db->loadSession("sub-01", "ses-01");
    CHECK(stored.targets.size() == 2, "targets stored");
    CHECK(stored.targets[0].id == "t-apex" && stored.targets[0].name == "Left apex",
          "name kept apart from the id");
    CHECK(stored.targets[0].radius == 2.5, "radius kept");
    CHECK(!stored.virtualFitApprovalForTargetId.has_value(),
          "moving the transducer revoked the stored approval");
    CHECK(stored.targets[1].units == "mm" && stored.targets[1].dims[0] == "R", "stored as RAS mm");
    CHECK(std::fabs(stored.targets[1].position[2] - 60.0) < 1e-9, "moved target stored");
    CHECK(stored.arrayTransform.units == "mm", "transform stored in native units");
    // Native LPS z is world z: 40 mm plus the 5 mm move.
    CHECK(std::fabs(stored.arrayTransform.matrix[11] - 45.0) < 1e-9, "moved placement stored");

    std::cout << " done\n";
}

static void testReloadAfterOrphaningUnload()
{
    std::cout << "  testReloadAfterOrphaningUnload...";
    LoadFixture f("lifu_db_orphan_reload");

    Session* first = f.registry.loadSession("sub-01", "ses-01");
    ArtifactId oldApex = first->targetArtifacts()[0];
    f.registry.unloadSession(false);
    CHECK(f.scene.contains(oldApex), "orphaned target stays");

    Session* s = f.registry.loadSession("sub-01", "ses-01", true);
    ArtifactId apex = s->targetArtifacts()[0];
    CHECK(f.scene.nameOf(apex) == "t-apex_1", "scene name made unique");
    CHECK(targetFromArtifact(f.scene, apex).id == "t-apex", "target id kept");

    f.registry.approveVirtualFit(std::string("t-apex"));
    f.scene.setTargetPoint(oldApex, 0, glm::dvec3(9.0, 9.0, 9.0));
    CHECK(s->virtualFitApprovedTarget() == std::string("t-apex"),
          "moving the orphan leaves the approval");
    f.scene.setTargetPoint(apex, 0, glm::dvec3(1.0, 1.0, 1.0));
    CHECK(!s->virtualFitApprovedTarget().has_value(), "moving the session target revokes");

    f.registry.approveVirtualFit(std::string("t-apex"));
    f.registry.saveSession();
    SessionDefinition stored = f.db->loadSession("sub-01", "ses-01");
    CHECK(stored.targets.size() == 2 && stored.targets[0].id == "t-apex" &&
              stored.targets[1].id == "t-base",
          "stored ids are the target ids, not scene names");
    CHECK(stored.virtualFitApprovalForTargetId == std::string("t-apex"),
          "approval names a stored target");

    std::cout << " done\n";
}

int main()
{
    std::cout << "=== Database Tests ===\n";

    try
    {
        testMissingRoot();
        testRecordsRoundTrip();
        testDefaultTransducerAxes();
        testVolumeCandidates();
        testWriteSolutionAndRun();
        testLoadSession();
        testAmbiguousVolume();
        testReloadConfirmation();
        testLoadRollback();
        testSaveSession();
        testReloadAfterOrphaningUnload();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected exception: " << e.what() << "\n";
        ++failures;
    }

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All Database tests PASSED.\n";
        return 0;
    }
    std::cout << failures << " Database test(s) FAILED.\n";
    return 1;
}
