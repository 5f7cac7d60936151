#include <array>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "CoordinateFrame.h"
#include "DirectoryDatabase.h"
#include "Errors.h"
#include "MemoryScene.h"
#include "PlannerConfig.h"
#include "Registry.h"
#include "TargetFile.h"
#include "TargetPoint.h"
#include "Tracking.h"

static void printUsage()
{
    std::cerr << "Usage: lifu_session [options] SUBJECT SESSION\n"
              << "\nOptions:\n"
              << "  -c, --config <path>       Merge config from <path> over the global config\n"
              << "      --db <dir>            Database directory (overrides config)\n"
              << "      --list                List subjects and sessions, then exit\n"
              << "      --approve-target <id> Approve the virtual fit for target <id>\n"
              << "      --revoke-fit          Clear the virtual fit approval\n"
              << "      --toggle-tracking     Flip the transducer tracking approval\n"
              << "      --track <file.tag>    Place the transducer from paired landmarks\n"
              << "                            (volume 1: world, volume 2: transducer)\n"
              << "      --save                Write the session back to the database\n"
              << "  -h, --help                Show this help message\n";
}

static void listDatabase(const Database& db)
{
    for (const auto& subject : db.subjectIds())
    {
        std::cout << subject << "\n";
        for (const auto& session : db.sessionIds(subject))
            std::cout << "  " << session << "\n";
    }
}

static void printMatrix(const glm::dmat4& m)
{
    std::array<double, 16> rows = matrixToRowMajor(m);
    for (int r = 0; r < 4; ++r)
    {
        std::cout << "   ";
        for (int c = 0; c < 4; ++c)
            std::cout << " " << std::setw(10) << std::fixed << std::setprecision(4) << rows[r * 4 + c];
        std::cout << "\n";
    }
}

static void printSummary(const Registry& registry)
{
    const Session* session = registry.session();
    std::cout << "State:    " << sessionStateName(registry.sessionState()) << "\n";
    if (!session)
        return;

    const SceneHost& scene = registry.scene();
    std::cout << "Session:  " << session->id() << " (subject " << session->subjectId() << ")\n"
              << "Valid:    " << (registry.sessionValid() ? "yes" : "no") << "\n"
              << "Protocol: " << session->protocolId() << "\n"
              << "Volume:   " << session->volumeId() << "\n"
              << "Targets:\n";
    for (ArtifactId id : session->targetArtifacts())
    {
        if (!isTargetCandidate(scene, id))
            continue;
        TargetPoint t = targetFromArtifact(scene, id);
        std::cout << "  " << t.id << "  RAS (" << t.position.x << ", " << t.position.y << ", "
                  << t.position.z << ") mm\n";
    }

    const auto& fit = session->virtualFitApprovedTarget();
    std::cout << "Virtual fit approved: " << (fit ? *fit : std::string("none")) << "\n"
              << "Tracking approved:    " << (session->trackingApproved() ? "yes" : "no") << "\n";

    if (const Transducer* t = registry.transducer(session->transducerId()))
    {
        std::cout << "Transducer: " << t->id() << " (" << t->definition().elements.size()
                  << " elements, " << t->definition().units << ")\n"
                  << "  placement (world RAS mm):\n";
        printMatrix(t->placement(scene));
    }
}

int main(int argc, char** argv)
{
    try
    {
        std::string cliConfigPath;
        std::string cliDatabase;
        bool listOnly = false;
        std::optional<std::string> approveTarget;
        bool revokeFit = false;
        bool toggleTracking = false;
        std::string trackFile;
        bool save = false;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg = argv[i];

            if ((arg == "--config" || arg == "-c") && i + 1 < argc)
            {
                cliConfigPath = argv[++i];
                continue;
            }
            if (arg == "--db" && i + 1 < argc)
            {
                cliDatabase = argv[++i];
                continue;
            }
            if (arg == "--approve-target" && i + 1 < argc)
            {
                approveTarget = argv[++i];
                continue;
            }
            if (arg == "--track" && i + 1 < argc)
            {
                trackFile = argv[++i];
                continue;
            }
            if (arg == "--list")           { listOnly = true; continue; }
            if (arg == "--revoke-fit")     { revokeFit = true; continue; }
            if (arg == "--toggle-tracking") { toggleTracking = true; continue; }
            if (arg == "--save")           { save = true; continue; }

            if (arg == "--help" || arg == "-h")
            {
                printUsage();
                return 0;
            }

            if (!arg.empty() && arg.front() == '-')
            {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage();
                return 1;
            }
            positional.emplace_back(arg);
        }

        // --- Load and merge configs ---
        PlannerConfig globalCfg;
        try { globalCfg = loadConfig(globalConfigPath()); }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: " << e.what() << "\n";
        }

        PlannerConfig localCfg;
        if (!cliConfigPath.empty())
            localCfg = loadConfig(cliConfigPath);
        PlannerConfig config = mergeConfigs(globalCfg, localCfg);
        if (!cliDatabase.empty())
            config.databaseDirectory = cliDatabase;

        if (config.databaseDirectory.empty())
        {
            std::cerr << "No database directory: pass --db or set database_directory\n";
            return 1;
        }

        auto db = std::make_unique<DirectoryDatabase>(config.databaseDirectory);
        db->setDefaultTransducerAxes(config.defaultTransducerAxes);

        if (listOnly)
        {
            listDatabase(*db);
            return 0;
        }
        if (positional.size() != 2)
        {
            printUsage();
            return 1;
        }

        MemoryScene scene;
        Registry registry(scene, config);
        registry.setDatabase(std::move(db));
        registry.setNotificationHandler([](const Notification& n) {
            std::cout << "Notice: " << n.message << "\n";
        });

        Session* session = registry.loadSession(positional[0], positional[1]);
        if (!session)
            return 1;

        if (!trackFile.empty())
        {
            const Transducer* t = registry.transducer(session->transducerId());
            if (!t)
                throw NotLoaded("Transducer '" + session->transducerId() + "' is not loaded");
            LandmarkPairs pairs = loadLandmarkPairs(trackFile);
            TrackingResult fit = placementFromLandmarks(pairs.first, pairs.second,
                                                        t->definition().axes,
                                                        t->definition().units);
            registry.applyTracking(t->id(), fit);
            for (std::size_t i = 0; i < fit.perLandmarkError.size(); ++i)
                std::cout << "Landmark " << i + 1 << ": " << fit.perLandmarkError[i] << " mm\n";
        }

        if (revokeFit)
            registry.approveVirtualFit(std::nullopt);
        if (approveTarget)
            registry.approveVirtualFit(approveTarget);
        if (toggleTracking)
            registry.toggleTrackingApproval();

        printSummary(registry);

        if (save)
        {
            registry.saveSession();
            std::cout << "Saved session " << registry.session()->id() << "\n";
        }
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
