#include "Solution.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "CoordinateFrame.h"
#include "Errors.h"
#include "Run.h"

static void checkField(const ScalarField& field, const SimulationGrid& grid, const std::string& what)
{
    if (!field.grid.sameGeometry(grid))
        throw ShapeMismatch(what + " grid differs from the first focus grid");
    if (field.data.size() != grid.size())
        throw ShapeMismatch(what + " has " + std::to_string(field.data.size()) +
                            " samples for a grid of " + std::to_string(grid.size()));
}

void aggregateFields(Solution& solution)
{
    if (solution.foci.empty())
        throw std::invalid_argument("Cannot aggregate a solution with no focus points");

    const SimulationGrid& grid = solution.foci.front().simulation.pnp.grid;
    for (const auto& f : solution.foci)
    {
        checkField(f.simulation.pnp, grid, "Peak negative pressure");
        checkField(f.simulation.intensity, grid, "Intensity");
    }

    std::size_t n = grid.size();
    solution.pnp.name = "pnp";
    solution.pnp.grid = grid;
    solution.pnp.data = solution.foci.front().simulation.pnp.data;

    solution.intensity.name = "intensity";
    solution.intensity.grid = grid;
    solution.intensity.data.assign(n, 0.0);

    for (const auto& f : solution.foci)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            solution.pnp.data[i] = std::max(solution.pnp.data[i], f.simulation.pnp.data[i]);
            solution.intensity.data[i] += f.simulation.intensity.data[i];
        }
    }

    double count = static_cast<double>(solution.foci.size());
    for (double& v : solution.intensity.data)
        v /= count;
}

Solution generateSolution(PlanningBackend& backend,
                          const TransducerDefinition& transducer,
                          const glm::dmat4& placement,
                          const TargetPoint& target,
                          const Volume& volume,
                          const glm::dmat4& worldToVolumeIndex,
                          const ProtocolDefinition& protocol,
                          BoundaryPolicy policy,
                          const std::optional<std::string>& sessionId,
                          std::chrono::system_clock::time_point time)
{
    std::string ts = formatTimestamp(time);

    Solution solution;
    solution.id = sessionId ? *sessionId + "_" + ts : ts;
    solution.name = "Solution_" + ts;
    solution.sessionId = sessionId.value_or("");
    solution.protocolId = protocol.id;
    solution.transducerId = transducer.id;
    solution.targetId = target.id;
    solution.units = transducer.units;

    glm::dvec3 center = transformPoint(glm::inverse(placement), target.position);

    SimulationGrid grid = protocol.sim.grid();
    ScalarField medium = resampleVolumeToGrid(volume, worldToVolumeIndex, placement,
                                              transducer.units, grid, policy);

    std::vector<glm::dvec3> foci = protocol.focalPattern.targets(center, transducer.units);
    std::cerr << "[planning] " << solution.id << ": " << foci.size()
              << " focus point(s) on a " << grid.shape.x << "x" << grid.shape.y << "x"
              << grid.shape.z << " grid\n";

    for (const auto& focus : foci)
    {
        FocusResult r;
        r.focus = focus;
        r.beamform = backend.beamform(transducer, focus, medium, protocol);
        r.simulation = backend.simulate(transducer, medium, r.beamform, protocol);
        solution.foci.push_back(std::move(r));
    }

    aggregateFields(solution);
    return solution;
}
