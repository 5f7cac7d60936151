#pragma once

#include <string>

#include "Resample.h"

/// Planner settings persisted as JSON.
struct PlannerConfig
{
    std::string databaseDirectory;                 // empty = none configured
    std::string defaultTransducerAxes = "LPS";     // for transducers that name none
    std::string boundaryPolicy = "nearest";        // "nearest" | "constant"
    bool releaseArtifactsOnInvalidation = false;   // when no handler decides
    bool verbose = false;

    /// @throws std::invalid_argument on an unknown policy name
    BoundaryPolicy resamplingPolicy() const;
};

/// Return the global config file path: $XDG_CONFIG_HOME/lifu_planner/config.json
/// or $HOME/.config/lifu_planner/config.json
std::string globalConfigPath();

/// Load a config from a JSON file.  Returns a default PlannerConfig if the
/// file does not exist.  Unknown keys are ignored.
/// Throws std::runtime_error on parse errors.
PlannerConfig loadConfig(const std::string& path);

/// Save a config to a JSON file.  Creates parent directories as needed.
/// Throws std::runtime_error on I/O errors.
void saveConfig(const PlannerConfig& config, const std::string& path);

/// Merge a local config on top of a global config.  Local values that
/// differ from the defaults win.
PlannerConfig mergeConfigs(const PlannerConfig& global, const PlannerConfig& local);
