#include "PlannerConfig.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <glaze/glaze.hpp>

template <>
struct glz::meta<PlannerConfig>
{
    using T = PlannerConfig;
    static constexpr auto value = object(
        "database_directory",                 &T::databaseDirectory,
        "default_transducer_axes",            &T::defaultTransducerAxes,
        "boundary_policy",                    &T::boundaryPolicy,
        "release_artifacts_on_invalidation",  &T::releaseArtifactsOnInvalidation,
        "verbose",                            &T::verbose
    );
};

namespace
{

std::filesystem::path configHome()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return xdg;
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config";
    throw std::runtime_error("Cannot determine home directory");
}

std::string readWholeFile(const std::string& path)
{
    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open config file: " + path);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

/// Take the local value only when it was changed from the default.
template <class V>
void overlay(V& merged, const V& local, const V& defaultValue)
{
    if (local != defaultValue)
        merged = local;
}

} // namespace

BoundaryPolicy PlannerConfig::resamplingPolicy() const
{
    if (boundaryPolicy == "nearest")
        return BoundaryPolicy::ClampToEdge;
    if (boundaryPolicy == "constant")
        return BoundaryPolicy::Zero;
    throw std::invalid_argument("Unknown boundary policy '" + boundaryPolicy +
                                "' (expected \"nearest\" or \"constant\")");
}

std::string globalConfigPath()
{
    return (configHome() / "lifu_planner" / "config.json").string();
}

PlannerConfig loadConfig(const std::string& path)
{
    PlannerConfig config{};
    if (!std::filesystem::exists(path))
        return config;

    std::string content = readWholeFile(path);
    if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, content))
        throw std::runtime_error("Invalid config file " + path + ":\n" +
                                 glz::format_error(ec, content));
    return config;
}

void saveConfig(const PlannerConfig& config, const std::string& path)
{
    std::string json;
    if (glz::write<glz::opts{.prettify = true}>(config, json))
        throw std::runtime_error("Cannot encode planner config as JSON");

    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!dir.empty() && !std::filesystem::create_directories(dir, ec) && ec)
        throw std::runtime_error("Cannot create config directory " + dir.string() + ": " +
                                 ec.message());

    std::ofstream ofs(path, std::ios::trunc);
    if (!(ofs << json))
        throw std::runtime_error("Cannot write config file: " + path);
}

PlannerConfig mergeConfigs(const PlannerConfig& global, const PlannerConfig& local)
{
    const PlannerConfig defaults{};
    PlannerConfig merged = global;
    overlay(merged.databaseDirectory, local.databaseDirectory, defaults.databaseDirectory);
    overlay(merged.defaultTransducerAxes, local.defaultTransducerAxes, defaults.defaultTransducerAxes);
    overlay(merged.boundaryPolicy, local.boundaryPolicy, defaults.boundaryPolicy);
    overlay(merged.releaseArtifactsOnInvalidation, local.releaseArtifactsOnInvalidation,
            defaults.releaseArtifactsOnInvalidation);
    overlay(merged.verbose, local.verbose, defaults.verbose);
    return merged;
}
