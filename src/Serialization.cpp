#include "Serialization.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <glaze/glaze.hpp>

// ---- Glaze meta for custom JSON field names --------------------------------

template <>
struct glz::meta<TargetRecord>
{
    using T = TargetRecord;
    static constexpr auto value = object(
        "id",       &T::id,
        "name",     &T::name,
        "color",    &T::color,
        "radius",   &T::radius,
        "position", &T::position,
        "dims",     &T::dims,
        "units",    &T::units
    );
};

template <>
struct glz::meta<ArrayTransform>
{
    using T = ArrayTransform;
    static constexpr auto value = object(
        "matrix", &T::matrix,
        "units",  &T::units
    );
};

template <>
struct glz::meta<SessionDefinition>
{
    using T = SessionDefinition;
    static constexpr auto value = object(
        "id",                                 &T::id,
        "name",                               &T::name,
        "subject_id",                         &T::subjectId,
        "protocol_id",                        &T::protocolId,
        "transducer_id",                      &T::transducerId,
        "volume_id",                          &T::volumeId,
        "array_transform",                    &T::arrayTransform,
        "targets",                            &T::targets,
        "virtual_fit_approval_for_target_id", &T::virtualFitApprovalForTargetId,
        "transducer_tracking_approved",       &T::transducerTrackingApproved
    );
};

template <>
struct glz::meta<TransducerElement>
{
    using T = TransducerElement;
    static constexpr auto value = object(
        "index",    &T::index,
        "position", &T::position,
        "size",     &T::size
    );
};

template <>
struct glz::meta<TransducerDefinition>
{
    using T = TransducerDefinition;
    static constexpr auto value = object(
        "id",       &T::id,
        "name",     &T::name,
        "units",    &T::units,
        "axes",     &T::axes,
        "elements", &T::elements
    );
};

template <>
struct glz::meta<PulseSpec>
{
    using T = PulseSpec;
    static constexpr auto value = object(
        "frequency", &T::frequency,
        "duration",  &T::duration
    );
};

template <>
struct glz::meta<SimSetup>
{
    using T = SimSetup;
    static constexpr auto value = object(
        "spacing",  &T::spacing,
        "units",    &T::units,
        "x_extent", &T::xExtent,
        "y_extent", &T::yExtent,
        "z_extent", &T::zExtent,
        "dt",       &T::dt,
        "t_end",    &T::tEnd,
        "c0",       &T::speedOfSound
    );
};

template <>
struct glz::meta<FocalPattern>
{
    using T = FocalPattern;
    static constexpr auto value = object(
        "type",           &T::type,
        "include_center", &T::includeCenter,
        "num_spokes",     &T::numSpokes,
        "spoke_radius",   &T::spokeRadius,
        "units",          &T::units
    );
};

template <>
struct glz::meta<ProtocolDefinition>
{
    using T = ProtocolDefinition;
    static constexpr auto value = object(
        "id",            &T::id,
        "name",          &T::name,
        "pulse",         &T::pulse,
        "sim_setup",     &T::sim,
        "focal_pattern", &T::focalPattern
    );
};

template <>
struct glz::meta<FocusRecord>
{
    using T = FocusRecord;
    static constexpr auto value = object(
        "position",    &T::position,
        "delays",      &T::delays,
        "apodization", &T::apodization
    );
};

template <>
struct glz::meta<SolutionRecord>
{
    using T = SolutionRecord;
    static constexpr auto value = object(
        "id",            &T::id,
        "name",          &T::name,
        "session_id",    &T::sessionId,
        "protocol_id",   &T::protocolId,
        "transducer_id", &T::transducerId,
        "target_id",     &T::targetId,
        "units",         &T::units,
        "approved",      &T::approved,
        "foci",          &T::foci,
        "grid_shape",    &T::gridShape,
        "grid_origin",   &T::gridOrigin,
        "grid_spacing",  &T::gridSpacing,
        "grid_units",    &T::gridUnits,
        "pnp_max",       &T::pnpMax,
        "intensity_max", &T::intensityMax
    );
};

template <>
struct glz::meta<Run>
{
    using T = Run;
    static constexpr auto value = object(
        "id",           &T::id,
        "name",         &T::name,
        "success_flag", &T::successFlag,
        "note",         &T::note,
        "session_id",   &T::sessionId,
        "solution_id",  &T::solutionId
    );
};

template <>
struct glz::meta<SubjectRecord>
{
    using T = SubjectRecord;
    static constexpr auto value = object(
        "id",   &T::id,
        "name", &T::name
    );
};

template <>
struct glz::meta<VolumeRecord>
{
    using T = VolumeRecord;
    static constexpr auto value = object(
        "id",            &T::id,
        "name",          &T::name,
        "data_filename", &T::dataFilename
    );
};

// ---- Implementation --------------------------------------------------------

template <class T>
static std::string writeRecord(const T& value)
{
    std::string buffer{};
    auto ec = glz::write<glz::opts{.skip_null_members = false}>(value, buffer);
    if (ec)
        throw std::runtime_error("Failed to serialize record to JSON");
    return buffer;
}

template <class T>
static void readRecord(const std::string& json, T& value)
{
    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
    if (ec)
        throw std::runtime_error("Failed to parse record:\n" + glz::format_error(ec, json));
}

SolutionRecord solutionToRecord(const Solution& solution)
{
    SolutionRecord r;
    r.id = solution.id;
    r.name = solution.name;
    r.sessionId = solution.sessionId;
    r.protocolId = solution.protocolId;
    r.transducerId = solution.transducerId;
    r.targetId = solution.targetId;
    r.units = solution.units;
    r.approved = solution.approved;

    for (const auto& f : solution.foci)
    {
        FocusRecord fr;
        fr.position = {f.focus.x, f.focus.y, f.focus.z};
        fr.delays = f.beamform.delays;
        fr.apodization = f.beamform.apodization;
        r.foci.push_back(std::move(fr));
    }

    const SimulationGrid& g = solution.pnp.grid;
    r.gridShape = {g.shape.x, g.shape.y, g.shape.z};
    r.gridOrigin = {g.origin.x, g.origin.y, g.origin.z};
    r.gridSpacing = {g.spacing.x, g.spacing.y, g.spacing.z};
    r.gridUnits = g.units;
    if (!solution.pnp.data.empty())
        r.pnpMax = *std::max_element(solution.pnp.data.begin(), solution.pnp.data.end());
    if (!solution.intensity.data.empty())
        r.intensityMax = *std::max_element(solution.intensity.data.begin(), solution.intensity.data.end());
    return r;
}

std::string toJson(const SessionDefinition& session)     { return writeRecord(session); }
std::string toJson(const TransducerDefinition& transducer) { return writeRecord(transducer); }
std::string toJson(const ProtocolDefinition& protocol)   { return writeRecord(protocol); }
std::string toJson(const SolutionRecord& solution)       { return writeRecord(solution); }
std::string toJson(const Run& run)                       { return writeRecord(run); }
std::string toJson(const SubjectRecord& subject)         { return writeRecord(subject); }
std::string toJson(const VolumeRecord& volume)           { return writeRecord(volume); }

void fromJson(const std::string& json, SessionDefinition& session)     { readRecord(json, session); }
void fromJson(const std::string& json, TransducerDefinition& transducer) { readRecord(json, transducer); }
void fromJson(const std::string& json, ProtocolDefinition& protocol)   { readRecord(json, protocol); }
void fromJson(const std::string& json, SolutionRecord& solution)       { readRecord(json, solution); }
void fromJson(const std::string& json, Run& run)                       { readRecord(json, run); }
void fromJson(const std::string& json, SubjectRecord& subject)         { readRecord(json, subject); }
void fromJson(const std::string& json, VolumeRecord& volume)           { readRecord(json, volume); }
