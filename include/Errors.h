#pragma once

#include <stdexcept>
#include <string>

// --- Configuration errors: fatal for the operation, never retried ---

/// An axis label outside {R, L, A, P, S, I}, or a label triple that does not
/// name each anatomical axis exactly once.
class InvalidAxisLabel : public std::invalid_argument
{
public:
    explicit InvalidAxisLabel(const std::string& what) : std::invalid_argument(what) {}
};

/// A length unit the unit registry does not know, or no unit registry at all.
class UnknownUnit : public std::invalid_argument
{
public:
    explicit UnknownUnit(const std::string& what) : std::invalid_argument(what) {}
};

/// A matrix, vector or field whose shape does not match what the operation needs.
class ShapeMismatch : public std::invalid_argument
{
public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};

// --- Ambiguity errors: fatal for the operation, never auto-resolved ---

/// Zero or several candidate files where exactly one volume file was expected.
class AmbiguousVolumeFile : public std::runtime_error
{
public:
    explicit AmbiguousVolumeFile(const std::string& what) : std::runtime_error(what) {}
};

/// Two loaded transducers claim the same scene artifact.
class DuplicateArtifactOwner : public std::runtime_error
{
public:
    explicit DuplicateArtifactOwner(const std::string& what) : std::runtime_error(what) {}
};

// --- Registry refusals ---

/// The transducer is owned by the active session and cannot be replaced.
class TransducerInUse : public std::runtime_error
{
public:
    explicit TransducerInUse(const std::string& what) : std::runtime_error(what) {}
};

/// Lookup or removal of an id that is not loaded.
class NotLoaded : public std::out_of_range
{
public:
    explicit NotLoaded(const std::string& what) : std::out_of_range(what) {}
};

/// No planning backend was handed to the registry at start-up.
class PlanningUnavailable : public std::runtime_error
{
public:
    explicit PlanningUnavailable(const std::string& what) : std::runtime_error(what) {}
};
