#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "SceneHost.h"

/// One radiating element, positioned in the transducer's native frame.
struct TransducerElement
{
    int index = 0;
    std::array<double, 3> position = {0.0, 0.0, 0.0};
    std::array<double, 2> size = {1.0, 1.0};  // width (x), length (y)
};

/// Immutable native description of a transducer.
struct TransducerDefinition
{
    std::string id;
    std::string name;
    std::string units = "mm";
    std::string axes = "LPS";  // native axis convention
    std::vector<TransducerElement> elements;

    /// One quad (two triangles) per element in the element's x/y plane,
    /// in native units.
    SurfaceMesh mesh() const;

    /// Reinterpret a placement given in `units` in native units: the
    /// translation column is rescaled, the linear part is left alone.
    /// @throws UnknownUnit
    glm::dmat4 convertPlacement(const glm::dmat4& matrix, const std::string& units) const;
};

class DetachedTransducer;

/// A loaded transducer: its definition plus the mesh and placement artifacts
/// it created in the scene.  The placement maps native coordinates to world
/// anatomical mm and is the only mutable geometric state.
class Transducer
{
    /// Only load() can name this, so only load() can construct.
    struct LoadKey
    {
        explicit LoadKey() = default;
    };

public:
    /// Create the scene artifacts.  The placement is
    ///   composeFrameToWorld(axes, units) * convertPlacement(matrix, matrixUnits)
    /// with `matrix` defaulting to identity and `matrixUnits` to the native
    /// units.  Nothing is left in the scene if this throws.
    static std::unique_ptr<Transducer> load(const TransducerDefinition& definition,
                                            SceneHost& scene,
                                            const std::optional<glm::dmat4>& matrix = std::nullopt,
                                            const std::optional<std::string>& matrixUnits = std::nullopt);

    Transducer(LoadKey, TransducerDefinition definition, ArtifactId mesh, ArtifactId placement);

    Transducer(const Transducer&) = delete;
    Transducer& operator=(const Transducer&) = delete;

    const std::string& id() const { return definition_.id; }
    const TransducerDefinition& definition() const { return definition_; }

    ArtifactId meshArtifact() const { return mesh_; }
    ArtifactId placementArtifact() const { return placement_; }
    bool owns(ArtifactId artifact) const
    {
        return artifact != kNoArtifact && (artifact == mesh_ || artifact == placement_);
    }

    /// Live placement matrix, read from the scene.
    glm::dmat4 placement(const SceneHost& scene) const;
    void setPlacement(SceneHost& scene, const glm::dmat4& matrix);

    /// Save-path inverse of load(): the matrix that, passed back to load()
    /// with the native units, reproduces the current placement.
    glm::dmat4 nativePlacement(const SceneHost& scene) const;

    glm::dvec3 worldToLocal(const SceneHost& scene, const glm::dvec3& world) const;
    glm::dvec3 localToWorld(const SceneHost& scene, const glm::dvec3& local) const;

private:
    friend class DetachedTransducer;

    /// Remove whichever artifacts are still present.
    /// @throws std::logic_error on a second call
    void release(SceneHost& scene);

    TransducerDefinition definition_;
    ArtifactId mesh_ = kNoArtifact;
    ArtifactId placement_ = kNoArtifact;
    bool released_ = false;
};

/// A transducer that has already been popped from whatever registry held it.
/// Releasing artifacts is only possible through this type, so a transducer
/// is always unregistered before its removal notifications fire.
class DetachedTransducer
{
public:
    DetachedTransducer(std::unique_ptr<Transducer> transducer, SceneHost& scene);

    DetachedTransducer(DetachedTransducer&&) noexcept = default;
    DetachedTransducer& operator=(DetachedTransducer&&) noexcept = default;

    const Transducer& transducer() const { return *transducer_; }

    /// Destroy the remaining scene artifacts.
    /// @throws std::logic_error if already released
    void release();

    /// Leave the artifacts in the scene, unmanaged.
    void orphan() { orphaned_ = true; }

    bool released() const { return transducer_->released_; }
    bool orphaned() const { return orphaned_; }

private:
    std::unique_ptr<Transducer> transducer_;
    SceneHost* scene_;
    bool orphaned_ = false;
};
