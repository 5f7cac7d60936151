#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

class Volume;

/// Opaque handle of an artifact owned by the scene.  0 never names one.
using ArtifactId = std::uint64_t;
constexpr ArtifactId kNoArtifact = 0;

enum class ArtifactKind
{
    Mesh,       ///< surface mesh, usually parented to a placement
    Placement,  ///< an affine transform other artifacts can ride on
    Volume,     ///< scalar field with its own index-to-world matrix
    Target      ///< list of labelled control points
};

const char* artifactKindName(ArtifactKind kind);

enum class SceneEventType
{
    ArtifactRemoved,
    PointModified,
    PointAdded,
    PointRemoved,
    TransducerPlacementChanged
};

/// Raised synchronously, in order, by every scene mutation that others may
/// need to react to.  For ArtifactRemoved the artifact is already gone and
/// `kind`/`name` are what it had just before removal.
struct SceneEvent
{
    SceneEventType type = SceneEventType::ArtifactRemoved;
    ArtifactId artifact = kNoArtifact;
    ArtifactKind kind = ArtifactKind::Mesh;
    std::string name;
};

/// Triangle surface in the coordinates of whatever placement it rides on.
struct SurfaceMesh
{
    std::vector<glm::dvec3> vertices;
    std::vector<glm::ivec3> triangles;
};

/// The external scene graph.  The planner requests creation and removal of
/// artifacts and listens for changes; it never assumes exclusive control over
/// artifact lifetime, since any actor may remove an artifact at any time.
class SceneHost
{
public:
    using EventHandler = std::function<void(const SceneEvent&)>;

    virtual ~SceneHost() = default;

    // --- Creation ---

    virtual ArtifactId addMesh(const std::string& name, SurfaceMesh mesh) = 0;
    virtual ArtifactId addPlacement(const std::string& name, const glm::dmat4& matrix) = 0;
    virtual ArtifactId addVolume(const std::string& name, Volume volume) = 0;
    virtual ArtifactId addTarget(const std::string& name,
                                 const std::vector<glm::dvec3>& points,
                                 const glm::dvec3& colour) = 0;

    /// Remove an artifact.  Returns false if it was not present.
    virtual bool remove(ArtifactId id) = 0;

    // --- Queries ---

    virtual bool contains(ArtifactId id) const = 0;
    virtual std::optional<ArtifactKind> kindOf(ArtifactId id) const = 0;
    virtual std::string nameOf(ArtifactId id) const = 0;
    virtual std::vector<ArtifactId> artifactsOfKind(ArtifactKind kind) const = 0;

    /// `base` if unused, else `base_1`, `base_2`, ...
    virtual std::string uniqueName(const std::string& base) const = 0;

    /// Free-form string attributes other components tag artifacts with.
    virtual void setAttribute(ArtifactId id, const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> attribute(ArtifactId id, const std::string& key) const = 0;

    // --- Placement ---

    /// Parent a mesh or volume to a placement (kNoArtifact unparents).
    virtual void setParent(ArtifactId child, ArtifactId placement) = 0;
    virtual ArtifactId parentOf(ArtifactId child) const = 0;
    virtual glm::dmat4 placementMatrix(ArtifactId placement) const = 0;

    /// Raises TransducerPlacementChanged.
    virtual void setPlacementMatrix(ArtifactId placement, const glm::dmat4& matrix) = 0;

    // --- Content ---

    virtual const SurfaceMesh& mesh(ArtifactId id) const = 0;
    virtual const Volume& volume(ArtifactId id) const = 0;
    virtual std::vector<glm::dvec3> targetPoints(ArtifactId id) const = 0;
    virtual glm::dvec3 targetColour(ArtifactId id) const = 0;

    /// Label shown on a target's control points and the glyph radius in mm.
    virtual std::string targetLabel(ArtifactId id) const = 0;
    virtual double targetRadius(ArtifactId id) const = 0;
    virtual void setTargetDisplay(ArtifactId id, const std::string& label, double radius) = 0;

    /// Raise PointModified / PointAdded / PointRemoved respectively.
    virtual void setTargetPoint(ArtifactId id, std::size_t index, const glm::dvec3& position) = 0;
    virtual void addTargetPoint(ArtifactId id, const glm::dvec3& position) = 0;
    virtual void removeTargetPoint(ArtifactId id, std::size_t index) = 0;

    // --- Notifications ---

    virtual int subscribe(EventHandler handler) = 0;
    virtual void unsubscribe(int subscription) = 0;

    /// Matrix of the placement `child` is parented to, if any.
    std::optional<glm::dmat4> parentMatrix(ArtifactId child) const
    {
        ArtifactId parent = parentOf(child);
        if (parent == kNoArtifact)
            return std::nullopt;
        return placementMatrix(parent);
    }
};

/// Removes every tracked artifact on destruction unless committed.  Used to
/// make multi-artifact operations leave nothing behind when a step throws.
class SceneTransaction
{
public:
    explicit SceneTransaction(SceneHost& scene) : scene_(scene) {}
    ~SceneTransaction();

    SceneTransaction(const SceneTransaction&) = delete;
    SceneTransaction& operator=(const SceneTransaction&) = delete;

    ArtifactId track(ArtifactId id)
    {
        created_.push_back(id);
        return id;
    }

    void commit() { committed_ = true; }

private:
    SceneHost& scene_;
    std::vector<ArtifactId> created_;
    bool committed_ = false;
};
