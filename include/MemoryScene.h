#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "SceneHost.h"
#include "Volume.h"

/// In-process SceneHost.  Artifacts live in an ordered map keyed by handle;
/// handles are never reused.
class MemoryScene : public SceneHost
{
public:
    MemoryScene() = default;
    ~MemoryScene() override = default;

    MemoryScene(const MemoryScene&) = delete;
    MemoryScene& operator=(const MemoryScene&) = delete;

    ArtifactId addMesh(const std::string& name, SurfaceMesh mesh) override;
    ArtifactId addPlacement(const std::string& name, const glm::dmat4& matrix) override;
    ArtifactId addVolume(const std::string& name, Volume volume) override;
    ArtifactId addTarget(const std::string& name,
                         const std::vector<glm::dvec3>& points,
                         const glm::dvec3& colour) override;

    bool remove(ArtifactId id) override;

    bool contains(ArtifactId id) const override;
    std::optional<ArtifactKind> kindOf(ArtifactId id) const override;
    std::string nameOf(ArtifactId id) const override;
    std::vector<ArtifactId> artifactsOfKind(ArtifactKind kind) const override;
    std::string uniqueName(const std::string& base) const override;

    void setAttribute(ArtifactId id, const std::string& key, const std::string& value) override;
    std::optional<std::string> attribute(ArtifactId id, const std::string& key) const override;

    void setParent(ArtifactId child, ArtifactId placement) override;
    ArtifactId parentOf(ArtifactId child) const override;
    glm::dmat4 placementMatrix(ArtifactId placement) const override;
    void setPlacementMatrix(ArtifactId placement, const glm::dmat4& matrix) override;

    const SurfaceMesh& mesh(ArtifactId id) const override;
    const Volume& volume(ArtifactId id) const override;
    std::vector<glm::dvec3> targetPoints(ArtifactId id) const override;
    glm::dvec3 targetColour(ArtifactId id) const override;
    std::string targetLabel(ArtifactId id) const override;
    double targetRadius(ArtifactId id) const override;
    void setTargetDisplay(ArtifactId id, const std::string& label, double radius) override;

    void setTargetPoint(ArtifactId id, std::size_t index, const glm::dvec3& position) override;
    void addTargetPoint(ArtifactId id, const glm::dvec3& position) override;
    void removeTargetPoint(ArtifactId id, std::size_t index) override;

    int subscribe(EventHandler handler) override;
    void unsubscribe(int subscription) override;

    std::size_t size() const { return nodes_.size(); }

private:
    struct Node
    {
        ArtifactKind kind = ArtifactKind::Mesh;
        std::string name;
        ArtifactId parent = kNoArtifact;
        glm::dmat4 matrix{1.0};
        SurfaceMesh mesh;
        std::unique_ptr<Volume> volume;
        std::vector<glm::dvec3> points;
        glm::dvec3 colour{1.0, 0.0, 0.0};
        std::string label;
        double radius = 1.0;
        std::map<std::string, std::string> attributes;
    };

    ArtifactId insert(Node node);
    Node& node(ArtifactId id, ArtifactKind expected);
    const Node& node(ArtifactId id, ArtifactKind expected) const;
    void raise(const SceneEvent& event);

    std::map<ArtifactId, Node> nodes_;
    ArtifactId nextId_ = 1;

    std::map<int, EventHandler> handlers_;
    int nextSubscription_ = 1;
};
