#include "MemoryScene.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

ArtifactId MemoryScene::insert(Node node)
{
    ArtifactId id = nextId_++;
    nodes_.emplace(id, std::move(node));
    return id;
}

MemoryScene::Node& MemoryScene::node(ArtifactId id, ArtifactKind expected)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw std::out_of_range("No artifact with handle " + std::to_string(id));
    if (it->second.kind != expected)
        throw std::invalid_argument("Artifact " + std::to_string(id) + " is a " +
                                    artifactKindName(it->second.kind) + ", not a " +
                                    artifactKindName(expected));
    return it->second;
}

const MemoryScene::Node& MemoryScene::node(ArtifactId id, ArtifactKind expected) const
{
    return const_cast<MemoryScene*>(this)->node(id, expected);
}

void MemoryScene::raise(const SceneEvent& event)
{
    // Handlers may subscribe, unsubscribe or mutate the scene re-entrantly.
    std::vector<EventHandler> handlers;
    handlers.reserve(handlers_.size());
    for (const auto& [sub, handler] : handlers_)
        handlers.push_back(handler);

    for (const auto& handler : handlers)
        handler(event);
}

// --- Creation ---

ArtifactId MemoryScene::addMesh(const std::string& name, SurfaceMesh mesh)
{
    Node n;
    n.kind = ArtifactKind::Mesh;
    n.name = name;
    n.mesh = std::move(mesh);
    return insert(std::move(n));
}

ArtifactId MemoryScene::addPlacement(const std::string& name, const glm::dmat4& matrix)
{
    Node n;
    n.kind = ArtifactKind::Placement;
    n.name = name;
    n.matrix = matrix;
    return insert(std::move(n));
}

ArtifactId MemoryScene::addVolume(const std::string& name, Volume volume)
{
    Node n;
    n.kind = ArtifactKind::Volume;
    n.name = name;
    n.volume = std::make_unique<Volume>(std::move(volume));
    return insert(std::move(n));
}

ArtifactId MemoryScene::addTarget(const std::string& name,
                                  const std::vector<glm::dvec3>& points,
                                  const glm::dvec3& colour)
{
    Node n;
    n.kind = ArtifactKind::Target;
    n.name = name;
    n.points = points;
    n.colour = colour;
    return insert(std::move(n));
}

bool MemoryScene::remove(ArtifactId id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return false;

    SceneEvent event;
    event.type = SceneEventType::ArtifactRemoved;
    event.artifact = id;
    event.kind = it->second.kind;
    event.name = it->second.name;

    if (event.kind == ArtifactKind::Placement)
    {
        for (auto& [childId, child] : nodes_)
        {
            if (child.parent == id)
                child.parent = kNoArtifact;
        }
    }
    nodes_.erase(it);

    raise(event);
    return true;
}

// --- Queries ---

bool MemoryScene::contains(ArtifactId id) const
{
    return nodes_.count(id) != 0;
}

std::optional<ArtifactKind> MemoryScene::kindOf(ArtifactId id) const
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return std::nullopt;
    return it->second.kind;
}

std::string MemoryScene::nameOf(ArtifactId id) const
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw std::out_of_range("No artifact with handle " + std::to_string(id));
    return it->second.name;
}

std::vector<ArtifactId> MemoryScene::artifactsOfKind(ArtifactKind kind) const
{
    std::vector<ArtifactId> ids;
    for (const auto& [id, n] : nodes_)
    {
        if (n.kind == kind)
            ids.push_back(id);
    }
    return ids;
}

std::string MemoryScene::uniqueName(const std::string& base) const
{
    auto taken = [this](const std::string& name) {
        for (const auto& [id, n] : nodes_)
        {
            if (n.name == name)
                return true;
        }
        return false;
    };

    if (!taken(base))
        return base;
    for (int suffix = 1;; ++suffix)
    {
        std::string candidate = base + "_" + std::to_string(suffix);
        if (!taken(candidate))
            return candidate;
    }
}

void MemoryScene::setAttribute(ArtifactId id, const std::string& key, const std::string& value)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw std::out_of_range("No artifact with handle " + std::to_string(id));
    it->second.attributes[key] = value;
}

std::optional<std::string> MemoryScene::attribute(ArtifactId id, const std::string& key) const
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        return std::nullopt;
    auto attr = it->second.attributes.find(key);
    if (attr == it->second.attributes.end())
        return std::nullopt;
    return attr->second;
}

// --- Placement ---

void MemoryScene::setParent(ArtifactId child, ArtifactId placement)
{
    auto it = nodes_.find(child);
    if (it == nodes_.end())
        throw std::out_of_range("No artifact with handle " + std::to_string(child));
    if (it->second.kind != ArtifactKind::Mesh && it->second.kind != ArtifactKind::Volume)
        throw std::invalid_argument("Only meshes and volumes can ride on a placement");
    if (placement != kNoArtifact)
        node(placement, ArtifactKind::Placement);
    it->second.parent = placement;
}

ArtifactId MemoryScene::parentOf(ArtifactId child) const
{
    auto it = nodes_.find(child);
    if (it == nodes_.end())
        return kNoArtifact;
    return it->second.parent;
}

glm::dmat4 MemoryScene::placementMatrix(ArtifactId placement) const
{
    return node(placement, ArtifactKind::Placement).matrix;
}

void MemoryScene::setPlacementMatrix(ArtifactId placement, const glm::dmat4& matrix)
{
    Node& n = node(placement, ArtifactKind::Placement);
    n.matrix = matrix;
    raise({SceneEventType::TransducerPlacementChanged, placement, n.kind, n.name});
}

// --- Content ---

const SurfaceMesh& MemoryScene::mesh(ArtifactId id) const
{
    return node(id, ArtifactKind::Mesh).mesh;
}

const Volume& MemoryScene::volume(ArtifactId id) const
{
    return *node(id, ArtifactKind::Volume).volume;
}

std::vector<glm::dvec3> MemoryScene::targetPoints(ArtifactId id) const
{
    return node(id, ArtifactKind::Target).points;
}

glm::dvec3 MemoryScene::targetColour(ArtifactId id) const
{
    return node(id, ArtifactKind::Target).colour;
}

std::string MemoryScene::targetLabel(ArtifactId id) const
{
    return node(id, ArtifactKind::Target).label;
}

double MemoryScene::targetRadius(ArtifactId id) const
{
    return node(id, ArtifactKind::Target).radius;
}

void MemoryScene::setTargetDisplay(ArtifactId id, const std::string& label, double radius)
{
    if (!(radius > 0.0))
        throw std::invalid_argument("Target radius must be positive");
    Node& n = node(id, ArtifactKind::Target);
    n.label = label;
    n.radius = radius;
}

void MemoryScene::setTargetPoint(ArtifactId id, std::size_t index, const glm::dvec3& position)
{
    Node& n = node(id, ArtifactKind::Target);
    if (index >= n.points.size())
        throw std::out_of_range("Control point index out of range");
    n.points[index] = position;
    raise({SceneEventType::PointModified, id, n.kind, n.name});
}

void MemoryScene::addTargetPoint(ArtifactId id, const glm::dvec3& position)
{
    Node& n = node(id, ArtifactKind::Target);
    n.points.push_back(position);
    raise({SceneEventType::PointAdded, id, n.kind, n.name});
}

void MemoryScene::removeTargetPoint(ArtifactId id, std::size_t index)
{
    Node& n = node(id, ArtifactKind::Target);
    if (index >= n.points.size())
        throw std::out_of_range("Control point index out of range");
    n.points.erase(n.points.begin() + static_cast<std::ptrdiff_t>(index));
    raise({SceneEventType::PointRemoved, id, n.kind, n.name});
}

// --- Notifications ---

int MemoryScene::subscribe(EventHandler handler)
{
    int sub = nextSubscription_++;
    handlers_.emplace(sub, std::move(handler));
    return sub;
}

void MemoryScene::unsubscribe(int subscription)
{
    handlers_.erase(subscription);
}
