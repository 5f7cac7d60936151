#include "Transducer.h"

#include <stdexcept>
#include <utility>

#include "CoordinateFrame.h"

// --- TransducerDefinition ---

SurfaceMesh TransducerDefinition::mesh() const
{
    SurfaceMesh m;
    m.vertices.reserve(elements.size() * 4);
    m.triangles.reserve(elements.size() * 2);

    for (const auto& el : elements)
    {
        glm::dvec3 c(el.position[0], el.position[1], el.position[2]);
        double hw = el.size[0] / 2.0;
        double hl = el.size[1] / 2.0;

        int base = static_cast<int>(m.vertices.size());
        m.vertices.push_back(c + glm::dvec3(-hw, -hl, 0.0));
        m.vertices.push_back(c + glm::dvec3( hw, -hl, 0.0));
        m.vertices.push_back(c + glm::dvec3( hw,  hl, 0.0));
        m.vertices.push_back(c + glm::dvec3(-hw,  hl, 0.0));
        m.triangles.emplace_back(base, base + 1, base + 2);
        m.triangles.emplace_back(base, base + 2, base + 3);
    }
    return m;
}

glm::dmat4 TransducerDefinition::convertPlacement(const glm::dmat4& matrix,
                                                  const std::string& matrixUnits) const
{
    double s = unitConversion(matrixUnits, units);
    glm::dmat4 converted = matrix;
    converted[3][0] *= s;
    converted[3][1] *= s;
    converted[3][2] *= s;
    return converted;
}

// --- Transducer ---

Transducer::Transducer(LoadKey, TransducerDefinition definition,
                       ArtifactId mesh, ArtifactId placement)
    : definition_(std::move(definition)), mesh_(mesh), placement_(placement)
{
}

std::unique_ptr<Transducer> Transducer::load(const TransducerDefinition& definition,
                                             SceneHost& scene,
                                             const std::optional<glm::dmat4>& matrix,
                                             const std::optional<std::string>& matrixUnits)
{
    // Everything that can fail on bad input runs before the scene is touched.
    glm::dmat4 frame = composeFrameToWorld(definition.axes, definition.units);
    glm::dmat4 placement = frame * definition.convertPlacement(
        matrix.value_or(glm::dmat4(1.0)), matrixUnits.value_or(definition.units));
    if (!isAffine(placement))
        throw std::invalid_argument("Placement for transducer '" + definition.id + "' is not affine");
    SurfaceMesh surface = definition.mesh();

    SceneTransaction tx(scene);
    ArtifactId placementId = tx.track(
        scene.addPlacement(scene.uniqueName(definition.id + "-placement"), placement));
    ArtifactId meshId = tx.track(
        scene.addMesh(scene.uniqueName(definition.id + "-mesh"), std::move(surface)));
    scene.setParent(meshId, placementId);

    auto t = std::make_unique<Transducer>(LoadKey{}, definition, meshId, placementId);
    tx.commit();
    return t;
}

glm::dmat4 Transducer::placement(const SceneHost& scene) const
{
    return scene.placementMatrix(placement_);
}

void Transducer::setPlacement(SceneHost& scene, const glm::dmat4& matrix)
{
    if (!isAffine(matrix))
        throw std::invalid_argument("Placement for transducer '" + id() + "' is not affine");
    scene.setPlacementMatrix(placement_, matrix);
}

glm::dmat4 Transducer::nativePlacement(const SceneHost& scene) const
{
    glm::dmat4 frame = composeFrameToWorld(definition_.axes, definition_.units);
    return glm::inverse(frame) * placement(scene);
}

glm::dvec3 Transducer::worldToLocal(const SceneHost& scene, const glm::dvec3& world) const
{
    return transformPoint(glm::inverse(placement(scene)), world);
}

glm::dvec3 Transducer::localToWorld(const SceneHost& scene, const glm::dvec3& local) const
{
    return transformPoint(placement(scene), local);
}

void Transducer::release(SceneHost& scene)
{
    if (released_)
        throw std::logic_error("Transducer '" + id() + "' has already been released");
    released_ = true;

    scene.remove(mesh_);
    scene.remove(placement_);
}

// --- DetachedTransducer ---

DetachedTransducer::DetachedTransducer(std::unique_ptr<Transducer> transducer, SceneHost& scene)
    : transducer_(std::move(transducer)), scene_(&scene)
{
    if (!transducer_)
        throw std::invalid_argument("DetachedTransducer needs a transducer");
}

void DetachedTransducer::release()
{
    transducer_->release(*scene_);
}
