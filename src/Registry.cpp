#include "Registry.h"

#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

#include "CoordinateFrame.h"
#include "Errors.h"
#include "TargetFile.h"
#include "TargetPoint.h"
#include "Volume.h"

const char* sessionStateName(SessionState state)
{
    switch (state)
    {
    case SessionState::Unloaded:    return "unloaded";
    case SessionState::Loading:     return "loading";
    case SessionState::Active:      return "active";
    case SessionState::Invalidated: return "invalidated";
    }
    return "unknown";
}

// Remove an artifact the registry no longer tracks, if it is still there.
static void releaseArtifact(SceneHost& scene, ArtifactId id)
{
    if (id == kNoArtifact || !scene.contains(id))
        return;
    if (!scene.remove(id))
        std::cerr << "[registry] artifact " << id << " vanished during release\n";
}

Registry::Registry(SceneHost& scene, PlannerConfig config, PlanningBackend* planner)
    : scene_(scene), config_(std::move(config)), planner_(planner)
{
    subscription_ = scene_.subscribe([this](const SceneEvent& e) { handleSceneEvent(e); });
}

Registry::~Registry()
{
    scene_.unsubscribe(subscription_);
}

bool Registry::confirm(const std::string& title, const std::string& text) const
{
    if (!confirm_)
        return false;
    return confirm_(title, text);
}

void Registry::notify(NotificationKind kind, const std::string& message) const
{
    std::cerr << "[registry] " << message << "\n";
    if (notify_)
        notify_({kind, message});
}

// ---------------------------------------------------------------------------
// Transducers
// ---------------------------------------------------------------------------

Transducer* Registry::loadTransducer(const TransducerDefinition& definition,
                                     const std::optional<glm::dmat4>& matrix,
                                     const std::optional<std::string>& matrixUnits,
                                     bool replaceConfirmed)
{
    if (hasTransducer(definition.id))
    {
        if (session_ && session_->transducerId() == definition.id)
            throw TransducerInUse("Transducer '" + definition.id +
                                  "' is in use by session '" + session_->id() + "'");

        if (!replaceConfirmed &&
            !confirm("Replace transducer",
                     "Transducer '" + definition.id + "' is already loaded. Replace it?"))
        {
            notify(NotificationKind::LoadAborted,
                   "Loading transducer '" + definition.id + "' aborted, it is already loaded");
            return nullptr;
        }

        if (solution_ && solution_->transducerId == definition.id)
            invalidateSolution("its transducer '" + definition.id + "' was replaced");

        DetachedTransducer old = detachTransducer(definition.id);
        old.release();
    }

    std::unique_ptr<Transducer> t = Transducer::load(definition, scene_, matrix, matrixUnits);
    Transducer* raw = t.get();
    transducers_[definition.id] = std::move(t);
    if (config_.verbose)
        std::cerr << "[registry] loaded transducer '" << definition.id << "'\n";
    return raw;
}

DetachedTransducer Registry::detachTransducer(const std::string& id)
{
    auto it = transducers_.find(id);
    if (it == transducers_.end())
        throw NotLoaded("Transducer '" + id + "' is not loaded");

    std::unique_ptr<Transducer> t = std::move(it->second);
    transducers_.erase(it);
    return DetachedTransducer(std::move(t), scene_);
}

void Registry::removeTransducer(const std::string& id, bool releaseArtifacts)
{
    DetachedTransducer detached = detachTransducer(id);
    if (releaseArtifacts)
        detached.release();
    else
        detached.orphan();

    if (config_.verbose)
        std::cerr << "[registry] removed transducer '" << id << "'"
                  << (releaseArtifacts ? "" : " (artifacts left in scene)") << "\n";

    revalidateSession();
    revalidateSolution();
}

Transducer* Registry::transducer(const std::string& id)
{
    auto it = transducers_.find(id);
    return it == transducers_.end() ? nullptr : it->second.get();
}

const Transducer* Registry::transducer(const std::string& id) const
{
    auto it = transducers_.find(id);
    return it == transducers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Registry::transducerIds() const
{
    std::vector<std::string> ids;
    ids.reserve(transducers_.size());
    for (const auto& [id, t] : transducers_)
        ids.push_back(id);
    return ids;
}

void Registry::onExternalArtifactRemoved(ArtifactId artifact, ArtifactKind which)
{
    std::vector<std::string> owners;
    for (const auto& [id, t] : transducers_)
    {
        if (t->owns(artifact))
            owners.push_back(id);
    }
    if (owners.empty())
        return;
    if (owners.size() > 1)
        throw DuplicateArtifactOwner("Transducers '" + owners[0] + "' and '" + owners[1] +
                                     "' both own " + artifactKindName(which) + " artifact " +
                                     std::to_string(artifact));

    // The removed artifact is gone already; the other one stays in the scene.
    DetachedTransducer detached = detachTransducer(owners.front());
    detached.orphan();

    notify(NotificationKind::TransducerRemoved,
           "Transducer '" + owners.front() + "' was unloaded because its " +
               artifactKindName(which) + " was removed");

    revalidateSession();
    revalidateSolution();
}

// ---------------------------------------------------------------------------
// Protocols
// ---------------------------------------------------------------------------

const ProtocolDefinition* Registry::loadProtocol(const ProtocolDefinition& definition,
                                                 bool replaceConfirmed)
{
    auto it = protocols_.find(definition.id);
    if (it == protocols_.end())
        return &protocols_.emplace(definition.id, definition).first->second;

    if (!replaceConfirmed &&
        !confirm("Replace protocol",
                 "Protocol '" + definition.id + "' is already loaded. Replace it?"))
    {
        notify(NotificationKind::LoadAborted,
               "Loading protocol '" + definition.id + "' aborted, it is already loaded");
        return nullptr;
    }

    if (solution_ && solution_->protocolId == definition.id)
        invalidateSolution("its protocol '" + definition.id + "' was replaced");

    it->second = definition;
    return &it->second;
}

void Registry::removeProtocol(const std::string& id)
{
    auto it = protocols_.find(id);
    if (it == protocols_.end())
        throw NotLoaded("Protocol '" + id + "' is not loaded");
    protocols_.erase(it);

    revalidateSession();
    revalidateSolution();
}

const ProtocolDefinition* Registry::protocol(const std::string& id) const
{
    auto it = protocols_.find(id);
    return it == protocols_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Session* Registry::loadSession(const std::string& subjectId,
                               const std::string& sessionId,
                               bool replaceConfirmed)
{
    if (!database_)
        throw std::runtime_error("Cannot load a session without a database");

    SessionDefinition definition = database_->loadSession(subjectId, sessionId);

    if (hasTransducer(definition.transducerId) && !replaceConfirmed &&
        !confirm("Reload transducer",
                 "Session '" + definition.id + "' uses transducer '" + definition.transducerId +
                     "', which is already loaded. Reload it?"))
    {
        notify(NotificationKind::LoadAborted,
               "Loading session '" + definition.id + "' aborted");
        return nullptr;
    }

    std::vector<std::string> candidates =
        database_->volumeFileCandidates(subjectId, definition.volumeId);
    if (candidates.size() != 1)
        throw AmbiguousVolumeFile("Expected exactly one data file for volume '" +
                                  definition.volumeId + "', found " +
                                  std::to_string(candidates.size()));

    // Everything that reads files or decodes records happens before the
    // previous session is touched.
    Volume volume = database_->loadVolume(candidates.front());
    volume.id = definition.volumeId;
    volume.name = definition.volumeId;
    TransducerDefinition transducerDef = database_->loadTransducer(definition.transducerId);
    ProtocolDefinition protocolDef = database_->loadProtocol(definition.protocolId);

    std::vector<TargetPoint> targets;
    targets.reserve(definition.targets.size());
    for (const auto& record : definition.targets)
        targets.push_back(targetFromRecord(record));
    glm::dmat4 placement = matrixFromRowMajor(definition.arrayTransform.matrix);

    clearSolution();
    run_.reset();
    clearSession(true);
    state_ = SessionState::Loading;

    try
    {
        SceneTransaction tx(scene_);
        ArtifactId volumeId =
            tx.track(scene_.addVolume(scene_.uniqueName(definition.volumeId), std::move(volume)));

        std::vector<ArtifactId> targetIds;
        for (const auto& t : targets)
            targetIds.push_back(tx.track(addTargetArtifact(scene_, t)));

        loadProtocol(protocolDef, true);
        loadTransducer(transducerDef, placement, definition.arrayTransform.units, true);

        session_ = std::make_unique<Session>(std::move(definition), volumeId, std::move(targetIds));
        state_ = SessionState::Active;
        tx.commit();
    }
    catch (const std::exception&)
    {
        state_ = SessionState::Unloaded;
        throw;
    }

    std::cerr << "[registry] loaded session '" << session_->id() << "' of subject '"
              << subjectId << "' (" << session_->targetArtifacts().size() << " target(s))\n";
    return session_.get();
}

Session* Registry::adoptSession(SessionDefinition definition,
                                ArtifactId volumeArtifact,
                                std::vector<ArtifactId> targetArtifacts)
{
    clearSolution();
    run_.reset();
    clearSession(true);

    session_ = std::make_unique<Session>(std::move(definition), volumeArtifact,
                                         std::move(targetArtifacts));
    state_ = SessionState::Active;
    revalidateSession();
    return session_.get();
}

void Registry::unloadSession(bool releaseArtifacts)
{
    clearSession(releaseArtifacts);
    state_ = SessionState::Unloaded;
}

void Registry::clearSession(bool releaseArtifacts)
{
    if (!session_)
        return;

    // Popped first: the removals below re-enter handleSceneEvent.
    std::unique_ptr<Session> old = std::move(session_);
    if (!releaseArtifacts)
        return;

    if (hasTransducer(old->transducerId()))
    {
        DetachedTransducer detached = detachTransducer(old->transducerId());
        detached.release();
    }
    for (ArtifactId id : old->targetArtifacts())
        releaseArtifact(scene_, id);
    releaseArtifact(scene_, old->volumeArtifact());
}

void Registry::saveSession()
{
    if (!session_)
        throw std::logic_error("No active session to save");
    if (!database_)
        throw std::logic_error("Cannot save a session without a database");

    const Transducer* t = transducer(session_->transducerId());
    if (!t)
        throw NotLoaded("Transducer '" + session_->transducerId() + "' is not loaded");

    SessionDefinition definition = session_->syncFromScene(scene_, *t, session_->targetArtifacts());
    database_->writeSession(definition);
}

bool Registry::sessionValid() const
{
    return session_ && state_ == SessionState::Active && session_->isValid(*this);
}

void Registry::approveVirtualFit(const std::optional<std::string>& targetId)
{
    if (!session_)
        throw std::logic_error("No active session");
    if (targetId && session_->findTarget(scene_, *targetId) == kNoArtifact)
        throw std::invalid_argument("Session '" + session_->id() + "' has no target '" +
                                    *targetId + "'");
    session_->approveVirtualFit(targetId);
    if (config_.verbose)
        std::cerr << "[registry] virtual fit approval: " << targetId.value_or("(none)") << "\n";
}

bool Registry::toggleTrackingApproval()
{
    if (!session_)
        throw std::logic_error("No active session");
    return session_->toggleTrackingApproval();
}

void Registry::revalidateSession()
{
    if (!session_ || state_ != SessionState::Active)
        return;
    if (session_->isValid(*this))
        return;

    std::string text = "Session '" + session_->id() +
                       "' lost its transducer, protocol or volume and was closed";
    state_ = SessionState::Invalidated;
    notify(NotificationKind::SessionInvalidated, text);

    bool release = invalidation_ ? invalidation_(text) : config_.releaseArtifactsOnInvalidation;
    clearSession(release);
}

void Registry::revokeVirtualFit(const std::string& reason)
{
    if (!session_ || !session_->virtualFitApprovedTarget())
        return;
    std::string target = *session_->virtualFitApprovedTarget();
    session_->approveVirtualFit(std::nullopt);
    notify(NotificationKind::ApprovalRevoked,
           "Virtual fit approval for target '" + target + "' revoked: " + reason);
}

// ---------------------------------------------------------------------------
// Scene events
// ---------------------------------------------------------------------------

void Registry::handleSceneEvent(const SceneEvent& event)
{
    switch (event.type)
    {
    case SceneEventType::ArtifactRemoved:
        switch (event.kind)
        {
        case ArtifactKind::Mesh:
        case ArtifactKind::Placement:
            onExternalArtifactRemoved(event.artifact, event.kind);
            break;
        case ArtifactKind::Volume:
            handleVolumeRemoved(event.artifact);
            break;
        case ArtifactKind::Target:
            handleTargetChanged(event);
            break;
        }
        break;
    case SceneEventType::PointModified:
    case SceneEventType::PointAdded:
    case SceneEventType::PointRemoved:
        handleTargetChanged(event);
        break;
    case SceneEventType::TransducerPlacementChanged:
        handlePlacementChanged(event.artifact);
        break;
    }
}

void Registry::handleVolumeRemoved(ArtifactId artifact)
{
    if (solution_ && solution_->ownsArtifact(artifact))
    {
        invalidateSolution("one of its field volumes was removed");
        return;
    }

    if (session_ && session_->volumeArtifact() == artifact)
    {
        session_->forgetArtifact(artifact);
        revalidateSession();
        revalidateSolution();
    }
}

void Registry::handleTargetChanged(const SceneEvent& event)
{
    // Targets outside the session never affect its approvals, whatever they
    // are called.
    if (!session_ || !session_->ownsTarget(event.artifact))
        return;

    const std::optional<std::string>& approved = session_->virtualFitApprovedTarget();
    if (event.type == SceneEventType::ArtifactRemoved)
    {
        session_->forgetArtifact(event.artifact);
        if (approved && session_->findTarget(scene_, *approved) == kNoArtifact)
            revokeVirtualFit("the target was removed");
        return;
    }

    bool isApproved = approved && targetIdOf(scene_, event.artifact) == *approved;
    switch (event.type)
    {
    case SceneEventType::PointModified:
        if (isApproved)
            revokeVirtualFit("the target was moved");
        break;
    case SceneEventType::PointAdded:
    case SceneEventType::PointRemoved:
        if (isApproved)
            revokeVirtualFit("the target's points changed");
        break;
    case SceneEventType::ArtifactRemoved:
    case SceneEventType::TransducerPlacementChanged:
        break;
    }
}

void Registry::handlePlacementChanged(ArtifactId placement)
{
    if (!session_)
        return;
    const Transducer* t = transducer(session_->transducerId());
    if (!t || t->placementArtifact() != placement)
        return;

    revokeVirtualFit("the transducer was moved");
    if (session_->trackingApproved())
    {
        session_->revokeTrackingApproval();
        notify(NotificationKind::ApprovalRevoked,
               "Transducer tracking approval revoked: the transducer was moved");
    }
}

// ---------------------------------------------------------------------------
// Targets and tracking
// ---------------------------------------------------------------------------

std::vector<ArtifactId> Registry::importTargets(const std::string& tagPath)
{
    std::vector<TargetPoint> targets = loadTargetsFromTagFile(tagPath);

    // Target ids stay unique within the session so approvals name one target.
    if (session_)
    {
        std::set<std::string> taken;
        for (ArtifactId id : session_->targetArtifacts())
        {
            if (scene_.contains(id))
                taken.insert(targetIdOf(scene_, id));
        }
        for (auto& t : targets)
        {
            std::string base = t.id;
            for (int suffix = 1; taken.count(t.id) != 0; ++suffix)
                t.id = base + "_" + std::to_string(suffix);
            taken.insert(t.id);
        }
    }

    SceneTransaction tx(scene_);
    std::vector<ArtifactId> created;
    for (const auto& t : targets)
        created.push_back(tx.track(addTargetArtifact(scene_, t)));
    tx.commit();

    if (session_)
    {
        for (ArtifactId id : created)
            session_->addTargetArtifact(id);
    }
    std::cerr << "[registry] imported " << created.size() << " target(s) from " << tagPath << "\n";
    return created;
}

void Registry::applyTracking(const std::string& transducerId, const TrackingResult& result)
{
    if (!result.valid)
        throw std::invalid_argument("Cannot apply tracking: " + result.message);

    Transducer* t = transducer(transducerId);
    if (!t)
        throw NotLoaded("Transducer '" + transducerId + "' is not loaded");

    t->setPlacement(scene_, result.placement);
    std::cerr << "[registry] tracked transducer '" << transducerId << "', RMS error "
              << result.rms << " mm\n";
}

// ---------------------------------------------------------------------------
// Planning
// ---------------------------------------------------------------------------

const Solution* Registry::computeSolution(ArtifactId targetArtifact,
                                          std::chrono::system_clock::time_point time)
{
    if (!planner_)
        throw PlanningUnavailable("No planning backend is available");
    if (!sessionValid())
        throw std::logic_error("Planning needs a valid active session");

    TargetPoint target = targetFromArtifact(scene_, targetArtifact);
    const Transducer& t = *transducer(session_->transducerId());
    const ProtocolDefinition& p = *protocol(session_->protocolId());

    Solution solution;
    {
        const Volume& volume = scene_.volume(session_->volumeArtifact());
        glm::dmat4 worldToIndex =
            worldToVolumeIndex(volume, scene_.parentMatrix(session_->volumeArtifact()));
        solution = generateSolution(*planner_, t.definition(), t.placement(scene_), target,
                                    volume, worldToIndex, p, config_.resamplingPolicy(),
                                    session_->id(), time);
    }

    const std::string& units = t.definition().units;
    SceneTransaction tx(scene_);
    solution.pnpArtifact = tx.track(scene_.addVolume(
        scene_.uniqueName(solution.id + "-pnp"), embedFieldInPlacedVolume(solution.pnp, units)));
    scene_.setParent(solution.pnpArtifact, t.placementArtifact());
    solution.intensityArtifact = tx.track(scene_.addVolume(
        scene_.uniqueName(solution.id + "-intensity"),
        embedFieldInPlacedVolume(solution.intensity, units)));
    scene_.setParent(solution.intensityArtifact, t.placementArtifact());

    setActiveSolution(std::move(solution));
    tx.commit();
    return solution_.get();
}

void Registry::setActiveSolution(Solution solution)
{
    // Written before the swap: a failed write leaves the previous solution
    // active and the new one unowned.
    if (database_ && sessionValid())
        database_->writeSolution(session_->definition(), solution);

    clearSolution();
    solution_ = std::make_unique<Solution>(std::move(solution));
    std::cerr << "[registry] active solution '" << solution_->id << "' ("
              << solution_->foci.size() << " focus point(s))\n";
}

void Registry::clearSolution()
{
    if (!solution_)
        return;

    std::unique_ptr<Solution> old = std::move(solution_);
    releaseArtifact(scene_, old->pnpArtifact);
    releaseArtifact(scene_, old->intensityArtifact);
}

void Registry::invalidateSolution(const std::string& reason)
{
    if (!solution_)
        return;
    std::string id = solution_->id;
    clearSolution();
    notify(NotificationKind::SolutionInvalidated, "Solution '" + id + "' cleared: " + reason);
}

void Registry::revalidateSolution()
{
    if (!solution_)
        return;
    if (!hasTransducer(solution_->transducerId))
        invalidateSolution("its transducer '" + solution_->transducerId + "' is no longer loaded");
    else if (!hasProtocol(solution_->protocolId))
        invalidateSolution("its protocol '" + solution_->protocolId + "' is no longer loaded");
}

void Registry::approveSolution(bool approved)
{
    if (!solution_)
        throw std::logic_error("No active solution");
    solution_->approved = approved;
    if (config_.verbose)
        std::cerr << "[registry] solution '" << solution_->id << "' "
                  << (approved ? "approved" : "unapproved") << "\n";
}

const Run* Registry::recordRun(bool success,
                               const std::string& note,
                               std::chrono::system_clock::time_point time)
{
    if (!solution_ || !solution_->approved)
        throw std::logic_error("Recording a run needs an approved active solution");

    std::optional<std::string> sessionId;
    if (session_)
        sessionId = session_->id();
    run_ = std::make_unique<Run>(makeRun(success, note, sessionId, solution_->id, time));

    if (database_ && sessionValid())
        database_->writeRun(session_->definition(), *run_);
    return run_.get();
}
