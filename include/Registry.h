#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "Database.h"
#include "PlannerConfig.h"
#include "Protocol.h"
#include "Run.h"
#include "SceneHost.h"
#include "Session.h"
#include "Solution.h"
#include "Tracking.h"
#include "Transducer.h"

enum class SessionState
{
    Unloaded,
    Loading,
    Active,
    Invalidated
};

const char* sessionStateName(SessionState state);

enum class NotificationKind
{
    ApprovalRevoked,
    SessionInvalidated,
    SolutionInvalidated,
    TransducerRemoved,
    LoadAborted
};

/// User-visible message raised by a state transition.
struct Notification
{
    NotificationKind kind;
    std::string message;
};

/// The authoritative store of what is loaded: transducers and protocols by
/// id, and at most one session, solution and run.
///
/// All mutation happens on one thread.  The registry listens to the scene
/// and reacts synchronously to artifact removal, point edits and placement
/// changes.  Anything it removes from the scene itself is popped from its
/// own maps first, so the resulting notifications never see it half-removed.
class Registry
{
public:
    using ConfirmationHandler = std::function<bool(const std::string& title, const std::string& text)>;
    using InvalidationHandler = std::function<bool(const std::string& text)>;
    using NotificationHandler = std::function<void(const Notification&)>;

    /// `planner` is the physics backend, if one is available; it must
    /// outlive the registry.
    explicit Registry(SceneHost& scene, PlannerConfig config = {}, PlanningBackend* planner = nullptr);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    SceneHost& scene() { return scene_; }
    const SceneHost& scene() const { return scene_; }
    const PlannerConfig& config() const { return config_; }

    void setDatabase(std::unique_ptr<Database> database) { database_ = std::move(database); }

    /// Asked before replacing something; no handler counts as "no".
    void setConfirmationHandler(ConfirmationHandler handler) { confirm_ = std::move(handler); }

    /// Decides release (true) or orphan (false) when a session is
    /// invalidated; without one the configured default applies.
    void setInvalidationHandler(InvalidationHandler handler) { invalidation_ = std::move(handler); }

    void setNotificationHandler(NotificationHandler handler) { notify_ = std::move(handler); }

    // --- Transducers ---

    /// Load a transducer, replacing one with the same id if confirmed.
    /// Returns nullptr when the replacement was declined.
    /// @throws TransducerInUse if the colliding transducer belongs to the
    ///         active session, whatever `replaceConfirmed` says
    Transducer* loadTransducer(const TransducerDefinition& definition,
                               const std::optional<glm::dmat4>& matrix = std::nullopt,
                               const std::optional<std::string>& matrixUnits = std::nullopt,
                               bool replaceConfirmed = false);

    /// Pop the transducer, then release (or orphan) its artifacts.
    /// @throws NotLoaded, with nothing changed, if the id is not loaded
    void removeTransducer(const std::string& id, bool releaseArtifacts = true);

    /// Pop without touching the scene.  The caller decides what happens to
    /// the artifacts through the returned handle.
    /// @throws NotLoaded
    DetachedTransducer detachTransducer(const std::string& id);

    bool hasTransducer(const std::string& id) const { return transducers_.count(id) != 0; }
    Transducer* transducer(const std::string& id);
    const Transducer* transducer(const std::string& id) const;
    std::vector<std::string> transducerIds() const;

    /// A mesh or placement artifact was removed by someone else.  The owning
    /// transducer, if any, is dropped without destroying its other artifact
    /// and the session is re-validated.
    /// @throws DuplicateArtifactOwner if two transducers claim the artifact
    void onExternalArtifactRemoved(ArtifactId artifact, ArtifactKind which);

    // --- Protocols ---

    /// Returns nullptr when replacing an existing protocol was declined.
    const ProtocolDefinition* loadProtocol(const ProtocolDefinition& definition,
                                           bool replaceConfirmed = false);

    /// @throws NotLoaded
    void removeProtocol(const std::string& id);

    bool hasProtocol(const std::string& id) const { return protocols_.count(id) != 0; }
    const ProtocolDefinition* protocol(const std::string& id) const;

    // --- Session ---

    /// Load a session from the database and make it active.  Returns nullptr
    /// when reloading its already loaded transducer was declined.
    /// @throws AmbiguousVolumeFile unless exactly one volume file matches
    /// @throws std::runtime_error with no database
    Session* loadSession(const std::string& subjectId,
                         const std::string& sessionId,
                         bool replaceConfirmed = false);

    /// Activate a session over artifacts that are already in the scene.
    /// Returns nullptr if the session is invalid straight away.
    Session* adoptSession(SessionDefinition definition,
                          ArtifactId volumeArtifact,
                          std::vector<ArtifactId> targetArtifacts);

    /// Pop the session, then release or orphan its artifacts.  Releasing
    /// also unloads the session's transducer.
    void unloadSession(bool releaseArtifacts);

    /// Sync the session from the scene and write it to the database.
    /// @throws std::logic_error without an active session or database
    void saveSession();

    Session* session() { return session_.get(); }
    const Session* session() const { return session_.get(); }
    SessionState sessionState() const { return state_; }
    bool sessionValid() const;

    /// Approve the virtual fit for one of the session's own targets, by
    /// target id, or clear the approval.
    /// @throws std::logic_error without an active session
    /// @throws std::invalid_argument if the session owns no such target
    void approveVirtualFit(const std::optional<std::string>& targetId);
    bool toggleTrackingApproval();

    // --- Targets and tracking ---

    /// Add every point of a .tag file as a target artifact, owned by the
    /// active session if there is one.  Returns the artifacts created.
    std::vector<ArtifactId> importTargets(const std::string& tagPath);

    /// Move a transducer to a tracked placement.  Any tracking approval is
    /// revoked by the placement change and must be given again.
    /// @throws std::invalid_argument for an invalid result, NotLoaded
    void applyTracking(const std::string& transducerId, const TrackingResult& result);

    // --- Planning ---

    /// Plan for a target artifact using the active session's transducer,
    /// protocol and volume.  The aggregated fields are added to the scene
    /// riding on the transducer placement and the solution becomes active.
    /// @throws PlanningUnavailable without a backend
    /// @throws std::logic_error without a valid active session
    const Solution* computeSolution(ArtifactId targetArtifact,
                                    std::chrono::system_clock::time_point time =
                                        std::chrono::system_clock::now());

    /// Replace the active solution.  With a valid session the new solution
    /// is written to the database first; if that throws nothing changes.
    void setActiveSolution(Solution solution);

    /// Pop the active solution, then release its field artifacts.
    void clearSolution();

    /// @throws std::logic_error without an active solution
    void approveSolution(bool approved);

    const Solution* solution() const { return solution_.get(); }

    /// Record a completed run of the active, approved solution.
    /// @throws std::logic_error without one
    const Run* recordRun(bool success,
                         const std::string& note,
                         std::chrono::system_clock::time_point time =
                             std::chrono::system_clock::now());

    const Run* run() const { return run_.get(); }

private:
    void handleSceneEvent(const SceneEvent& event);
    void handleVolumeRemoved(ArtifactId artifact);
    void handleTargetChanged(const SceneEvent& event);
    void handlePlacementChanged(ArtifactId placement);

    void revalidateSession();
    void revalidateSolution();
    void invalidateSolution(const std::string& reason);
    void clearSession(bool releaseArtifacts);
    void revokeVirtualFit(const std::string& reason);

    bool confirm(const std::string& title, const std::string& text) const;
    void notify(NotificationKind kind, const std::string& message) const;

    SceneHost& scene_;
    PlannerConfig config_;
    PlanningBackend* planner_ = nullptr;
    std::unique_ptr<Database> database_;
    int subscription_ = 0;

    ConfirmationHandler confirm_;
    InvalidationHandler invalidation_;
    NotificationHandler notify_;

    std::map<std::string, std::unique_ptr<Transducer>> transducers_;
    std::map<std::string, ProtocolDefinition> protocols_;

    std::unique_ptr<Session> session_;
    SessionState state_ = SessionState::Unloaded;
    std::unique_ptr<Solution> solution_;
    std::unique_ptr<Run> run_;
};
