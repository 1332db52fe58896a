#include "MemoryWorkspaceStore.hpp"
#include "sync/Errors.hpp"

#include <algorithm>

using namespace cs::test;
using namespace cs::database;
using namespace cs::sync;
using namespace cs::sync::model;

MemoryWorkspaceStore::State& MemoryWorkspaceStore::stateOf(const std::string& workspaceId) {
    const auto it = workspaces_.find(workspaceId);
    if (it == workspaces_.end()) throw NotFoundError("Workspace not found: " + workspaceId);
    return it->second;
}

Workspace MemoryWorkspaceStore::createWorkspace(const std::string& id, const std::string& name, const std::string& ownerId) {
    std::scoped_lock lock(mutex_);
    Workspace ws;
    ws.id = id;
    ws.name = name;
    ws.version = INITIAL_WORKSPACE_VERSION;
    ws.created_by = ownerId;
    ws.created_at = 1'700'000'000;
    ws.members.push_back({ownerId, ROLE_OWNER});
    workspaces_[id] = State{ws, {}};
    return ws;
}

std::optional<Workspace> MemoryWorkspaceStore::getWorkspace(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto it = workspaces_.find(id);
    if (it == workspaces_.end()) return std::nullopt;
    return it->second.workspace;
}

std::vector<WorkspaceSummary> MemoryWorkspaceStore::listWorkspaces(const std::string& userId) {
    std::scoped_lock lock(mutex_);
    std::vector<WorkspaceSummary> out;
    for (const auto& [id, st] : workspaces_) {
        const auto& ws = st.workspace;
        for (const auto& m : ws.members)
            if (m.user_id == userId) out.push_back({ws.id, ws.name, ws.created_by, ws.created_at, m.role});
    }
    return out;
}

void MemoryWorkspaceStore::addMember(const std::string& workspaceId, const WorkspaceMember& member) {
    std::scoped_lock lock(mutex_);
    auto& members = stateOf(workspaceId).workspace.members;
    const auto it = std::find_if(members.begin(), members.end(), [&](const auto& m) { return m.user_id == member.user_id; });
    if (it != members.end()) it->role = member.role;
    else members.push_back(member);
}

ManifestSnapshot MemoryWorkspaceStore::snapshot(const std::string& workspaceId) {
    std::scoped_lock lock(mutex_);
    const auto& st = stateOf(workspaceId);
    ManifestSnapshot snap;
    snap.version = st.workspace.version;
    for (const auto& [_, e] : st.manifest) snap.entries.push_back(e);
    return snap;
}

void MemoryWorkspaceStore::saveReservation(const Reservation& reservation) {
    if (!reservation.isPending()) throw std::invalid_argument("Only pending reservations can be saved");
    std::scoped_lock lock(mutex_);
    reservations_[reservation.id] = reservation;
}

std::optional<Reservation> MemoryWorkspaceStore::getReservation(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto it = reservations_.find(id);
    if (it == reservations_.end()) return std::nullopt;
    return it->second;
}

CommitOutcome MemoryWorkspaceStore::commit(const CommitPlan& plan) {
    using Kind = CommitOutcome::Kind;
    std::scoped_lock lock(mutex_);

    auto& st = stateOf(plan.workspace_id);
    const auto current = st.workspace.version;

    const auto rit = reservations_.find(plan.reservation_id);
    if (rit == reservations_.end() || rit->second.workspace_id != plan.workspace_id) return {Kind::Expired, current, {}};
    auto& r = rit->second;

    if (const auto* c = std::get_if<Committed>(&r.state)) return {Kind::AlreadyCommitted, c->version, {}};
    if (r.isSuperseded()) return {Kind::Superseded, current, {}};
    if (r.isExpired(plan.now)) return {Kind::Expired, current, {}};
    if (current != plan.base_version) return {Kind::VersionMoved, current, {}};

    auto manifest = st.manifest;
    std::vector<std::string> obsolete;

    for (const auto& a : plan.actions) {
        if (a.op != ConfirmOp::Delete) continue;
        const auto it = manifest.find(a.filePath);
        if (it == manifest.end()) continue;
        if (it->second.storageKey) obsolete.push_back(*it->second.storageKey);
        manifest.erase(it);
    }

    for (const auto& a : plan.actions) {
        if (a.op != ConfirmOp::Upsert) continue;

        if (const auto it = manifest.find(a.filePath); it != manifest.end() && it->second.storageKey &&
                                                       *it->second.storageKey != a.storageKey)
            obsolete.push_back(*it->second.storageKey);

        ManifestEntry e;
        e.filePath = a.filePath;
        e.fileId = a.fileId;
        e.kind = a.kind;
        e.created_at = plan.now;
        e.updated_at = plan.now;
        if (a.kind == EntryKind::File) {
            e.storageKey = a.storageKey;
            e.contentHash = a.clientHash;
            e.size = a.size;
        }
        manifest[a.filePath] = std::move(e);
    }

    const auto newVersion = current + 1;
    st.manifest = std::move(manifest);
    st.workspace.version = newVersion;
    r.state = Committed{newVersion};

    for (auto& [id, other] : reservations_)
        if (id != r.id && other.workspace_id == plan.workspace_id && other.base_version == plan.base_version && other.isPending())
            other.state = Superseded{newVersion};

    return {Kind::Committed, newVersion, std::move(obsolete)};
}

size_t MemoryWorkspaceStore::purgeReservations(const std::time_t now, const std::chrono::seconds retention) {
    std::scoped_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = reservations_.begin(); it != reservations_.end();) {
        const auto& r = it->second;
        const bool drop = r.isPending() ? r.isExpired(now) : r.created_at < now - retention.count();
        if (drop) {
            it = reservations_.erase(it);
            ++removed;
        } else ++it;
    }
    return removed;
}

void MemoryWorkspaceStore::forceVersion(const std::string& workspaceId, const uint64_t version) {
    std::scoped_lock lock(mutex_);
    stateOf(workspaceId).workspace.version = version;
}

size_t MemoryWorkspaceStore::reservationCount() const {
    std::scoped_lock lock(mutex_);
    return reservations_.size();
}
