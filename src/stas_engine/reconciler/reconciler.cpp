#include "reconciler.h"

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

bool desired_contains(const DesiredStateSet& desired, const TransportId& tid) {
    for (const auto& entry : desired) {
        if (TransportId::matches(entry.tid, tid)) {
            return true;
        }
    }
    return false;
}

} // namespace

ReconcilePolicy ReconcilePolicy::from_config(const config::IocManagementSettings& settings) {
    ReconcilePolicy policy;
    policy.scope = settings.disconnect_scope;
    policy.disconnect_trtypes = settings.disconnect_trtypes;
    return policy;
}

Reconciler::Reconciler(ControllerKind kind, ReconcilePolicy policy) : kind_(kind), policy_(std::move(policy)) {}

std::map<TransportId, Reconciler::ManagedRecord>::iterator Reconciler::find_matching(const TransportId& tid) {
    auto exact = managed_.find(tid);
    if (exact != managed_.end()) {
        return exact;
    }
    for (auto it = managed_.begin(); it != managed_.end(); ++it) {
        if (TransportId::matches(it->first, tid)) {
            return it;
        }
    }
    return managed_.end();
}

bool Reconciler::should_disconnect(const TransportId& tid, bool owned) const {
    switch (policy_.scope) {
        case config::DisconnectScope::OnlyManaged:
            return owned;
        case config::DisconnectScope::AllMatchingTransportTypes:
            return policy_.disconnect_trtypes.count(tid.transport()) > 0;
        case config::DisconnectScope::NoDisconnect:
            return false;
    }
    return false;
}

std::vector<std::pair<TransportId, const KernelConnectionEntry*>> Reconciler::relevant_connections(
    const KernelConnectionSnapshot& snapshot) const {
    std::vector<std::pair<TransportId, const KernelConnectionEntry*>> result;
    for (const auto& entry : snapshot) {
        auto transport = entry.fields.find("transport");
        if (transport == entry.fields.end() || !is_supported_transport(transport->second)) {
            // pcie and friends are local devices this daemon never created.
            continue;
        }
        const bool is_dc = entry.looks_like_discovery_controller();
        if (is_dc != (kind_ == ControllerKind::Discovery)) {
            continue;
        }
        std::string error;
        auto tid = parse_transport_id(entry.fields, &error);
        if (!tid) {
            LOG_STAS_WARNING("Skipping %s during audit: %s", entry.device.c_str(), error.c_str());
            continue;
        }
        result.emplace_back(tid->with_kind(kind_), &entry);
    }
    return result;
}

ReconcileActions Reconciler::audit(const DesiredStateSet& desired, const KernelConnectionSnapshot& snapshot) {
    ReconcileActions actions;
    const auto existing = relevant_connections(snapshot);

    for (const auto& entry : desired) {
        if (find_matching(entry.tid) != managed_.end()) {
            continue;
        }
        CreateAction create;
        create.entry = entry;
        for (const auto& connection : existing) {
            if (TransportId::matches(connection.first, entry.tid)) {
                create.adopt = true;
                create.device = connection.second->device;
                break;
            }
        }
        managed_[entry.tid] = ManagedRecord{!create.adopt, false};
        actions.to_create.push_back(std::move(create));
    }

    for (auto& record : managed_) {
        if (record.second.disposing || desired_contains(desired, record.first)) {
            continue;
        }
        record.second.disposing = true;
        if (should_disconnect(record.first, record.second.owned)) {
            RemoveAction remove;
            remove.tid = record.first;
            remove.managed = true;
            for (const auto& connection : existing) {
                if (TransportId::matches(connection.first, record.first)) {
                    remove.device = connection.second->device;
                    break;
                }
            }
            actions.to_remove.push_back(std::move(remove));
        } else {
            actions.to_release.push_back(ReleaseAction{record.first});
        }
    }

    if (policy_.scope == config::DisconnectScope::AllMatchingTransportTypes) {
        for (const auto& connection : existing) {
            if (find_matching(connection.first) != managed_.end()) {
                continue;
            }
            if (policy_.disconnect_trtypes.count(connection.first.transport()) == 0) {
                continue;
            }
            managed_[connection.first] = ManagedRecord{false, true};
            RemoveAction remove;
            remove.tid = connection.first;
            remove.device = connection.second->device;
            remove.managed = false;
            actions.to_remove.push_back(std::move(remove));
        }
    }

    if (!actions.empty()) {
        LOG_STAS_DEBUG("Audit: %zu to create, %zu to remove, %zu to release.",
                       actions.to_create.size(),
                       actions.to_remove.size(),
                       actions.to_release.size());
    }
    return actions;
}

void Reconciler::track(const TransportId& tid, bool owned) {
    auto it = managed_.find(tid);
    if (it == managed_.end()) {
        managed_[tid] = ManagedRecord{owned, false};
    } else {
        it->second.owned = owned;
    }
}

void Reconciler::forget(const TransportId& tid) {
    managed_.erase(tid);
}

bool Reconciler::is_managed(const TransportId& tid) const {
    return managed_.find(tid) != managed_.end();
}

bool Reconciler::is_owned(const TransportId& tid) const {
    auto it = managed_.find(tid);
    return it != managed_.end() && it->second.owned;
}

bool Reconciler::is_disposing(const TransportId& tid) const {
    auto it = managed_.find(tid);
    return it != managed_.end() && it->second.disposing;
}

} // namespace engine
} // namespace nvmestas
