/**
 * @file reconciler.h
 * @brief The audit engine: compares the desired state with the kernel's connections.
 * @details The Reconciler keeps a shadow of the controller records its owner manages
 *          (TID, owned, disposing), similar to how a config applier remembers what it
 *          applied last. audit() only returns the difference between the desired set,
 *          that shadow and a fresh kernel snapshot, so running it twice with the same
 *          inputs yields no actions the second time.
 *
 *          Rules:
 *          - kernel entries on a local bus (pcie) or with an unknown transport are never
 *            audited; entries whose TID cannot be rebuilt are logged and skipped;
 *          - a desired TID without a record is created, adopting the kernel connection
 *            when one matches;
 *          - a record no longer desired is disposed of. Whether its connection is torn
 *            down depends on the disconnect scope;
 *          - a kernel connection nobody manages and nobody wants is only torn down under
 *            the all-matching-transport-types scope;
 *          - records present in both sets are left alone, live connections are never
 *            reconfigured in place.
 */
#ifndef STAS_RECONCILER_H
#define STAS_RECONCILER_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "configuration/stas_config_types.h"
#include "desired_state.h"
#include "../kernel/kernel_inventory.h"
#include "../transport/transport_id.h"

namespace nvmestas {
namespace engine {

struct ReconcilePolicy {
    config::DisconnectScope scope = config::DisconnectScope::OnlyManaged;
    std::set<std::string> disconnect_trtypes{"tcp"};

    static ReconcilePolicy from_config(const config::IocManagementSettings& settings);
};

struct CreateAction {
    DesiredEntry entry;
    bool adopt = false;      // a matching kernel connection already exists
    std::string device;      // that connection's device when adopting
};

struct RemoveAction {
    TransportId tid;
    std::string device;      // empty when not connected
    bool managed = false;    // false: an external connection with no record
};

struct ReleaseAction {
    TransportId tid;         // record goes away, connection stays
};

struct ReconcileActions {
    std::vector<CreateAction> to_create;
    std::vector<RemoveAction> to_remove;
    std::vector<ReleaseAction> to_release;

    bool empty() const { return to_create.empty() && to_remove.empty() && to_release.empty(); }
    size_t size() const { return to_create.size() + to_remove.size() + to_release.size(); }
};

class Reconciler {
public:
    /**
     * @param kind Which controllers this instance audits. Kernel entries of the other
     *             kind are invisible to it (the connector never touches DCs and the
     *             finder never touches I/O controllers).
     */
    Reconciler(ControllerKind kind, ReconcilePolicy policy);

    void set_policy(ReconcilePolicy policy) { policy_ = std::move(policy); }
    const ReconcilePolicy& policy() const { return policy_; }

    ReconcileActions audit(const DesiredStateSet& desired, const KernelConnectionSnapshot& snapshot);

    /** @brief Registers a record created outside of audit() (startup recovery). */
    void track(const TransportId& tid, bool owned);

    /** @brief The record finished its disposal. */
    void forget(const TransportId& tid);

    bool is_managed(const TransportId& tid) const;
    bool is_owned(const TransportId& tid) const;
    bool is_disposing(const TransportId& tid) const;
    size_t managed_count() const { return managed_.size(); }

    /** @brief Kernel entries this instance audits, with the TID rebuilt. */
    std::vector<std::pair<TransportId, const KernelConnectionEntry*>> relevant_connections(
        const KernelConnectionSnapshot& snapshot) const;

private:
    struct ManagedRecord {
        bool owned = false;
        bool disposing = false;
    };

    std::map<TransportId, ManagedRecord>::iterator find_matching(const TransportId& tid);
    bool should_disconnect(const TransportId& tid, bool owned) const;

    ControllerKind kind_;
    ReconcilePolicy policy_;
    std::map<TransportId, ManagedRecord> managed_;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_RECONCILER_H
