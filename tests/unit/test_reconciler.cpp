#include <gtest/gtest.h>

#include "mocks/controller_harness.h"
#include "reconciler/reconciler.h"

using namespace nvmestas::engine;
using nvmestas::config::DisconnectScope;
using nvmestas::engine::testing::make_dc_tid;
using nvmestas::engine::testing::make_tid;

namespace {

const char* kHostNqn = "nqn.2014-08.org.nvmexpress:uuid:host-under-test";

KernelConnectionEntry kernel_entry(const std::string& device, const TransportId& tid, bool io = true) {
    KernelConnectionEntry entry;
    entry.device = device;
    entry.fields = tid.as_fields();
    entry.fields["host-nqn"] = kHostNqn;
    entry.cntrltype = io ? "io" : "discovery";
    entry.has_children = io;
    return entry;
}

DesiredEntry desired(const TransportId& tid) {
    DesiredEntry entry;
    entry.tid = tid;
    return entry;
}

ReconcilePolicy policy(DisconnectScope scope, std::set<std::string> trtypes = {"tcp"}) {
    ReconcilePolicy result;
    result.scope = scope;
    result.disconnect_trtypes = std::move(trtypes);
    return result;
}

} // namespace

class ReconcilerTest : public ::testing::Test {
protected:
    TransportId io_a = make_tid("tcp", "10.0.0.1", "4420", "nqn.io-a").with_kind(ControllerKind::Io);
    TransportId io_b = make_tid("tcp", "10.0.0.2", "4420", "nqn.io-b").with_kind(ControllerKind::Io);
    TransportId io_rdma = make_tid("rdma", "10.0.0.3", "4420", "nqn.io-c").with_kind(ControllerKind::Io);
};

TEST_F(ReconcilerTest, CreatesMissingControllers) {
    Reconciler reconciler(ControllerKind::Io, ReconcilePolicy());
    auto actions = reconciler.audit({desired(io_a), desired(io_b)}, {});

    ASSERT_EQ(actions.to_create.size(), 2u);
    EXPECT_TRUE(actions.to_remove.empty());
    EXPECT_FALSE(actions.to_create[0].adopt);
    EXPECT_TRUE(reconciler.is_managed(io_a));
    EXPECT_TRUE(reconciler.is_owned(io_a));
}

TEST_F(ReconcilerTest, AuditIsIdempotent) {
    Reconciler reconciler(ControllerKind::Io, ReconcilePolicy());
    const DesiredStateSet want{desired(io_a), desired(io_b)};
    const KernelConnectionSnapshot snapshot{kernel_entry("nvme0", io_a)};

    auto first = reconciler.audit(want, snapshot);
    EXPECT_EQ(first.to_create.size(), 2u);

    auto second = reconciler.audit(want, snapshot);
    EXPECT_TRUE(second.empty());

    auto third = reconciler.audit(want, snapshot);
    EXPECT_TRUE(third.empty());
}

TEST_F(ReconcilerTest, AdoptsExistingKernelConnection) {
    Reconciler reconciler(ControllerKind::Io, ReconcilePolicy());
    auto actions = reconciler.audit({desired(io_a)}, {kernel_entry("nvme4", io_a)});

    ASSERT_EQ(actions.to_create.size(), 1u);
    EXPECT_TRUE(actions.to_create[0].adopt);
    EXPECT_EQ(actions.to_create[0].device, "nvme4");
    // Adopted connections are not ours to tear down under the default scope.
    EXPECT_FALSE(reconciler.is_owned(io_a));
}

TEST_F(ReconcilerTest, AdoptionUsesRelaxedMatching) {
    Reconciler reconciler(ControllerKind::Io, ReconcilePolicy());
    auto with_iface = make_tid("tcp", "10.0.0.1", "4420", "nqn.io-a", "eth0").with_kind(ControllerKind::Io);
    auto actions = reconciler.audit({desired(io_a)}, {kernel_entry("nvme2", with_iface)});

    ASSERT_EQ(actions.to_create.size(), 1u);
    EXPECT_TRUE(actions.to_create[0].adopt);
}

TEST_F(ReconcilerTest, OnlyManagedDisconnectsOwnedRecords) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::OnlyManaged));
    reconciler.audit({desired(io_a), desired(io_b)}, {kernel_entry("nvme0", io_b)});
    ASSERT_TRUE(reconciler.is_owned(io_a));
    ASSERT_FALSE(reconciler.is_owned(io_b));

    const KernelConnectionSnapshot snapshot{kernel_entry("nvme1", io_a), kernel_entry("nvme0", io_b)};
    auto actions = reconciler.audit({}, snapshot);

    ASSERT_EQ(actions.to_remove.size(), 1u);
    EXPECT_EQ(actions.to_remove[0].tid, io_a);
    EXPECT_EQ(actions.to_remove[0].device, "nvme1");
    EXPECT_TRUE(actions.to_remove[0].managed);

    ASSERT_EQ(actions.to_release.size(), 1u);
    EXPECT_EQ(actions.to_release[0].tid, io_b);

    EXPECT_TRUE(reconciler.is_disposing(io_a));
    EXPECT_TRUE(reconciler.is_disposing(io_b));
}

TEST_F(ReconcilerTest, OnlyManagedLeavesExternalConnectionsAlone) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::OnlyManaged));
    auto actions = reconciler.audit({}, {kernel_entry("nvme7", io_a)});
    EXPECT_TRUE(actions.empty());
}

TEST_F(ReconcilerTest, AllMatchingTransportTypesDisconnectsByTransport) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::AllMatchingTransportTypes, {"tcp"}));
    const KernelConnectionSnapshot snapshot{kernel_entry("nvme0", io_a), kernel_entry("nvme1", io_rdma)};

    auto actions = reconciler.audit({desired(io_b)}, snapshot);

    ASSERT_EQ(actions.to_create.size(), 1u);
    EXPECT_EQ(actions.to_create[0].entry.tid, io_b);

    // Unwanted external tcp connection goes, the rdma one is outside disconnect-trtypes.
    ASSERT_EQ(actions.to_remove.size(), 1u);
    EXPECT_EQ(actions.to_remove[0].device, "nvme0");
    EXPECT_FALSE(actions.to_remove[0].managed);
    EXPECT_TRUE(reconciler.is_disposing(actions.to_remove[0].tid));

    // Already disposing: not reported twice.
    EXPECT_TRUE(reconciler.audit({desired(io_b)}, snapshot).empty());
}

TEST_F(ReconcilerTest, AllMatchingTransportTypesDisconnectsAdoptedRecords) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::AllMatchingTransportTypes, {"tcp", "rdma"}));
    const KernelConnectionSnapshot snapshot{kernel_entry("nvme0", io_a)};
    reconciler.audit({desired(io_a)}, snapshot);
    ASSERT_FALSE(reconciler.is_owned(io_a));

    auto actions = reconciler.audit({}, snapshot);
    ASSERT_EQ(actions.to_remove.size(), 1u);
    EXPECT_TRUE(actions.to_remove[0].managed);
    EXPECT_EQ(actions.to_remove[0].device, "nvme0");
    EXPECT_TRUE(actions.to_release.empty());
}

TEST_F(ReconcilerTest, NoDisconnectOnlyReleases) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::NoDisconnect));
    reconciler.audit({desired(io_a)}, {});
    ASSERT_TRUE(reconciler.is_owned(io_a));

    auto actions = reconciler.audit({}, {kernel_entry("nvme0", io_a), kernel_entry("nvme1", io_b)});
    EXPECT_TRUE(actions.to_remove.empty());
    ASSERT_EQ(actions.to_release.size(), 1u);
    EXPECT_EQ(actions.to_release[0].tid, io_a);
}

TEST_F(ReconcilerTest, NeverReconfiguresLiveConnections) {
    Reconciler reconciler(ControllerKind::Io, ReconcilePolicy());
    DesiredEntry entry = desired(io_a);
    reconciler.audit({entry}, {});

    entry.overrides["kato"] = "99";
    EXPECT_TRUE(reconciler.audit({entry}, {kernel_entry("nvme0", io_a)}).empty());
}

TEST_F(ReconcilerTest, PcieAndUnknownTransportsAreSkipped) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::AllMatchingTransportTypes, {"tcp", "rdma", "fc"}));

    KernelConnectionEntry pcie;
    pcie.device = "nvme0";
    pcie.fields = {{"transport", "pcie"}, {"traddr", "0000:01:00.0"}};
    pcie.has_children = true;

    KernelConnectionEntry no_transport;
    no_transport.device = "nvme1";
    no_transport.fields = {{"traddr", "10.0.0.8"}};
    no_transport.has_children = true;

    EXPECT_TRUE(reconciler.relevant_connections({pcie, no_transport}).empty());
    EXPECT_TRUE(reconciler.audit({}, {pcie, no_transport}).empty());
}

TEST_F(ReconcilerTest, UnparsableEntriesAreSkipped) {
    Reconciler reconciler(ControllerKind::Io, policy(DisconnectScope::AllMatchingTransportTypes));
    KernelConnectionEntry broken;
    broken.device = "nvme5";
    broken.fields = {{"transport", "tcp"}};  // no traddr
    broken.cntrltype = "io";

    EXPECT_TRUE(reconciler.relevant_connections({broken}).empty());
    EXPECT_TRUE(reconciler.audit({}, {broken}).empty());
}

TEST_F(ReconcilerTest, DiscoveryAndIoControllersAreSeparate) {
    auto dc = make_dc_tid("10.0.0.50");
    const KernelConnectionSnapshot snapshot{kernel_entry("nvme0", dc, false), kernel_entry("nvme1", io_a)};

    Reconciler io(ControllerKind::Io, policy(DisconnectScope::AllMatchingTransportTypes));
    auto io_connections = io.relevant_connections(snapshot);
    ASSERT_EQ(io_connections.size(), 1u);
    EXPECT_EQ(io_connections[0].second->device, "nvme1");
    EXPECT_EQ(io_connections[0].first.kind(), ControllerKind::Io);

    Reconciler finder(ControllerKind::Discovery, policy(DisconnectScope::OnlyManaged));
    auto dc_connections = finder.relevant_connections(snapshot);
    ASSERT_EQ(dc_connections.size(), 1u);
    EXPECT_EQ(dc_connections[0].second->device, "nvme0");

    // The I/O audit must not touch the DC even under the widest scope.
    auto actions = io.audit({}, snapshot);
    ASSERT_EQ(actions.to_remove.size(), 1u);
    EXPECT_EQ(actions.to_remove[0].device, "nvme1");
}

TEST_F(ReconcilerTest, TrackAndForget) {
    Reconciler reconciler(ControllerKind::Io, ReconcilePolicy());
    reconciler.track(io_a, true);
    EXPECT_TRUE(reconciler.is_managed(io_a));
    EXPECT_EQ(reconciler.managed_count(), 1u);

    // A tracked record is not created again.
    EXPECT_TRUE(reconciler.audit({desired(io_a)}, {}).empty());

    reconciler.audit({}, {});
    EXPECT_TRUE(reconciler.is_disposing(io_a));
    reconciler.forget(io_a);
    EXPECT_FALSE(reconciler.is_managed(io_a));

    // Once forgotten, wanting it again creates it again.
    auto actions = reconciler.audit({desired(io_a)}, {});
    EXPECT_EQ(actions.to_create.size(), 1u);
}

TEST_F(ReconcilerTest, PolicyFromConfig) {
    nvmestas::config::IocManagementSettings settings;
    settings.disconnect_scope = DisconnectScope::NoDisconnect;
    settings.disconnect_trtypes = {"rdma"};
    auto result = ReconcilePolicy::from_config(settings);
    EXPECT_EQ(result.scope, DisconnectScope::NoDisconnect);
    EXPECT_EQ(result.disconnect_trtypes, (std::set<std::string>{"rdma"}));
}

TEST(KernelConnectionEntryTest, DiscoveryControllerDetection) {
    KernelConnectionEntry entry;
    entry.fields = {{"transport", "tcp"}, {"subsysnqn", kWellKnownDiscoveryNqn}};
    entry.cntrltype = "io";
    EXPECT_TRUE(entry.looks_like_discovery_controller());

    entry.fields["subsysnqn"] = "nqn.2014-08.com.vendor:unique-dc";
    entry.cntrltype = "discovery";
    EXPECT_TRUE(entry.looks_like_discovery_controller());

    entry.cntrltype = "io";
    EXPECT_FALSE(entry.looks_like_discovery_controller());

    // Older kernels: no cntrltype, fall back on namespaces being present.
    entry.cntrltype.clear();
    entry.has_children = false;
    EXPECT_TRUE(entry.looks_like_discovery_controller());
    entry.has_children = true;
    EXPECT_FALSE(entry.looks_like_discovery_controller());
}
