#include <gtest/gtest.h>

#include "discovery/service_directory.h"

using namespace nvmestas::engine;

namespace {

ServiceAnnouncement announcement(const std::string& id, const std::string& address, int port = 8009) {
    ServiceAnnouncement result;
    result.id = id;
    result.interface = "eth0";
    result.address = address;
    result.port = port;
    return result;
}

} // namespace

TEST(ServiceDirectoryTest, UpsertReportsNewAndChangedOnly) {
    ServiceDirectory directory;
    auto a = announcement("eth0/ipv4/dc-a", "10.0.0.1");

    EXPECT_TRUE(directory.upsert(a));
    EXPECT_FALSE(directory.upsert(a));
    EXPECT_EQ(directory.size(), 1u);

    a.txt["nqn"] = "nqn.dc-a";
    EXPECT_TRUE(directory.upsert(a));
    EXPECT_EQ(directory.size(), 1u);
    EXPECT_EQ(directory.all_announcements()[0].txt.at("nqn"), "nqn.dc-a");
}

TEST(ServiceDirectoryTest, RemoveAndClear) {
    ServiceDirectory directory;
    directory.upsert(announcement("a", "10.0.0.1"));
    directory.upsert(announcement("b", "10.0.0.2"));

    EXPECT_TRUE(directory.remove("a"));
    EXPECT_FALSE(directory.remove("a"));
    EXPECT_EQ(directory.size(), 1u);

    directory.clear();
    EXPECT_EQ(directory.size(), 0u);
    EXPECT_TRUE(directory.discovery_controllers().empty());
}

TEST(ServiceDirectoryTest, DefaultsToTcpAndWellKnownNqn) {
    auto tid = ServiceDirectory::to_transport_id(announcement("a", "10.0.0.1", 8009));
    ASSERT_TRUE(tid.has_value());
    EXPECT_EQ(tid->transport(), "tcp");
    EXPECT_EQ(tid->traddr(), "10.0.0.1");
    EXPECT_EQ(tid->trsvcid(), "8009");
    EXPECT_EQ(tid->subsysnqn(), kWellKnownDiscoveryNqn);
    EXPECT_EQ(tid->host_iface(), "eth0");
    EXPECT_EQ(tid->kind(), ControllerKind::Discovery);
}

TEST(ServiceDirectoryTest, HonoursTxtRecord) {
    auto a = announcement("a", "fe80::1%eth0", 4420);
    a.txt["p"] = " RDMA ";
    a.txt["nqn"] = "nqn.2014-08.com.example:cdc";

    auto tid = ServiceDirectory::to_transport_id(a);
    ASSERT_TRUE(tid.has_value());
    EXPECT_EQ(tid->transport(), "rdma");
    EXPECT_EQ(tid->traddr(), "fe80::1");
    EXPECT_EQ(tid->trsvcid(), "4420");
    EXPECT_EQ(tid->subsysnqn(), "nqn.2014-08.com.example:cdc");
    EXPECT_EQ(tid->kind(), ControllerKind::Discovery);
}

TEST(ServiceDirectoryTest, RejectsUnusableAnnouncements) {
    EXPECT_FALSE(ServiceDirectory::to_transport_id(announcement("a", "", 8009)));
    EXPECT_FALSE(ServiceDirectory::to_transport_id(announcement("a", "10.0.0.1", 0)));

    auto bad_transport = announcement("a", "10.0.0.1");
    bad_transport.txt["p"] = "carrier-pigeon";
    EXPECT_FALSE(ServiceDirectory::to_transport_id(bad_transport));
}

TEST(ServiceDirectoryTest, DiscoveryControllersSkipsDuplicatesAndUnusable) {
    ServiceDirectory directory;
    directory.upsert(announcement("eth0/ipv4/dc-a", "10.0.0.1"));
    // Same controller seen twice, e.g. through two service names.
    directory.upsert(announcement("eth0/ipv4/dc-a-alias", "10.0.0.1"));
    directory.upsert(announcement("eth0/ipv4/dc-b", "10.0.0.2"));
    directory.upsert(announcement("eth0/ipv4/broken", "", 8009));

    auto dcs = directory.discovery_controllers();
    ASSERT_EQ(dcs.size(), 2u);
    EXPECT_EQ(dcs[0].traddr(), "10.0.0.1");
    EXPECT_EQ(dcs[1].traddr(), "10.0.0.2");
}
