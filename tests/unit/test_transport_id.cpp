#include <gtest/gtest.h>

#include <map>

#include "transport/transport_id.h"

using namespace nvmestas::engine;

namespace {

TransportId Parse(const TidFields& fields) {
    std::string error;
    auto tid = parse_transport_id(fields, &error);
    EXPECT_TRUE(tid.has_value()) << error;
    return tid ? *tid : TransportId();
}

const char* kIoNqn = "nqn.1988-11.com.dell:powerstore:00:ab12";
const char* kUniqueDcNqn = "nqn.1988-11.com.dell:SFSS:1:20210101";

} // namespace

TEST(TransportIdTest, ParsesAndLowercasesTransport) {
    auto tid = Parse({{"transport", "TCP"}, {"traddr", "10.0.0.1"}, {"trsvcid", "4420"}, {"nqn", kIoNqn}});
    EXPECT_EQ(tid.transport(), "tcp");
    EXPECT_EQ(tid.traddr(), "10.0.0.1");
    EXPECT_EQ(tid.trsvcid(), "4420");
    EXPECT_EQ(tid.subsysnqn(), kIoNqn);
}

TEST(TransportIdTest, DefaultPorts) {
    EXPECT_EQ(Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}}).trsvcid(), "8009");
    EXPECT_EQ(Parse({{"transport", "rdma"}, {"traddr", "10.0.0.1"}}).trsvcid(), "4420");
    EXPECT_EQ(Parse({{"transport", "fc"}, {"traddr", "nn-0x1:pn-0x2"}, {"trsvcid", "99"}}).trsvcid(), "");
}

TEST(TransportIdTest, RejectsMissingOrUnknownFields) {
    std::string error;
    EXPECT_FALSE(parse_transport_id({{"traddr", "10.0.0.1"}}, &error));
    EXPECT_NE(error.find("transport"), std::string::npos);
    EXPECT_FALSE(parse_transport_id({{"transport", "tcp"}}, &error));
    EXPECT_NE(error.find("traddr"), std::string::npos);
    EXPECT_FALSE(parse_transport_id({{"transport", "pcie"}, {"traddr", "0000:01:00.0"}}, &error));
}

TEST(TransportIdTest, WellKnownNqnMakesADiscoveryTid) {
    auto dc = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kWellKnownDiscoveryNqn}});
    EXPECT_TRUE(dc.is_discovery());
    EXPECT_EQ(dc.kind(), ControllerKind::Discovery);
    auto io = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}});
    EXPECT_FALSE(io.is_discovery());
    EXPECT_TRUE(io.with_kind(ControllerKind::Discovery).is_discovery());
}

TEST(TransportIdTest, HostIfaceOnlyComparedWhenBothSidesHaveOne) {
    auto configured = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}, {"host-iface", "eth0"}});
    auto kernel = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}});
    auto other_iface = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}, {"host-iface", "eth1"}});

    EXPECT_TRUE(TransportId::matches(configured, kernel));
    EXPECT_TRUE(TransportId::matches(kernel, configured));
    EXPECT_FALSE(TransportId::matches(configured, other_iface));
    EXPECT_NE(configured, kernel);
}

TEST(TransportIdTest, HostTraddrIsAlwaysCompared) {
    auto a = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}, {"host-traddr", "10.0.0.100"}});
    auto b = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}});
    EXPECT_FALSE(TransportId::matches(a, b));
}

TEST(TransportIdTest, HostNqnRelaxedLikeHostIface) {
    auto plain = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}});
    auto with_host = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}, {"host-nqn", "nqn.host"}});
    auto other_host = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}, {"host-nqn", "nqn.other"}});
    EXPECT_TRUE(TransportId::matches(plain, with_host));
    EXPECT_FALSE(TransportId::matches(with_host, other_host));
}

TEST(TransportIdTest, WellKnownNqnPairsWithUniqueDiscoveryNqn) {
    auto well_known = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kWellKnownDiscoveryNqn}});
    auto unique = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kUniqueDcNqn}})
                      .with_kind(ControllerKind::Discovery);
    auto unique_io = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kUniqueDcNqn}});
    auto other_unique = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", "nqn.other:dc"}})
                            .with_kind(ControllerKind::Discovery);

    EXPECT_TRUE(TransportId::matches(well_known, unique));
    EXPECT_FALSE(TransportId::matches(well_known, unique_io));
    EXPECT_FALSE(TransportId::matches(unique, other_unique));
}

TEST(TransportIdTest, UsableAsMapKey) {
    std::map<TransportId, int> table;
    table[Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}})] = 1;
    table[Parse({{"transport", "tcp"}, {"traddr", "10.0.0.2"}, {"subsysnqn", kIoNqn}})] = 2;
    table[Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}})
              .with_kind(ControllerKind::Io)] = 3;
    EXPECT_EQ(table.size(), 2u);
}

TEST(TransportIdTest, FieldsRoundTripAndStringForm) {
    auto tid = Parse({{"transport", "tcp"},
                      {"traddr", "10.0.0.1"},
                      {"trsvcid", "4420"},
                      {"subsysnqn", kIoNqn},
                      {"host-iface", "eth0"},
                      {"host-traddr", "10.0.0.100"}});
    EXPECT_EQ(Parse(tid.as_fields()), tid);
    EXPECT_EQ(tid.as_fields().count("host-nqn"), 0u);
    EXPECT_EQ(tid.to_string(), std::string("(tcp, 10.0.0.1, 4420, ") + kIoNqn + ", eth0, 10.0.0.100)");
}

TEST(TransportIdTest, CopyHelpers) {
    auto tid = Parse({{"transport", "tcp"}, {"traddr", "10.0.0.1"}, {"subsysnqn", kIoNqn}, {"host-iface", "eth0"}});
    EXPECT_TRUE(tid.without_host_iface().host_iface().empty());
    auto with_host = tid.with_host_defaults("nqn.host", "id-1");
    EXPECT_EQ(with_host.host_nqn(), "nqn.host");
    EXPECT_EQ(with_host.host_id(), "id-1");
    EXPECT_EQ(with_host.with_host_defaults("nqn.other", "id-2").host_nqn(), "nqn.host");
}
