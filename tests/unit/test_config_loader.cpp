#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

#include "configuration/config_loader.h"

using namespace nvmestas::config;

namespace {

// Keeps tests independent of /etc/nvme on the build machine.
const char* kHostSection =
    "[Host]\n"
    "nqn=nqn.2014-08.org.nvmexpress:uuid:test-host\n"
    "id=11111111-2222-3333-4444-555555555555\n";

std::string write_temp_file(const std::string& name, const std::string& contents) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    StasConfig load(const std::string& text) {
        StasConfig config;
        EXPECT_TRUE(loader.load_string(text + kHostSection, config));
        return config;
    }

    ConfigLoader loader;
};

TEST_F(ConfigLoaderTest, DefaultsWhenSectionsAreMissing) {
    StasConfig config = load("");

    EXPECT_FALSE(config.global.tron);
    EXPECT_FALSE(config.global.ignore_iface);
    EXPECT_TRUE(config.global.ipv4_enabled);
    EXPECT_TRUE(config.global.ipv6_enabled);
    EXPECT_TRUE(config.service_discovery.zeroconf_enabled);
    EXPECT_TRUE(config.dc_management.persistent_connections);
    EXPECT_EQ(config.dc_management.zeroconf_persistence, std::chrono::seconds(72 * 3600));
    EXPECT_EQ(config.ioc_management.disconnect_scope, DisconnectScope::OnlyManaged);
    EXPECT_EQ(config.ioc_management.disconnect_trtypes, (std::set<std::string>{"tcp"}));
    EXPECT_EQ(config.ioc_management.connect_attempts_on_ncc, 0);
    EXPECT_EQ(config.global.connection.reconnect_delay, 10);
    EXPECT_EQ(config.global.connection.ctrl_loss_tmo, -1);
    EXPECT_FALSE(config.global.connection.kato.has_value());
    EXPECT_EQ(config.state_dir, kDefaultStateDir);
    EXPECT_TRUE(loader.warnings().empty());
}

TEST_F(ConfigLoaderTest, GlobalSection) {
    StasConfig config = load("[Global]\n"
                             "tron=true\n"
                             "hdr-digest=yes\n"
                             "data-digest=on\n"
                             "kato=15\n"
                             "nr-io-queues=8\n"
                             "queue-size=64\n"
                             "reconnect-delay=5s\n"
                             "ctrl-loss-tmo=10m\n"
                             "ignore-iface=true\n"
                             "ip-family=ipv6\n");

    EXPECT_TRUE(config.global.tron);
    EXPECT_TRUE(config.global.connection.hdr_digest);
    EXPECT_TRUE(config.global.connection.data_digest);
    EXPECT_EQ(config.global.connection.kato, 15);
    EXPECT_EQ(config.global.connection.nr_io_queues, 8);
    EXPECT_EQ(config.global.connection.queue_size, 64);
    EXPECT_FALSE(config.global.connection.nr_poll_queues.has_value());
    EXPECT_EQ(config.global.connection.reconnect_delay, 5);
    EXPECT_EQ(config.global.connection.ctrl_loss_tmo, 600);
    EXPECT_TRUE(config.global.ignore_iface);
    EXPECT_FALSE(config.global.ipv4_enabled);
    EXPECT_TRUE(config.global.ipv6_enabled);
    EXPECT_TRUE(loader.warnings().empty());
}

TEST_F(ConfigLoaderTest, SectionAndKeyNamesAreCaseInsensitive) {
    StasConfig config = load("[SERVICE DISCOVERY]\n"
                             "Zeroconf=disabled\n");
    EXPECT_FALSE(config.service_discovery.zeroconf_enabled);
}

TEST_F(ConfigLoaderTest, CommentsAndBlankLinesAreIgnored) {
    StasConfig config = load("# leading comment\n"
                             "\n"
                             "[Global]\n"
                             "; another comment\n"
                             "   tron = true   \n");
    EXPECT_TRUE(config.global.tron);
    EXPECT_TRUE(loader.warnings().empty());
}

TEST_F(ConfigLoaderTest, RepeatedControllerAndExcludeKeysAccumulate) {
    StasConfig config = load("[Controllers]\n"
                             "controller=transport=tcp;traddr=10.0.0.1;trsvcid=8009\n"
                             "controller = transport=tcp ; traddr=10.0.0.2 ; nqn=nqn.io-1\n"
                             "exclude=transport=tcp;traddr=10.0.0.9\n"
                             "exclude=host-iface=eth9\n");

    ASSERT_EQ(config.controllers.size(), 2u);
    EXPECT_EQ(config.controllers[0].at("traddr"), "10.0.0.1");
    EXPECT_EQ(config.controllers[0].at("trsvcid"), "8009");
    EXPECT_EQ(config.controllers[1].at("traddr"), "10.0.0.2");
    EXPECT_EQ(config.controllers[1].at("subsysnqn"), "nqn.io-1");
    EXPECT_EQ(config.controllers[1].count("nqn"), 0u);

    ASSERT_EQ(config.excludes.size(), 2u);
    EXPECT_EQ(config.excludes[0].at("traddr"), "10.0.0.9");
    EXPECT_EQ(config.excludes[1].at("host-iface"), "eth9");
}

TEST_F(ConfigLoaderTest, MalformedControllerStringIsSkippedWithWarning) {
    StasConfig config = load("[Controllers]\n"
                             "controller=transport=tcp;10.0.0.1\n"
                             "controller=transport=tcp;traddr=10.0.0.3\n");

    ASSERT_EQ(config.controllers.size(), 1u);
    EXPECT_EQ(config.controllers[0].at("traddr"), "10.0.0.3");
    EXPECT_EQ(loader.warnings().size(), 1u);
}

TEST_F(ConfigLoaderTest, DisconnectScopeSpellings) {
    EXPECT_EQ(load("[I/O controller connection management]\ndisconnect-scope=only-stas-connections\n")
                  .ioc_management.disconnect_scope,
              DisconnectScope::OnlyManaged);
    EXPECT_EQ(load("[I/O controller connection management]\ndisconnect-scope=only-managed\n")
                  .ioc_management.disconnect_scope,
              DisconnectScope::OnlyManaged);
    EXPECT_EQ(load("[I/O controller connection management]\n"
                   "disconnect-scope=all-connections-matching-disconnect-trtypes\n")
                  .ioc_management.disconnect_scope,
              DisconnectScope::AllMatchingTransportTypes);
    EXPECT_EQ(load("[I/O controller connection management]\ndisconnect-scope=all-matching-transport-types\n")
                  .ioc_management.disconnect_scope,
              DisconnectScope::AllMatchingTransportTypes);
    EXPECT_EQ(load("[I/O controller connection management]\ndisconnect-scope=no-disconnect\n")
                  .ioc_management.disconnect_scope,
              DisconnectScope::NoDisconnect);
}

TEST_F(ConfigLoaderTest, PleoFlagAndRetiredUdevRuleKey) {
    StasConfig config = load("[Global]\npleo=disabled\nudev-rule=enabled\n");
    EXPECT_FALSE(config.global.pleo_enabled);
    ASSERT_EQ(loader.warnings().size(), 1u);
    EXPECT_NE(loader.warnings()[0].find("udev-rule"), std::string::npos);
}

TEST_F(ConfigLoaderTest, UnknownDisconnectScopeKeepsDefault) {
    StasConfig config = load("[I/O controller connection management]\ndisconnect-scope=everything\n");
    EXPECT_EQ(config.ioc_management.disconnect_scope, DisconnectScope::OnlyManaged);
    EXPECT_EQ(loader.warnings().size(), 1u);
}

TEST_F(ConfigLoaderTest, DisconnectTrtypesReplaceTheDefault) {
    StasConfig config = load("[I/O controller connection management]\n"
                             "disconnect-trtypes=rdma+fc\n"
                             "disconnect-trtypes=TCP\n");
    EXPECT_EQ(config.ioc_management.disconnect_trtypes, (std::set<std::string>{"fc", "rdma", "tcp"}));

    config = load("[I/O controller connection management]\n"
                  "disconnect-trtypes=rdma\n");
    EXPECT_EQ(config.ioc_management.disconnect_trtypes, (std::set<std::string>{"rdma"}));
}

TEST_F(ConfigLoaderTest, InvalidTrtypesFallBackToTcp) {
    StasConfig config = load("[I/O controller connection management]\n"
                             "disconnect-trtypes=pcie\n");
    EXPECT_EQ(config.ioc_management.disconnect_trtypes, (std::set<std::string>{"tcp"}));
    EXPECT_EQ(loader.warnings().size(), 1u);
}

TEST_F(ConfigLoaderTest, ConnectAttemptsOnNcc) {
    StasConfig config = load("[I/O controller connection management]\nconnect-attempts-on-ncc=1\n");
    EXPECT_EQ(config.ioc_management.connect_attempts_on_ncc, 1);
    EXPECT_EQ(config.ioc_management.effective_connect_attempts_on_ncc(), 2);

    config = load("[I/O controller connection management]\nconnect-attempts-on-ncc=5\n");
    EXPECT_EQ(config.ioc_management.effective_connect_attempts_on_ncc(), 5);

    config = load("[I/O controller connection management]\nconnect-attempts-on-ncc=-3\n");
    EXPECT_EQ(config.ioc_management.connect_attempts_on_ncc, 0);
    EXPECT_EQ(config.ioc_management.effective_connect_attempts_on_ncc(), 0);
    EXPECT_EQ(loader.warnings().size(), 1u);
}

TEST_F(ConfigLoaderTest, ZeroconfPersistenceDurations) {
    EXPECT_EQ(load("[Discovery controller connection management]\nzeroconf-connections-persistence=1d\n")
                  .dc_management.zeroconf_persistence,
              std::chrono::seconds(86400));
    EXPECT_EQ(load("[Discovery controller connection management]\nzeroconf-connections-persistence=1:30:00\n")
                  .dc_management.zeroconf_persistence,
              std::chrono::seconds(5400));
    EXPECT_EQ(load("[Discovery controller connection management]\nzeroconf-connections-persistence=45\n")
                  .dc_management.zeroconf_persistence,
              std::chrono::seconds(45));
}

TEST_F(ConfigLoaderTest, LegacyGlobalPersistentConnections) {
    StasConfig config = load("[Global]\npersistent-connections=false\n");
    EXPECT_FALSE(config.dc_management.persistent_connections);
}

TEST_F(ConfigLoaderTest, BadValuesWarnAndKeepDefaults) {
    StasConfig config = load("[Global]\n"
                             "tron=maybe\n"
                             "kato=soon\n"
                             "reconnect-delay=0\n"
                             "ctrl-loss-tmo=-5\n"
                             "ip-family=ipx\n"
                             "frobnicate=1\n"
                             "[Imaginary]\n"
                             "key=value\n");

    EXPECT_FALSE(config.global.tron);
    EXPECT_FALSE(config.global.connection.kato.has_value());
    EXPECT_EQ(config.global.connection.reconnect_delay, 10);
    EXPECT_EQ(config.global.connection.ctrl_loss_tmo, -1);
    EXPECT_TRUE(config.global.ipv4_enabled);
    EXPECT_TRUE(config.global.ipv6_enabled);
    EXPECT_EQ(loader.warnings().size(), 7u);
}

TEST_F(ConfigLoaderTest, SyntaxErrorsAreWarnings) {
    StasConfig config = load("tron=true\n"
                             "[Global\n"
                             "[Global]\n"
                             "no equals sign here\n");
    EXPECT_FALSE(config.global.tron);
    EXPECT_EQ(loader.warnings().size(), 3u);
}

TEST_F(ConfigLoaderTest, LoadResetsPreviousState) {
    StasConfig config;
    ASSERT_TRUE(loader.load_string("[Global]\ntron=true\nbogus=1\n", config));
    EXPECT_EQ(loader.warnings().size(), 1u);
    ASSERT_TRUE(loader.load_string("[Global]\n", config));
    EXPECT_FALSE(config.global.tron);
    EXPECT_TRUE(loader.warnings().empty());
}

TEST_F(ConfigLoaderTest, HostValuesFromFiles) {
    const std::string nqn_file = write_temp_file("stas_hostnqn", "nqn.2014-08.org.nvmexpress:uuid:from-file\n");
    const std::string id_file = write_temp_file("stas_hostid", "  abcdef  \nsecond line\n");

    StasConfig config;
    ASSERT_TRUE(loader.load_string("[Host]\n"
                                   "nqn=file://" + nqn_file + "\n"
                                   "id=file://" + id_file + "\n"
                                   "symname=lab-host-3\n",
                                   config));
    EXPECT_EQ(config.host.nqn, "nqn.2014-08.org.nvmexpress:uuid:from-file");
    EXPECT_EQ(config.host.id, "abcdef");
    EXPECT_EQ(config.host.symname, "lab-host-3");

    std::remove(nqn_file.c_str());
    std::remove(id_file.c_str());
}

TEST_F(ConfigLoaderTest, MissingHostFileYieldsEmptyValue) {
    EXPECT_EQ(resolve_host_value("file:///nonexistent/stas/hostnqn"), "");
    EXPECT_EQ(resolve_host_value("  nqn.literal  "), "nqn.literal");
}

TEST_F(ConfigLoaderTest, LoadFileRecordsPath) {
    const std::string path = write_temp_file("stasd_test.conf", std::string("[Global]\ntron=true\n") + kHostSection);

    StasConfig config;
    ASSERT_TRUE(loader.load_file(path, config));
    EXPECT_EQ(config.conf_file, path);
    EXPECT_TRUE(config.global.tron);
    EXPECT_EQ(config.host.nqn, "nqn.2014-08.org.nvmexpress:uuid:test-host");

    std::remove(path.c_str());
}

TEST_F(ConfigLoaderTest, UnreadableFileFallsBackToDefaults) {
    StasConfig config;
    config.global.tron = true;
    EXPECT_FALSE(loader.load_file("/nonexistent/stas/stasd.conf", config));
    EXPECT_FALSE(config.global.tron);
    EXPECT_EQ(config.conf_file, "/nonexistent/stas/stasd.conf");
    EXPECT_FALSE(loader.warnings().empty());
}

TEST(ControllerString, ParsesFieldsAndAliases) {
    auto fields = parse_controller_string("Transport=tcp; traddr=10.0.0.1 ;nqn=nqn.x;kato=5");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(fields->at("transport"), "tcp");
    EXPECT_EQ(fields->at("traddr"), "10.0.0.1");
    EXPECT_EQ(fields->at("subsysnqn"), "nqn.x");
    EXPECT_EQ(fields->at("kato"), "5");
}

TEST(ControllerString, RejectsMalformedInput) {
    std::string error;
    EXPECT_FALSE(parse_controller_string("transport=tcp;=10.0.0.1", &error).has_value());
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(parse_controller_string("", &error).has_value());
}

TEST(ConnectionParamsResolution, DiscoveryControllersGetDefaultKato) {
    GlobalSettings global;
    ConnectionParams dc = resolve_connection_params(global, {}, true);
    EXPECT_EQ(dc.kato, kDcKatoDefault);

    ConnectionParams ioc = resolve_connection_params(global, {}, false);
    EXPECT_FALSE(ioc.kato.has_value());

    global.connection.kato = 12;
    EXPECT_EQ(resolve_connection_params(global, {}, true).kato, 12);
}

TEST(ConnectionParamsResolution, PerControllerOverridesWin) {
    GlobalSettings global;
    global.connection.reconnect_delay = 10;
    global.connection.hdr_digest = false;

    nvmestas::engine::TidFields overrides{{"transport", "tcp"},
                                          {"traddr", "10.0.0.1"},
                                          {"reconnect-delay", "3"},
                                          {"hdr-digest", "true"},
                                          {"nr-io-queues", "not-a-number"}};
    ConnectionParams params = resolve_connection_params(global, overrides, false);
    EXPECT_EQ(params.reconnect_delay, 3);
    EXPECT_TRUE(params.hdr_digest);
    EXPECT_FALSE(params.nr_io_queues.has_value());
}

TEST(DisconnectScopeNames, RoundTrip) {
    for (DisconnectScope scope : {DisconnectScope::OnlyManaged,
                                  DisconnectScope::AllMatchingTransportTypes,
                                  DisconnectScope::NoDisconnect}) {
        bool ok = false;
        EXPECT_EQ(parse_disconnect_scope(to_string(scope), &ok), scope);
        EXPECT_TRUE(ok);
    }
}
