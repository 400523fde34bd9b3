/**
 * @file test_port_discovery.cpp
 * @brief Unit tests for PortDiscovery
 *
 * Tests listener table parsing, range filtering and failure reporting.
 */

#include <gtest/gtest.h>
#include "tokenrouter/port_discovery.hpp"
#include "fake_command_runner.hpp"

using namespace tokenrouter;
using tokenrouter::test::FakeCommandRunner;

namespace {

// Real /proc/net/tcp and tcp6 excerpt: 8080 and 9000 listening, 4096 listening
// (excluded), 22 listening (out of range), 5000 established
const char* SAMPLE_TABLE =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 11111 1 0000000000000000 100 0 0 10 0\n"
    "   1: 0100007F:1000 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 22222 1 0000000000000000 100 0 0 10 0\n"
    "   2: 00000000:0016 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 33333 1 0000000000000000 100 0 0 10 0\n"
    "   3: 0100007F:1388 0100007F:D431 01 00000000:00000000 00:00000000 00000000  1000        0 44444 1 0000000000000000 20 4 30 10 -1\n"
    "  sl  local_address                         remote_address                        st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000000000000000000000000000:2328 00000000000000000000000000000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 55555 1 0000000000000000 100 0 0 10 0\n"
    "   1: 00000000000000000000000000000000:1F90 00000000000000000000000000000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 66666 1 0000000000000000 100 0 0 10 0\n";

} // namespace

class PortDiscoveryTest : public ::testing::Test {
protected:
    RouterConfig config_;
    FakeCommandRunner runner_;
};

// ============================================================================
// Parsing Tests
// ============================================================================

TEST(ListenerTableTest, ParsesListeningPortsFromBothTables) {
    auto ports = PortDiscovery::parse_listener_table(SAMPLE_TABLE);
    EXPECT_EQ(ports, std::set<uint16_t>({0x1F90, 0x1000, 0x0016, 0x2328}));
}

TEST(ListenerTableTest, IgnoresMalformedRows) {
    const char* table =
        "garbage\n"
        "   0: 00000000 00000000:0000 0A\n"
        "   1: 00000000:ZZZZ 00000000:0000 0A\n"
        "   2: 00000000:123456789 00000000:0000 0A\n"
        "   3: 00000000:1F90\n"
        "\n"
        "   4: 00000000:1F91 00000000:0000 0A\n";

    EXPECT_EQ(PortDiscovery::parse_listener_table(table), std::set<uint16_t>({0x1F91}));
}

TEST(ListenerTableTest, EmptyOutputYieldsNoPorts) {
    EXPECT_TRUE(PortDiscovery::parse_listener_table("").empty());
}

TEST(ListenerTableTest, FilterAppliesRangeAndExclusions) {
    RouterConfig config;
    auto filtered = PortDiscovery::filter_ports({22, 3000, 4096, 8080, 9999, 10000}, config);
    EXPECT_EQ(filtered, std::vector<uint16_t>({3000, 8080, 9999}));
}

// ============================================================================
// Discovery Tests
// ============================================================================

TEST_F(PortDiscoveryTest, BuildsExecCommandForTarget) {
    config_.container_runtime = "podman";
    config_.target_container = "backend";
    PortDiscovery discovery(config_, runner_);

    EXPECT_EQ(discovery.discovery_command(), std::vector<std::string>({
        "podman", "exec", "backend", "sh", "-c", "cat /proc/net/tcp /proc/net/tcp6"
    }));
}

TEST_F(PortDiscoveryTest, ReturnsSortedRoutablePorts) {
    runner_.set_raw_discovery_output(SAMPLE_TABLE);
    PortDiscovery discovery(config_, runner_);

    DiscoveryResult result = discovery.discover_ports();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.ports, std::vector<uint16_t>({8080, 9000}));
    EXPECT_EQ(runner_.discovery_calls(), 1u);
}

TEST_F(PortDiscoveryTest, CommandFailureIsReported) {
    runner_.set_listening_ports({8080});
    runner_.fail_discovery(1, "Error: No such container: opencode-backend");
    PortDiscovery discovery(config_, runner_);

    DiscoveryResult result = discovery.discover_ports();

    EXPECT_EQ(result.status, DiscoveryStatus::COMMAND_FAILED);
    EXPECT_TRUE(result.ports.empty());
    EXPECT_NE(result.error.find("No such container"), std::string::npos);
}

TEST_F(PortDiscoveryTest, TimeoutIsReported) {
    runner_.time_out_discovery();
    PortDiscovery discovery(config_, runner_);

    DiscoveryResult result = discovery.discover_ports();

    EXPECT_EQ(result.status, DiscoveryStatus::TIMED_OUT);
    EXPECT_TRUE(result.ports.empty());
    EXPECT_STREQ(discovery_status_name(result.status), "timed_out");
}
