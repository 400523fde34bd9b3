/**
 * @file test_gateway_publisher.cpp
 * @brief Unit tests for GatewayPublisher
 *
 * Tests map rendering, atomic replacement and reload reporting.
 */

#include <gtest/gtest.h>
#include "tokenrouter/gateway_publisher.hpp"
#include "tokenrouter/utilities.hpp"
#include "fake_command_runner.hpp"
#include <filesystem>

using namespace tokenrouter;
using tokenrouter::test::FakeCommandRunner;
namespace fs = std::filesystem;

namespace {

RouteTable sample_table() {
    RouteTable table;
    table["bbb"] = Route{"bbb", 9000, 1700000001};
    table["aaa"] = Route{"aaa", 8080, 1700000000};
    table["zero"] = Route{"zero", 0, 1700000002};
    return table;
}

} // namespace

class GatewayPublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            ("tokenrouter_publisher_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        config_.map_file = (test_dir_ / "token_map" / "token_map.conf").string();
        config_.gateway_container = "gateway";
        publisher_ = std::make_unique<GatewayPublisher>(config_, runner_);
    }

    void TearDown() override {
        publisher_.reset();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
    RouterConfig config_;
    FakeCommandRunner runner_;
    std::unique_ptr<GatewayPublisher> publisher_;
};

// ============================================================================
// Rendering Tests
// ============================================================================

TEST(MapRenderTest, HeaderThenSortedEntries) {
    EXPECT_EQ(GatewayPublisher::render_map(sample_table()),
              "# token -> port mapping (auto generated)\n"
              "aaa 8080;\n"
              "bbb 9000;\n");
}

TEST(MapRenderTest, EmptyTableIsHeaderOnly) {
    EXPECT_EQ(GatewayPublisher::render_map({}), std::string(MAP_HEADER_LINE) + "\n");
}

// ============================================================================
// Publishing Tests
// ============================================================================

TEST_F(GatewayPublisherTest, WritesMapAndReloads) {
    PublishResult result = publisher_->publish(sample_table());

    EXPECT_TRUE(result.map_written);
    EXPECT_TRUE(result.reload_ok);
    EXPECT_EQ(utilities::read_file(config_.map_file), GatewayPublisher::render_map(sample_table()));
    ASSERT_EQ(runner_.reload_calls(), 1u);
    EXPECT_EQ(runner_.calls().back(), publisher_->reload_command());
}

TEST_F(GatewayPublisherTest, ReloadCommandTargetsGateway) {
    EXPECT_EQ(publisher_->reload_command(), std::vector<std::string>({
        "docker", "exec", "gateway", "nginx", "-s", "reload"
    }));
}

TEST_F(GatewayPublisherTest, ReloadFailureKeepsWrittenMap) {
    runner_.fail_reload();

    PublishResult result = publisher_->publish(sample_table());

    EXPECT_TRUE(result.map_written);
    EXPECT_FALSE(result.reload_ok);
    EXPECT_NE(result.error.find("exited with 1"), std::string::npos);
    EXPECT_TRUE(fs::exists(config_.map_file));
}

TEST_F(GatewayPublisherTest, WriteFailureSkipsReload) {
    fs::create_directories(fs::path(config_.map_file) / "blocker");

    PublishResult result = publisher_->publish(sample_table());

    EXPECT_FALSE(result.map_written);
    EXPECT_FALSE(result.reload_ok);
    EXPECT_EQ(runner_.reload_calls(), 0u);
}
