/**
 * @file test_router_node.cpp
 * @brief Integration tests for RouterNode
 *
 * Runs the full daemon wiring against a scripted command runner.
 */

#include <gtest/gtest.h>
#include "tokenrouter/router_node.hpp"
#include "tokenrouter/route_crypto.hpp"
#include "tokenrouter/utilities.hpp"
#include "fake_command_runner.hpp"
#include <filesystem>
#include <functional>
#include <thread>

using namespace tokenrouter;
using tokenrouter::test::FakeCommandRunner;
namespace fs = std::filesystem;

class RouterNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(RouteCrypto::initialize());

        test_dir_ = fs::temp_directory_path() /
            ("tokenrouter_node_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        config_.state_file = (test_dir_ / "data" / "routes.json").string();
        config_.map_file = (test_dir_ / "token_map" / "token_map.conf").string();
        config_.listen_address = "127.0.0.1";
        config_.listen_port = 0;
        config_.scan_interval = std::chrono::seconds(1);
    }

    void TearDown() override {
        if (node_) {
            node_->stop();
            node_.reset();
        }
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    void create_node() {
        auto runner = std::make_unique<FakeCommandRunner>();
        runner_ = runner.get();
        node_ = std::make_unique<RouterNode>(config_, std::move(runner));
    }

    // Poll until predicate holds or timeout expires
    static bool wait_for(const std::function<bool()>& predicate,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return predicate();
    }

    fs::path test_dir_;
    RouterConfig config_;
    FakeCommandRunner* runner_ = nullptr;
    std::unique_ptr<RouterNode> node_;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(RouterNodeTest, StartRunsFirstCycleImmediately) {
    create_node();
    runner_->set_listening_ports({8080, 9000});

    ASSERT_TRUE(node_->start());
    EXPECT_TRUE(node_->is_running());
    EXPECT_NE(node_->get_api_port(), 0);

    ASSERT_TRUE(wait_for([this]() { return node_->get_cycle_count() >= 1; }));

    RouteStore store(config_.state_file);
    EXPECT_EQ(RouteTableHelpers::ports_of(store.load()), std::set<uint16_t>({8080, 9000}));
    EXPECT_EQ(utilities::read_file(config_.map_file),
              GatewayPublisher::render_map(store.load()));

    node_->stop();
    EXPECT_FALSE(node_->is_running());
    EXPECT_EQ(node_->get_api_port(), 0);
}

TEST_F(RouterNodeTest, TimerKeepsReconciling) {
    create_node();
    runner_->set_listening_ports({8080});
    ASSERT_TRUE(node_->start());
    ASSERT_TRUE(wait_for([this]() { return node_->get_cycle_count() >= 1; }));

    runner_->set_listening_ports({8080, 9000});

    RouteStore store(config_.state_file);
    EXPECT_TRUE(wait_for([&store]() { return store.load().size() == 2; }));
}

TEST_F(RouterNodeTest, DoubleStartFails) {
    create_node();
    ASSERT_TRUE(node_->start());
    EXPECT_FALSE(node_->start());
}

TEST_F(RouterNodeTest, StartFailsWhenListenerUnavailable) {
    config_.listen_address = "not-an-address";
    create_node();

    EXPECT_FALSE(node_->start());
    EXPECT_FALSE(node_->is_running());
}

TEST_F(RouterNodeTest, StartRepublishesPersistedState) {
    RouteTable seeded;
    seeded["Tabcdefghijk"] = Route{"Tabcdefghijk", 8080, 1700000000};
    ASSERT_TRUE(RouteStore(config_.state_file).save(seeded));

    create_node();
    runner_->set_listening_ports({8080});
    ASSERT_TRUE(node_->start());
    ASSERT_TRUE(wait_for([this]() { return node_->get_cycle_count() >= 1; }));

    // Table unchanged, but the gateway map is rebuilt on startup
    EXPECT_EQ(utilities::read_file(config_.map_file), GatewayPublisher::render_map(seeded));
    EXPECT_EQ(runner_->reload_calls(), 1u);
    EXPECT_EQ(RouteStore(config_.state_file).load(), seeded);
}

// ============================================================================
// One-shot Tests
// ============================================================================

TEST_F(RouterNodeTest, RunCycleNowWithoutStart) {
    create_node();
    runner_->set_listening_ports({9000});

    CycleReport report = node_->run_cycle_now();

    EXPECT_EQ(report.outcome, CycleOutcome::UPDATED);
    EXPECT_EQ(node_->get_cycle_count(), 1u);
    EXPECT_EQ(node_->get_api_port(), 0);
}
