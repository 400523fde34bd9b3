/**
 * @file test_route_api_server.cpp
 * @brief Unit tests for RouteApiServer
 *
 * Tests the read API including:
 * - Request parsing
 * - Basic authentication
 * - Route listing document
 * - Loopback round trip over TCP
 */

#include <gtest/gtest.h>
#include "tokenrouter/route_api_server.hpp"
#include "tokenrouter/route_crypto.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace tokenrouter;
using json = nlohmann::json;
namespace fs = std::filesystem;

class RouteApiServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(RouteCrypto::initialize());

        test_dir_ = fs::temp_directory_path() /
            ("tokenrouter_api_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        config_.state_file = (test_dir_ / "routes.json").string();
        config_.listen_address = "127.0.0.1";
        config_.listen_port = 0;
        config_.public_base_url = "https://x.example";

        store_ = std::make_unique<RouteStore>(config_.state_file);

        RouteTable table;
        table["T1abcdefghij"] = Route{"T1abcdefghij", 8080, 1700000000};
        table["T2abcdefghij"] = Route{"T2abcdefghij", 9000, 1700000050};
        ASSERT_TRUE(store_->save(table));
    }

    void TearDown() override {
        server_.reset();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    void create_server() {
        server_ = std::make_unique<RouteApiServer>(config_, *store_, io_context_);
    }

    void enable_auth(const std::string& username, const std::string& password) {
        config_.username = username;
        config_.password = password;
    }

    static HttpRequest get_routes(const std::optional<std::string>& authorization = std::nullopt) {
        HttpRequest request;
        request.method = "GET";
        request.target = ROUTES_PATH;
        request.version = "HTTP/1.1";
        if (authorization) {
            request.headers["authorization"] = *authorization;
        }
        return request;
    }

    static std::string basic(const std::string& credentials) {
        return "Basic " + RouteCrypto::bytes_to_base64(credentials);
    }

    fs::path test_dir_;
    RouterConfig config_;
    std::unique_ptr<RouteStore> store_;
    asio::io_context io_context_;
    std::unique_ptr<RouteApiServer> server_;
};

// ============================================================================
// Parsing Tests
// ============================================================================

TEST(HttpParseTest, ParsesRequestLineAndHeaders) {
    auto request = RouteApiServer::parse_request(
        "GET /routes?verbose=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Authorization:  Basic abc \r\n"
        "\r\n");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "GET");
    EXPECT_EQ(request->target, "/routes");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->header("authorization"), std::optional<std::string>("Basic abc"));
    EXPECT_EQ(request->header("HOST"), std::optional<std::string>("localhost"));
}

TEST(HttpParseTest, RejectsMalformedRequests) {
    EXPECT_FALSE(RouteApiServer::parse_request("").has_value());
    EXPECT_FALSE(RouteApiServer::parse_request("GET /routes\r\n\r\n").has_value());
    EXPECT_FALSE(RouteApiServer::parse_request("GET routes HTTP/1.1\r\n\r\n").has_value());
    EXPECT_FALSE(RouteApiServer::parse_request("GET /routes HTTP/1.1\r\nbadheader\r\n\r\n").has_value());
}

TEST(HttpResponseTest, SerializesWithLengthAndClose) {
    HttpResponse response;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = "{}";

    EXPECT_EQ(response.to_string(),
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 2\r\n"
              "Connection: close\r\n"
              "\r\n"
              "{}");
}

// ============================================================================
// Listing Tests
// ============================================================================

TEST_F(RouteApiServerTest, ListsRoutesWithPublicUrls) {
    create_server();
    HttpResponse response = server_->handle_request(get_routes());

    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Type"), std::optional<std::string>("application/json"));

    json document = json::parse(response.body);
    ASSERT_TRUE(document["routes"].is_array());
    ASSERT_EQ(document["routes"].size(), 2u);

    const json& first = document["routes"][0];
    EXPECT_EQ(first["token"], "T1abcdefghij");
    EXPECT_EQ(first["port"], 8080);
    EXPECT_EQ(first["createdAt"], 1700000000);
    EXPECT_EQ(first["publicUrl"], "https://x.example/p/T1abcdefghij/");
}

TEST_F(RouteApiServerTest, EmptyBaseUrlYieldsEmptyPublicUrl) {
    config_.public_base_url.clear();
    create_server();

    json document = json::parse(server_->handle_request(get_routes()).body);
    EXPECT_EQ(document["routes"][0]["publicUrl"], "");
}

TEST_F(RouteApiServerTest, MissingStateListsNothing) {
    fs::remove(config_.state_file);
    create_server();

    HttpResponse response = server_->handle_request(get_routes());

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(json::parse(response.body)["routes"].size(), 0u);
}

TEST_F(RouteApiServerTest, UnknownPathIsNotFound) {
    create_server();
    HttpRequest request = get_routes();
    request.target = "/other";

    EXPECT_EQ(server_->handle_request(request).status, 404);
}

TEST_F(RouteApiServerTest, NonGetIsMethodNotAllowed) {
    create_server();
    HttpRequest request = get_routes();
    request.method = "POST";

    HttpResponse response = server_->handle_request(request);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.header("Allow"), std::optional<std::string>("GET"));
}

// ============================================================================
// Authentication Tests
// ============================================================================

TEST_F(RouteApiServerTest, AuthDisabledAcceptsAnything) {
    create_server();
    EXPECT_EQ(server_->handle_request(get_routes()).status, 200);
    EXPECT_EQ(server_->handle_request(get_routes(basic("who:ever"))).status, 200);
}

TEST_F(RouteApiServerTest, MissingCredentialsChallenged) {
    enable_auth("u", "p");
    create_server();

    HttpResponse response = server_->handle_request(get_routes());

    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(response.header("WWW-Authenticate"), std::optional<std::string>("Basic"));
    EXPECT_EQ(response.body, "Unauthorized");
}

TEST_F(RouteApiServerTest, CorrectCredentialsAccepted) {
    enable_auth("u", "p");
    create_server();

    EXPECT_EQ(server_->handle_request(get_routes(basic("u:p"))).status, 200);
    EXPECT_EQ(server_->handle_request(get_routes("basic " + RouteCrypto::bytes_to_base64("u:p"))).status, 200);
}

TEST_F(RouteApiServerTest, WrongCredentialsRejected) {
    enable_auth("u", "p");
    create_server();

    EXPECT_EQ(server_->handle_request(get_routes(basic("u:wrong"))).status, 401);
    EXPECT_EQ(server_->handle_request(get_routes(basic("x:p"))).status, 401);
    EXPECT_EQ(server_->handle_request(get_routes(basic("up"))).status, 401);
    EXPECT_EQ(server_->handle_request(get_routes("Basic !!!notbase64")).status, 401);
    EXPECT_EQ(server_->handle_request(get_routes("Bearer abc")).status, 401);
}

TEST_F(RouteApiServerTest, PasswordMayContainColon) {
    enable_auth("u", "p:q");
    create_server();

    EXPECT_EQ(server_->handle_request(get_routes(basic("u:p:q"))).status, 200);
}

TEST_F(RouteApiServerTest, EmptyUsernameMatchesEmptyConfiguredUsername) {
    enable_auth("", "secret");
    create_server();

    EXPECT_EQ(server_->handle_request(get_routes(basic(":secret"))).status, 200);
    EXPECT_EQ(server_->handle_request(get_routes(basic("admin:secret"))).status, 401);
}

TEST_F(RouteApiServerTest, AuthCheckedBeforeRouting) {
    enable_auth("u", "p");
    create_server();
    HttpRequest request = get_routes();
    request.target = "/other";

    EXPECT_EQ(server_->handle_request(request).status, 401);
}

// ============================================================================
// Network Tests
// ============================================================================

TEST_F(RouteApiServerTest, ServesRoutesOverLoopback) {
    create_server();
    ASSERT_TRUE(server_->start());
    ASSERT_NE(server_->get_port(), 0);

    std::thread io_thread([this]() { io_context_.run(); });

    std::string reply;
    {
        asio::io_context client_context;
        asio::ip::tcp::socket client(client_context);
        client.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->get_port()));

        std::string request = "GET /routes HTTP/1.1\r\nHost: localhost\r\n\r\n";
        asio::write(client, asio::buffer(request));

        asio::error_code ec;
        asio::streambuf buffer;
        asio::read(client, buffer, ec);
        EXPECT_EQ(ec, asio::error::eof);
        reply.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
    }

    io_context_.stop();
    io_thread.join();
    server_->stop();

    ASSERT_EQ(reply.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    auto body_start = reply.find("\r\n\r\n");
    ASSERT_NE(body_start, std::string::npos);
    json document = json::parse(reply.substr(body_start + 4));
    EXPECT_EQ(document["routes"].size(), 2u);
}

TEST_F(RouteApiServerTest, MultiThreadedContextServesAndTimesOut) {
    server_ = std::make_unique<RouteApiServer>(config_, *store_, io_context_,
                                               std::chrono::milliseconds(200));
    ASSERT_TRUE(server_->start());
    const uint16_t port = server_->get_port();

    std::vector<std::thread> workers;
    for (int i = 0; i < 2; ++i) {
        workers.emplace_back([this]() { io_context_.run(); });
    }

    const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);

    // Silent client: the deadline closes it without a response
    std::thread idle_client([&endpoint]() {
        asio::io_context client_context;
        asio::ip::tcp::socket client(client_context);
        client.connect(endpoint);

        asio::error_code ec;
        asio::streambuf buffer;
        asio::read(client, buffer, ec);
        EXPECT_TRUE(ec == asio::error::eof || ec == asio::error::connection_reset);
        EXPECT_EQ(buffer.size(), 0u);
    });

    std::vector<std::string> replies(8);
    std::vector<std::thread> clients;
    for (size_t i = 0; i < replies.size(); ++i) {
        clients.emplace_back([&endpoint, &replies, i]() {
            asio::io_context client_context;
            asio::ip::tcp::socket client(client_context);
            client.connect(endpoint);

            std::string request = "GET /routes HTTP/1.1\r\n\r\n";
            asio::write(client, asio::buffer(request));

            asio::error_code ec;
            asio::streambuf buffer;
            asio::read(client, buffer, ec);
            replies[i].assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
        });
    }

    for (auto& client : clients) {
        client.join();
    }
    idle_client.join();

    io_context_.stop();
    for (auto& worker : workers) {
        worker.join();
    }
    server_->stop();

    for (const auto& reply : replies) {
        EXPECT_EQ(reply.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    }
}

TEST_F(RouteApiServerTest, StartFailsOnInvalidAddress) {
    config_.listen_address = "not-an-address";
    create_server();

    EXPECT_FALSE(server_->start());
    EXPECT_FALSE(server_->is_running());
}
