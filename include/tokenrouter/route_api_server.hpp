/**
 * @file route_api_server.hpp
 * @brief Read-only HTTP listing of the current routes
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Serves GET /routes over plain HTTP/1.1 with ASIO:
 * - One request per connection (Connection: close)
 * - Optional HTTP Basic authentication
 * - Fresh load from the route store per request; never mutates state
 */

#pragma once

#include "tokenrouter/route_store.hpp"
#include "tokenrouter/router_config.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokenrouter {

/// Upper bound on request line plus headers
constexpr size_t MAX_REQUEST_HEAD_SIZE = 8 * 1024;

/// Per-connection read deadline
constexpr auto API_READ_TIMEOUT = std::chrono::seconds(10);

/// Path of the listing endpoint
constexpr const char* ROUTES_PATH = "/routes";

/**
 * @brief Parsed HTTP request head
 */
struct HttpRequest {
    std::string method;
    std::string target;                          ///< Path without query string
    std::string version;
    std::map<std::string, std::string> headers;  ///< Lower-cased names

    /**
     * @brief Header value by (case-insensitive) name
     */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief HTTP response
 */
struct HttpResponse {
    int status = 200;
    std::string reason = "OK";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * @brief Serialize with Content-Length and Connection: close
     */
    std::string to_string() const;

    /**
     * @brief Header value by exact name, if present
     */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief RouteApiServer - read API over the route store
 *
 * handle_request() is a pure function of configuration and the state
 * file, so it can be exercised without sockets.
 */
class RouteApiServer {
public:
    /**
     * @brief Construct RouteApiServer
     * @param config Router configuration (listen address, credentials, base URL)
     * @param store Route store to read snapshots from
     * @param io_context ASIO context that runs accept/read/write handlers
     * @param read_timeout Time a client gets to send the request head
     *
     * Each connection runs on its own strand, so the context may be run
     * from several threads.
     */
    RouteApiServer(
        const RouterConfig& config,
        const RouteStore& store,
        asio::io_context& io_context,
        std::chrono::steady_clock::duration read_timeout = API_READ_TIMEOUT
    );

    /**
     * @brief Destructor - closes the acceptor
     */
    ~RouteApiServer();

    // Disable copy and move
    RouteApiServer(const RouteApiServer&) = delete;
    RouteApiServer& operator=(const RouteApiServer&) = delete;

    /**
     * @brief Bind and start accepting connections
     * @return true if listening, false if bind failed
     */
    bool start();

    /**
     * @brief Stop accepting connections
     */
    void stop();

    /**
     * @brief Check if the server is accepting connections
     */
    bool is_running() const;

    /**
     * @brief Bound port (useful when configured with port 0)
     */
    uint16_t get_port() const;

    /**
     * @brief Produce the response for a parsed request
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    /**
     * @brief Validate an Authorization header against configured credentials
     * @return true if auth is disabled or the credentials match
     */
    bool check_basic_auth(const std::optional<std::string>& authorization) const;

    /**
     * @brief Render the listing document for a table
     */
    std::string render_routes(const RouteTable& table) const;

    /**
     * @brief Parse a request head (request line + headers, CRLF separated)
     * @return Parsed request, or std::nullopt if malformed
     */
    static std::optional<HttpRequest> parse_request(const std::string& head);

private:
    void start_accept();

    void handle_accept(
        const asio::error_code& error,
        std::shared_ptr<asio::ip::tcp::socket> socket
    );

    void handle_connection(std::shared_ptr<asio::ip::tcp::socket> socket);

    void send_response(
        std::shared_ptr<asio::ip::tcp::socket> socket,
        const HttpResponse& response
    );

    static HttpResponse make_error(int status, const std::string& reason);

    const RouterConfig& config_;
    const RouteStore& store_;
    asio::io_context& io_context_;
    const std::chrono::steady_clock::duration read_timeout_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
};

} // namespace tokenrouter
