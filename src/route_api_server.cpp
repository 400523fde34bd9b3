/**
 * @file route_api_server.cpp
 * @brief Implementation of the read-only route listing endpoint
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/route_api_server.hpp"
#include "tokenrouter/route_crypto.hpp"
#include "tokenrouter/utilities.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace tokenrouter {

using namespace tokenrouter::utilities;

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lowercase(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string HttpResponse::to_string() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reason << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";
    oss << "\r\n";
    oss << body;
    return oss.str();
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

RouteApiServer::RouteApiServer(
    const RouterConfig& config,
    const RouteStore& store,
    asio::io_context& io_context,
    std::chrono::steady_clock::duration read_timeout
)
    : config_(config)
    , store_(store)
    , io_context_(io_context)
    , read_timeout_(read_timeout)
{
}

RouteApiServer::~RouteApiServer() {
    stop();
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool RouteApiServer::start() {
    if (running_.exchange(true)) {
        log_warn("RouteApiServer: Already running");
        return false;
    }

    try {
        asio::ip::tcp::endpoint endpoint(
            asio::ip::make_address(config_.listen_address),
            config_.listen_port
        );

        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        bound_port_ = acceptor_->local_endpoint().port();

        log_info("RouteApiServer: Listening on " + config_.listen_address + ":" +
                 std::to_string(bound_port_.load()) +
                 (config_.auth_enabled() ? " (basic auth enabled)" : ""));

        start_accept();
        return true;

    } catch (const std::exception& e) {
        log_error("RouteApiServer: Failed to listen on " + config_.listen_address + ":" +
                  std::to_string(config_.listen_port) + ": " + e.what());
        acceptor_.reset();
        running_ = false;
        return false;
    }
}

void RouteApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_ && acceptor_->is_open()) {
        asio::error_code ec;
        acceptor_->close(ec);
    }
    log_info("RouteApiServer: Stopped");
}

bool RouteApiServer::is_running() const {
    return running_;
}

uint16_t RouteApiServer::get_port() const {
    return bound_port_;
}

// ============================================================================
// Connection Handling
// ============================================================================

void RouteApiServer::start_accept() {
    // Socket handlers and its deadline share one strand
    auto socket = std::make_shared<asio::ip::tcp::socket>(asio::make_strand(io_context_));

    acceptor_->async_accept(
        *socket,
        [this, socket](const asio::error_code& error) {
            handle_accept(error, socket);
        }
    );
}

void RouteApiServer::handle_accept(
    const asio::error_code& error,
    std::shared_ptr<asio::ip::tcp::socket> socket
) {
    if (!error) {
        asio::dispatch(socket->get_executor(), [this, socket]() {
            handle_connection(socket);
        });
    } else if (error != asio::error::operation_aborted) {
        log_warn("RouteApiServer: Accept failed: " + error.message());
    }

    if (running_) {
        start_accept();
    }
}

void RouteApiServer::handle_connection(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>(MAX_REQUEST_HEAD_SIZE);
    auto deadline = std::make_shared<asio::steady_timer>(socket->get_executor(), read_timeout_);

    deadline->async_wait([socket](const asio::error_code& error) {
        if (!error) {
            asio::error_code ignored;
            socket->close(ignored);
        }
    });

    asio::async_read_until(
        *socket,
        *buffer,
        "\r\n\r\n",
        [this, socket, buffer, deadline](const asio::error_code& error, std::size_t bytes_transferred) {
            deadline->cancel();

            if (error) {
                if (error == asio::error::not_found) {
                    send_response(socket, make_error(431, "Request Header Fields Too Large"));
                }
                return;
            }

            try {
                std::string head(
                    asio::buffers_begin(buffer->data()),
                    asio::buffers_begin(buffer->data()) + static_cast<std::ptrdiff_t>(bytes_transferred)
                );

                auto request = parse_request(head);
                if (!request) {
                    send_response(socket, make_error(400, "Bad Request"));
                    return;
                }
                send_response(socket, handle_request(*request));

            } catch (const std::exception& e) {
                log_error("RouteApiServer: Request handling failed: " + std::string(e.what()));
                send_response(socket, make_error(500, "Internal Server Error"));
            }
        }
    );
}

void RouteApiServer::send_response(
    std::shared_ptr<asio::ip::tcp::socket> socket,
    const HttpResponse& response
) {
    auto payload = std::make_shared<std::string>(response.to_string());

    asio::async_write(
        *socket,
        asio::buffer(*payload),
        [socket, payload](const asio::error_code& error, std::size_t) {
            asio::error_code ignored;
            if (!error) {
                socket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            }
            socket->close(ignored);
        }
    );
}

// ============================================================================
// Request Processing
// ============================================================================

std::optional<HttpRequest> RouteApiServer::parse_request(const std::string& head) {
    std::istringstream stream(head);
    std::string line;

    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    auto parts = split_whitespace(line);
    if (parts.size() != 3 || !starts_with(parts[2], "HTTP/")) {
        return std::nullopt;
    }

    HttpRequest request;
    request.method = parts[0];
    request.version = parts[2];

    std::string target = parts[1];
    auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }
    if (target.empty() || target[0] != '/') {
        return std::nullopt;
    }
    request.target = target;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        request.headers[to_lowercase(trim_string(line.substr(0, colon)))] =
            trim_string(line.substr(colon + 1));
    }

    return request;
}

HttpResponse RouteApiServer::handle_request(const HttpRequest& request) const {
    if (!check_basic_auth(request.header("Authorization"))) {
        HttpResponse response;
        response.status = 401;
        response.reason = "Unauthorized";
        response.headers.emplace_back("WWW-Authenticate", "Basic");
        response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
        response.body = "Unauthorized";
        return response;
    }

    if (request.target != ROUTES_PATH) {
        return make_error(404, "Not Found");
    }

    if (request.method != "GET") {
        HttpResponse response = make_error(405, "Method Not Allowed");
        response.headers.emplace_back("Allow", "GET");
        return response;
    }

    HttpResponse response;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = render_routes(store_.load());
    return response;
}

bool RouteApiServer::check_basic_auth(const std::optional<std::string>& authorization) const {
    if (!config_.auth_enabled()) {
        return true;
    }
    if (!authorization) {
        return false;
    }

    std::string value = trim_string(*authorization);
    if (!starts_with(to_lowercase(value), "basic ")) {
        return false;
    }

    auto decoded = RouteCrypto::base64_to_bytes(trim_string(value.substr(6)));
    if (!decoded) {
        return false;
    }

    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        return false;
    }

    // Evaluate both halves so timing does not reveal which one mismatched
    bool user_ok = RouteCrypto::constant_time_equals(decoded->substr(0, colon), config_.username);
    bool password_ok = RouteCrypto::constant_time_equals(decoded->substr(colon + 1), config_.password);
    return user_ok && password_ok;
}

std::string RouteApiServer::render_routes(const RouteTable& table) const {
    json routes = json::array();

    for (const auto& [token, route] : table) {
        if (route.port == 0) {
            continue;
        }
        json entry;
        entry["token"] = token;
        entry["port"] = route.port;
        entry["publicUrl"] = config_.public_url_for(token);
        entry["createdAt"] = route.created_at;
        routes.push_back(entry);
    }

    json document;
    document["routes"] = routes;
    return document.dump() + "\n";
}

HttpResponse RouteApiServer::make_error(int status, const std::string& reason) {
    HttpResponse response;
    response.status = status;
    response.reason = reason;
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    response.body = reason;
    return response;
}

} // namespace tokenrouter
