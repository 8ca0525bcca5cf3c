#include <almanac/transport/http_server.hpp>
#include <almanac/log.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <sys/socket.h>
#include <chrono>
#include <exception>

namespace almanac::transport {

namespace beast = boost::beast;
namespace net = boost::asio;

HttpServer::HttpServer(McpEndpoint& endpoint, std::string host, uint16_t port)
    : endpoint_(endpoint), host_(std::move(host)), port_(port), acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) return true;  // Already running

    beast::error_code ec;
    auto address = net::ip::make_address(host_, ec);
    if (ec) {
        last_error_ = "invalid host " + host_ + ": " + ec.message();
        return false;
    }

    tcp::endpoint bind_point{address, port_};

    acceptor_.open(bind_point.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(bind_point, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        last_error_ = "cannot listen on " + host_ + ":" + std::to_string(port_) + ": " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    accept_thread_ = std::thread([this]() {
        accept_loop();
    });

    log_info("http", "listening on http://%s:%u/mcp", host_.c_str(), static_cast<unsigned>(port_));
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;  // Not running

    // Wakes the blocking accept() in the accept thread
    ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    beast::error_code ec;
    acceptor_.close(ec);

    std::unique_lock<std::mutex> lock(conns_mutex_);
    for (auto& entry : connections_) {
        ::shutdown(entry.second->native_handle(), SHUT_RDWR);
    }
    while (!connections_.empty()) {
        if (!conns_done_.wait_for(lock, std::chrono::seconds(1),
                                  [this] { return connections_.empty(); })) {
            log_warning("http", "waiting on %zu connection(s) still blocked in a request",
                        connections_.size());
        }
    }

    log_info("http", "stopped");
}

size_t HttpServer::connection_count() const {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    return connections_.size();
}

void HttpServer::accept_loop() {
    while (running_) {
        auto socket = std::make_shared<tcp::socket>(ioc_);
        beast::error_code ec;
        acceptor_.accept(*socket, ec);

        if (ec) {
            if (!running_) break;
            log_warning("http", "accept() error: %s", ec.message().c_str());
            // Avoid spinning on persistent failures such as fd exhaustion
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        uint64_t conn_id = 0;
        {
            std::lock_guard<std::mutex> lock(conns_mutex_);
            if (connections_.size() >= MAX_CONNECTIONS) {
                log_warning("http", "max connections reached, rejecting");
                socket->close(ec);
                continue;
            }
            conn_id = next_conn_id_++;
            connections_.emplace(conn_id, socket);
        }

        log_debug("http", "connection #%llu accepted", static_cast<unsigned long long>(conn_id));
        // Detached: stop() waits on conns_done_ until every connection has released itself
        std::thread([this, conn_id](std::shared_ptr<tcp::socket> conn) {
            serve(std::move(conn), conn_id);
        }, std::move(socket)).detach();
    }
}

void HttpServer::serve(std::shared_ptr<tcp::socket> socket, uint64_t conn_id) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.header_limit(16 * 1024);
        parser.body_limit(endpoint_.options().max_body_bytes);

        http::read(*socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec == http::error::body_limit) {
            log_notice("http", "connection #%llu: body over %zu bytes refused",
                       static_cast<unsigned long long>(conn_id), endpoint_.options().max_body_bytes);
            auto response = endpoint_.payload_too_large(parser.get().version(), false);
            http::write(*socket, response, ec);
            break;
        }
        if (ec) {
            log_debug("http", "connection #%llu read: %s",
                      static_cast<unsigned long long>(conn_id), ec.message().c_str());
            break;
        }

        HttpResponse response;
        try {
            response = endpoint_.handle(parser.get());
        } catch (const std::exception& e) {
            log_error("http", "connection #%llu: request failed: %s",
                      static_cast<unsigned long long>(conn_id), e.what());
            response = HttpResponse{http::status::internal_server_error, parser.get().version()};
            response.set(http::field::content_type, "text/plain; charset=utf-8");
            response.body() = "Internal Server Error";
            response.keep_alive(false);
            response.prepare_payload();
        }

        bool keep_alive = response.keep_alive();
        http::write(*socket, response, ec);
        if (ec || !keep_alive) break;
    }

    socket->shutdown(tcp::socket::shutdown_send, ec);
    // The connection table holds the last reference; it is destroyed under
    // the lock so stop() never returns while a socket is still alive
    socket.reset();
    release(conn_id);
}

void HttpServer::release(uint64_t conn_id) {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    auto it = connections_.find(conn_id);
    if (it != connections_.end()) {
        beast::error_code ec;
        it->second->close(ec);
        connections_.erase(it);
    }
    log_debug("http", "connection #%llu closed (open=%zu)",
              static_cast<unsigned long long>(conn_id), connections_.size());
    conns_done_.notify_all();
}

} // namespace almanac::transport
