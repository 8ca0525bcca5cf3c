#pragma once
// HTTP Server: blocking Boost.Beast listener, one thread per connection
//
// Each connection thread parses requests (body capped at the endpoint's
// max_body_bytes before anything is buffered), hands them to McpEndpoint and
// may block there until the request's reply arrives. Keep-alive is honored.

#include <almanac/transport/http_endpoint.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace almanac::transport {

class HttpServer {
public:
    static constexpr size_t MAX_CONNECTIONS = 256;

    // port 0 binds an ephemeral port; port() reports the real one after start()
    HttpServer(McpEndpoint& endpoint, std::string host, uint16_t port);
    ~HttpServer();

    // Non-copyable, non-movable (owns the listening socket and threads)
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    // Bind, listen and spawn the accept thread. False with last_error() set on failure.
    bool start();

    // Stop accepting, shut down open connections and wait for their threads.
    // Close the session first so no connection is still blocked on a reply.
    void stop();

    bool running() const { return running_; }
    uint16_t port() const { return port_; }
    const std::string& host() const { return host_; }
    size_t connection_count() const;
    const std::string& last_error() const { return last_error_; }

private:
    using tcp = boost::asio::ip::tcp;

    void accept_loop();
    void serve(std::shared_ptr<tcp::socket> socket, uint64_t conn_id);
    void release(uint64_t conn_id);

    McpEndpoint& endpoint_;
    std::string host_;
    uint16_t port_;
    std::string last_error_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex conns_mutex_;
    std::condition_variable conns_done_;
    std::unordered_map<uint64_t, std::shared_ptr<tcp::socket>> connections_;
    uint64_t next_conn_id_ = 1;
};

} // namespace almanac::transport
