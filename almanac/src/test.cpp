#include <almanac/config.hpp>
#include <almanac/log.hpp>
#include <almanac/rpc/handler.hpp>
#include <almanac/rpc/protocol.hpp>
#include <almanac/transport/http_endpoint.hpp>
#include <almanac/transport/http_server.hpp>
#include <almanac/transport/inbound_stream.hpp>
#include <almanac/transport/pending_registry.hpp>
#include <almanac/transport/pump.hpp>
#include <almanac/transport/session.hpp>
#include <almanac/transport/stdio_server.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace almanac;
using namespace almanac::transport;
using json = nlohmann::json;

namespace beast = boost::beast;
namespace net = boost::asio;

constexpr auto WAIT_LIMIT = std::chrono::seconds(5);

// Wait up to WAIT_LIMIT for a condition that another thread will make true
bool eventually(const std::function<bool()>& condition) {
    auto deadline = std::chrono::steady_clock::now() + WAIT_LIMIT;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

template <typename T>
bool ready(std::future<T>& future, std::chrono::milliseconds within = WAIT_LIMIT) {
    return future.wait_for(within) == std::future_status::ready;
}

// Processor stub: records every message, answers id-bearing ones with
// {"echo": method}, and optionally holds each message until released.
class StubProcessor : public MessageProcessor {
public:
    explicit StubProcessor(bool gated = false) : gated_(gated) {}

    std::optional<std::string> process(const std::string& message) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            received_.push_back(message);
            changed_.notify_all();
            if (gated_) {
                changed_.wait(lock, [this] { return released_ > processed_; });
            }
            ++processed_;
        }

        auto request = json::parse(message);
        if (!request.contains("id")) return std::nullopt;
        return rpc::dump(rpc::make_result(request["id"], {{"echo", request.value("method", "")}}));
    }

    void release(size_t count = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ += count;
        changed_.notify_all();
    }

    void release_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        gated_ = false;
        released_ = static_cast<size_t>(-1) / 2;
        changed_.notify_all();
    }

    bool wait_received(size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, WAIT_LIMIT, [&] { return received_.size() >= count; });
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<std::string> received_;
    bool gated_;
    size_t released_ = 0;
    size_t processed_ = 0;
};

class FunctionProcessor : public MessageProcessor {
public:
    explicit FunctionProcessor(std::function<std::optional<std::string>(const std::string&)> fn)
        : fn_(std::move(fn)) {}

    std::optional<std::string> process(const std::string& message) override {
        return fn_(message);
    }

private:
    std::function<std::optional<std::string>(const std::string&)> fn_;
};

// Session + endpoint + pump wired the way the server wires them
struct Harness {
    StubProcessor& processor;
    std::unique_ptr<Session> session;
    McpEndpoint endpoint;
    Pump pump;

    explicit Harness(StubProcessor& p, EndpointOptions options = {}, size_t max_pending = 0)
        : processor(p),
          session(Session::open({max_pending})),
          endpoint(*session, options),
          pump(*session, p) {
        pump.start();
    }

    ~Harness() {
        session->close("test teardown");
        processor.release_all();
        pump.join();
    }

    std::future<HttpResponse> post_async(const std::string& body) {
        return std::async(std::launch::async, [this, body]() {
            return endpoint.handle(make_post(body));
        });
    }

    static HttpRequest make_post(const std::string& body) {
        HttpRequest request{http::verb::post, "/mcp", 11};
        request.set(http::field::content_type, "application/json");
        request.body() = body;
        request.prepare_payload();
        return request;
    }

    static HttpRequest make_request(http::verb verb, const std::string& target) {
        HttpRequest request{verb, target, 11};
        request.prepare_payload();
        return request;
    }
};

std::string request_body(int id, const std::string& method) {
    return json({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}}).dump();
}

std::string notification_body(const std::string& method) {
    return json({{"jsonrpc", "2.0"}, {"method", method}}).dump();
}

// ═══════════════════════════════════════════════════════════════════════════
// Ambient: logging and configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_log_levels() {
    std::cout << "Testing log levels..." << std::endl;

    assert(parse_log_level("debug") == LogLevel::Debug);
    assert(parse_log_level("WARNING") == LogLevel::Warning);
    assert(parse_log_level("bogus") == LogLevel::Info);
    assert(is_log_level_name("critical"));
    assert(!is_log_level_name("verbose"));
    assert(std::string(log_level_name(LogLevel::Notice)) == "notice");

    LogLevel saved = log_level();
    set_log_level(LogLevel::Error);
    assert(!log_enabled(LogLevel::Warning));
    assert(log_enabled(LogLevel::Critical));

    // Every level entry point formats through the same writer; below the
    // threshold they are silent
    log_trace("test", "trace %d", 1);
    log_debug("test", "debug %s", "two");
    log_info("test", "info %zu", static_cast<size_t>(3));
    log_notice("test", "notice %u", 4u);
    log_warning("test", "warning %.1f", 5.0);
    log_at(LogLevel::Info, "test", "at %c", '6');
    log_error("test", "expected error line from the logging test (%d)", 7);
    set_log_level(saved);

    std::cout << "  PASS" << std::endl;
}

ConfigParse parse_args(ServerConfig& config, std::vector<std::string> args) {
    args.insert(args.begin(), "almanac_mcp");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(&arg[0]);
    return parse_command_line(config, static_cast<int>(argv.size()), argv.data());
}

void test_config_command_line() {
    std::cout << "Testing config command line..." << std::endl;

    ServerConfig config;
    auto parsed = parse_args(config, {"--transport", "http", "-p", "9001", "--host", "0.0.0.0",
                                      "--log-level", "debug", "--max-body", "2048",
                                      "--max-pending", "4", "--idle-timeout-ms", "250"});
    assert(parsed.action == ConfigParse::Action::Run);
    assert(config.transport == TransportMode::Http);
    assert(config.port == 9001);
    assert(config.host == "0.0.0.0");
    assert(config.log_level == LogLevel::Debug);
    assert(config.max_body_bytes == 2048);
    assert(config.max_pending == 4);
    assert(config.idle_timeout_ms == 250);

    ServerConfig defaults;
    assert(parse_args(defaults, {}).action == ConfigParse::Action::Run);
    assert(defaults.transport == TransportMode::Stdio);
    assert(defaults.port == 8080);
    assert(defaults.max_body_bytes == 1024 * 1024);

    ServerConfig bad;
    auto failed = parse_args(bad, {"--port", "70000"});
    assert(failed.action == ConfigParse::Action::Fail);
    assert(failed.error.find("port") != std::string::npos);
    assert(parse_args(bad, {"--transport", "carrier-pigeon"}).action == ConfigParse::Action::Fail);
    assert(parse_args(bad, {"--log-level", "loud"}).action == ConfigParse::Action::Fail);
    assert(parse_args(bad, {"--frobnicate"}).action == ConfigParse::Action::Fail);
    assert(parse_args(bad, {"--help"}).action == ConfigParse::Action::ShowHelp);
    assert(parse_args(bad, {"-v"}).action == ConfigParse::Action::ShowVersion);

    std::cout << "  PASS" << std::endl;
}

void test_config_idle_timeout_bounds() {
    std::cout << "Testing config idle timeout bounds..." << std::endl;

    ServerConfig config;
    auto huge = parse_args(config, {"--idle-timeout-ms", "10000000000000"});
    assert(huge.action == ConfigParse::Action::Fail);
    assert(huge.error.find("idle timeout") != std::string::npos);
    assert(config.idle_timeout_ms == 0);

    assert(parse_args(config, {"--idle-timeout-ms", "18446744073709551615"}).action ==
           ConfigParse::Action::Fail);
    assert(parse_args(config, {"--idle-timeout-ms", "86400001"}).action ==
           ConfigParse::Action::Fail);

    auto longest = parse_args(config, {"--idle-timeout-ms", "86400000"});
    assert(longest.action == ConfigParse::Action::Run);
    assert(config.idle_timeout_ms == ServerConfig::MAX_IDLE_TIMEOUT_MS);

    setenv("ALMANAC_IDLE_TIMEOUT_MS", "10000000000000", 1);
    ServerConfig from_env;
    std::string error_msg;
    assert(!apply_environment(from_env, error_msg));
    assert(from_env.idle_timeout_ms == 0);
    unsetenv("ALMANAC_IDLE_TIMEOUT_MS");

    // The longest accepted timeout still waits for the reply instead of
    // expiring on the spot
    PendingRegistry registry;
    Admission admission = Admission::Accepted;
    auto waiter = registry.register_waiter(admission);
    auto replier = std::async(std::launch::async, [&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return registry.deliver("answer");
    });
    auto outcome = registry.await_resolution(
        waiter, std::chrono::milliseconds(config.idle_timeout_ms));
    assert(outcome.ok() && outcome.payload == "answer");
    assert(replier.get());

    std::cout << "  PASS" << std::endl;
}

void test_config_environment() {
    std::cout << "Testing config environment..." << std::endl;

    setenv("ALMANAC_PORT", "9090", 1);
    setenv("ALMANAC_MAX_PENDING", "0", 1);
    setenv("ALMANAC_LOG_LEVEL", "trace", 1);

    ServerConfig config;
    std::string error_msg;
    assert(apply_environment(config, error_msg));
    assert(config.port == 9090);
    assert(config.max_pending == 0);
    assert(config.log_level == LogLevel::Trace);

    // Command line wins over environment
    assert(parse_args(config, {"--port", "9191"}).action == ConfigParse::Action::Run);
    assert(config.port == 9191);

    setenv("ALMANAC_PORT", "eighty", 1);
    ServerConfig broken;
    assert(!apply_environment(broken, error_msg));
    assert(error_msg.find("eighty") != std::string::npos);

    unsetenv("ALMANAC_PORT");
    unsetenv("ALMANAC_MAX_PENDING");
    unsetenv("ALMANAC_LOG_LEVEL");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Protocol and message processor
// ═══════════════════════════════════════════════════════════════════════════

void test_envelope_classification() {
    std::cout << "Testing envelope classification..." << std::endl;

    std::string error_msg;

    auto request = rpc::decode_envelope(R"({"jsonrpc":"2.0","id":7,"method":"ping"})", error_msg);
    assert(request && request->has_correlation_id);
    assert(request->id == 7);

    auto null_id = rpc::decode_envelope(R"({"jsonrpc":"2.0","id":null,"method":"ping"})", error_msg);
    assert(null_id && null_id->has_correlation_id);
    assert(null_id->id.is_null());

    auto notification = rpc::decode_envelope(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", error_msg);
    assert(notification && !notification->has_correlation_id);

    assert(!rpc::decode_envelope("{not json", error_msg));
    assert(error_msg.find("Parse error") != std::string::npos);
    assert(!rpc::decode_envelope(R"([{"jsonrpc":"2.0","id":1,"method":"ping"}])", error_msg));
    assert(!rpc::decode_envelope("42", error_msg));

    std::cout << "  PASS" << std::endl;
}

json process_json(rpc::Handler& handler, const json& message) {
    auto reply = handler.process(message.dump());
    assert(reply.has_value());
    return json::parse(*reply);
}

void test_handler_lifecycle_methods() {
    std::cout << "Testing handler lifecycle methods..." << std::endl;

    rpc::Handler handler;

    auto init = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 0}, {"method", "initialize"},
        {"params", {{"protocolVersion", ALMANAC_MCP_PROTOCOL_VERSION},
                    {"capabilities", json::object()},
                    {"clientInfo", {{"name", "test"}, {"version", "0"}}}}}
    });
    assert(init["id"] == 0);
    assert(init["result"]["protocolVersion"] == ALMANAC_MCP_PROTOCOL_VERSION);
    assert(init["result"]["serverInfo"]["name"] == ALMANAC_SERVER_NAME);
    assert(init["result"]["capabilities"].contains("tools"));

    auto ping = process_json(handler, {{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "ping"}});
    assert(ping["id"] == "abc");
    assert(ping["result"].is_object() && ping["result"].empty());

    // Notifications never produce a reply, even unknown or malformed ones
    assert(!handler.process(notification_body("notifications/initialized")));
    assert(!handler.process(notification_body("no/such/method")));
    assert(!handler.process(R"({"method":"ping"})"));

    auto unknown = process_json(handler, {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "resources/frob"}});
    assert(unknown["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    auto invalid = process_json(handler, {{"id", 6}, {"method", "ping"}});
    assert(invalid["id"] == 6);
    assert(invalid["error"]["code"] == rpc::error::INVALID_REQUEST);

    auto garbage = json::parse(*handler.process("{oops"));
    assert(garbage["error"]["code"] == rpc::error::PARSE_ERROR);
    assert(garbage["id"].is_null());

    std::cout << "  PASS" << std::endl;
}

void test_handler_tools() {
    std::cout << "Testing handler tools..." << std::endl;

    rpc::Handler handler;

    auto list = process_json(handler, {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    bool has_server_info = false;
    for (const auto& tool : list["result"]["tools"]) {
        if (tool["name"] == "server_info") {
            has_server_info = true;
            assert(tool.contains("inputSchema"));
        }
    }
    assert(has_server_info);

    auto info = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
        {"params", {{"name", "server_info"}, {"arguments", json::object()}}}
    });
    assert(info["result"]["isError"] == false);
    assert(info["result"]["content"][0]["type"] == "text");
    assert(info["result"]["structuredContent"]["version"] == ALMANAC_VERSION);

    handler.add_tool({"explode", "Always throws", {{"type", "object"}}},
                     [](const json&) -> rpc::ToolResult {
                         throw std::runtime_error("kaboom");
                     });
    auto failed = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
        {"params", {{"name", "explode"}}}
    });
    assert(failed["error"]["code"] == rpc::error::TOOL_EXECUTION_ERROR);

    // Re-registering a name replaces the handler without duplicating the schema
    size_t tool_count = handler.tools().size();
    handler.add_tool({"explode", "Now calm", {{"type", "object"}}},
                     [](const json&) { return rpc::ToolResult::ok("calm"); });
    assert(handler.tools().size() == tool_count);
    auto calm = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
        {"params", {{"name", "explode"}}}
    });
    assert(calm["result"]["content"][0]["text"] == "calm");

    // A tool-level failure is a normal reply flagged isError, not an RPC error
    handler.add_tool({"refuse", "Rejects its input", json()},
                     [](const json&) { return rpc::ToolResult::error("bad input"); });
    auto refused = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
        {"params", {{"name", "refuse"}, {"arguments", {{"x", 1}}}}}
    });
    assert(!refused.contains("error"));
    assert(refused["result"]["isError"] == true);
    assert(refused["result"]["content"][0]["text"] == "bad input");
    assert(!refused["result"].contains("structuredContent"));

    auto listed = process_json(handler, {{"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/list"}});
    bool refuse_listed = false;
    for (const auto& tool : listed["result"]["tools"]) {
        if (tool["name"] == "refuse") {
            refuse_listed = true;
            assert(tool["inputSchema"]["type"] == "object");
        }
    }
    assert(refuse_listed);

    auto missing = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
        {"params", {{"name", "no_such_tool"}}}
    });
    assert(missing["error"]["code"] == rpc::error::TOOL_NOT_FOUND);

    auto nameless = process_json(handler, {
        {"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"}, {"params", json::object()}
    });
    assert(nameless["error"]["code"] == rpc::error::INVALID_PARAMS);

    std::cout << "  PASS" << std::endl;
}

void test_stdio_server() {
    std::cout << "Testing stdio server..." << std::endl;

    rpc::Handler handler;
    std::istringstream in(
        request_body(1, "ping") + "\n"
        "\n" +
        notification_body("notifications/initialized") + "\n" +
        request_body(2, "tools/list") + "\r\n");
    std::ostringstream out;

    StdioServer server(handler, in, out);
    assert(server.run() == 3);

    std::istringstream replies(out.str());
    std::string line;
    std::vector<json> parsed;
    while (std::getline(replies, line)) {
        parsed.push_back(json::parse(line));
    }
    assert(parsed.size() == 2);
    assert(parsed[0]["id"] == 1);
    assert(parsed[1]["id"] == 2);
    assert(parsed[1]["result"].contains("tools"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Pending registry
// ═══════════════════════════════════════════════════════════════════════════

void test_registry_fifo() {
    std::cout << "Testing registry FIFO pairing..." << std::endl;

    PendingRegistry registry;
    Admission admission = Admission::SessionClosed;

    auto first = registry.register_waiter(admission);
    assert(first && admission == Admission::Accepted);
    auto second = registry.register_waiter(admission);
    assert(second && second->sequence() > first->sequence());
    assert(registry.pending() == 2);

    // The later caller starts waiting first; pairing still follows registration
    auto second_outcome = std::async(std::launch::async, [&]() {
        return registry.await_resolution(second);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto first_outcome = std::async(std::launch::async, [&]() {
        return registry.await_resolution(first);
    });

    assert(registry.deliver("reply-1"));
    assert(registry.deliver("reply-2"));

    assert(ready(first_outcome) && ready(second_outcome));
    auto a = first_outcome.get();
    auto b = second_outcome.get();
    assert(a.ok() && a.payload == "reply-1");
    assert(b.ok() && b.payload == "reply-2");
    assert(registry.pending() == 0);

    // An extra reply is a defect signal, not a crash
    assert(!registry.deliver("reply-3"));

    std::cout << "  PASS" << std::endl;
}

void test_registry_cancel_all() {
    std::cout << "Testing registry cancel_all..." << std::endl;

    PendingRegistry registry;
    Admission admission = Admission::Accepted;
    auto w1 = registry.register_waiter(admission);
    auto w2 = registry.register_waiter(admission);

    auto o1 = std::async(std::launch::async, [&]() { return registry.await_resolution(w1); });
    auto o2 = std::async(std::launch::async, [&]() { return registry.await_resolution(w2); });

    assert(registry.cancel_all("going away") == 2);
    assert(ready(o1) && ready(o2));
    auto r1 = o1.get();
    auto r2 = o2.get();
    assert(r1.kind == Outcome::Kind::Cancelled && r1.reason == "going away");
    assert(r2.kind == Outcome::Kind::Cancelled);

    assert(registry.cancel_all("again") == 0);
    assert(!registry.accepting());
    assert(!registry.register_waiter(admission));
    assert(admission == Admission::SessionClosed);

    // Awaiting a waiter twice is a programming error
    bool threw = false;
    try {
        registry.await_resolution(w1);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_registry_backpressure() {
    std::cout << "Testing registry backpressure..." << std::endl;

    PendingRegistry registry(2);
    Admission admission = Admission::Accepted;
    auto w1 = registry.register_waiter(admission);
    auto w2 = registry.register_waiter(admission);
    assert(w1 && w2);

    assert(!registry.register_waiter(admission));
    assert(admission == Admission::TooManyPending);

    assert(registry.deliver("r1"));
    auto w3 = registry.register_waiter(admission);
    assert(w3 && admission == Admission::Accepted);
    assert(registry.registered_total() == 3);

    registry.cancel_all("done");

    std::cout << "  PASS" << std::endl;
}

void test_registry_idle_timeout() {
    std::cout << "Testing registry idle timeout..." << std::endl;

    PendingRegistry registry;
    Admission admission = Admission::Accepted;
    auto slow = registry.register_waiter(admission);
    auto next = registry.register_waiter(admission);

    auto timed_out = registry.await_resolution(slow, std::chrono::milliseconds(30));
    assert(timed_out.kind == Outcome::Kind::TimedOut);

    // The abandoned waiter keeps its slot: its late reply is swallowed
    // instead of landing on the next caller
    assert(registry.pending() == 2);
    assert(registry.deliver("late reply for slow"));
    assert(registry.deliver("reply for next"));

    auto outcome = registry.await_resolution(next, std::chrono::milliseconds(1000));
    assert(outcome.ok() && outcome.payload == "reply for next");
    assert(registry.pending() == 0);

    // A waiter answered before its timeout expires gets the reply
    auto quick = registry.register_waiter(admission);
    registry.deliver("fast");
    auto fast = registry.await_resolution(quick, std::chrono::milliseconds(1000));
    assert(fast.ok() && fast.payload == "fast");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound stream and session lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void test_inbound_stream() {
    std::cout << "Testing inbound stream..." << std::endl;

    InboundStream stream;
    assert(stream.publish({"a", true}));
    assert(stream.publish({"b", false}));
    assert(stream.backlog() == 2);

    auto a = stream.next();
    assert(a && a->body == "a" && a->expects_reply);
    auto b = stream.next();
    assert(b && b->body == "b" && !b->expects_reply);

    // A blocked consumer wakes up when the stream finishes
    auto consumer = std::async(std::launch::async, [&]() { return stream.next(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(stream.finish() == 0);
    assert(ready(consumer));
    assert(!consumer.get().has_value());

    assert(stream.finished());
    assert(!stream.publish({"c", true}));

    InboundStream backlog;
    backlog.publish({"x", true});
    backlog.publish({"y", true});
    assert(backlog.finish() == 2);
    assert(!backlog.next().has_value());

    std::cout << "  PASS" << std::endl;
}

void test_session_lifecycle() {
    std::cout << "Testing session lifecycle..." << std::endl;

    // Sessions come only from open(), waiters only from a registry
    static_assert(!std::is_constructible<Session, std::string, SessionOptions>::value,
                  "sessions must be created through Session::open");
    static_assert(!std::is_constructible<Waiter, uint64_t>::value,
                  "waiters must be created by a PendingRegistry");

    auto session = Session::open();
    assert(session->state() == SessionState::Open);
    assert(session->id().size() == 36);
    assert(session->id()[14] == '4');

    auto other = Session::open();
    assert(other->id() != session->id());

    bool threw = false;
    try {
        session->finalize();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    auto submission = session->submit(request_body(1, "ping"), true);
    assert(submission.admission == Admission::Accepted && submission.waiter);
    assert(session->registry().pending() == 1);
    assert(session->inbound().backlog() == 1);

    // Step through the transitions by hand
    assert(session->begin_close());
    assert(session->state() == SessionState::Closing);
    assert(!session->begin_close());

    auto late = session->submit(request_body(2, "ping"), true);
    assert(late.admission == Admission::SessionClosed && !late.waiter);
    assert(session->inbound().backlog() == 1);

    // Not yet: a waiter is still queued and the stream is open
    assert(!session->finalize());
    session->inbound().finish();
    assert(!session->finalize());
    assert(session->registry().cancel_all("closing") == 1);
    assert(session->finalize());
    assert(session->state() == SessionState::Closed);
    assert(!session->finalize());

    auto outcome = session->registry().await_resolution(submission.waiter);
    assert(outcome.kind == Outcome::Kind::Cancelled);

    assert(!session->close("again"));

    std::cout << "  PASS" << std::endl;
}

void test_session_close_sequence() {
    std::cout << "Testing session close sequence..." << std::endl;

    auto session = Session::open();
    auto w1 = session->submit(request_body(1, "a"), true).waiter;
    auto w2 = session->submit(request_body(2, "b"), true).waiter;
    auto note = session->submit(notification_body("notifications/x"), false);
    assert(note.admission == Admission::Accepted && !note.waiter);

    assert(session->close("bye"));
    assert(session->state() == SessionState::Closed);
    assert(session->inbound().finished());
    assert(session->registry().pending() == 0);

    assert(session->registry().await_resolution(w1).reason == "bye");
    assert(session->registry().await_resolution(w2).kind == Outcome::Kind::Cancelled);

    // Replies that show up after close are dropped
    assert(!session->deliver("{}"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Pump
// ═══════════════════════════════════════════════════════════════════════════

void test_pump_contract_enforcement() {
    std::cout << "Testing pump contract enforcement..." << std::endl;

    FunctionProcessor misbehaving([](const std::string& message) -> std::optional<std::string> {
        auto request = json::parse(message);
        std::string method = request.value("method", "");
        if (method == "throw") throw std::runtime_error("processor failure");
        if (method == "silent") return std::nullopt;
        // Replies to everything, notifications included
        return rpc::dump(rpc::make_result(request.value("id", json()), method));
    });

    auto session = Session::open();
    Pump pump(*session, misbehaving);
    pump.start();

    auto thrower = session->submit(request_body(1, "throw"), true).waiter;
    session->submit(notification_body("chatty"), false);
    auto silent = session->submit(request_body(2, "silent"), true).waiter;
    auto normal = session->submit(request_body(3, "normal"), true).waiter;

    auto& registry = session->registry();
    auto r1 = json::parse(registry.await_resolution(thrower, std::chrono::seconds(5)).payload);
    auto r2 = json::parse(registry.await_resolution(silent, std::chrono::seconds(5)).payload);
    auto r3 = json::parse(registry.await_resolution(normal, std::chrono::seconds(5)).payload);

    assert(r1["id"] == 1 && r1["error"]["code"] == rpc::error::INTERNAL_ERROR);
    assert(r2["id"] == 2 && r2["error"]["code"] == rpc::error::INTERNAL_ERROR);
    assert(r3["id"] == 3 && r3["result"] == "normal");

    assert(eventually([&] { return pump.processed() == 4; }));
    session->close("done");
    pump.join();
    assert(!pump.running());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// HTTP endpoint
// ═══════════════════════════════════════════════════════════════════════════

void test_endpoint_round_trip() {
    std::cout << "Testing endpoint round trip..." << std::endl;

    const std::string pong = R"({"id":1,"result":"pong"})";
    FunctionProcessor processor([&](const std::string& message) -> std::optional<std::string> {
        auto request = json::parse(message);
        if (request.value("method", "") == "ping") return pong;
        return std::nullopt;
    });

    auto session = Session::open();
    McpEndpoint endpoint(*session);
    Pump pump(*session, processor);
    pump.start();

    auto response = endpoint.handle(Harness::make_post(R"({"id":1,"method":"ping"})"));
    assert(response.result() == http::status::ok);
    assert(response.body() == pong);
    assert(std::string(response[SESSION_HEADER]) == session->id());
    assert(std::string(response[http::field::content_type]) == "application/json");

    session->close("done");
    pump.join();

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_fifo_correlation() {
    std::cout << "Testing endpoint FIFO correlation..." << std::endl;

    StubProcessor processor(true);
    Harness harness(processor);

    // A is published and held inside the processor before B arrives
    auto a = harness.post_async(request_body(1, "alpha"));
    assert(processor.wait_received(1));
    auto b = harness.post_async(request_body(2, "beta"));
    assert(eventually([&] { return harness.session->registry().pending() == 2; }));

    // B's HTTP call has been waiting the whole time; neither is answered yet
    assert(!ready(a, std::chrono::milliseconds(20)));
    assert(!ready(b, std::chrono::milliseconds(20)));

    processor.release(2);
    assert(ready(a) && ready(b));

    auto ra = a.get();
    auto rb = b.get();
    assert(ra.result() == http::status::ok && rb.result() == http::status::ok);
    auto ja = json::parse(ra.body());
    auto jb = json::parse(rb.body());
    assert(ja["id"] == 1 && ja["result"]["echo"] == "alpha");
    assert(jb["id"] == 2 && jb["result"]["echo"] == "beta");

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_many_concurrent_callers() {
    std::cout << "Testing endpoint with many concurrent callers..." << std::endl;

    StubProcessor processor;
    Harness harness(processor);

    std::vector<std::future<HttpResponse>> calls;
    for (int i = 0; i < 32; ++i) {
        calls.push_back(harness.post_async(request_body(i, "m" + std::to_string(i))));
    }

    for (int i = 0; i < 32; ++i) {
        assert(ready(calls[i]));
        auto response = calls[i].get();
        assert(response.result() == http::status::ok);
        auto body = json::parse(response.body());
        assert(body["id"] == i);
        assert(body["result"]["echo"] == "m" + std::to_string(i));
    }

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_notification_does_not_block() {
    std::cout << "Testing endpoint notification is non-blocking..." << std::endl;

    StubProcessor processor(true);  // never processes until released
    Harness harness(processor);

    auto start = std::chrono::steady_clock::now();
    auto response = harness.endpoint.handle(Harness::make_post(notification_body("notifications/initialized")));
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(response.result() == http::status::accepted);
    assert(response.body().empty());
    assert(std::string(response[SESSION_HEADER]) == harness.session->id());
    assert(elapsed < std::chrono::seconds(1));
    assert(harness.session->registry().pending() == 0);

    assert(processor.wait_received(1));
    processor.release_all();

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_termination_drains_pending() {
    std::cout << "Testing endpoint termination drains pending..." << std::endl;

    StubProcessor processor(true);
    Harness harness(processor);

    auto a = harness.post_async(request_body(1, "alpha"));
    auto b = harness.post_async(request_body(2, "beta"));
    assert(eventually([&] { return harness.session->registry().pending() == 2; }));

    auto del = harness.endpoint.handle(Harness::make_request(http::verb::delete_, "/mcp"));
    assert(del.result() == http::status::ok);

    assert(ready(a) && ready(b));
    auto ra = a.get();
    auto rb = b.get();
    assert(ra.result() == http::status::gone);
    assert(rb.result() == http::status::gone);
    auto body = json::parse(ra.body());
    assert(body["error"]["code"] == rpc::error::SESSION_TERMINATED);
    assert(body["id"] == 1 || body["id"] == 2);

    assert(harness.session->state() == SessionState::Closed);

    // Later POSTs on the terminated session fail without reaching the processor
    processor.release_all();
    size_t seen = processor.received().size();
    auto after = harness.endpoint.handle(Harness::make_post(request_body(3, "gamma")));
    assert(after.result() == http::status::not_found);
    auto note = harness.endpoint.handle(Harness::make_post(notification_body("notifications/x")));
    assert(note.result() == http::status::not_found);
    assert(processor.received().size() == seen);

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_idempotent_close() {
    std::cout << "Testing endpoint idempotent close..." << std::endl;

    StubProcessor processor;
    Harness harness(processor);

    auto first = harness.endpoint.handle(Harness::make_request(http::verb::delete_, "/mcp"));
    auto second = harness.endpoint.handle(Harness::make_request(http::verb::delete_, "/mcp"));
    assert(first.result() == http::status::ok);
    assert(second.result() == http::status::ok);
    assert(harness.session->state() == SessionState::Closed);

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_rejects_oversized_body() {
    std::cout << "Testing endpoint rejects oversized body..." << std::endl;

    StubProcessor processor;
    EndpointOptions options;
    options.max_body_bytes = 64;
    Harness harness(processor, options);

    std::string padding(200, 'x');
    std::string body = json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"},
                             {"params", {{"pad", padding}}}}).dump();
    assert(body.size() > options.max_body_bytes);

    auto response = harness.endpoint.handle(Harness::make_post(body));
    assert(response.result() == http::status::payload_too_large);
    assert(harness.session->registry().registered_total() == 0);

    // A small request afterwards proves the pipeline is alive and the big
    // body never reached the processor
    auto ok = harness.endpoint.handle(Harness::make_post(request_body(2, "ping")));
    assert(ok.result() == http::status::ok);
    auto received = processor.received();
    assert(received.size() == 1);
    assert(json::parse(received[0])["id"] == 2);

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_malformed_and_routing() {
    std::cout << "Testing endpoint malformed input and routing..." << std::endl;

    StubProcessor processor;
    Harness harness(processor);

    auto garbage = harness.endpoint.handle(Harness::make_post("{not json"));
    assert(garbage.result() == http::status::bad_request);
    assert(json::parse(garbage.body())["error"]["code"] == rpc::error::PARSE_ERROR);

    auto batch = harness.endpoint.handle(Harness::make_post("[]"));
    assert(batch.result() == http::status::bad_request);

    auto health = harness.endpoint.handle(Harness::make_request(http::verb::get, "/health"));
    assert(health.result() == http::status::ok);
    assert(health.body() == "OK");

    auto get_mcp = harness.endpoint.handle(Harness::make_request(http::verb::get, "/mcp"));
    assert(get_mcp.result() == http::status::method_not_allowed);

    auto unknown = harness.endpoint.handle(Harness::make_request(http::verb::get, "/nope"));
    assert(unknown.result() == http::status::not_found);

    auto with_query = harness.endpoint.handle(Harness::make_request(http::verb::get, "/health?check=1"));
    assert(with_query.result() == http::status::ok);

    auto stale = Harness::make_post(request_body(1, "ping"));
    stale.set(SESSION_HEADER, "00000000-0000-4000-8000-000000000000");
    auto stale_response = harness.endpoint.handle(stale);
    assert(stale_response.result() == http::status::not_found);

    auto current = Harness::make_post(request_body(2, "ping"));
    current.set(SESSION_HEADER, harness.session->id());
    assert(harness.endpoint.handle(current).result() == http::status::ok);

    // Only the request carrying the right session id got through
    assert(processor.received().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_backpressure() {
    std::cout << "Testing endpoint backpressure..." << std::endl;

    StubProcessor processor(true);
    Harness harness(processor, {}, 1);

    auto a = harness.post_async(request_body(1, "alpha"));
    assert(processor.wait_received(1));

    auto rejected = harness.endpoint.handle(Harness::make_post(request_body(2, "beta")));
    assert(rejected.result() == http::status::service_unavailable);
    assert(std::string(rejected[http::field::retry_after]) == "1");

    processor.release(1);
    assert(ready(a));
    assert(a.get().result() == http::status::ok);
    assert(processor.received().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_endpoint_idle_timeout() {
    std::cout << "Testing endpoint idle timeout..." << std::endl;

    StubProcessor processor(true);
    EndpointOptions options;
    options.idle_timeout = std::chrono::milliseconds(50);
    Harness harness(processor, options);

    auto response = harness.endpoint.handle(Harness::make_post(request_body(1, "slow")));
    assert(response.result() == http::status::gateway_timeout);
    assert(json::parse(response.body())["id"] == 1);

    // Only this caller gave up; the session is still open
    assert(harness.session->state() == SessionState::Open);
    processor.release_all();

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// HTTP server over loopback
// ═══════════════════════════════════════════════════════════════════════════

http::response<http::string_body> roundtrip(uint16_t port, http::request<http::string_body> request) {
    net::io_context ioc;
    net::ip::tcp::socket socket(ioc);
    socket.connect({net::ip::make_address("127.0.0.1"), port});

    request.set(http::field::host, "127.0.0.1");
    request.keep_alive(false);
    request.prepare_payload();
    http::write(socket, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    beast::error_code ec;
    socket.shutdown(net::ip::tcp::socket::shutdown_both, ec);
    return response;
}

// Announce a body larger than the cap and send only the header; the server
// must refuse from Content-Length alone
http::response<http::string_body> oversized_header_only(uint16_t port, size_t body_size) {
    net::io_context ioc;
    net::ip::tcp::socket socket(ioc);
    socket.connect({net::ip::make_address("127.0.0.1"), port});

    http::request<http::string_body> request{http::verb::post, "/mcp", 11};
    request.set(http::field::host, "127.0.0.1");
    request.body() = std::string(body_size, ' ');
    request.prepare_payload();

    http::request_serializer<http::string_body> serializer{request};
    http::write_header(socket, serializer);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    beast::error_code ec;
    socket.shutdown(net::ip::tcp::socket::shutdown_both, ec);
    return response;
}

void test_http_server_loopback() {
    std::cout << "Testing HTTP server over loopback..." << std::endl;

    rpc::Handler handler;
    auto session = Session::open({16});
    EndpointOptions options;
    options.max_body_bytes = 1024;
    McpEndpoint endpoint(*session, options);
    Pump pump(*session, handler);
    pump.start();

    HttpServer server(endpoint, "127.0.0.1", 0);
    assert(server.start());
    assert(server.port() != 0);

    auto health = roundtrip(server.port(), {http::verb::get, "/health", 11});
    assert(health.result() == http::status::ok && health.body() == "OK");

    http::request<http::string_body> init{http::verb::post, "/mcp", 11};
    init.set(http::field::content_type, "application/json");
    init.body() = json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                        {"params", {{"protocolVersion", ALMANAC_MCP_PROTOCOL_VERSION}}}}).dump();
    auto init_response = roundtrip(server.port(), init);
    assert(init_response.result() == http::status::ok);
    assert(std::string(init_response[SESSION_HEADER]) == session->id());
    assert(json::parse(init_response.body())["result"]["serverInfo"]["name"] == ALMANAC_SERVER_NAME);

    auto big_response = oversized_header_only(server.port(), 4096);
    assert(big_response.result() == http::status::payload_too_large);

    http::request<http::string_body> end{http::verb::delete_, "/mcp", 11};
    assert(roundtrip(server.port(), end).result() == http::status::ok);

    http::request<http::string_body> after{http::verb::post, "/mcp", 11};
    after.body() = request_body(2, "ping");
    assert(roundtrip(server.port(), after).result() == http::status::not_found);

    server.stop();
    assert(!server.running());
    assert(server.connection_count() == 0);
    pump.join();

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Almanac C++ Tests ===" << std::endl;
    set_log_level(LogLevel::Warning);

    test_log_levels();
    test_config_command_line();
    test_config_idle_timeout_bounds();
    test_config_environment();

    std::cout << std::endl;
    std::cout << "=== Protocol ===" << std::endl;
    test_envelope_classification();
    test_handler_lifecycle_methods();
    test_handler_tools();
    test_stdio_server();

    std::cout << std::endl;
    std::cout << "=== Correlation ===" << std::endl;
    test_registry_fifo();
    test_registry_cancel_all();
    test_registry_backpressure();
    test_registry_idle_timeout();
    test_inbound_stream();
    test_session_lifecycle();
    test_session_close_sequence();
    test_pump_contract_enforcement();

    std::cout << std::endl;
    std::cout << "=== HTTP ===" << std::endl;
    test_endpoint_round_trip();
    test_endpoint_fifo_correlation();
    test_endpoint_many_concurrent_callers();
    test_endpoint_notification_does_not_block();
    test_endpoint_termination_drains_pending();
    test_endpoint_idempotent_close();
    test_endpoint_rejects_oversized_body();
    test_endpoint_malformed_and_routing();
    test_endpoint_backpressure();
    test_endpoint_idle_timeout();
    test_http_server_loopback();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
