#include <catch2/catch_test_macros.hpp>
#include "server.hpp"
#include "error.hpp"
#include "handler.hpp"
#include "sse.hpp"
#include "providers/echo.hpp"
#include "util.hpp"
#include "mock_response_writer.hpp"
#include "mock_source_stream.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <thread>
#include <nlohmann/json.hpp>

using namespace gaistream;
using namespace std::chrono_literals;

namespace {

// Both ends of a connected AF_UNIX stream socket; closed on destruction.
struct SocketPair {
    int fds[2] = {-1, -1};

    SocketPair() { ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds); }
    ~SocketPair() {
        close_side(0);
        close_side(1);
    }

    int server() const { return fds[0]; }
    int client() const { return fds[1]; }

    void close_side(int i) {
        if (fds[i] >= 0) ::close(fds[i]);
        fds[i] = -1;
    }
};

void send_text(int fd, const std::string& text) {
    size_t sent = 0;
    while (sent < text.size()) {
        ssize_t n = ::send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

// Reads until EOF, `chunk` bytes at a time.
std::string read_all(int fd, size_t chunk = 4096) {
    std::string out;
    std::vector<char> buf(chunk);
    while (true) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) break;
        out.append(buf.data(), static_cast<size_t>(n));
    }
    return out;
}

struct ParsedResponse {
    std::string head;
    std::string body;
    bool terminated = false; // saw the zero-length chunk
};

// Splits the response head and decodes a chunked body.
ParsedResponse parse_chunked(const std::string& raw) {
    ParsedResponse resp;
    auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos) return resp;
    resp.head = raw.substr(0, end);

    size_t pos = end + 4;
    while (pos < raw.size()) {
        auto line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) break;
        size_t size = std::strtoul(raw.substr(pos, line_end - pos).c_str(), nullptr, 16);
        pos = line_end + 2;
        if (size == 0) {
            resp.terminated = true;
            break;
        }
        resp.body += raw.substr(pos, size);
        pos += size + 2;
    }
    return resp;
}

int connect_local(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

std::string post_request(const std::string& path, const std::string& body,
                         const std::string& extra_headers = "") {
    return "POST " + path + " HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: application/json\r\n" + extra_headers +
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// Emits a start, `count` text deltas and a finish.
class BurstProvider : public StreamProvider {
public:
    explicit BurstProvider(int count) : count_(count) {}

    std::unique_ptr<SourceStream> stream_text(const GenerateRequest&, const CancelToken&) override {
        std::vector<Event> events{make_start()};
        for (int i = 0; i < count_; ++i) events.push_back(make_text_delta("t" + std::to_string(i)));
        events.push_back(make_finish());
        return std::make_unique<MockSourceStream>(std::move(events));
    }

    std::string provider_name() const override { return "burst"; }

private:
    int count_;
};

} // namespace

// ── parse_listen_addr ───────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:8080", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8080);
}

TEST_CASE("parse_listen_addr: port 0 selects an ephemeral port", "[server]") {
    std::string host;
    uint16_t port = 1;
    REQUIRE(parse_listen_addr("0.0.0.0:0", host, port));
    REQUIRE(port == 0);
}

TEST_CASE("parse_listen_addr: malformed addresses rejected", "[server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8080", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:abc", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:80x", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:70000", host, port));
}

// ── read_http_request ───────────────────────────────────────────

TEST_CASE("read_http_request: parses line, query, headers and body", "[server]") {
    SocketPair sp;
    send_text(sp.client(), post_request("/v1/stream?mode=passthrough&q=a%20b", "{\"x\":1}",
                                        "Accept: Application/X-NDJSON\r\n"));
    HttpRequest req;
    REQUIRE(read_http_request(sp.server(), 1024, req) == 0);
    REQUIRE(req.method == "POST");
    REQUIRE(req.path == "/v1/stream");
    REQUIRE(req.query_param("mode") == "passthrough");
    REQUIRE(req.query_param("q") == "a b");
    REQUIRE(req.header("Accept") == "Application/X-NDJSON");
    REQUIRE(req.body == "{\"x\":1}");
}

TEST_CASE("read_http_request: oversized body is 413", "[server]") {
    SocketPair sp;
    send_text(sp.client(), post_request("/v1/stream", std::string(100, 'a')));
    HttpRequest req;
    REQUIRE(read_http_request(sp.server(), 10, req) == 413);
}

TEST_CASE("read_http_request: garbage request line is 400", "[server]") {
    SocketPair sp;
    send_text(sp.client(), "NONSENSE\r\n\r\n");
    HttpRequest req;
    REQUIRE(read_http_request(sp.server(), 1024, req) == 400);
}

TEST_CASE("read_http_request: peer closing early returns -1", "[server]") {
    SocketPair sp;
    send_text(sp.client(), "POST /v1/stream HTTP/1.1\r\n");
    sp.close_side(1);
    HttpRequest req;
    REQUIRE(read_http_request(sp.server(), 1024, req) == -1);
}

// ── SocketResponseWriter ────────────────────────────────────────

TEST_CASE("SocketResponseWriter: chunked body with headers", "[server]") {
    SocketPair sp;
    {
        SocketResponseWriter out(sp.server());
        out.set_header("Content-Type", "text/event-stream");
        out.set_header("content-type", "text/plain");
        out.set_header("Content-Length", "99");
        out.write("hello");
        out.write(std::string(20, 'x'));
        out.finish();
        REQUIRE(out.status() == 200);
    }
    ::shutdown(sp.server(), SHUT_WR);

    auto resp = parse_chunked(read_all(sp.client()));
    REQUIRE(resp.head.rfind("HTTP/1.1 200 OK", 0) == 0);
    REQUIRE(contains(resp.head, "Content-Type: text/plain"));
    REQUIRE_FALSE(contains(resp.head, "text/event-stream"));
    REQUIRE_FALSE(contains(resp.head, "Content-Length"));
    REQUIRE(contains(resp.head, "Transfer-Encoding: chunked"));
    REQUIRE(contains(resp.head, "Connection: close"));
    REQUIRE(resp.body == "hello" + std::string(20, 'x'));
    REQUIRE(resp.terminated);
}

TEST_CASE("SocketResponseWriter: send_error is a complete plain response", "[server]") {
    SocketPair sp;
    SocketResponseWriter out(sp.server());
    out.send_error(400, "bad");
    REQUIRE(out.committed());
    REQUIRE_THROWS_AS(out.write("more"), TransportError);
    ::shutdown(sp.server(), SHUT_WR);

    std::string raw = read_all(sp.client());
    REQUIRE(raw.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
    REQUIRE(contains(raw, "Content-Length: 3\r\n"));
    REQUIRE(raw.substr(raw.size() - 3) == "bad");
}

TEST_CASE("SocketResponseWriter: write to a closed peer throws TransportError", "[server]") {
    SocketPair sp;
    SocketResponseWriter out(sp.server());
    out.commit();
    sp.close_side(1);
    REQUIRE_THROWS_AS(out.write("data"), TransportError);
}

TEST_CASE("SocketResponseWriter: failed send marks the writer broken", "[server]") {
    SocketPair sp;
    SocketResponseWriter out(sp.server());
    out.commit();
    sp.close_side(1);
    REQUIRE_THROWS_AS(out.write("data"), TransportError);
    REQUIRE(out.broken());
    REQUIRE_NOTHROW(out.finish());
    REQUIRE_THROWS_AS(out.write("more"), TransportError);
}

TEST_CASE("SocketResponseWriter: slow reader receives every event in order", "[server]") {
    SocketPair sp;
    constexpr int kEvents = 200;

    std::thread writer([&]() {
        SocketResponseWriter out(sp.server());
        out.set_header("Content-Type", "text/event-stream");
        for (int i = 0; i < kEvents; ++i) {
            out.write(format_sse_event("delta", "{\"n\":" + std::to_string(i) + "}", std::nullopt));
        }
        out.finish();
        ::shutdown(sp.server(), SHUT_WR);
    });

    auto resp = parse_chunked(read_all(sp.client(), 1));
    writer.join();

    SSEParser parser;
    std::vector<SSEEvent> events;
    parser.feed(resp.body, [&](const SSEEvent& ev) { events.push_back(ev); return true; });
    REQUIRE(events.size() == kEvents);
    for (int i = 0; i < kEvents; ++i) {
        REQUIRE(events[i].data == "{\"n\":" + std::to_string(i) + "}");
    }
}

// ── watch_disconnect ────────────────────────────────────────────

TEST_CASE("watch_disconnect: peer hang-up cancels", "[server]") {
    SocketPair sp;
    int wake[2];
    REQUIRE(::pipe(wake) == 0);
    CancelSource cancel;

    std::thread watcher([&]() { watch_disconnect(sp.server(), wake[0], cancel); });
    sp.close_side(1);
    watcher.join();
    REQUIRE(cancel.is_cancelled());
    ::close(wake[0]);
    ::close(wake[1]);
}

TEST_CASE("watch_disconnect: wake pipe returns without cancelling", "[server]") {
    SocketPair sp;
    int wake[2];
    REQUIRE(::pipe(wake) == 0);
    CancelSource cancel;

    std::thread watcher([&]() { watch_disconnect(sp.server(), wake[0], cancel); });
    char b = 0;
    REQUIRE(::write(wake[1], &b, 1) == 1);
    watcher.join();
    REQUIRE_FALSE(cancel.is_cancelled());
    ::close(wake[0]);
    ::close(wake[1]);
}

// ── StreamServer ────────────────────────────────────────────────

TEST_CASE("StreamServer: invalid listen address fails to start", "[server]") {
    StreamServer server("nope", 1024, [](const HttpRequest&, ResponseWriter&, const CancelToken&) {});
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(contains(error, "Invalid listen address"));
}

TEST_CASE("StreamServer: streams echo events end to end over SSE", "[server]") {
    EchoProvider provider(0ms);
    SSEOptions sse;
    sse.heartbeat_interval = 0ms;
    StreamHandler handler(provider, prepare_generic_request, sse);

    StreamServer server("127.0.0.1:0", 4096,
        [&](const HttpRequest& req, ResponseWriter& out, const CancelToken& cancel) {
            handler.serve(req, out, cancel);
        });
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(server.port() != 0);

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    send_text(fd, post_request("/v1/stream", R"({"model":"echo-1","prompt":"the quick brown fox"})"));
    auto resp = parse_chunked(read_all(fd, 7));
    ::close(fd);

    REQUIRE(contains(resp.head, "Content-Type: text/event-stream"));
    REQUIRE(resp.terminated);

    SSEParser parser;
    std::vector<SSEEvent> events;
    parser.feed(resp.body, [&](const SSEEvent& ev) { events.push_back(ev); return true; });
    REQUIRE(events.size() == 7); // start, 4 deltas, finish, done
    REQUIRE(events.front().event == "start");
    REQUIRE(events.back().event == "done");

    server.stop();
}

TEST_CASE("StreamServer: oversized body answered with 413", "[server]") {
    std::atomic<bool> called{false};
    StreamServer server("127.0.0.1:0", 8,
        [&](const HttpRequest&, ResponseWriter&, const CancelToken&) { called = true; });
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    send_text(fd, post_request("/v1/stream", R"({"prompt":"too long for the limit"})"));
    std::string raw = read_all(fd);
    ::close(fd);

    REQUIRE(raw.rfind("HTTP/1.1 413", 0) == 0);
    REQUIRE_FALSE(called.load());
    server.stop();
}

TEST_CASE("StreamServer: handler exception before commit becomes 500", "[server]") {
    StreamServer server("127.0.0.1:0", 1024,
        [](const HttpRequest&, ResponseWriter&, const CancelToken&) {
            throw std::runtime_error("boom");
        });
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    send_text(fd, post_request("/v1/stream", "{}"));
    std::string raw = read_all(fd);
    ::close(fd);

    REQUIRE(raw.rfind("HTTP/1.1 500", 0) == 0);
    server.stop();
}

TEST_CASE("StreamServer: client disconnect cancels the request", "[server]") {
    std::atomic<bool> entered{false};
    std::atomic<bool> cancelled{false};
    StreamServer server("127.0.0.1:0", 1024,
        [&](const HttpRequest&, ResponseWriter& out, const CancelToken& cancel) {
            out.set_header("Content-Type", "text/event-stream");
            out.commit();
            entered = true;
            cancelled = cancel.wait_for(5s);
        });
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    send_text(fd, post_request("/v1/stream", "{}"));
    REQUIRE(eventually([&]() { return entered.load(); }));
    ::close(fd);

    REQUIRE(eventually([&]() { return cancelled.load(); }));
    REQUIRE(eventually([&]() { return server.active_connections() == 0; }));
    server.stop();
}

TEST_CASE("StreamServer: stop cancels in-flight streams", "[server]") {
    std::atomic<bool> entered{false};
    std::atomic<bool> cancelled{false};
    StreamServer server("127.0.0.1:0", 1024,
        [&](const HttpRequest&, ResponseWriter&, const CancelToken& cancel) {
            entered = true;
            cancelled = cancel.wait_for(5s);
        });
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    send_text(fd, post_request("/v1/stream", "{}"));
    REQUIRE(eventually([&]() { return entered.load(); }));

    auto begin = std::chrono::steady_clock::now();
    server.stop();
    REQUIRE(std::chrono::steady_clock::now() - begin < 2s);
    REQUIRE(cancelled.load());
    ::close(fd);
}

TEST_CASE("StreamServer: cancelled stream gets no closing chunk", "[server]") {
    std::atomic<bool> entered{false};
    StreamServer server("127.0.0.1:0", 1024,
        [&](const HttpRequest&, ResponseWriter& out, const CancelToken& cancel) {
            out.set_header("Content-Type", "text/event-stream");
            out.write("data: x\n\n");
            entered = true;
            cancel.wait_for(5s);
        });
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    send_text(fd, post_request("/v1/stream", "{}"));
    REQUIRE(eventually([&]() { return entered.load(); }));
    ::shutdown(fd, SHUT_WR);

    auto resp = parse_chunked(read_all(fd));
    ::close(fd);
    REQUIRE(resp.head.rfind("HTTP/1.1 200", 0) == 0);
    REQUIRE(resp.body == "data: x\n\n");
    REQUIRE_FALSE(resp.terminated);
    server.stop();
}

// ── Backpressure ────────────────────────────────────────────────

TEST_CASE("StreamHandler: slow socket reader gets every event in order", "[server]") {
    constexpr int kDeltas = 50;
    BurstProvider provider(kDeltas);
    SSEOptions sse;
    sse.heartbeat_interval = 0ms;
    StreamHandler handler(provider, prepare_generic_request, sse, {}, 4);

    SocketPair sp;
    std::atomic<int> result{-1};
    std::thread server([&]() {
        SocketResponseWriter out(sp.server());
        HttpRequest req;
        req.method = "POST";
        req.path = "/v1/stream";
        req.body = R"({"model":"m1","prompt":"go"})";
        result = static_cast<int>(handler.serve(req, out));
        out.finish();
        ::shutdown(sp.server(), SHUT_WR);
    });

    auto resp = parse_chunked(read_all(sp.client(), 1));
    server.join();
    REQUIRE(result.load() == static_cast<int>(ServeResult::Completed));
    REQUIRE(resp.terminated);

    SSEParser parser;
    std::vector<SSEEvent> events;
    parser.feed(resp.body, [&](const SSEEvent& ev) { events.push_back(ev); return true; });
    REQUIRE(events.size() == kDeltas + 3); // start, deltas, finish, done
    REQUIRE(events.back().event == "done");

    for (int i = 0; i <= kDeltas; ++i) {
        auto data = nlohmann::json::parse(events[i].data);
        REQUIRE(data["seq"] == i + 1);
        if (i > 0) {
            REQUIRE(data["type"] == "text.delta");
            REQUIRE(data["text"] == "t" + std::to_string(i - 1));
        }
    }
}
