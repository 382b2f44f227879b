#pragma once
#include "cancel.hpp"
#include "response.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gaistream {

// ResponseWriter over a connected socket. Bodies use chunked transfer
// encoding; send failures raise TransportError. Does not own the fd.
class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    using ResponseWriter::write;

    void set_header(const std::string& name, const std::string& value) override;
    void commit(int status = 200) override;
    void send_error(int status, const std::string& message) override;
    void write(const char* data, size_t len) override;
    void flush() override {}
    bool committed() const override { return committed_; }

    // Terminate the chunked body. Commits an empty 200 if nothing was sent.
    // No-op once a send has failed.
    void finish();

    int status() const { return status_; }

    // A send failed; nothing more is written to the socket.
    bool broken() const { return broken_; }

private:
    void send_all(const std::string& bytes);

    int fd_;
    std::vector<Header> headers_;
    bool committed_ = false;
    bool finished_ = false;
    bool broken_ = false;
    int status_ = 0;
};

// Minimal HTTP/1.1 server for streaming responses. One thread per
// connection, one request per connection; the accept loop runs in a
// background thread. Client hang-ups cancel the request's CancelToken.
class StreamServer {
public:
    using Handler = std::function<void(const HttpRequest& req, ResponseWriter& out,
                                       const CancelToken& cancel)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8080"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    StreamServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, cancel in-flight requests and join every thread. Idempotent.
    void stop();

    // Port actually bound (useful with port 0).
    uint16_t port() const { return bound_port_; }

    size_t active_connections() const;

private:
    struct Connection {
        int fd = -1;
        CancelSource cancel;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void accept_loop();
    void handle_connection(Connection& conn);
    void reap_finished();

    std::string listen_addr_;
    uint32_t max_body_;
    Handler handler_;

    int server_fd_ = -1;
    int shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted (ephemeral).
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Blocks until the peer hangs up or `wake_fd` becomes readable, then cancels
// `cancel` on hang-up. Extra bytes sent by the peer are discarded.
void watch_disconnect(int client_fd, int wake_fd, CancelSource& cancel);

// Parse the request head and body from `fd`. Returns 0 on success, or the
// HTTP status to reply with (400, 413). Returns -1 if the peer went away.
int read_http_request(int fd, uint32_t max_body, HttpRequest& req);

} // namespace gaistream
