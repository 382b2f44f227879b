#include "server.hpp"
#include "error.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

#ifndef POLLRDHUP
#define POLLRDHUP 0
#endif

namespace gaistream {

// ── URL helpers ─────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(qs, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else {
            result[url_decode(pair)] = "";
        }
    }
    return result;
}

// ── Address parsing ─────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        size_t used = 0;
        std::string digits = addr.substr(pos + 1);
        int p = std::stoi(digits, &used);
        if (used != digits.size() || p < 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── HTTP helpers ────────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "OK";
    }
}

static void send_plain_response(int fd, int status, const std::string& body) {
    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + body;
    if (::send(fd, resp.c_str(), resp.size(), MSG_NOSIGNAL) < 0) {
        std::cerr << "[server] Failed to send " << status << " response: "
                  << std::strerror(errno) << '\n';
    }
}

int read_http_request(int fd, uint32_t max_body, HttpRequest& req) {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[512];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return -1;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) return 400;
    }

    auto hdr_end = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover = buf.substr(hdr_end + 4);

    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return 400;
        if (ver.rfind("HTTP/", 0) != 0) return 400;
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        try {
            content_len = std::stoul(it->second);
        } catch (const std::exception&) {
            return 400;
        }
    }
    if (content_len > max_body) return 413;

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return -1;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);
    return 0;
}

// ── SocketResponseWriter ────────────────────────────────────────

void SocketResponseWriter::set_header(const std::string& name, const std::string& value) {
    if (committed_) return;
    std::string lower = to_lower(name);
    for (auto& header : headers_) {
        if (to_lower(header.first) == lower) {
            header.second = value;
            return;
        }
    }
    headers_.emplace_back(name, value);
}

void SocketResponseWriter::commit(int status) {
    if (committed_) return;
    committed_ = true;
    status_ = status;

    bool has_encoding = false;
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
    for (const auto& [name, value] : headers_) {
        std::string lower = to_lower(name);
        if (lower == "transfer-encoding") has_encoding = true;
        if (lower == "content-length" || lower == "connection") continue;
        head += name + ": " + value + "\r\n";
    }
    if (!has_encoding) head += "Transfer-Encoding: chunked\r\n";
    // One request per connection.
    head += "Connection: close\r\n\r\n";
    send_all(head);
}

void SocketResponseWriter::send_error(int status, const std::string& message) {
    if (committed_) {
        std::cerr << "[server] send_error(" << status << ") after commit ignored\n";
        return;
    }
    committed_ = true;
    finished_ = true;
    status_ = status;
    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: " + std::to_string(message.size()) + "\r\n"
        "Connection: close\r\n\r\n" + message;
    send_all(resp);
}

void SocketResponseWriter::write(const char* data, size_t len) {
    if (finished_) throw TransportError("response already finished");
    commit(200);
    if (len == 0) return;

    std::ostringstream size;
    size << std::hex << len;
    std::string chunk = size.str() + "\r\n";
    chunk.append(data, len);
    chunk += "\r\n";
    send_all(chunk);
}

void SocketResponseWriter::finish() {
    if (finished_ || broken_) return;
    commit(200);
    finished_ = true;
    send_all("0\r\n\r\n");
}

void SocketResponseWriter::send_all(const std::string& bytes) {
    if (broken_) throw TransportError("connection already failed");
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            broken_ = true;
            throw TransportError(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

// ── Disconnect detection ────────────────────────────────────────

void watch_disconnect(int client_fd, int wake_fd, CancelSource& cancel) {
    char discard[512];
    while (true) {
        struct pollfd fds[2];
        fds[0].fd = client_fd;  fds[0].events = POLLIN | POLLRDHUP;  fds[0].revents = 0;
        fds[1].fd = wake_fd;    fds[1].events = POLLIN;              fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return;
        }
        if (fds[1].revents & POLLIN) return; // request finished

        if (fds[0].revents & (POLLRDHUP | POLLHUP | POLLERR)) {
            cancel.cancel();
            return;
        }
        if (fds[0].revents & POLLIN) {
            ssize_t n = ::recv(client_fd, discard, sizeof(discard), MSG_DONTWAIT);
            if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
                cancel.cancel();
                return;
            }
        }
    }
}

// ── StreamServer ────────────────────────────────────────────────

StreamServer::StreamServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr)),
      max_body_(max_body),
      handler_(std::move(handler)) {}

StreamServer::~StreamServer() {
    stop();
}

bool StreamServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& message) {
        error = message;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }
    if (::listen(server_fd_, 64) != 0) {
        return fail(std::string("listen failed: ") + std::strerror(errno));
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    std::cerr << "[server] Listening on " << host << ":" << bound_port_ << '\n';
    return true;
}

void StreamServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] Failed to signal shutdown: " << std::strerror(errno) << '\n';
    }
    if (thread_.joinable()) thread_.join();

    std::list<std::unique_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& conn : connections) {
        if (conn->done.load()) continue;
        conn->cancel.cancel();
        // Unblocks a handler stuck in send() to a stalled client.
        ::shutdown(conn->fd, SHUT_RDWR);
    }
    for (auto& conn : connections) {
        if (conn->thread.joinable()) conn->thread.join();
        ::close(conn->fd);
    }

    if (server_fd_ >= 0)        { ::close(server_fd_);        server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0) { ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0) { ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1; }
    std::cerr << "[server] Stopped\n";
}

size_t StreamServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t active = 0;
    for (const auto& conn : connections_) {
        if (!conn->done.load()) ++active;
    }
    return active;
}

void StreamServer::reap_finished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn->thread.joinable()) conn->thread.join();
        ::close(conn->fd);
    }
}

void StreamServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;        fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0]; fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        reap_finished();
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout for the request head
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        int one = 1;
        ::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        auto conn = std::make_unique<Connection>();
        conn->fd = cfd;
        Connection* raw = conn.get();
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.push_back(std::move(conn));
        }
        raw->thread = std::thread([this, raw]() {
            handle_connection(*raw);
            raw->done.store(true);
        });
    }
}

void StreamServer::handle_connection(Connection& conn) {
    HttpRequest req;
    int status = read_http_request(conn.fd, max_body_, req);
    if (status < 0) return;
    if (status > 0) {
        send_plain_response(conn.fd, status,
                            status == 413 ? "Payload too large" : "Bad request");
        return;
    }

    int wake[2] = {-1, -1};
    std::thread watcher;
    if (::pipe(wake) == 0) {
        watcher = std::thread([&conn, &wake]() { watch_disconnect(conn.fd, wake[0], conn.cancel); });
    } else {
        std::cerr << "[server] Disconnect watcher unavailable: " << std::strerror(errno) << '\n';
    }

    SocketResponseWriter out(conn.fd);
    try {
        handler_(req, out, conn.cancel.token());
        // An abandoned stream gets no closing chunk.
        if (!conn.cancel.is_cancelled() && !out.broken()) out.finish();
    } catch (const TransportError& e) {
        std::cerr << "[server] " << req.method << " " << req.path
                  << " transport error: " << e.what() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "[server] " << req.method << " " << req.path
                  << " handler failed: " << e.what() << '\n';
        try {
            if (!out.committed()) {
                out.send_error(500, "Internal server error");
            }
        } catch (const TransportError& te) {
            std::cerr << "[server] Failed to report error: " << te.what() << '\n';
        }
    }

    if (watcher.joinable()) {
        char b = 0;
        if (::write(wake[1], &b, 1) < 0) {
            // Closing the client side still ends the watcher through POLLHUP.
            ::shutdown(conn.fd, SHUT_RDWR);
        }
        watcher.join();
    }
    if (wake[0] >= 0) ::close(wake[0]);
    if (wake[1] >= 0) ::close(wake[1]);
}

} // namespace gaistream
