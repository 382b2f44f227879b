#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gaistream {

using Header = std::pair<std::string, std::string>;

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;
    std::string path;                                // without the query string
    std::map<std::string, std::string> query_params; // URL-decoded
    std::map<std::string, std::string> headers;      // names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Case-insensitive header lookup, or "" if absent.
    std::string header(const std::string& name) const;
};

// Server side of one HTTP response (injectable for testing).
//
// Headers may be set until commit(). After commit the status line and headers
// are on the wire and cannot be changed; only body bytes may follow. Body
// writes and flushes throw TransportError when the peer is gone.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void set_header(const std::string& name, const std::string& value) = 0;

    // Send status line and headers. No-op once committed.
    virtual void commit(int status = 200) = 0;

    // Complete non-streaming response. Only valid before commit.
    virtual void send_error(int status, const std::string& message) = 0;

    // Append body bytes; commits with 200 if not yet committed.
    virtual void write(const char* data, size_t len) = 0;

    // Push buffered body bytes to the peer.
    virtual void flush() = 0;

    virtual bool committed() const = 0;

    void write(const std::string& s) { write(s.data(), s.size()); }
};

// Output buffer owned by a protocol writer. Bytes accumulate until flush()
// or until the configured size is reached.
class ResponseBuffer {
public:
    ResponseBuffer(ResponseWriter& out, size_t capacity);

    void append(const std::string& s);

    // Drain buffered bytes to the response and flush the transport.
    void flush();

    size_t pending() const { return buffer_.size(); }

private:
    void drain();

    ResponseWriter& out_;
    size_t capacity_;
    std::string buffer_;
};

// Response headers shared by both streaming transports.
std::vector<Header> streaming_headers(const std::string& content_type);

} // namespace gaistream
