#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mbuckets::net {

// HTTP methods used by the buckets API
enum class HttpMethod {
    GET,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_client_error_status(int status);
bool is_server_error_status(int status);

// HTTP headers (case-insensitive, names stored lowercase)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    // Iteration
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    // Overwrite with every header from other
    void merge(const HttpHeaders& other);

    // Common headers
    void set_content_type(const std::string& content_type);
    void set_content_length(uint64_t length);

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

    static std::string normalize_name(const std::string& name);

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

// A finite, non-rewindable byte stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Reads up to max_len bytes into buffer. Returns 0 at end of stream.
    // Throws on I/O errors.
    virtual size_t read(uint8_t* buffer, size_t max_len) = 0;
};

// Pull reader over a response body that is still arriving from the network.
// read() blocks until bytes are available, the body ends, or the exchange
// fails (TransportError).
class ResponseBody : public ByteSource {
public:
    // Stop the exchange and release its connection. Idempotent.
    virtual void abort() = 0;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;   // already percent-encoded
    std::string query;  // without leading '?'
    HttpHeaders headers;

    // Streaming request body (not owned). Must outlive the response.
    ByteSource* body = nullptr;
    std::optional<uint64_t> body_size;
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::unique_ptr<ResponseBody> body;  // null when the response has none

    bool ok() const { return is_success_status(status_code); }

    // Drain the body into a string, stopping after max_bytes.
    std::string read_body(size_t max_bytes = 64 * 1024);

    // Abort and drop the body.
    void discard_body();
};

// Authenticated HTTP exchange used by the client core.
// Implementations are thread-safe: many requests may be in flight at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Perform one exchange. Returns once the response status and headers are
    // known; the body is pulled lazily. Throws TransportError on network failure.
    virtual HttpResponse request(const HttpRequest& request) = 0;

    // Release pooled connections. Further requests fail with TransportError.
    virtual void close() = 0;
};

// URL encoding (RFC 3986 unreserved set passes through)
std::string url_encode(const std::string& str);

// Base64 encoding
std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const std::string& str);

}  // namespace mbuckets::net
