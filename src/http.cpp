#include "mbuckets/net/http.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <charconv>

namespace mbuckets::net {

// ============================================================================
// Status and method helpers
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD:   return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) { return status / 100 == 2; }
bool is_client_error_status(int status) { return status / 100 == 4; }
bool is_server_error_status(int status) { return status / 100 == 5; }

// ============================================================================
// Encoding
// ============================================================================

namespace {

bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

}  // namespace

// RFC 3986: everything outside the unreserved set is %XX, including '/'
std::string url_encode(const std::string& str) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string base64_encode(const uint8_t* data, size_t size) {
    if (size == 0) return {};

    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data, static_cast<int>(size));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(c >= 'A' && c <= 'Z' ? c + ('a' - 'A') : c);
    });
    return lower;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    auto& values = headers_[normalize_name(name)];
    values.assign(1, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(normalize_name(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> pairs;
    for (const auto& entry : headers_) {
        for (const auto& value : entry.second) {
            pairs.emplace_back(entry.first, value);
        }
    }
    return pairs;
}

// Names present in other replace ours wholesale
void HttpHeaders::merge(const HttpHeaders& other) {
    for (const auto& entry : other.headers_) {
        headers_[entry.first] = entry.second;
    }
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("content-type", content_type);
}

void HttpHeaders::set_content_length(uint64_t length) {
    set("content-length", std::to_string(length));
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("content-type");
}

// Malformed or out-of-range values read as absent
std::optional<uint64_t> HttpHeaders::content_length() const {
    auto raw = get("content-length");
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    uint64_t length = 0;
    const char* first = raw->data();
    const char* last = first + raw->size();
    auto [ptr, ec] = std::from_chars(first, last, length);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return length;
}

// ============================================================================
// HttpResponse
// ============================================================================

std::string HttpResponse::read_body(size_t max_bytes) {
    std::string out;
    if (!body) return out;

    uint8_t buf[16 * 1024];
    while (out.size() < max_bytes) {
        size_t n = body->read(buf, std::min(sizeof(buf), max_bytes - out.size()));
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(buf), n);
    }
    discard_body();
    return out;
}

void HttpResponse::discard_body() {
    if (!body) return;
    body->abort();
    body.reset();
}

}  // namespace mbuckets::net
