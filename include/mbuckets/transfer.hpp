#pragma once

#include "mbuckets/metadata.hpp"
#include "mbuckets/net/http.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <optional>
#include <string>

// Forward declaration (OpenSSL)
struct evp_md_ctx_st;

namespace mbuckets {

// ============================================================================
// Upload sources
// ============================================================================

/// In-memory payload.
class StringSource : public net::ByteSource {
public:
    explicit StringSource(std::string data) : data_(std::move(data)) {}

    size_t read(uint8_t* buffer, size_t max_len) override;
    uint64_t size() const { return data_.size(); }

private:
    std::string data_;
    size_t offset_ = 0;
};

/// Reads from a caller-owned stream. Throws std::runtime_error if the stream
/// goes bad.
class IstreamSource : public net::ByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}

    size_t read(uint8_t* buffer, size_t max_len) override;

private:
    std::istream& in_;
};

/// Reads a local file. Throws InvalidArgument if it cannot be opened.
class FileSource : public net::ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);

    size_t read(uint8_t* buffer, size_t max_len) override;
    uint64_t size() const { return size_; }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    uint64_t size_ = 0;
};

/// Wraps a caller's payload source for upload. Any exception from the inner
/// source becomes PayloadStreamError, and so does a source that ends before
/// or runs past the declared size. Either way the transport aborts the PUT.
class GuardedSource : public net::ByteSource {
public:
    GuardedSource(net::ByteSource& inner, std::optional<uint64_t> expected_size)
        : inner_(inner), expected_size_(expected_size) {}

    size_t read(uint8_t* buffer, size_t max_len) override;

    uint64_t bytes_sent() const { return sent_; }

private:
    net::ByteSource& inner_;
    std::optional<uint64_t> expected_size_;
    uint64_t sent_ = 0;
};

// ============================================================================
// Download reader
// ============================================================================

/// Pull reader over a GET response.
///
/// Headers are available before any payload byte is read. Bytes are delivered
/// verbatim and in order. A body that ends short of content-length raises
/// TransportError instead of reporting a clean end.
///
/// The reader hashes what it delivers; computed_md5() is set once the body
/// has been read to the end.
class ObjectReader {
public:
    enum class Outcome {
        Finished,   // body read to the end
        Cancelled,  // closed or destroyed before the end
        Failed      // error is set
    };

    /// Invoked once when the body ends, fails or is closed early, with the
    /// number of bytes delivered and the error for Outcome::Failed.
    using CompletionHandler =
        std::function<void(uint64_t bytes, Outcome outcome, std::exception_ptr error)>;

    explicit ObjectReader(net::HttpResponse response, CompletionHandler on_complete = nullptr);
    ~ObjectReader();

    ObjectReader(ObjectReader&& other) noexcept;
    ObjectReader& operator=(ObjectReader&& other) noexcept;
    ObjectReader(const ObjectReader&) = delete;
    ObjectReader& operator=(const ObjectReader&) = delete;

    int status_code() const { return response_.status_code; }
    const net::HttpHeaders& headers() const { return response_.headers; }
    std::optional<uint64_t> content_length() const { return response_.headers.content_length(); }
    std::optional<std::string> content_type() const { return response_.headers.content_type(); }
    std::optional<std::string> content_md5() const { return response_.headers.get("content-md5"); }
    ObjectMetadata metadata() const { return decode_metadata(response_.headers); }

    /// Up to max_len bytes; 0 at end of body or after close().
    size_t read(uint8_t* buffer, size_t max_len);

    /// Read the rest of the body.
    std::string read_all();

    /// Copy the rest of the body to out. Returns the bytes written.
    uint64_t write_to(std::ostream& out);

    /// Stop reading and release the connection. Idempotent.
    void close();

    bool eof() const { return eof_; }
    uint64_t bytes_read() const { return bytes_read_; }

    /// Base64 MD5 of the delivered bytes, once the body has been fully read.
    std::optional<std::string> computed_md5() const { return computed_md5_; }

    /// True if computed_md5() equals the content-md5 header. False when either
    /// is missing.
    bool matches_content_md5() const;

private:
    void complete(Outcome outcome, std::exception_ptr error = nullptr);

    net::HttpResponse response_;
    CompletionHandler on_complete_;
    evp_md_ctx_st* md5_ctx_ = nullptr;
    uint64_t bytes_read_ = 0;
    bool eof_ = false;
    bool completed_ = false;
    std::optional<std::string> computed_md5_;
};

}  // namespace mbuckets
