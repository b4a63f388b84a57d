#pragma once

#include "mbuckets/list_decoder.hpp"
#include "mbuckets/metadata.hpp"
#include "mbuckets/metrics.hpp"
#include "mbuckets/net/http.hpp"
#include "mbuckets/request_builder.hpp"
#include "mbuckets/transfer.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mbuckets {

/// Per-call request customisation.
struct RequestOptions {
    // Sent verbatim; may carry raw m-* metadata headers
    net::HttpHeaders headers;

    // Encoded as m-* headers, applied after headers
    ObjectMetadata metadata;

    std::string content_type;

    // Upload size; when unset the body is sent chunked
    std::optional<uint64_t> content_length;
};

/// Status and headers of a completed exchange.
struct ResponseInfo {
    int status_code = 0;
    net::HttpHeaders headers;

    std::optional<uint64_t> content_length() const { return headers.content_length(); }
    std::optional<std::string> content_type() const { return headers.content_type(); }
    std::optional<std::string> content_md5() const { return headers.get("content-md5"); }
    std::optional<std::string> etag() const { return headers.get("etag"); }
    ObjectMetadata metadata() const { return decode_metadata(headers); }
};

/// Client for the buckets API of one account.
///
/// Every call builds its request, sends it through the transport and maps a
/// non-2xx status to HttpStatusError (NotFoundError for 404). Nothing is
/// retried. Calls may run concurrently from any thread; each owns its request
/// and response state, and the transport's connection pool is the only shared
/// resource.
///
/// List streams, object readers and futures returned by the client refer back
/// to it and must not outlive it.
class BucketsClient {
public:
    BucketsClient(std::shared_ptr<net::Transport> transport,
                  std::string account,
                  std::shared_ptr<ClientMetrics> metrics = nullptr);

    BucketsClient(const BucketsClient&) = delete;
    BucketsClient& operator=(const BucketsClient&) = delete;

    /// HEAD on the buckets root. False if the service answers 400, 404, 405
    /// or 501; other failures throw.
    bool is_buckets_supported();

    // --- Buckets ---
    ResponseInfo create_bucket(const std::string& bucket, const RequestOptions& options = {});
    ResponseInfo head_bucket(const std::string& bucket, const RequestOptions& options = {});
    ResponseInfo delete_bucket(const std::string& bucket, const RequestOptions& options = {});
    std::unique_ptr<ListStream> list_buckets(const ListOptions& options = {});

    // --- Objects ---

    /// PUT payload as the object body. content-type defaults to
    /// application/octet-stream. A payload that throws or ends short of
    /// content_length aborts the request with PayloadStreamError.
    ResponseInfo create_bucket_object(const std::string& bucket,
                                      const std::string& object,
                                      net::ByteSource& payload,
                                      const RequestOptions& options = {});

    /// Convenience overload for an in-memory payload (content-length is set).
    ResponseInfo create_bucket_object(const std::string& bucket,
                                      const std::string& object,
                                      const std::string& data,
                                      const RequestOptions& options = {});

    ResponseInfo head_bucket_object(const std::string& bucket,
                                    const std::string& object,
                                    const RequestOptions& options = {});

    /// Returns once headers arrive; the payload is pulled from the reader.
    ObjectReader get_bucket_object(const std::string& bucket,
                                   const std::string& object,
                                   const RequestOptions& options = {});

    /// Replace user metadata without touching the object body.
    ResponseInfo put_bucket_object_metadata(const std::string& bucket,
                                            const std::string& object,
                                            const ObjectMetadata& metadata,
                                            const RequestOptions& options = {});

    ResponseInfo delete_bucket_object(const std::string& bucket,
                                      const std::string& object,
                                      const RequestOptions& options = {});

    std::unique_ptr<ListStream> list_bucket_objects(const std::string& bucket,
                                                    const ListOptions& options = {});

    // --- Asynchronous variants (run on a separate thread) ---
    std::future<ResponseInfo> create_bucket_object_async(std::string bucket,
                                                         std::string object,
                                                         std::shared_ptr<net::ByteSource> payload,
                                                         RequestOptions options = {});
    std::future<ObjectReader> get_bucket_object_async(std::string bucket,
                                                      std::string object,
                                                      RequestOptions options = {});
    std::future<ResponseInfo> head_bucket_object_async(std::string bucket,
                                                       std::string object,
                                                       RequestOptions options = {});
    std::future<ResponseInfo> delete_bucket_object_async(std::string bucket,
                                                         std::string object,
                                                         RequestOptions options = {});

    /// Close the transport. Later calls throw ClientClosedError. Idempotent.
    void close();
    bool closed() const { return closed_; }

    const RequestBuilder& builder() const { return builder_; }
    const std::shared_ptr<ClientMetrics>& metrics() const { return metrics_; }

private:
    class Call;

    void ensure_open() const;

    ResponseInfo simple_call(Operation op,
                             const std::string& bucket,
                             const std::string& object,
                             const RequestOptions& options,
                             const ObjectMetadata* metadata = nullptr);

    std::unique_ptr<ListStream> open_list(Operation op,
                                          const std::string& bucket,
                                          const ListOptions& options);

    net::HttpResponse send(Call& call, const net::HttpRequest& request);

    std::shared_ptr<net::Transport> transport_;
    RequestBuilder builder_;
    std::shared_ptr<ClientMetrics> metrics_;
    std::atomic<bool> closed_{false};
};

}  // namespace mbuckets
