#include "mbuckets/client.hpp"
#include "mbuckets/errors.hpp"
#include "mbuckets/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace mbuckets {

namespace {

constexpr const char* kDefaultContentType = "application/octet-stream";
constexpr size_t kMaxErrorBody = 64 * 1024;

enum class CallState {
    Idle,
    RequestBuilt,
    InFlight,
    Completed,
    Failed
};

const char* call_state_name(CallState state) {
    switch (state) {
        case CallState::Idle: return "idle";
        case CallState::RequestBuilt: return "request-built";
        case CallState::InFlight: return "in-flight";
        case CallState::Completed: return "completed";
        case CallState::Failed: return "failed";
    }
    return "unknown";
}

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const BucketsError& e) {
        return std::string(error_kind_name(e.kind())) + ": " + e.what();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

// Reads what it can of an error body. A connection dropped mid-body keeps the
// bytes that arrived, so the status error still reaches the caller.
std::string read_error_body(net::HttpResponse& response) {
    std::string body;
    if (!response.body) return body;

    uint8_t buf[4096];
    try {
        while (body.size() < kMaxErrorBody) {
            size_t n = response.body->read(buf, std::min(sizeof(buf), kMaxErrorBody - body.size()));
            if (n == 0) break;
            body.append(reinterpret_cast<const char*>(buf), n);
        }
    } catch (const TransportError& e) {
        log_debug("error body for status %d cut short: %s", response.status_code, e.what());
    }
    response.discard_body();
    return body;
}

// Maps a non-2xx response to the matching exception. The service's JSON error
// body ({"code": ..., "message": ...}) is used when it parses.
[[noreturn]] void throw_status_error(net::HttpResponse& response) {
    std::string body = read_error_body(response);

    std::string code;
    std::string message;
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("code") && j["code"].is_string()) {
            code = j["code"].get<std::string>();
        }
        if (j.contains("message") && j["message"].is_string()) {
            message = j["message"].get<std::string>();
        }
    }

    if (response.status_code == 404) {
        throw NotFoundError(std::move(body), response.headers, std::move(code), std::move(message));
    }
    throw HttpStatusError(response.status_code, std::move(body), response.headers,
                          std::move(code), std::move(message));
}

void apply_options(net::HttpRequest& request, const RequestOptions& options) {
    request.headers.merge(options.headers);
    if (!options.metadata.empty()) {
        request.headers.merge(encode_metadata(options.metadata));
    }
    if (!options.content_type.empty()) {
        request.headers.set_content_type(options.content_type);
    }
}

bool means_unsupported(int status) {
    return status == 400 || status == 404 || status == 405 || status == 501;
}

}  // namespace

// ============================================================================
// Call: lifecycle of one operation, logged and counted
// ============================================================================

class BucketsClient::Call {
public:
    Call(Operation op, std::shared_ptr<ClientMetrics> metrics)
        : op_(op)
        , metrics_(std::move(metrics))
        , start_(std::chrono::steady_clock::now()) {}

    void built(const net::HttpRequest& request) {
        log_debug("%s: %s %s%s%s", operation_name(op_),
                  net::http_method_to_string(request.method), request.path.c_str(),
                  request.query.empty() ? "" : "?", request.query.c_str());
        transition(CallState::RequestBuilt);
    }

    void in_flight() {
        if (state_ != CallState::InFlight) {
            transition(CallState::InFlight);
        }
    }

    void completed() {
        if (terminal()) return;
        transition(CallState::Completed);
        record(true);
    }

    void failed(const std::exception_ptr& error) {
        if (terminal()) return;
        transition(CallState::Failed);
        log_debug("%s: %s", operation_name(op_), describe(error).c_str());
        record(false);
    }

    // Closed by the caller before the body ended; counted as a failure
    void cancelled(uint64_t bytes) {
        if (terminal()) return;
        transition(CallState::Failed);
        log_debug("%s: closed after %llu bytes", operation_name(op_),
                  static_cast<unsigned long long>(bytes));
        record(false);
    }

private:
    bool terminal() const {
        return state_ == CallState::Completed || state_ == CallState::Failed;
    }

    void transition(CallState next) {
        log_debug("%s: %s -> %s", operation_name(op_), call_state_name(state_),
                  call_state_name(next));
        state_ = next;
    }

    void record(bool success) {
        if (metrics_) {
            metrics_->record_request(op_, success, std::chrono::steady_clock::now() - start_);
        }
    }

    Operation op_;
    std::shared_ptr<ClientMetrics> metrics_;
    std::chrono::steady_clock::time_point start_;
    CallState state_ = CallState::Idle;
};

// ============================================================================
// BucketsClient
// ============================================================================

BucketsClient::BucketsClient(std::shared_ptr<net::Transport> transport,
                             std::string account,
                             std::shared_ptr<ClientMetrics> metrics)
    : transport_(std::move(transport))
    , builder_(std::move(account))
    , metrics_(std::move(metrics)) {
    if (!transport_) {
        throw InvalidArgument("transport must not be null");
    }
}

void BucketsClient::ensure_open() const {
    if (closed_) {
        throw ClientClosedError();
    }
}

net::HttpResponse BucketsClient::send(Call& call, const net::HttpRequest& request) {
    call.in_flight();
    net::HttpResponse response = transport_->request(request);
    if (!response.ok()) {
        throw_status_error(response);
    }
    return response;
}

bool BucketsClient::is_buckets_supported() {
    ensure_open();
    Call call(Operation::IsBucketsSupported, metrics_);
    try {
        net::HttpRequest request = builder_.build(Operation::IsBucketsSupported).to_request();
        call.built(request);
        call.in_flight();

        net::HttpResponse response = transport_->request(request);
        bool supported = response.ok();
        if (!supported && !means_unsupported(response.status_code)) {
            throw_status_error(response);
        }
        response.read_body();
        call.completed();
        return supported;
    } catch (...) {
        call.failed(std::current_exception());
        throw;
    }
}

ResponseInfo BucketsClient::simple_call(Operation op,
                                        const std::string& bucket,
                                        const std::string& object,
                                        const RequestOptions& options,
                                        const ObjectMetadata* metadata) {
    ensure_open();
    Call call(op, metrics_);
    try {
        net::HttpRequest request = builder_.build(op, bucket, object).to_request();
        apply_options(request, options);
        if (metadata) {
            request.headers.merge(encode_metadata(*metadata));
        }
        call.built(request);

        net::HttpResponse response = send(call, request);
        ResponseInfo info{response.status_code, response.headers};
        response.read_body();
        call.completed();
        return info;
    } catch (...) {
        call.failed(std::current_exception());
        throw;
    }
}

ResponseInfo BucketsClient::create_bucket(const std::string& bucket,
                                          const RequestOptions& options) {
    return simple_call(Operation::CreateBucket, bucket, {}, options);
}

ResponseInfo BucketsClient::head_bucket(const std::string& bucket,
                                        const RequestOptions& options) {
    return simple_call(Operation::HeadBucket, bucket, {}, options);
}

ResponseInfo BucketsClient::delete_bucket(const std::string& bucket,
                                          const RequestOptions& options) {
    return simple_call(Operation::DeleteBucket, bucket, {}, options);
}

std::unique_ptr<ListStream> BucketsClient::list_buckets(const ListOptions& options) {
    return open_list(Operation::ListBuckets, {}, options);
}

ResponseInfo BucketsClient::create_bucket_object(const std::string& bucket,
                                                 const std::string& object,
                                                 net::ByteSource& payload,
                                                 const RequestOptions& options) {
    ensure_open();
    Call call(Operation::CreateBucketObject, metrics_);
    try {
        net::HttpRequest request =
            builder_.build(Operation::CreateBucketObject, bucket, object).to_request();
        apply_options(request, options);
        if (!request.headers.has("content-type")) {
            request.headers.set_content_type(kDefaultContentType);
        }

        std::optional<uint64_t> size = options.content_length;
        if (!size) {
            size = request.headers.content_length();
        }
        if (size) {
            request.headers.set_content_length(*size);
        } else {
            request.headers.remove("content-length");
        }

        GuardedSource guarded(payload, size);
        request.body = &guarded;
        request.body_size = size;
        call.built(request);

        net::HttpResponse response = send(call, request);
        ResponseInfo info{response.status_code, response.headers};
        response.read_body();
        if (metrics_) {
            metrics_->upload_bytes_total().Increment(static_cast<double>(guarded.bytes_sent()));
        }
        call.completed();
        return info;
    } catch (...) {
        call.failed(std::current_exception());
        throw;
    }
}

ResponseInfo BucketsClient::create_bucket_object(const std::string& bucket,
                                                 const std::string& object,
                                                 const std::string& data,
                                                 const RequestOptions& options) {
    StringSource source(data);
    RequestOptions sized = options;
    sized.content_length = source.size();
    return create_bucket_object(bucket, object, source, sized);
}

ResponseInfo BucketsClient::head_bucket_object(const std::string& bucket,
                                               const std::string& object,
                                               const RequestOptions& options) {
    return simple_call(Operation::HeadBucketObject, bucket, object, options);
}

ObjectReader BucketsClient::get_bucket_object(const std::string& bucket,
                                              const std::string& object,
                                              const RequestOptions& options) {
    ensure_open();
    auto call = std::make_shared<Call>(Operation::GetBucketObject, metrics_);
    try {
        net::HttpRequest request =
            builder_.build(Operation::GetBucketObject, bucket, object).to_request();
        apply_options(request, options);
        call->built(request);

        net::HttpResponse response = send(*call, request);
        auto metrics = metrics_;
        return ObjectReader(std::move(response),
                            [call, metrics](uint64_t bytes, ObjectReader::Outcome outcome,
                                            std::exception_ptr error) {
            if (metrics) {
                metrics->download_bytes_total().Increment(static_cast<double>(bytes));
            }
            switch (outcome) {
                case ObjectReader::Outcome::Finished:
                    call->completed();
                    break;
                case ObjectReader::Outcome::Cancelled:
                    call->cancelled(bytes);
                    break;
                case ObjectReader::Outcome::Failed:
                    call->failed(error);
                    break;
            }
        });
    } catch (...) {
        call->failed(std::current_exception());
        throw;
    }
}

ResponseInfo BucketsClient::put_bucket_object_metadata(const std::string& bucket,
                                                       const std::string& object,
                                                       const ObjectMetadata& metadata,
                                                       const RequestOptions& options) {
    return simple_call(Operation::PutBucketObjectMetadata, bucket, object, options, &metadata);
}

ResponseInfo BucketsClient::delete_bucket_object(const std::string& bucket,
                                                 const std::string& object,
                                                 const RequestOptions& options) {
    return simple_call(Operation::DeleteBucketObject, bucket, object, options);
}

std::unique_ptr<ListStream> BucketsClient::list_bucket_objects(const std::string& bucket,
                                                               const ListOptions& options) {
    return open_list(Operation::ListBucketObjects, bucket, options);
}

std::unique_ptr<ListStream> BucketsClient::open_list(Operation op,
                                                     const std::string& bucket,
                                                     const ListOptions& options) {
    ensure_open();
    auto call = std::make_shared<Call>(op, metrics_);
    try {
        // Validates names and options before anything is sent
        call->built(builder_.build_list(op, bucket, options).to_request());
    } catch (...) {
        call->failed(std::current_exception());
        throw;
    }

    auto fetch_page = [this, call, op, bucket, options](const std::string& marker) {
        ensure_open();
        ListOptions page = options;
        page.marker = marker;
        return send(*call, builder_.build_list(op, bucket, page).to_request());
    };

    auto metrics = metrics_;
    auto on_complete = [call, metrics](size_t records, std::exception_ptr error) {
        if (metrics) {
            metrics->list_records_total().Increment(static_cast<double>(records));
        }
        if (error) {
            call->failed(error);
        } else {
            call->completed();
        }
    };

    return std::make_unique<ListStream>(std::move(fetch_page), options.marker,
                                        options.follow_pages, std::move(on_complete));
}

// ============================================================================
// Asynchronous variants
// ============================================================================

std::future<ResponseInfo> BucketsClient::create_bucket_object_async(
    std::string bucket, std::string object,
    std::shared_ptr<net::ByteSource> payload, RequestOptions options) {
    ensure_open();
    if (!payload) {
        throw InvalidArgument("payload must not be null");
    }
    return std::async(std::launch::async,
                      [this, bucket = std::move(bucket), object = std::move(object),
                       payload = std::move(payload), options = std::move(options)] {
        return create_bucket_object(bucket, object, *payload, options);
    });
}

std::future<ObjectReader> BucketsClient::get_bucket_object_async(
    std::string bucket, std::string object, RequestOptions options) {
    ensure_open();
    return std::async(std::launch::async,
                      [this, bucket = std::move(bucket), object = std::move(object),
                       options = std::move(options)] {
        return get_bucket_object(bucket, object, options);
    });
}

std::future<ResponseInfo> BucketsClient::head_bucket_object_async(
    std::string bucket, std::string object, RequestOptions options) {
    ensure_open();
    return std::async(std::launch::async,
                      [this, bucket = std::move(bucket), object = std::move(object),
                       options = std::move(options)] {
        return head_bucket_object(bucket, object, options);
    });
}

std::future<ResponseInfo> BucketsClient::delete_bucket_object_async(
    std::string bucket, std::string object, RequestOptions options) {
    ensure_open();
    return std::async(std::launch::async,
                      [this, bucket = std::move(bucket), object = std::move(object),
                       options = std::move(options)] {
        return delete_bucket_object(bucket, object, options);
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

void BucketsClient::close() {
    if (closed_.exchange(true)) {
        return;
    }

    Call call(Operation::Close, metrics_);
    try {
        log_debug("closing client for account %s", builder_.account().c_str());
        transport_->close();
        call.completed();
    } catch (...) {
        call.failed(std::current_exception());
        throw;
    }
}

}  // namespace mbuckets
