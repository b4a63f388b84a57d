#include "mbuckets/net/curl_transport.hpp"
#include "mbuckets/errors.hpp"
#include "mbuckets/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace mbuckets::net {

// ============================================================================
// Per-request exchange state shared by the worker and the response body
// ============================================================================

namespace {

struct Exchange {
    std::shared_ptr<CurlTransport::Impl> owner;
    CURL* curl = nullptr;
    struct curl_slist* header_list = nullptr;
    ByteSource* upload = nullptr;
    std::exception_ptr upload_error;
    std::string method;
    std::string url;
    char error_buf[CURL_ERROR_SIZE] = {0};

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<uint8_t>> chunks;
    size_t front_offset = 0;
    size_t buffered = 0;
    size_t max_buffered = 0;
    bool headers_ready = false;
    bool done = false;
    bool aborted = false;
    CURLcode result = CURLE_OK;
    int status_code = 0;
    HttpHeaders headers;

    std::thread worker;
    std::once_flag join_once;

    void join() {
        std::call_once(join_once, [this] {
            if (worker.joinable()) {
                worker.join();
            }
        });
    }

    // Caller holds mutex
    [[noreturn]] void throw_failure() const {
        if (upload_error) {
            std::rethrow_exception(upload_error);
        }
        std::string detail = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(result);
        throw TransportError(method + " " + url + ": " + detail,
                             result == CURLE_OPERATION_TIMEDOUT);
    }
};

// ============================================================================
// CURL callback functions
// ============================================================================

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    std::lock_guard<std::mutex> lock(ex->mutex);

    // Status line starts a new header block (interim 1xx responses come first)
    if (line.starts_with("HTTP/")) {
        ex->headers.clear();
        ex->status_code = 0;
        size_t sp = line.find(' ');
        if (sp != std::string::npos) {
            try {
                ex->status_code = std::stoi(line.substr(sp + 1, 3));
            } catch (const std::exception&) {
                ex->status_code = 0;
            }
        }
        return bytes;
    }

    // Blank line ends the block; final responses make headers visible
    if (line.empty()) {
        if (ex->status_code >= 200) {
            ex->headers_ready = true;
            ex->cv.notify_all();
        }
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        size_t end = value.find_last_not_of(" \t");
        value = (start == std::string::npos) ? "" : value.substr(start, end - start + 1);

        ex->headers.add(name, value);
    }

    return bytes;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t bytes = size * nmemb;

    std::unique_lock<std::mutex> lock(ex->mutex);

    // Backpressure: hold the transfer until the reader drains the buffer
    ex->cv.wait(lock, [ex] { return ex->aborted || ex->buffered < ex->max_buffered; });
    if (ex->aborted) {
        return 0;  // Signals error and aborts transfer
    }

    ex->headers_ready = true;
    ex->chunks.emplace_back(ptr, ptr + bytes);
    ex->buffered += bytes;
    ex->cv.notify_all();
    return bytes;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    {
        std::lock_guard<std::mutex> lock(ex->mutex);
        if (ex->aborted) {
            return CURL_READFUNC_ABORT;
        }
    }
    if (!ex->upload) {
        return 0;
    }

    try {
        return ex->upload->read(reinterpret_cast<uint8_t*>(buffer), size * nitems);
    } catch (...) {
        // Exceptions must not cross libcurl; rethrown to the caller once the
        // transfer unwinds
        std::lock_guard<std::mutex> lock(ex->mutex);
        ex->upload_error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ex = static_cast<Exchange*>(clientp);
    std::lock_guard<std::mutex> lock(ex->mutex);
    return ex->aborted ? 1 : 0;  // Non-zero aborts a stalled transfer
}

// ============================================================================
// CurlResponseBody
// ============================================================================

class CurlResponseBody : public ResponseBody {
public:
    explicit CurlResponseBody(std::shared_ptr<Exchange> exchange)
        : ex_(std::move(exchange)) {}

    ~CurlResponseBody() override {
        abort();
    }

    size_t read(uint8_t* buffer, size_t max_len) override {
        if (max_len == 0) return 0;

        std::unique_lock<std::mutex> lock(ex_->mutex);
        ex_->cv.wait(lock, [this] {
            return !ex_->chunks.empty() || ex_->done || ex_->aborted;
        });

        if (!ex_->chunks.empty()) {
            auto& front = ex_->chunks.front();
            size_t n = std::min(max_len, front.size() - ex_->front_offset);
            std::memcpy(buffer, front.data() + ex_->front_offset, n);
            ex_->front_offset += n;
            if (ex_->front_offset == front.size()) {
                ex_->chunks.pop_front();
                ex_->front_offset = 0;
            }
            ex_->buffered -= n;
            ex_->cv.notify_all();
            return n;
        }

        if (ex_->aborted) {
            return 0;
        }
        if (ex_->result != CURLE_OK) {
            ex_->throw_failure();
        }
        return 0;
    }

    void abort() override {
        {
            std::lock_guard<std::mutex> lock(ex_->mutex);
            ex_->aborted = true;
        }
        ex_->cv.notify_all();
        ex_->join();
    }

private:
    std::shared_ptr<Exchange> ex_;
};

}  // namespace

// ============================================================================
// CurlTransport::Impl
// ============================================================================

class CurlTransport::Impl {
public:
    Impl(const CurlTransportConfig& config, std::shared_ptr<const RequestSigner> signer)
        : config_(config), signer_(std::move(signer)) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        if (config_.stream_buffer_bytes == 0) {
            config_.stream_buffer_bytes = 1;
        }
    }

    ~Impl() {
        close();
    }

    void close() {
        closed_ = true;

        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
        stats_.idle_connections = 0;
        pool_cv_.notify_all();
    }

    // Acquire a handle from the pool or create a new one. At capacity, waits
    // for an exchange to release its handle.
    CURL* acquire_handle() {
        std::unique_lock<std::mutex> lock(pool_mutex_);

        auto available = [this] {
            return closed_ || !idle_handles_.empty() ||
                   stats_.active_connections < config_.max_total_connections;
        };
        if (config_.pool_wait_timeout.count() > 0) {
            if (!pool_cv_.wait_for(lock, config_.pool_wait_timeout, available)) {
                throw TransportError("timed out waiting for a pooled connection", true);
            }
        } else {
            pool_cv_.wait(lock, available);
        }
        if (closed_) {
            throw TransportError("transport is closed");
        }

        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            stats_.idle_connections = idle_handles_.size();
            stats_.active_connections++;
            return handle;
        }

        CURL* handle = curl_easy_init();
        if (handle) {
            stats_.active_connections++;
        }
        return handle;
    }

    // Return a handle to the pool
    void release_handle(CURL* handle, bool succeeded) {
        if (!handle) return;

        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            stats_.active_connections--;
            stats_.total_requests++;
            if (!succeeded) {
                stats_.failed_requests++;
            }

            if (closed_ || idle_handles_.size() >= config_.max_idle_connections) {
                curl_easy_cleanup(handle);
            } else {
                // Reset handle for reuse; the connection cache survives the reset
                curl_easy_reset(handle);
                idle_handles_.push_back(handle);
                stats_.idle_connections = idle_handles_.size();
            }
        }
        pool_cv_.notify_one();
    }

    HttpResponse execute(const HttpRequest& request, const std::shared_ptr<Impl>& self) {
        if (closed_) {
            throw TransportError("transport is closed");
        }

        HttpRequest signed_request = request;
        if (signer_) {
            signer_->sign(signed_request);
        } else if (!signed_request.headers.has("date")) {
            signed_request.headers.set("date", http_date(std::chrono::system_clock::now()));
        }

        CURL* curl = acquire_handle();
        if (!curl) {
            throw TransportError("curl_easy_init failed");
        }

        auto ex = std::make_shared<Exchange>();
        ex->owner = self;
        ex->curl = curl;
        ex->upload = request.body;
        ex->max_buffered = config_.stream_buffer_bytes;
        ex->method = http_method_to_string(request.method);
        ex->url = config_.base_url + request.path;
        if (!request.query.empty()) {
            ex->url += "?" + request.query;
        }

        configure(*ex, signed_request);

        log_debug("%s %s", ex->method.c_str(), ex->url.c_str());

        ex->worker = std::thread([ex]() { run(ex); });

        HttpResponse response;
        {
            std::unique_lock<std::mutex> lock(ex->mutex);
            ex->cv.wait(lock, [&ex] { return ex->headers_ready; });

            if (ex->done && ex->result != CURLE_OK) {
                lock.unlock();
                ex->join();
                std::lock_guard<std::mutex> relock(ex->mutex);
                ex->throw_failure();
            }

            response.status_code = ex->status_code;
            response.headers = ex->headers;
        }
        response.body = std::make_unique<CurlResponseBody>(ex);
        return response;
    }

    const CurlTransportConfig& config() const { return config_; }

    PoolStats pool_stats() const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return stats_;
    }

private:
    void configure(Exchange& ex, const HttpRequest& request) {
        CURL* curl = ex.curl;

        curl_easy_setopt(curl, CURLOPT_URL, ex.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, ex.error_buf);

        // Method
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &ex);
                if (!request.body) {
                    // Empty-body PUT: send Content-Length: 0 rather than chunked
                    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
                } else if (request.body_size) {
                    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                     static_cast<curl_off_t>(*request.body_size));
                }
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        // Headers; libcurl derives Content-Length from INFILESIZE
        for (const auto& [name, value] : request.headers.all()) {
            if (name == "content-length") continue;
            std::string header = name + ": " + value;
            ex.header_list = curl_slist_append(ex.header_list, header.c_str());
        }
        if (request.method == HttpMethod::PUT) {
            // Send the body immediately instead of waiting for 100-continue
            ex.header_list = curl_slist_append(ex.header_list, "Expect:");
            if (request.body && !request.body_size) {
                ex.header_list = curl_slist_append(ex.header_list, "Transfer-Encoding: chunked");
            }
        }
        if (ex.header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, ex.header_list);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Response callbacks
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ex);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ex);

        // Progress callback doubles as the abort check for stalled transfers
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ex);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        // Timeouts
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.request_timeout.count()));

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }
    }

    static void run(std::shared_ptr<Exchange> ex) {
        CURLcode res = curl_easy_perform(ex->curl);

        long response_code = 0;
        curl_easy_getinfo(ex->curl, CURLINFO_RESPONSE_CODE, &response_code);

        {
            std::lock_guard<std::mutex> lock(ex->mutex);
            ex->result = res;
            if (ex->status_code == 0) {
                ex->status_code = static_cast<int>(response_code);
            }
            ex->done = true;
            ex->headers_ready = true;
        }
        ex->cv.notify_all();

        if (res != CURLE_OK && res != CURLE_WRITE_ERROR && res != CURLE_ABORTED_BY_CALLBACK) {
            log_debug("%s %s failed: %s", ex->method.c_str(), ex->url.c_str(),
                      curl_easy_strerror(res));
        }

        if (ex->header_list) {
            curl_slist_free_all(ex->header_list);
            ex->header_list = nullptr;
        }
        ex->owner->release_handle(ex->curl, res == CURLE_OK);
        ex->curl = nullptr;
    }

    CurlTransportConfig config_;
    std::shared_ptr<const RequestSigner> signer_;
    std::atomic<bool> closed_{false};

    // Connection pool
    mutable std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<CURL*> idle_handles_;
    PoolStats stats_;
};

// ============================================================================
// CurlTransport public interface
// ============================================================================

CurlTransport::CurlTransport(const CurlTransportConfig& config,
                             std::shared_ptr<const RequestSigner> signer)
    : impl_(std::make_shared<Impl>(config, std::move(signer))) {}

CurlTransport::~CurlTransport() {
    impl_->close();
}

HttpResponse CurlTransport::request(const HttpRequest& request) {
    return impl_->execute(request, impl_);
}

void CurlTransport::close() {
    impl_->close();
}

const CurlTransportConfig& CurlTransport::config() const {
    return impl_->config();
}

CurlTransport::PoolStats CurlTransport::pool_stats() const {
    return impl_->pool_stats();
}

}  // namespace mbuckets::net
