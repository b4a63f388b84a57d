#pragma once

#include "mbuckets/net/http.hpp"
#include "mbuckets/net/signer.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace mbuckets::net {

// libcurl transport configuration
struct CurlTransportConfig {
    // Service endpoint, e.g. "https://us-central.manta.mnx.io". Request paths
    // are appended verbatim.
    std::string base_url;

    std::string user_agent = "mbuckets/1.0";

    // Connection pooling
    size_t max_total_connections = 64;
    size_t max_idle_connections = 16;
    // How long a request waits for a handle when every one is checked out by
    // an unfinished exchange (0 = wait indefinitely)
    std::chrono::milliseconds pool_wait_timeout{30000};

    // TCP keep-alive to prevent idle connections from being dropped by firewalls/LBs
    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    // Timeouts (total 0 = no limit, for long transfers)
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{0};

    // Bytes a response may buffer ahead of its reader before the network
    // read is paused
    size_t stream_buffer_bytes = 1024 * 1024;

    // SSL
    bool verify_ssl = true;
    std::string ca_bundle;

    // Verbose libcurl tracing (for debugging)
    bool verbose = false;
};

// Transport backed by libcurl easy handles.
//
// Each exchange runs curl_easy_perform() on its own worker thread. The worker
// feeds response bytes into a bounded buffer that the ResponseBody drains;
// when the buffer is full the worker blocks, which stops reading the socket.
// Handles are returned to an idle pool for connection reuse.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const CurlTransportConfig& config,
                           std::shared_ptr<const RequestSigner> signer = nullptr);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse request(const HttpRequest& request) override;
    void close() override;

    const CurlTransportConfig& config() const;

    struct PoolStats {
        size_t active_connections = 0;
        size_t idle_connections = 0;
        size_t total_requests = 0;
        size_t failed_requests = 0;
    };
    PoolStats pool_stats() const;

    class Impl;

private:
    std::shared_ptr<Impl> impl_;
};

}  // namespace mbuckets::net
