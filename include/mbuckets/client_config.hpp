#pragma once

#include "mbuckets/net/curl_transport.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace mbuckets {

/// Connection and identity settings for a BucketsClient.
///
/// Values are layered: built-in defaults, then a JSON file (load_json), then
/// MANTA_* environment variables (apply_env), then command-line overrides set
/// directly by the caller.
struct ClientConfig {
    // Service endpoint, e.g. https://us-central.manta.mnx.io
    std::string url;

    // Identity; requests are signed when key_id is set
    std::string account;
    std::string subuser;
    std::string key_id;                 // key fingerprint
    std::filesystem::path key_file;     // PEM private key, default ~/.ssh/id_rsa

    // TLS
    bool insecure = false;              // skip certificate verification
    std::string ca_bundle;

    // HTTP
    std::string user_agent;
    size_t connect_timeout_ms = 10000;
    size_t request_timeout_ms = 0;      // 0 = no limit
    size_t max_connections = 64;
    size_t stream_buffer_bytes = 1024 * 1024;

    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Load configuration from a JSON file, overlaying onto current values.
    /// Logs the reason and returns false on error.
    bool load_json(const std::filesystem::path& path);

    /// Overlay MANTA_URL, MANTA_USER, MANTA_SUBUSER, MANTA_KEY_ID,
    /// MANTA_KEY_FILE and MANTA_TLS_INSECURE.
    void apply_env();

    /// Fill in user_agent and key_file when unset.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    net::CurlTransportConfig transport_config() const;

    /// Build a CurlTransport, with an HttpSignatureSigner when key_id is set.
    /// Throws InvalidArgument if the key cannot be loaded.
    std::shared_ptr<net::CurlTransport> make_transport() const;
};

}  // namespace mbuckets
