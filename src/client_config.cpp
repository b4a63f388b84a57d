#include "mbuckets/client_config.hpp"
#include "mbuckets/log.hpp"
#include "mbuckets/net/signer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mbuckets {

namespace {

bool env_flag(const char* value) {
    std::string v = value;
    return v == "1" || v == "true" || v == "yes";
}

}  // namespace

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            log_error("cannot open config file: %s", path.c_str());
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("url")) url = j["url"].get<std::string>();
        if (j.contains("account")) account = j["account"].get<std::string>();
        if (j.contains("subuser")) subuser = j["subuser"].get<std::string>();
        if (j.contains("key_id")) key_id = j["key_id"].get<std::string>();
        if (j.contains("key_file")) key_file = j["key_file"].get<std::string>();
        if (j.contains("insecure")) insecure = j["insecure"].get<bool>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("connect_timeout_ms"))
            connect_timeout_ms = j["connect_timeout_ms"].get<size_t>();
        if (j.contains("request_timeout_ms"))
            request_timeout_ms = j["request_timeout_ms"].get<size_t>();
        if (j.contains("max_connections")) max_connections = j["max_connections"].get<size_t>();
        if (j.contains("stream_buffer_bytes"))
            stream_buffer_bytes = j["stream_buffer_bytes"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval"))
            metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        log_error("parsing config %s: %s", path.c_str(), e.what());
        return false;
    }
}

void ClientConfig::apply_env() {
    if (const char* v = std::getenv("MANTA_URL")) url = v;
    if (const char* v = std::getenv("MANTA_USER")) account = v;
    if (const char* v = std::getenv("MANTA_SUBUSER")) subuser = v;
    if (const char* v = std::getenv("MANTA_KEY_ID")) key_id = v;
    if (const char* v = std::getenv("MANTA_KEY_FILE")) key_file = v;
    if (const char* v = std::getenv("MANTA_TLS_INSECURE")) insecure = env_flag(v);
}

void ClientConfig::apply_defaults() {
    if (user_agent.empty()) {
        user_agent = "mbuckets/1.0";
    }
    if (key_file.empty()) {
        if (const char* home = std::getenv("HOME")) {
            key_file = std::filesystem::path(home) / ".ssh" / "id_rsa";
        }
    }
    // Trailing slash would double up with the leading slash of every path
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
}

std::string ClientConfig::validate() const {
    if (url.empty()) return "url is required (MANTA_URL)";
    if (!url.starts_with("http://") && !url.starts_with("https://"))
        return "url must start with http:// or https://: " + url;
    if (account.empty()) return "account is required (MANTA_USER)";
    if (!key_id.empty()) {
        if (key_file.empty()) return "key_file is required when key_id is set";
        if (!std::filesystem::exists(key_file))
            return "key_file does not exist: " + key_file.string();
    }
    if (stream_buffer_bytes == 0) return "stream_buffer_bytes must be > 0";
    if (max_connections == 0) return "max_connections must be > 0";
    return {};
}

net::CurlTransportConfig ClientConfig::transport_config() const {
    net::CurlTransportConfig tc;
    tc.base_url = url;
    if (!user_agent.empty()) tc.user_agent = user_agent;
    tc.max_total_connections = max_connections;
    tc.max_idle_connections = std::min<size_t>(max_connections, tc.max_idle_connections);
    tc.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    tc.request_timeout = std::chrono::milliseconds(request_timeout_ms);
    tc.stream_buffer_bytes = stream_buffer_bytes;
    tc.verify_ssl = !insecure;
    tc.ca_bundle = ca_bundle;
    return tc;
}

std::shared_ptr<net::CurlTransport> ClientConfig::make_transport() const {
    std::shared_ptr<const net::RequestSigner> signer;
    if (!key_id.empty()) {
        auto full_key_id = net::HttpSignatureSigner::make_key_id(account, subuser, key_id);
        signer = net::HttpSignatureSigner::from_key_file(full_key_id, key_file);
        log_debug("signing requests as %s", full_key_id.c_str());
    }
    return std::make_shared<net::CurlTransport>(transport_config(), std::move(signer));
}

}  // namespace mbuckets
