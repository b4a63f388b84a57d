#pragma once

#include "mbuckets/request_builder.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace mbuckets {

/// Client-side request metrics.
///
/// Owns a prometheus::Registry with one request counter and one latency
/// histogram per operation, plus byte and record totals. serialize() renders
/// the text exposition format; start_writer() additionally writes it to a
/// .prom file on an interval using atomic temp+rename, for node_exporter's
/// textfile collector.
class ClientMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit ClientMetrics(const std::map<std::string, std::string>& labels = {});
    ~ClientMetrics();

    ClientMetrics(const ClientMetrics&) = delete;
    ClientMetrics& operator=(const ClientMetrics&) = delete;

    /// Count one finished call and observe its duration.
    void record_request(Operation op, bool success, std::chrono::steady_clock::duration elapsed);

    prometheus::Counter& requests(Operation op, bool success);
    prometheus::Histogram& request_duration(Operation op);
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& list_records_total() { return *list_records_total_; }

    std::shared_ptr<prometheus::Registry> registry() const { return registry_; }

    /// Text exposition of every metric family.
    std::string serialize() const;

    /// Start writing prom_file_path every interval. No-op if already running.
    void start_writer(const std::filesystem::path& prom_file_path,
                      std::chrono::seconds interval);

    /// Stop the writer thread, writing one final snapshot.
    void stop_writer();

    /// Write the exposition to path via path.tmp and rename. False on failure.
    bool write_file(const std::filesystem::path& path) const;

private:
    void writer_loop();

    std::shared_ptr<prometheus::Registry> registry_;

    std::map<Operation, std::pair<prometheus::Counter*, prometheus::Counter*>> requests_;
    std::map<Operation, prometheus::Histogram*> durations_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* list_records_total_;

    // Writer thread
    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_{15};
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace mbuckets
