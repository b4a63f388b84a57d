#include "mbuckets/metrics.hpp"
#include "mbuckets/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace mbuckets {

ClientMetrics::ClientMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& requests_family = prometheus::BuildCounter()
        .Name("mbuckets_requests_total")
        .Help("Total client operations completed")
        .Labels(labels)
        .Register(*registry_);

    auto& duration_family = prometheus::BuildHistogram()
        .Name("mbuckets_request_duration_seconds")
        .Help("Client operation duration in seconds")
        .Labels(labels)
        .Register(*registry_);

    for (Operation op : kAllOperations) {
        const std::string name = operation_name(op);
        requests_[op] = {
            &requests_family.Add({{"operation", name}, {"result", "success"}}),
            &requests_family.Add({{"operation", name}, {"result", "failure"}}),
        };
        durations_[op] = &duration_family.Add(
            {{"operation", name}},
            prometheus::Histogram::BucketBoundaries{
                0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 300});
    }

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("mbuckets_upload_bytes_total")
        .Help("Total object bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("mbuckets_download_bytes_total")
        .Help("Total object bytes downloaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    list_records_total_ = &prometheus::BuildCounter()
        .Name("mbuckets_list_records_total")
        .Help("Total listing records decoded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});
}

ClientMetrics::~ClientMetrics() {
    stop_writer();
}

void ClientMetrics::record_request(Operation op, bool success,
                                   std::chrono::steady_clock::duration elapsed) {
    requests(op, success).Increment();
    request_duration(op).Observe(std::chrono::duration<double>(elapsed).count());
}

prometheus::Counter& ClientMetrics::requests(Operation op, bool success) {
    auto& pair = requests_.at(op);
    return success ? *pair.first : *pair.second;
}

prometheus::Histogram& ClientMetrics::request_duration(Operation op) {
    return *durations_.at(op);
}

std::string ClientMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void ClientMetrics::start_writer(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds interval) {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
        prom_file_path_ = prom_file_path;
        write_interval_ = interval;
    }
    writer_thread_ = std::thread(&ClientMetrics::writer_loop, this);
}

void ClientMetrics::stop_writer() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        write_file(prom_file_path_);
    }
}

void ClientMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file(prom_file_path_);
    }
}

bool ClientMetrics::write_file(const std::filesystem::path& path) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) {
        log_error("Failed writing metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        log_error("Cannot rename %s: %s", tmp_path.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace mbuckets
