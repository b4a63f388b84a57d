#include "mbuckets/list_decoder.hpp"
#include "mbuckets/errors.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace mbuckets {

const char* record_type_name(RecordType type) {
    switch (type) {
        case RecordType::Bucket: return "bucket";
        case RecordType::BucketObject: return "bucketobject";
        case RecordType::Group: return "group";
    }
    return "unknown";
}

// ============================================================================
// Record decoding
// ============================================================================

namespace {

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw DecodeError(std::string("listing field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

std::string required_string(const nlohmann::json& j, const char* key, const char* type) {
    auto value = optional_string(j, key);
    if (!value) {
        throw DecodeError(std::string(type) + " record is missing '" + key + "'");
    }
    return *value;
}

// YYYY-MM-DDTHH:MM:SS.mmmZ; 'd' marks a digit
bool is_listing_timestamp(const std::string& value) {
    static constexpr char kShape[] = "dddd-dd-ddTdd:dd:dd.dddZ";
    if (value.size() != sizeof(kShape) - 1) return false;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (kShape[i] == 'd' ? (c < '0' || c > '9') : c != kShape[i]) return false;
    }
    return true;
}

RecordType parse_type(const nlohmann::json& j) {
    auto type = optional_string(j, "type");
    if (!type || *type == "bucket") return RecordType::Bucket;
    if (*type == "bucketobject") return RecordType::BucketObject;
    if (*type == "group") return RecordType::Group;
    throw DecodeError("unknown listing record type '" + *type + "'");
}

}  // namespace

ListingRecord decode_listing_record(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("malformed listing line: ") + e.what());
    }
    if (!j.is_object()) {
        throw DecodeError("listing line is not a JSON object");
    }

    ListingRecord record;
    record.raw = line;
    record.type = parse_type(j);
    const char* type_name = record_type_name(record.type);
    record.name = required_string(j, "name", type_name);

    if (record.type != RecordType::BucketObject) {
        record.mtime = optional_string(j, "mtime").value_or("");
        return record;
    }

    record.mtime = required_string(j, "mtime", type_name);
    if (!is_listing_timestamp(record.mtime)) {
        throw DecodeError("bucketobject 'mtime' is not an ISO-8601 timestamp: '" +
                          record.mtime + "'");
    }
    record.etag = required_string(j, "etag", type_name);
    record.content_type = required_string(j, "contentType", type_name);
    record.content_md5 = required_string(j, "contentMD5", type_name);

    auto size = j.find("size");
    if (size == j.end()) {
        throw DecodeError("bucketobject record is missing 'size'");
    }
    if (size->is_number_unsigned()) {
        record.size = size->get<uint64_t>();
    } else if (size->is_number_integer() && size->get<int64_t>() >= 0) {
        record.size = static_cast<uint64_t>(size->get<int64_t>());
    } else {
        throw DecodeError("bucketobject 'size' is not a non-negative integer");
    }

    return record;
}

// ============================================================================
// LineSplitter
// ============================================================================

void LineSplitter::feed(const char* data, size_t len, std::deque<std::string>& lines) {
    size_t start = 0;
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != '\n') continue;

        partial_.append(data + start, i - start);
        start = i + 1;

        if (!partial_.empty() && partial_.back() == '\r') {
            partial_.pop_back();
        }
        if (!partial_.empty()) {
            lines.push_back(std::move(partial_));
        }
        partial_.clear();
    }
    partial_.append(data + start, len - start);
}

std::optional<std::string> LineSplitter::finish() {
    std::string tail = std::move(partial_);
    partial_.clear();
    if (!tail.empty() && tail.back() == '\r') {
        tail.pop_back();
    }
    if (tail.empty()) {
        return std::nullopt;
    }
    return tail;
}

// ============================================================================
// ListStream
// ============================================================================

ListStream::ListStream(PageFetcher fetch_page,
                       std::string start_marker,
                       bool follow_pages,
                       CompletionHandler on_complete,
                       size_t read_chunk)
    : fetch_page_(std::move(fetch_page)),
      on_complete_(std::move(on_complete)),
      read_chunk_(read_chunk == 0 ? kDefaultReadChunk : read_chunk),
      follow_pages_(follow_pages),
      marker_(std::move(start_marker)) {}

ListStream::~ListStream() {
    close();
}

std::optional<ListingRecord> ListStream::next() {
    if (finished_) {
        return std::nullopt;
    }

    try {
        if (lines_.empty() && !fill()) {
            finish(nullptr);
            return std::nullopt;
        }

        std::string line = std::move(lines_.front());
        lines_.pop_front();
        ListingRecord record = decode_listing_record(line);
        ++delivered_;
        return record;
    } catch (...) {
        // End the sequence, then let the caller see the error
        finish(std::current_exception());
        throw;
    }
}

std::vector<ListingRecord> ListStream::collect() {
    std::vector<ListingRecord> records;
    while (auto record = next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

void ListStream::close() {
    finish(nullptr);
}

// Reads until at least one complete line is queued. False at the end of the
// last page.
bool ListStream::fill() {
    while (true) {
        if (!page_active_ && !start_next_page()) {
            return false;
        }

        if (page_.body) {
            if (buffer_.size() != read_chunk_) {
                buffer_.resize(read_chunk_);
            }
            size_t n = page_.body->read(buffer_.data(), buffer_.size());
            if (n > 0) {
                splitter_.feed(reinterpret_cast<const char*>(buffer_.data()), n, lines_);
                if (!lines_.empty()) {
                    return true;
                }
                continue;
            }
        }

        // Page drained; an unterminated last line still counts
        if (auto tail = splitter_.finish()) {
            lines_.push_back(std::move(*tail));
        }
        page_.body.reset();
        page_active_ = false;
        if (!lines_.empty()) {
            return true;
        }
    }
}

bool ListStream::start_next_page() {
    if (started_) {
        if (!follow_pages_ || !next_marker_) {
            return false;
        }
        if (*next_marker_ == marker_) {
            throw DecodeError("listing next-marker did not advance past '" + marker_ + "'");
        }
        marker_ = *next_marker_;
    }
    started_ = true;

    page_ = fetch_page_(marker_);
    page_active_ = true;
    ++pages_;

    next_marker_ = page_.headers.get("next-marker");
    if (next_marker_ && next_marker_->empty()) {
        next_marker_.reset();
    }
    return true;
}

void ListStream::finish(std::exception_ptr error) {
    if (finished_) {
        return;
    }
    finished_ = true;
    page_active_ = false;

    if (page_.body) {
        page_.body->abort();
        page_.body.reset();
    }
    lines_.clear();
    splitter_.finish();

    if (on_complete_) {
        on_complete_(delivered_, error);
    }
}

}  // namespace mbuckets
