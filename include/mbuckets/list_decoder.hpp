#pragma once

#include "mbuckets/net/http.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mbuckets {

enum class RecordType {
    Bucket,
    BucketObject,
    Group       // common prefix, returned when a delimiter is set
};

const char* record_type_name(RecordType type);

/// One line of a bucket or object listing.
///
/// Bucket records always have a name. BucketObject records have every field;
/// a line that claims that type but lacks one is rejected with DecodeError.
struct ListingRecord {
    std::string name;
    RecordType type = RecordType::Bucket;
    std::string mtime;
    std::string etag;
    std::optional<uint64_t> size;
    std::string content_type;
    std::string content_md5;

    std::string raw;    // the JSON line as received
};

/// Decode one listing line. Throws DecodeError.
ListingRecord decode_listing_record(const std::string& line);

/// Splits a byte stream into LF-terminated lines. A trailing CR is dropped and
/// blank lines are skipped. Bytes after the last LF are held until more data
/// arrives or finish() is called.
class LineSplitter {
public:
    void feed(const char* data, size_t len, std::deque<std::string>& lines);

    /// The unterminated tail, if any. Resets the splitter.
    std::optional<std::string> finish();

    size_t pending_bytes() const { return partial_.size(); }

private:
    std::string partial_;
};

/// Lazy, pull-based sequence of listing records.
///
/// The response body is read only when no decoded record is waiting, so a
/// slow consumer stops the transport from reading the socket. At most one
/// read chunk of records plus one partial line is held in memory.
///
/// The first page is requested on the first call to next(). When a page's
/// response carries a next-marker header and follow_pages is set, the next
/// page is fetched once the current one is drained.
///
/// A DecodeError or TransportError ends the sequence; records already returned
/// stay valid. After the end, next() keeps returning std::nullopt.
class ListStream {
public:
    /// Issues the request for one page, starting after marker (empty for the
    /// first page). Must return a 2xx response or throw.
    using PageFetcher = std::function<net::HttpResponse(const std::string& marker)>;

    /// Invoked exactly once when the sequence ends, with the number of records
    /// delivered and the error (null on a clean end or close()).
    using CompletionHandler = std::function<void(size_t records, std::exception_ptr error)>;

    static constexpr size_t kDefaultReadChunk = 64 * 1024;

    ListStream(PageFetcher fetch_page,
               std::string start_marker,
               bool follow_pages,
               CompletionHandler on_complete = nullptr,
               size_t read_chunk = kDefaultReadChunk);
    ~ListStream();

    ListStream(const ListStream&) = delete;
    ListStream& operator=(const ListStream&) = delete;
    ListStream(ListStream&&) = delete;
    ListStream& operator=(ListStream&&) = delete;

    /// Next record, or std::nullopt once the listing is exhausted.
    std::optional<ListingRecord> next();

    /// Drain the remaining records.
    std::vector<ListingRecord> collect();

    /// Abort the in-flight page and end the sequence. Idempotent.
    void close();

    bool finished() const { return finished_; }
    size_t records_delivered() const { return delivered_; }
    size_t pages_fetched() const { return pages_; }

private:
    bool fill();
    bool start_next_page();
    void finish(std::exception_ptr error);

    PageFetcher fetch_page_;
    CompletionHandler on_complete_;
    size_t read_chunk_;
    bool follow_pages_;

    std::string marker_;
    std::optional<std::string> next_marker_;
    bool started_ = false;
    bool page_active_ = false;
    bool finished_ = false;
    size_t delivered_ = 0;
    size_t pages_ = 0;

    net::HttpResponse page_;
    LineSplitter splitter_;
    std::deque<std::string> lines_;
    std::vector<uint8_t> buffer_;
};

}  // namespace mbuckets
