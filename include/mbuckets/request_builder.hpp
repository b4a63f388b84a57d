#pragma once

#include "mbuckets/net/http.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace mbuckets {

/// Every public client operation. operation_name() switches over all of them,
/// so a new enumerator without a name is a compiler warning (-Wswitch).
enum class Operation {
    IsBucketsSupported,
    CreateBucket,
    HeadBucket,
    DeleteBucket,
    ListBuckets,
    CreateBucketObject,
    HeadBucketObject,
    GetBucketObject,
    PutBucketObjectMetadata,
    DeleteBucketObject,
    ListBucketObjects,
    Close
};

inline constexpr std::array<Operation, 12> kAllOperations = {
    Operation::IsBucketsSupported,
    Operation::CreateBucket,
    Operation::HeadBucket,
    Operation::DeleteBucket,
    Operation::ListBuckets,
    Operation::CreateBucketObject,
    Operation::HeadBucketObject,
    Operation::GetBucketObject,
    Operation::PutBucketObjectMetadata,
    Operation::DeleteBucketObject,
    Operation::ListBucketObjects,
    Operation::Close,
};

const char* operation_name(Operation op);

/// Paging and filtering for bucket and object listings.
struct ListOptions {
    std::string prefix;
    std::string delimiter;
    std::string marker;                 // start after this name
    std::optional<uint32_t> limit;      // page size, 1..kMaxListLimit
    bool follow_pages = true;           // fetch further pages via next-marker

    static constexpr uint32_t kMaxListLimit = 1024;
};

/// Method, path and base headers for one exchange.
struct RequestSpec {
    net::HttpMethod method = net::HttpMethod::GET;
    std::string path;
    std::string query;
    net::HttpHeaders headers;

    net::HttpRequest to_request() const;
};

/// Builds canonical resource paths for an account.
///
///   /<account>/buckets
///   /<account>/buckets/<bucket>
///   /<account>/buckets/<bucket>/objects
///   /<account>/buckets/<bucket>/objects/<object>
///   /<account>/buckets/<bucket>/objects/<object>/metadata
///
/// Names are percent-encoded. Empty names throw InvalidArgument; service
/// naming rules are left to the server.
class RequestBuilder {
public:
    explicit RequestBuilder(std::string account);

    const std::string& account() const { return account_; }

    std::string buckets_path() const;
    std::string bucket_path(const std::string& bucket) const;
    std::string objects_path(const std::string& bucket) const;
    std::string object_path(const std::string& bucket, const std::string& object) const;
    std::string object_metadata_path(const std::string& bucket, const std::string& object) const;

    /// Query string for a listing, parameters in a fixed order.
    static std::string list_query(const ListOptions& options);

    /// Request for a non-listing operation.
    RequestSpec build(Operation op,
                      const std::string& bucket = {},
                      const std::string& object = {}) const;

    /// Request for ListBuckets (bucket ignored) or ListBucketObjects.
    RequestSpec build_list(Operation op,
                           const std::string& bucket,
                           const ListOptions& options) const;

private:
    std::string account_;
};

}  // namespace mbuckets
