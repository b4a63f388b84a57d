#include "mbuckets/request_builder.hpp"
#include "mbuckets/errors.hpp"

#include <vector>

namespace mbuckets {

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::IsBucketsSupported: return "is_buckets_supported";
        case Operation::CreateBucket: return "create_bucket";
        case Operation::HeadBucket: return "head_bucket";
        case Operation::DeleteBucket: return "delete_bucket";
        case Operation::ListBuckets: return "list_buckets";
        case Operation::CreateBucketObject: return "create_bucket_object";
        case Operation::HeadBucketObject: return "head_bucket_object";
        case Operation::GetBucketObject: return "get_bucket_object";
        case Operation::PutBucketObjectMetadata: return "put_bucket_object_metadata";
        case Operation::DeleteBucketObject: return "delete_bucket_object";
        case Operation::ListBucketObjects: return "list_bucket_objects";
        case Operation::Close: return "close";
    }
    return "unknown";
}

namespace {

constexpr const char* kJsonStreamType = "application/x-json-stream";

void require_name(const std::string& value, const char* what) {
    if (value.empty()) {
        throw InvalidArgument(std::string(what) + " must be a non-empty string");
    }
}

}  // namespace

net::HttpRequest RequestSpec::to_request() const {
    net::HttpRequest request;
    request.method = method;
    request.path = path;
    request.query = query;
    request.headers = headers;
    return request;
}

RequestBuilder::RequestBuilder(std::string account)
    : account_(std::move(account)) {
    require_name(account_, "account");
}

std::string RequestBuilder::buckets_path() const {
    return "/" + net::url_encode(account_) + "/buckets";
}

std::string RequestBuilder::bucket_path(const std::string& bucket) const {
    require_name(bucket, "bucket name");
    return buckets_path() + "/" + net::url_encode(bucket);
}

std::string RequestBuilder::objects_path(const std::string& bucket) const {
    return bucket_path(bucket) + "/objects";
}

std::string RequestBuilder::object_path(const std::string& bucket,
                                        const std::string& object) const {
    require_name(object, "object name");
    return objects_path(bucket) + "/" + net::url_encode(object);
}

std::string RequestBuilder::object_metadata_path(const std::string& bucket,
                                                 const std::string& object) const {
    return object_path(bucket, object) + "/metadata";
}

std::string RequestBuilder::list_query(const ListOptions& options) {
    if (options.limit &&
        (*options.limit == 0 || *options.limit > ListOptions::kMaxListLimit)) {
        throw InvalidArgument("list limit must be between 1 and " +
                              std::to_string(ListOptions::kMaxListLimit));
    }

    std::vector<std::string> params;
    if (!options.prefix.empty()) {
        params.push_back("prefix=" + net::url_encode(options.prefix));
    }
    if (!options.delimiter.empty()) {
        params.push_back("delimiter=" + net::url_encode(options.delimiter));
    }
    if (!options.marker.empty()) {
        params.push_back("marker=" + net::url_encode(options.marker));
    }
    if (options.limit) {
        params.push_back("limit=" + std::to_string(*options.limit));
    }

    std::string query;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) query += "&";
        query += params[i];
    }
    return query;
}

RequestSpec RequestBuilder::build(Operation op,
                                  const std::string& bucket,
                                  const std::string& object) const {
    RequestSpec spec;

    switch (op) {
        case Operation::IsBucketsSupported:
            spec.method = net::HttpMethod::HEAD;
            spec.path = buckets_path();
            break;
        case Operation::CreateBucket:
            spec.method = net::HttpMethod::PUT;
            spec.path = bucket_path(bucket);
            break;
        case Operation::HeadBucket:
            spec.method = net::HttpMethod::HEAD;
            spec.path = bucket_path(bucket);
            break;
        case Operation::DeleteBucket:
            spec.method = net::HttpMethod::DELETE;
            spec.path = bucket_path(bucket);
            break;
        case Operation::CreateBucketObject:
            spec.method = net::HttpMethod::PUT;
            spec.path = object_path(bucket, object);
            break;
        case Operation::HeadBucketObject:
            spec.method = net::HttpMethod::HEAD;
            spec.path = object_path(bucket, object);
            break;
        case Operation::GetBucketObject:
            spec.method = net::HttpMethod::GET;
            spec.path = object_path(bucket, object);
            break;
        case Operation::PutBucketObjectMetadata:
            spec.method = net::HttpMethod::PUT;
            spec.path = object_metadata_path(bucket, object);
            break;
        case Operation::DeleteBucketObject:
            spec.method = net::HttpMethod::DELETE;
            spec.path = object_path(bucket, object);
            break;
        case Operation::ListBuckets:
        case Operation::ListBucketObjects:
            return build_list(op, bucket, ListOptions{});
        case Operation::Close:
            throw InvalidArgument("close does not issue a request");
    }

    return spec;
}

RequestSpec RequestBuilder::build_list(Operation op,
                                       const std::string& bucket,
                                       const ListOptions& options) const {
    RequestSpec spec;
    spec.method = net::HttpMethod::GET;

    if (op == Operation::ListBuckets) {
        spec.path = buckets_path();
    } else if (op == Operation::ListBucketObjects) {
        spec.path = objects_path(bucket);
    } else {
        throw InvalidArgument(std::string(operation_name(op)) + " is not a listing");
    }

    spec.query = list_query(options);
    spec.headers.set("Accept", kJsonStreamType);
    return spec;
}

}  // namespace mbuckets
