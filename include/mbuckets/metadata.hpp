#pragma once

#include "mbuckets/net/http.hpp"

#include <map>
#include <string>

namespace mbuckets {

// User metadata travels as "m-<key>: <value>" headers.
inline constexpr const char* kMetadataPrefix = "m-";

// Keys are lowercase header tokens without the prefix.
using ObjectMetadata = std::map<std::string, std::string>;

// True if key is a non-empty RFC 7230 token with no uppercase letters.
bool is_valid_metadata_key(const std::string& key);

// Prefix each key. Throws InvalidArgument on an invalid key or
// a value containing CR or LF.
net::HttpHeaders encode_metadata(const ObjectMetadata& metadata);

// Collect every m-* header with the prefix stripped. Repeated headers keep
// their first value.
ObjectMetadata decode_metadata(const net::HttpHeaders& headers);

}  // namespace mbuckets
