#include "mbuckets/metadata.hpp"
#include "mbuckets/errors.hpp"

#include <cctype>
#include <cstring>

namespace mbuckets {

namespace {

// Lowercase only; header names do not keep their case on the wire
bool is_token_char(unsigned char c) {
    if (std::islower(c) || std::isdigit(c)) return true;
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

}  // namespace

bool is_valid_metadata_key(const std::string& key) {
    if (key.empty()) return false;
    for (unsigned char c : key) {
        if (!is_token_char(c)) return false;
    }
    return true;
}

net::HttpHeaders encode_metadata(const ObjectMetadata& metadata) {
    net::HttpHeaders headers;
    for (const auto& [key, value] : metadata) {
        if (!is_valid_metadata_key(key)) {
            throw InvalidArgument("invalid metadata key: '" + key + "'");
        }
        if (value.find_first_of("\r\n") != std::string::npos) {
            throw InvalidArgument("metadata value for '" + key + "' contains a line break");
        }
        headers.set(std::string(kMetadataPrefix) + key, value);
    }
    return headers;
}

ObjectMetadata decode_metadata(const net::HttpHeaders& headers) {
    ObjectMetadata metadata;
    const size_t prefix_len = std::strlen(kMetadataPrefix);
    for (const auto& [name, value] : headers.all()) {
        if (name.size() <= prefix_len || !name.starts_with(kMetadataPrefix)) {
            continue;
        }
        metadata.emplace(name.substr(prefix_len), value);
    }
    return metadata;
}

}  // namespace mbuckets
