#include "mbuckets/transfer.hpp"
#include "mbuckets/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace mbuckets {

// ============================================================================
// Upload sources
// ============================================================================

size_t StringSource::read(uint8_t* buffer, size_t max_len) {
    size_t n = std::min(max_len, data_.size() - offset_);
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return n;
}

size_t IstreamSource::read(uint8_t* buffer, size_t max_len) {
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
    if (in_.bad()) {
        throw std::runtime_error("input stream read failed");
    }
    return static_cast<size_t>(in_.gcount());
}

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path), in_(path, std::ios::binary) {
    if (!in_) {
        throw InvalidArgument("cannot open " + path.string());
    }
    std::error_code ec;
    size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        throw InvalidArgument("cannot stat " + path.string() + ": " + ec.message());
    }
}

size_t FileSource::read(uint8_t* buffer, size_t max_len) {
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
    if (in_.bad()) {
        throw std::runtime_error("read failed: " + path_.string());
    }
    return static_cast<size_t>(in_.gcount());
}

size_t GuardedSource::read(uint8_t* buffer, size_t max_len) {
    size_t n = 0;
    try {
        n = inner_.read(buffer, max_len);
    } catch (const PayloadStreamError&) {
        throw;
    } catch (const std::exception& e) {
        throw PayloadStreamError(std::string("payload source failed: ") + e.what());
    }

    sent_ += n;
    if (expected_size_) {
        if (sent_ > *expected_size_) {
            throw PayloadStreamError("payload source produced more than " +
                                     std::to_string(*expected_size_) + " bytes");
        }
        if (n == 0 && sent_ < *expected_size_) {
            throw PayloadStreamError("payload source ended after " + std::to_string(sent_) +
                                     " of " + std::to_string(*expected_size_) + " bytes");
        }
    }
    return n;
}

// ============================================================================
// ObjectReader
// ============================================================================

ObjectReader::ObjectReader(net::HttpResponse response, CompletionHandler on_complete)
    : response_(std::move(response)), on_complete_(std::move(on_complete)) {
    md5_ctx_ = EVP_MD_CTX_new();
    if (!md5_ctx_ || EVP_DigestInit_ex(md5_ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(md5_ctx_);
        md5_ctx_ = nullptr;
        response_.discard_body();
        throw TransportError("failed to initialise MD5 digest");
    }
}

ObjectReader::~ObjectReader() {
    close();
    EVP_MD_CTX_free(md5_ctx_);
}

ObjectReader::ObjectReader(ObjectReader&& other) noexcept
    : response_(std::move(other.response_)),
      on_complete_(std::move(other.on_complete_)),
      md5_ctx_(std::exchange(other.md5_ctx_, nullptr)),
      bytes_read_(other.bytes_read_),
      eof_(other.eof_),
      completed_(std::exchange(other.completed_, true)),
      computed_md5_(std::move(other.computed_md5_)) {}

ObjectReader& ObjectReader::operator=(ObjectReader&& other) noexcept {
    if (this != &other) {
        close();
        EVP_MD_CTX_free(md5_ctx_);

        response_ = std::move(other.response_);
        on_complete_ = std::move(other.on_complete_);
        md5_ctx_ = std::exchange(other.md5_ctx_, nullptr);
        bytes_read_ = other.bytes_read_;
        eof_ = other.eof_;
        completed_ = std::exchange(other.completed_, true);
        computed_md5_ = std::move(other.computed_md5_);
    }
    return *this;
}

size_t ObjectReader::read(uint8_t* buffer, size_t max_len) {
    if (eof_ || completed_ || max_len == 0) {
        return 0;
    }

    try {
        size_t n = response_.body ? response_.body->read(buffer, max_len) : 0;
        if (n > 0) {
            EVP_DigestUpdate(md5_ctx_, buffer, n);
            bytes_read_ += n;
            return n;
        }

        auto expected = content_length();
        if (expected && bytes_read_ < *expected) {
            throw TransportError("object body ended after " + std::to_string(bytes_read_) +
                                 " of " + std::to_string(*expected) + " bytes");
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        EVP_DigestFinal_ex(md5_ctx_, digest, &digest_len);
        computed_md5_ = net::base64_encode(digest, digest_len);

        eof_ = true;
        complete(Outcome::Finished);
        return 0;
    } catch (...) {
        complete(Outcome::Failed, std::current_exception());
        throw;
    }
}

std::string ObjectReader::read_all() {
    std::string data;
    uint8_t buffer[64 * 1024];
    size_t n;
    while ((n = read(buffer, sizeof(buffer))) > 0) {
        data.append(reinterpret_cast<const char*>(buffer), n);
    }
    return data;
}

uint64_t ObjectReader::write_to(std::ostream& out) {
    uint64_t total = 0;
    uint8_t buffer[64 * 1024];
    size_t n;
    while ((n = read(buffer, sizeof(buffer))) > 0) {
        out.write(reinterpret_cast<const char*>(buffer), static_cast<std::streamsize>(n));
        if (!out) {
            std::runtime_error error("failed to write object data");
            complete(Outcome::Failed, std::make_exception_ptr(error));
            throw error;
        }
        total += n;
    }
    return total;
}

void ObjectReader::close() {
    complete(Outcome::Cancelled);
}

bool ObjectReader::matches_content_md5() const {
    auto expected = content_md5();
    return computed_md5_ && expected && *computed_md5_ == *expected;
}

void ObjectReader::complete(Outcome outcome, std::exception_ptr error) {
    if (completed_) {
        return;
    }
    completed_ = true;
    response_.discard_body();
    if (on_complete_) {
        on_complete_(bytes_read_, outcome, error);
    }
}

}  // namespace mbuckets
