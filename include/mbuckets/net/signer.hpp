#pragma once

#include "mbuckets/net/http.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

// Forward declaration (OpenSSL)
struct evp_pkey_st;

namespace mbuckets::net {

// Adds authentication headers to an outgoing request.
class RequestSigner {
public:
    virtual ~RequestSigner() = default;
    virtual void sign(HttpRequest& request) const = 0;
};

// HTTP Signature authentication over the "date" header.
//
//   Authorization: Signature keyId="/<account>/keys/<id>",
//                  algorithm="rsa-sha256",headers="date",signature="<b64>"
//
// RSA keys sign as rsa-sha256, EC keys as ecdsa-sha256.
class HttpSignatureSigner : public RequestSigner {
public:
    // Throws InvalidArgument if the PEM cannot be parsed.
    HttpSignatureSigner(std::string key_id, const std::string& private_key_pem);
    ~HttpSignatureSigner() override;

    HttpSignatureSigner(const HttpSignatureSigner&) = delete;
    HttpSignatureSigner& operator=(const HttpSignatureSigner&) = delete;

    static std::unique_ptr<HttpSignatureSigner> from_key_file(
        std::string key_id, const std::filesystem::path& key_file);

    // Builds the keyId for an account, optional subuser and key fingerprint.
    static std::string make_key_id(const std::string& account,
                                   const std::string& subuser,
                                   const std::string& fingerprint);

    void sign(HttpRequest& request) const override;

    const std::string& key_id() const { return key_id_; }
    const std::string& algorithm() const { return algorithm_; }

private:
    std::string sign_string(const std::string& data) const;

    std::string key_id_;
    std::string algorithm_;
    evp_pkey_st* pkey_ = nullptr;
};

// RFC 7231 IMF-fixdate, e.g. "Tue, 15 Nov 1994 08:12:31 GMT"
std::string http_date(std::chrono::system_clock::time_point when);

}  // namespace mbuckets::net
