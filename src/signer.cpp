#include "mbuckets/net/signer.hpp"
#include "mbuckets/errors.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <ctime>
#include <fstream>
#include <sstream>

namespace mbuckets::net {

std::string http_date(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm;
    gmtime_r(&time, &tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf, n);
}

HttpSignatureSigner::HttpSignatureSigner(std::string key_id, const std::string& private_key_pem)
    : key_id_(std::move(key_id)) {
    BIO* bio = BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size()));
    if (!bio) {
        throw InvalidArgument("cannot allocate key buffer");
    }
    pkey_ = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!pkey_) {
        throw InvalidArgument("cannot parse private key (expected unencrypted PEM)");
    }

    switch (EVP_PKEY_base_id(pkey_)) {
        case EVP_PKEY_RSA:
            algorithm_ = "rsa-sha256";
            break;
        case EVP_PKEY_EC:
            algorithm_ = "ecdsa-sha256";
            break;
        default:
            EVP_PKEY_free(pkey_);
            pkey_ = nullptr;
            throw InvalidArgument("unsupported private key type (need RSA or EC)");
    }
}

HttpSignatureSigner::~HttpSignatureSigner() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
    }
}

std::unique_ptr<HttpSignatureSigner> HttpSignatureSigner::from_key_file(
    std::string key_id, const std::filesystem::path& key_file) {
    std::ifstream ifs(key_file, std::ios::binary);
    if (!ifs) {
        throw InvalidArgument("cannot open key file: " + key_file.string());
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return std::make_unique<HttpSignatureSigner>(std::move(key_id), ss.str());
}

std::string HttpSignatureSigner::make_key_id(const std::string& account,
                                             const std::string& subuser,
                                             const std::string& fingerprint) {
    std::string id = "/" + account;
    if (!subuser.empty()) {
        id += "/" + subuser;
    }
    id += "/keys/" + fingerprint;
    return id;
}

std::string HttpSignatureSigner::sign_string(const std::string& data) const {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw TransportError("cannot allocate signing context");
    }

    std::string signature;
    bool ok = false;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey_) == 1 &&
        EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1) {
        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
            signature.resize(sig_len);
            if (EVP_DigestSignFinal(ctx, reinterpret_cast<unsigned char*>(signature.data()),
                                    &sig_len) == 1) {
                signature.resize(sig_len);
                ok = true;
            }
        }
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw TransportError("request signing failed");
    }
    return signature;
}

void HttpSignatureSigner::sign(HttpRequest& request) const {
    auto date = request.headers.get("date");
    if (!date) {
        date = http_date(std::chrono::system_clock::now());
        request.headers.set("date", *date);
    }

    std::string signature = base64_encode(sign_string("date: " + *date));

    std::ostringstream auth;
    auth << "Signature keyId=\"" << key_id_ << "\","
         << "algorithm=\"" << algorithm_ << "\","
         << "headers=\"date\","
         << "signature=\"" << signature << "\"";
    request.headers.set("Authorization", auth.str());
}

}  // namespace mbuckets::net
