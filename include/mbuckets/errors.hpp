#pragma once

#include "mbuckets/net/http.hpp"

#include <stdexcept>
#include <string>

namespace mbuckets {

/// Stable classification carried by every error the client raises.
enum class ErrorKind {
    InvalidArgument,
    TransportError,
    HttpStatusError,
    NotFoundError,
    DecodeError,
    PayloadStreamError,
    ClientClosedError
};

const char* error_kind_name(ErrorKind kind);

/// Base class for all client errors.
class BucketsError : public std::runtime_error {
public:
    BucketsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Bad local input. Never reaches the network.
class InvalidArgument : public BucketsError {
public:
    explicit InvalidArgument(const std::string& message)
        : BucketsError(ErrorKind::InvalidArgument, message) {}
};

/// Connection, DNS, TLS or timeout failure reported by the transport.
class TransportError : public BucketsError {
public:
    explicit TransportError(const std::string& message, bool timed_out = false)
        : BucketsError(ErrorKind::TransportError, message), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

/// The service answered with a non-success status.
class HttpStatusError : public BucketsError {
public:
    HttpStatusError(int status_code,
                    std::string body,
                    net::HttpHeaders headers,
                    std::string code = {},
                    std::string service_message = {})
        : HttpStatusError(ErrorKind::HttpStatusError, status_code, std::move(body),
                          std::move(headers), std::move(code), std::move(service_message)) {}

    int status_code() const { return status_code_; }
    const std::string& body() const { return body_; }
    const net::HttpHeaders& headers() const { return headers_; }

    // Service error code and message from a JSON error body, if any
    const std::string& code() const { return code_; }
    const std::string& service_message() const { return service_message_; }

protected:
    HttpStatusError(ErrorKind kind, int status_code, std::string body,
                    net::HttpHeaders headers, std::string code,
                    std::string service_message);

private:
    int status_code_;
    std::string body_;
    net::HttpHeaders headers_;
    std::string code_;
    std::string service_message_;
};

/// A 404 from the service. Callers commonly branch on existence.
class NotFoundError : public HttpStatusError {
public:
    NotFoundError(std::string body,
                  net::HttpHeaders headers,
                  std::string code = {},
                  std::string service_message = {})
        : HttpStatusError(ErrorKind::NotFoundError, 404, std::move(body),
                          std::move(headers), std::move(code),
                          std::move(service_message)) {}
};

/// Malformed listing-stream content.
class DecodeError : public BucketsError {
public:
    explicit DecodeError(const std::string& message)
        : BucketsError(ErrorKind::DecodeError, message) {}
};

/// The local upload source failed mid-transfer.
class PayloadStreamError : public BucketsError {
public:
    explicit PayloadStreamError(const std::string& message)
        : BucketsError(ErrorKind::PayloadStreamError, message) {}
};

/// Operation attempted after BucketsClient::close().
class ClientClosedError : public BucketsError {
public:
    ClientClosedError()
        : BucketsError(ErrorKind::ClientClosedError, "client is closed") {}
};

}  // namespace mbuckets
