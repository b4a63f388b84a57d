#include "mbuckets/errors.hpp"

namespace mbuckets {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::HttpStatusError: return "HTTPStatusError";
        case ErrorKind::NotFoundError: return "NotFoundError";
        case ErrorKind::DecodeError: return "DecodeError";
        case ErrorKind::PayloadStreamError: return "PayloadStreamError";
        case ErrorKind::ClientClosedError: return "ClientClosedError";
    }
    return "Unknown";
}

namespace {

std::string format_status_message(int status_code, const std::string& code,
                                  const std::string& service_message) {
    std::string msg = "HTTP " + std::to_string(status_code);
    if (!code.empty()) {
        msg += " " + code;
    }
    if (!service_message.empty()) {
        msg += ": " + service_message;
    }
    return msg;
}

}  // namespace

HttpStatusError::HttpStatusError(ErrorKind kind, int status_code, std::string body,
                                 net::HttpHeaders headers, std::string code,
                                 std::string service_message)
    : BucketsError(kind, format_status_message(status_code, code, service_message))
    , status_code_(status_code)
    , body_(std::move(body))
    , headers_(std::move(headers))
    , code_(std::move(code))
    , service_message_(std::move(service_message)) {}

}  // namespace mbuckets
