//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// errors.hpp
//
// Exception hierarchy. Every error carries a stable code ("E-EGOD-<n>")
// and what() reads "<code>: <message>".
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>

namespace exaconn {

namespace error_code {
constexpr const char* BAD_CONNECTION = "E-EGOD-2";
constexpr const char* MALFORMED_DATA = "E-EGOD-3";
constexpr const char* INVALID_TRANSACTION = "E-EGOD-4";
constexpr const char* INVALID_VALUES_COUNT = "E-EGOD-5";
constexpr const char* NAMED_PARAMETERS = "E-EGOD-7";
constexpr const char* CERTIFICATE_MISMATCH = "E-EGOD-10";
constexpr const char* SERVER_EXCEPTION = "E-EGOD-11";
constexpr const char* MISSING_EXCEPTION = "E-EGOD-12";
constexpr const char* RESPONSE_PARSE = "E-EGOD-13";
constexpr const char* INVALID_CONFIG = "E-EGOD-15";
constexpr const char* INVALID_HOST_RANGE = "E-EGOD-20";
constexpr const char* CONNECTION_FAILED = "E-EGOD-21";
constexpr const char* LOGIN_FAILED = "E-EGOD-24";
constexpr const char* INVALID_IMPORT_QUERY = "E-EGOD-27";
constexpr const char* FILE_NOT_FOUND = "E-EGOD-28";
constexpr const char* NOT_CONNECTED = "E-EGOD-29";
constexpr const char* IMPORT_SERVER = "E-EGOD-30";
constexpr const char* INVALID_COLUMN_INDEX = "E-EGOD-31";
} // namespace error_code

class Error : public std::runtime_error {
public:
    Error(std::string code, const std::string& message)
        : std::runtime_error(code + ": " + message)
        , code_(std::move(code))
        , message_(message) {}

    const std::string& Code() const { return code_; }
    const std::string& Message() const { return message_; }

private:
    std::string code_;
    std::string message_;
};

// Transport unreachable, handshake failed, all hosts exhausted
class ConnectionError : public Error {
public:
    using Error::Error;
};

// The session can not be used any more; reconnect instead of resending
class BadConnectionError : public ConnectionError {
public:
    BadConnectionError()
        : ConnectionError(error_code::BAD_CONNECTION, "bad connection") {}
    BadConnectionError(std::string code, const std::string& message)
        : ConnectionError(std::move(code), message) {}
};

// Non-ok status carrying a structured server exception
class ServerError : public Error {
public:
    ServerError(const std::string& sql_code, const std::string& text);

    const std::string& SqlCode() const { return sql_code_; }
    const std::string& Text() const { return text_; }

private:
    std::string sql_code_;
    std::string text_;
};

class MalformedDataError : public Error {
public:
    explicit MalformedDataError(const std::string& message)
        : Error(error_code::MALFORMED_DATA, message) {}
    MalformedDataError(std::string code, const std::string& message)
        : Error(std::move(code), message) {}
};

// Usage errors, detected before any network I/O where feasible
class InvalidArgumentError : public Error {
public:
    using Error::Error;
};

} // namespace exaconn
