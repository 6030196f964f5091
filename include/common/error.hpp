#ifndef BLOBNET_COMMON_ERROR_HPP
#define BLOBNET_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobnet {

// Terminal error kinds reported by the transfer engine
enum class ErrorKind {
    NOT_FOUND,
    TIMEOUT,
    HASH_MISMATCH,
    PROTOCOL,
    PEER_UNAVAILABLE,
    IO,
    INVALID_REQUEST
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:        return "NotFoundError";
        case ErrorKind::TIMEOUT:          return "TimeoutError";
        case ErrorKind::HASH_MISMATCH:    return "HashMismatchError";
        case ErrorKind::PROTOCOL:         return "ProtocolError";
        case ErrorKind::PEER_UNAVAILABLE: return "PeerUnavailableError";
        case ErrorKind::IO:               return "IOError";
        case ErrorKind::INVALID_REQUEST:  return "InvalidRequestError";
        default:                          return "UnknownError";
    }
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* kind_name() const { return error_kind_to_string(kind_); }

private:
    ErrorKind kind_;
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorKind::NOT_FOUND, message) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(ErrorKind::TIMEOUT, message) {}
};

class HashMismatchError : public Error {
public:
    explicit HashMismatchError(const std::string& message)
        : Error(ErrorKind::HASH_MISMATCH, message) {}
};

class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message)
        : Error(ErrorKind::PROTOCOL, message) {}
};

class PeerUnavailableError : public Error {
public:
    explicit PeerUnavailableError(const std::string& message)
        : Error(ErrorKind::PEER_UNAVAILABLE, message) {}
};

class IOError : public Error {
public:
    explicit IOError(const std::string& message)
        : Error(ErrorKind::IO, message) {}
};

class InvalidRequestError : public Error {
public:
    explicit InvalidRequestError(const std::string& message)
        : Error(ErrorKind::INVALID_REQUEST, message) {}
};

// Renders "<KindName>: <message>" as used in control API error payloads
inline std::string to_error_payload(const Error& error) {
    return std::string(error.kind_name()) + ": " + error.what();
}

} // namespace blobnet

#endif // BLOBNET_COMMON_ERROR_HPP
