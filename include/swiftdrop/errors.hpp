#pragma once

#include <stdexcept>
#include <string>

namespace swiftdrop {

enum class ErrorKind {
    None,
    Validation,
    Crypto,
    Transport,
    Timeout,
    Cancelled
};

const char* ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    // Only transport and crypto failures are worth another attempt.
    bool retryable() const noexcept {
        return kind_ == ErrorKind::Transport || kind_ == ErrorKind::Crypto;
    }

private:
    ErrorKind kind_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(ErrorKind::Validation, message) {}
};

// Malformed framing; still a validation failure for retry purposes.
class FormatError : public ValidationError {
public:
    explicit FormatError(const std::string& message) : ValidationError(message) {}
};

class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& message) : Error(ErrorKind::Crypto, message) {}
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& message) : Error(ErrorKind::Transport, message) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message) : Error(ErrorKind::Timeout, message) {}
};

class CancellationError : public Error {
public:
    explicit CancellationError(const std::string& message = "Transfer cancelled")
        : Error(ErrorKind::Cancelled, message) {}
};

}  // namespace swiftdrop
