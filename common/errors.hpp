#pragma once

// ============================================================
// errors.hpp -- Exception hierarchy and process exit codes
// ============================================================

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Generic,
    BadArgs,
    Io,
    Network,
    Auth,
    Transfer,
    Canceled,
};

// Process exit codes (one per ErrorKind)
enum ExitCode : int {
    EXIT_OK       = 0,
    EXIT_GENERIC  = 1,
    EXIT_BAD_ARGS = 2,
    EXIT_IO       = 3,
    EXIT_NETWORK  = 4,
    EXIT_AUTH     = 5,
    EXIT_TRANSFER = 6,
    EXIT_CANCELED = 130,
};

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad CLI usage or an input that can never be sent (e.g. unknown size)
class InvalidInputError : public TransferError {
public:
    explicit InvalidInputError(const std::string& msg)
        : TransferError(ErrorKind::BadArgs, msg) {}
};

class IoError : public TransferError {
public:
    explicit IoError(const std::string& msg)
        : TransferError(ErrorKind::Io, msg) {}
};

class FileExistsError : public TransferError {
public:
    explicit FileExistsError(const std::string& path)
        : TransferError(ErrorKind::Io, "refusing to overwrite existing file: " + path +
                                           " (use --overwrite)")
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Archive entry whose path would resolve outside the extraction root
class UnsafePathError : public TransferError {
public:
    explicit UnsafePathError(const std::string& entry)
        : TransferError(ErrorKind::Io, "unsafe archive path: " + entry)
        , entry_(entry) {}

    const std::string& entry() const { return entry_; }

private:
    std::string entry_;
};

class NetworkError : public TransferError {
public:
    explicit NetworkError(const std::string& msg)
        : TransferError(ErrorKind::Network, msg) {}
};

// Channel closed before FIN and the byte counts do not add up
class ConnectionClosedEarlyError : public TransferError {
public:
    ConnectionClosedEarlyError(unsigned long long announced, unsigned long long written)
        : TransferError(ErrorKind::Network,
                        "connection closed before transfer finished (" +
                        std::to_string(written) + "/" + std::to_string(announced) + " bytes)") {}
};

enum class AuthFailure {
    Timeout,
    Rejected,
    PeerRejected,
    FingerprintMismatch,
    Protocol,
};

class AuthError : public TransferError {
public:
    AuthError(AuthFailure reason, const std::string& msg)
        : TransferError(ErrorKind::Auth, msg), reason_(reason) {}

    AuthFailure reason() const { return reason_; }

private:
    AuthFailure reason_;
};

// Malformed frame, bad checksum, out-of-order sequence, corrupt archive
class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& msg)
        : TransferError(ErrorKind::Transfer, msg) {}
};

class SizeMismatchError : public TransferError {
public:
    SizeMismatchError(unsigned long long announced, unsigned long long actual)
        : TransferError(ErrorKind::Transfer,
                        "size mismatch: announced " + std::to_string(announced) +
                        " bytes, got " + std::to_string(actual))
        , announced_(announced), actual_(actual) {}

    unsigned long long announced() const { return announced_; }
    unsigned long long actual() const { return actual_; }

private:
    unsigned long long announced_;
    unsigned long long actual_;
};

// Sender finished with FIN{ok=false}
class SenderFailureError : public TransferError {
public:
    SenderFailureError()
        : TransferError(ErrorKind::Transfer, "sender reported failure") {}
};

class CancelledError : public TransferError {
public:
    CancelledError()
        : TransferError(ErrorKind::Canceled, "cancelled") {}
};

inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadArgs:  return EXIT_BAD_ARGS;
        case ErrorKind::Io:       return EXIT_IO;
        case ErrorKind::Network:  return EXIT_NETWORK;
        case ErrorKind::Auth:     return EXIT_AUTH;
        case ErrorKind::Transfer: return EXIT_TRANSFER;
        case ErrorKind::Canceled: return EXIT_CANCELED;
        case ErrorKind::Generic:  break;
    }
    return EXIT_GENERIC;
}

inline int exit_code_for(const TransferError& e) {
    return exit_code_for(e.kind());
}
