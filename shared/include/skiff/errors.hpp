/**
 * Skiff - Exception hierarchy for the error taxonomy.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "skiff/error_codes.hpp"

namespace skiff
{

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorKind kind, std::string message);

        ErrorKind kind() const noexcept { return kind_; }

        bool retryable() const noexcept { return is_retryable(kind_); }

    private:
        ErrorKind kind_;
    };

    // Unreachable host, DNS failure, timeout, reset.
    class ConnectionError : public Error
    {
    public:
        explicit ConnectionError(std::string message);
    };

    // Bad credentials, rejected host key, certificate validation failure.
    class AuthenticationError : public Error
    {
    public:
        explicit AuthenticationError(std::string message);
    };

    // The server presented a host key that is not yet trusted. Connecting again
    // with this fingerprint accepted stores the key and proceeds.
    class UnknownHostKeyError : public AuthenticationError
    {
    public:
        UnknownHostKeyError(std::string host, std::uint16_t port, std::string algorithm, std::string fingerprint);

        const std::string &host() const noexcept { return host_; }
        std::uint16_t port() const noexcept { return port_; }
        const std::string &algorithm() const noexcept { return algorithm_; }
        const std::string &fingerprint() const noexcept { return fingerprint_; }

    private:
        std::string host_;
        std::uint16_t port_;
        std::string algorithm_;
        std::string fingerprint_;
    };

    class HostKeyMismatchError : public AuthenticationError
    {
    public:
        HostKeyMismatchError(const std::string &host, std::uint16_t port);
    };

    // Malformed server response or unsupported command/feature.
    class ProtocolError : public Error
    {
    public:
        explicit ProtocolError(std::string message);
    };

    // Transient failure while moving file data.
    class TransferError : public Error
    {
    public:
        explicit TransferError(std::string message);
    };

    // Local side: permission denied, disk full, path not found.
    class FileSystemError : public Error
    {
    public:
        explicit FileSystemError(std::string message);
    };

    class ConflictError : public Error
    {
    public:
        explicit ConflictError(std::string message);
    };

} // namespace skiff
