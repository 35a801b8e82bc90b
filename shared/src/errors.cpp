#include "skiff/errors.hpp"

#include <utility>

namespace skiff
{

    Error::Error(ErrorKind kind, std::string message)
        : std::runtime_error(std::move(message)), kind_(kind) {}

    ConnectionError::ConnectionError(std::string message)
        : Error(ErrorKind::Connection, std::move(message)) {}

    AuthenticationError::AuthenticationError(std::string message)
        : Error(ErrorKind::Authentication, std::move(message)) {}

    UnknownHostKeyError::UnknownHostKeyError(std::string host, std::uint16_t port, std::string algorithm,
                                             std::string fingerprint)
        : AuthenticationError("unknown host key for " + host + ':' + std::to_string(port) + " (" + algorithm + ' ' +
                              fingerprint + ')'),
          host_(std::move(host)),
          port_(port),
          algorithm_(std::move(algorithm)),
          fingerprint_(std::move(fingerprint)) {}

    HostKeyMismatchError::HostKeyMismatchError(const std::string &host, std::uint16_t port)
        : AuthenticationError("host key for " + host + ':' + std::to_string(port) +
                              " does not match the known key, possible man-in-the-middle attack") {}

    ProtocolError::ProtocolError(std::string message)
        : Error(ErrorKind::Protocol, std::move(message)) {}

    TransferError::TransferError(std::string message)
        : Error(ErrorKind::Transfer, std::move(message)) {}

    FileSystemError::FileSystemError(std::string message)
        : Error(ErrorKind::FileSystem, std::move(message)) {}

    ConflictError::ConflictError(std::string message)
        : Error(ErrorKind::Conflict, std::move(message)) {}

} // namespace skiff
