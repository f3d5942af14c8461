#pragma once

#include <stdexcept>
#include <string>

namespace segxfer {

enum class ErrorKind {
    none = 0,
    validation = 1,
    sequence = 2,
    integrity = 3,
    transport = 4,
    internal = 5,
};

const char *error_kind_name(ErrorKind kind) noexcept;

class TransferError : public std::runtime_error {
  public:
    TransferError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

// Malformed or missing metadata, path escapes, duplicate ids.
class ValidationError : public TransferError {
  public:
    explicit ValidationError(const std::string &message)
        : TransferError(ErrorKind::validation, message) {}
};

class SequenceError : public TransferError {
  public:
    explicit SequenceError(const std::string &message)
        : TransferError(ErrorKind::sequence, message) {}
};

class IntegrityError : public TransferError {
  public:
    explicit IntegrityError(const std::string &message)
        : TransferError(ErrorKind::integrity, message) {}
};

class TransportError : public TransferError {
  public:
    explicit TransportError(const std::string &message)
        : TransferError(ErrorKind::transport, message) {}
};

// Rethrows the exception type matching kind. ErrorKind::none is not an error
// and raises std::invalid_argument.
[[noreturn]] void throw_transfer_error(ErrorKind kind, const std::string &message);

} // namespace segxfer
