#include "segxfer/errors.hpp"

namespace segxfer {

const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::none:
        return "none";
    case ErrorKind::validation:
        return "validation";
    case ErrorKind::sequence:
        return "sequence";
    case ErrorKind::integrity:
        return "integrity";
    case ErrorKind::transport:
        return "transport";
    case ErrorKind::internal:
        return "internal";
    }
    return "unknown";
}

void throw_transfer_error(ErrorKind kind, const std::string &message) {
    switch (kind) {
    case ErrorKind::validation:
        throw ValidationError(message);
    case ErrorKind::sequence:
        throw SequenceError(message);
    case ErrorKind::integrity:
        throw IntegrityError(message);
    case ErrorKind::transport:
        throw TransportError(message);
    case ErrorKind::internal:
        throw TransferError(kind, message);
    case ErrorKind::none:
        break;
    }
    throw std::invalid_argument("not an error kind: " + std::string(error_kind_name(kind)));
}

} // namespace segxfer
