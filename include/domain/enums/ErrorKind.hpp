#pragma once

#include <string>

namespace scim::domain {

enum class ErrorKind {
    NotFound,
    Conflict,
    MethodNotAllowed,
    InvalidPatch,
    InvalidValue,
    InvalidConfig,
    Internal
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::MethodNotAllowed: return "MethodNotAllowed";
        case ErrorKind::InvalidPatch: return "InvalidPatch";
        case ErrorKind::InvalidValue: return "InvalidValue";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::Internal: return "Internal";
        default: return "Unknown";
    }
}

/**
 * @brief HTTP-статус для вида ошибки
 */
inline int httpStatus(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return 404;
        case ErrorKind::Conflict: return 409;
        case ErrorKind::MethodNotAllowed: return 405;
        case ErrorKind::InvalidPatch: return 400;
        case ErrorKind::InvalidValue: return 400;
        case ErrorKind::InvalidConfig: return 400;
        default: return 500;
    }
}

} // namespace scim::domain
