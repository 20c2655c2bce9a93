#pragma once

#include "core/shared/errors.h"

#include <QString>

namespace hr {

// Numeric codes carried in an error envelope's "error.code".
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 4,
    InternalError      = 6,
    Unsupported        = 7,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

// Validation failures surface as InvalidParams; the core code survives in the
// message text.
inline IpcErrorCode ipcErrorCodeFor(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotFound:         return IpcErrorCode::NotFound;
    case ErrorCode::StorageError:     return IpcErrorCode::InternalError;
    case ErrorCode::ModelUnavailable: return IpcErrorCode::ServiceUnavailable;
    default:                          return IpcErrorCode::InvalidParams;
    }
}

// "CODE [field]: message", omitting the parts that are empty.
inline QString describeError(const Error& error)
{
    QString text = errorCodeToString(error.code);
    if (!error.field.isEmpty()) {
        text += QStringLiteral(" [%1]").arg(error.field);
    }
    if (!error.message.isEmpty()) {
        text += QStringLiteral(": ") + error.message;
    }
    return text;
}

} // namespace hr
