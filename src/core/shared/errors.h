#pragma once

#include <QString>

namespace hr {

// Error taxonomy shared by the recommendation core. Operations report failures
// through an optional Error* out-parameter and a bool/optional return.
enum class ErrorCode : int {
    InvalidPreferenceRange = 1,
    InvalidInteractionType = 2,
    InvalidInputList       = 3,
    InvalidWeights         = 4,
    InvalidRequest         = 5,
    NotFound               = 6,
    ModelUnavailable       = 7,
    MalformedEmbedding     = 8,
    StorageError           = 9,
};

struct Error {
    ErrorCode code = ErrorCode::StorageError;
    QString field;
    QString message;
};

inline QString errorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidPreferenceRange: return QStringLiteral("INVALID_PREFERENCE_RANGE");
    case ErrorCode::InvalidInteractionType: return QStringLiteral("INVALID_INTERACTION_TYPE");
    case ErrorCode::InvalidInputList:       return QStringLiteral("INVALID_INPUT_LIST");
    case ErrorCode::InvalidWeights:         return QStringLiteral("INVALID_WEIGHTS");
    case ErrorCode::InvalidRequest:         return QStringLiteral("INVALID_REQUEST");
    case ErrorCode::NotFound:               return QStringLiteral("NOT_FOUND");
    case ErrorCode::ModelUnavailable:       return QStringLiteral("MODEL_UNAVAILABLE");
    case ErrorCode::MalformedEmbedding:     return QStringLiteral("MALFORMED_EMBEDDING");
    case ErrorCode::StorageError:           return QStringLiteral("STORAGE_ERROR");
    }
    return QStringLiteral("UNKNOWN");
}

inline void setError(Error* errorOut, ErrorCode code, const QString& field, const QString& message)
{
    if (errorOut) {
        errorOut->code = code;
        errorOut->field = field;
        errorOut->message = message;
    }
}

} // namespace hr
