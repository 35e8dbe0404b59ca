/**
 * @file remoteerror.h
 * @brief Classified errors returned by RemoteStore implementations.
 */

#ifndef REMOTEERROR_H
#define REMOTEERROR_H

#include <QString>

/**
 * @brief Whether retrying a failed store call can help.
 */
enum class RemoteErrorClass {
    None,       ///< The call succeeded
    Transient,  ///< Retryable (network blip, timeout)
    Permanent   ///< Not retryable (permission, quota, not-found)
};

/**
 * @brief What went wrong in a failed store call.
 */
enum class RemoteErrorCode {
    None,
    Network,
    Timeout,
    PermissionDenied,
    QuotaExceeded,
    NotFound,
    AlreadyExists,
    Io,
    Other
};

[[nodiscard]] inline const char* remoteErrorCodeToString(RemoteErrorCode code) {
    switch (code) {
        case RemoteErrorCode::None: return "None";
        case RemoteErrorCode::Network: return "Network";
        case RemoteErrorCode::Timeout: return "Timeout";
        case RemoteErrorCode::PermissionDenied: return "PermissionDenied";
        case RemoteErrorCode::QuotaExceeded: return "QuotaExceeded";
        case RemoteErrorCode::NotFound: return "NotFound";
        case RemoteErrorCode::AlreadyExists: return "AlreadyExists";
        case RemoteErrorCode::Io: return "Io";
        case RemoteErrorCode::Other: return "Other";
    }
    return "Unknown";
}

/**
 * @brief Error value carried by every store call.
 *
 * A default-constructed RemoteError means success. Use fromCode() to get
 * the default classification for a code (Network and Timeout are
 * transient, everything else is permanent), or transient()/permanent()
 * to classify explicitly.
 */
struct RemoteError {
    RemoteErrorClass errorClass = RemoteErrorClass::None;
    RemoteErrorCode code = RemoteErrorCode::None;
    QString message;

    [[nodiscard]] bool isError() const { return errorClass != RemoteErrorClass::None; }
    [[nodiscard]] bool isTransient() const { return errorClass == RemoteErrorClass::Transient; }
    [[nodiscard]] bool isPermanent() const { return errorClass == RemoteErrorClass::Permanent; }

    [[nodiscard]] static RemoteError transient(RemoteErrorCode code, const QString &message)
    {
        return RemoteError{RemoteErrorClass::Transient, code, message};
    }

    [[nodiscard]] static RemoteError permanent(RemoteErrorCode code, const QString &message)
    {
        return RemoteError{RemoteErrorClass::Permanent, code, message};
    }

    [[nodiscard]] static RemoteError fromCode(RemoteErrorCode code, const QString &message)
    {
        if (code == RemoteErrorCode::None) {
            return RemoteError();
        }
        if (code == RemoteErrorCode::Network || code == RemoteErrorCode::Timeout) {
            return transient(code, message);
        }
        return permanent(code, message);
    }
};

/**
 * @brief A store call result carrying either a value or a classified error.
 */
template <typename T>
struct RemoteResult {
    T value{};
    RemoteError error;

    [[nodiscard]] bool ok() const { return !error.isError(); }

    [[nodiscard]] static RemoteResult success(const T &value)
    {
        RemoteResult result;
        result.value = value;
        return result;
    }

    [[nodiscard]] static RemoteResult failure(const RemoteError &error)
    {
        RemoteResult result;
        result.error = error;
        return result;
    }
};

#endif // REMOTEERROR_H
