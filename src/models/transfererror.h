/**
 * @file transfererror.h
 * @brief Error taxonomy for planning and executing transfer units.
 */

#ifndef TRANSFERERROR_H
#define TRANSFERERROR_H

#include <QMetaType>
#include <QString>

#include "services/remoteerror.h"

/**
 * @brief An error recorded against a batch or one of its units.
 *
 * Cancellation is not an error; cancelled units carry the Cancelled
 * outcome and a default (empty) TransferError.
 */
struct TransferError {
    enum class Kind {
        None,
        Planning,             ///< Selection or listing failure, scoped to one branch
        TransientExecution,   ///< Retryable failure that exhausted its attempts
        PermanentExecution,   ///< Failure that is never retried
        Timeout               ///< Attempt deadline exceeded (retried like transient)
    };

    Kind kind = Kind::None;
    RemoteErrorCode code = RemoteErrorCode::None;
    QString path;      ///< Local path or remote id the error refers to
    QString message;
    int attempts = 0;  ///< Attempts made before giving up (0 for planning errors)

    [[nodiscard]] bool isError() const { return kind != Kind::None; }

    [[nodiscard]] static TransferError planning(const QString &path, const QString &message,
                                                RemoteErrorCode code = RemoteErrorCode::Other)
    {
        TransferError error;
        error.kind = Kind::Planning;
        error.code = code;
        error.path = path;
        error.message = message;
        return error;
    }

    [[nodiscard]] static TransferError fromRemote(const RemoteError &remote, const QString &path, int attempts)
    {
        TransferError error;
        if (remote.code == RemoteErrorCode::Timeout) {
            error.kind = Kind::Timeout;
        } else if (remote.isTransient()) {
            error.kind = Kind::TransientExecution;
        } else {
            error.kind = Kind::PermanentExecution;
        }
        error.code = remote.code;
        error.path = path;
        error.message = remote.message;
        error.attempts = attempts;
        return error;
    }
};

[[nodiscard]] inline const char* transferErrorKindToString(TransferError::Kind kind) {
    switch (kind) {
        case TransferError::Kind::None: return "None";
        case TransferError::Kind::Planning: return "Planning";
        case TransferError::Kind::TransientExecution: return "Transient";
        case TransferError::Kind::PermanentExecution: return "Permanent";
        case TransferError::Kind::Timeout: return "Timeout";
    }
    return "Unknown";
}

Q_DECLARE_METATYPE(TransferError)

#endif // TRANSFERERROR_H
