/**
 * @file transferunit.h
 * @brief Atomic transfer actions produced by the path planner.
 */

#ifndef TRANSFERUNIT_H
#define TRANSFERUNIT_H

#include <QList>
#include <QString>
#include <optional>

enum class OperationKind { Upload, Download, Delete, CreateFolder };

[[nodiscard]] inline const char* operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Upload: return "Upload";
        case OperationKind::Download: return "Download";
        case OperationKind::Delete: return "Delete";
        case OperationKind::CreateFolder: return "CreateFolder";
    }
    return "Unknown";
}

/**
 * @brief One atomic upload/download/create/delete action.
 *
 * Units are immutable once enqueued in a batch. A unit whose target
 * folder is created earlier in the same batch refers to that CreateFolder
 * unit through parentUnit; its targetParentId is resolved from the parent's
 * result when the unit is dispatched.
 */
struct TransferUnit {
    enum class Kind { UploadFile, DownloadFile, CreateFolder, Delete };

    /// Where the unit's effect happens
    enum class Location { Remote, Local };

    Kind kind = Kind::UploadFile;
    Location location = Location::Remote;
    QString sourcePath;        ///< Local path (upload) or remote id (download/delete)
    QString name;              ///< File or folder name
    QString targetParentId;    ///< Remote parent id when known while planning
    QString localPath;         ///< Download target or local folder path
    int parentUnit = -1;       ///< CreateFolder unit providing the parent id, -1 if none
    QList<int> dependsOn;      ///< Units that must succeed before this one starts
    std::optional<qint64> sizeBytes;  ///< Unknown for folders
    int sequenceIndex = 0;

    [[nodiscard]] bool isFolderCreation() const { return kind == Kind::CreateFolder; }

    /// Identity used in log records, e.g. "4/12"
    [[nodiscard]] QString unitId(int batchId) const
    {
        return QStringLiteral("%1/%2").arg(batchId).arg(sequenceIndex);
    }
};

[[nodiscard]] inline const char* unitKindToString(TransferUnit::Kind kind) {
    switch (kind) {
        case TransferUnit::Kind::UploadFile: return "UploadFile";
        case TransferUnit::Kind::DownloadFile: return "DownloadFile";
        case TransferUnit::Kind::CreateFolder: return "CreateFolder";
        case TransferUnit::Kind::Delete: return "Delete";
    }
    return "Unknown";
}

#endif // TRANSFERUNIT_H
