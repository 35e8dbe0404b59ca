#ifndef REMOTEITEM_H
#define REMOTEITEM_H

#include <QMetaType>
#include <QString>

/**
 * @brief Represents a single entry in a remote folder listing.
 */
struct RemoteItem {
    QString id;                ///< Store-assigned identifier
    QString name;              ///< Display name of the file or folder
    bool isFolder = false;     ///< True if this entry is a folder
    qint64 size = 0;           ///< Size in bytes (0 for folders)
    QString parentId;          ///< Identifier of the containing folder
};

Q_DECLARE_METATYPE(RemoteItem)

#endif // REMOTEITEM_H
