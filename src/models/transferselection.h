#ifndef TRANSFERSELECTION_H
#define TRANSFERSELECTION_H

#include <QList>
#include <QString>
#include <QStringList>

#include "services/remoteitem.h"

/**
 * @brief What the user picked for a batch operation.
 *
 * Uploads use localPaths; downloads and deletes use remoteItems, whose
 * types must be known. Folder creation uses folderName. An empty
 * localDestination falls back to the configured default download path.
 */
struct TransferSelection {
    QStringList localPaths;
    QList<RemoteItem> remoteItems;
    QString localDestination;
    QString folderName;

    [[nodiscard]] bool isEmpty() const
    {
        return localPaths.isEmpty() && remoteItems.isEmpty() && folderName.trimmed().isEmpty();
    }
};

#endif // TRANSFERSELECTION_H
