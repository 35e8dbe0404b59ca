#include "browsesession.h"

#include <QStringList>

BrowseSession::BrowseSession(const QString &rootId, const QString &rootName)
    : root_{rootId, rootName}
    , current_{rootId, rootName}
{
}

void BrowseSession::enterFolder(const QString &folderId, const QString &folderName)
{
    if (folderId.isEmpty() || folderId == current_.id) {
        return;
    }

    history_.append(current_);
    current_ = Location{folderId, folderName};
}

bool BrowseSession::goBack()
{
    if (history_.isEmpty()) {
        return false;
    }

    current_ = history_.takeLast();
    return true;
}

void BrowseSession::goHome()
{
    history_.clear();
    current_ = root_;
}

QStringList BrowseSession::breadcrumb() const
{
    QStringList names;
    for (const Location &location : history_) {
        names.append(location.name);
    }
    names.append(current_.name);
    return names;
}
