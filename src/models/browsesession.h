/**
 * @file browsesession.h
 * @brief Explicit browsing context: current remote folder and history.
 */

#ifndef BROWSESESSION_H
#define BROWSESESSION_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief Tracks where the user is in the remote hierarchy.
 *
 * Passed explicitly into batch submission so that uploads target the
 * folder the user is looking at, instead of reading ambient state.
 */
class BrowseSession
{
public:
    explicit BrowseSession(const QString &rootId = QStringLiteral("/"),
                           const QString &rootName = QStringLiteral("My Drive"));

    [[nodiscard]] QString currentFolderId() const { return current_.id; }
    [[nodiscard]] QString currentFolderName() const { return current_.name; }
    [[nodiscard]] QString rootId() const { return root_.id; }
    [[nodiscard]] bool isAtRoot() const { return current_.id == root_.id; }

    /**
     * @brief Enters a folder, remembering the current one for goBack().
     */
    void enterFolder(const QString &folderId, const QString &folderName);

    /**
     * @brief Returns to the previous folder.
     * @return False if there is no history.
     */
    bool goBack();

    /**
     * @brief Returns to the root folder and clears history.
     */
    void goHome();

    [[nodiscard]] bool canGoBack() const { return !history_.isEmpty(); }

    /**
     * @brief Names from the first entered folder down to the current one.
     */
    [[nodiscard]] QStringList breadcrumb() const;

private:
    struct Location {
        QString id;
        QString name;
    };

    Location root_;
    Location current_;
    QList<Location> history_;
};

#endif // BROWSESESSION_H
