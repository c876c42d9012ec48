#ifndef ACCOUNT_H
#define ACCOUNT_H

#include <QString>
#include <QDateTime>

/**
 * @brief The account this installation syncs with
 *
 * Stored in the state directory as account.conf, next to the records and
 * the pending queue, so signing out of one state directory leaves others
 * untouched.
 *
 * An account corresponds to:
 *   - One remote folder shared by every device of the account
 *   - One device registry inside that folder
 */
class Account
{
public:
    /**
     * @brief Create an account bound to a state directory
     * @param stateDirectory Directory holding account.conf
     */
    explicit Account(const QString &stateDirectory = QString());

    QString stateDirectory() const { return m_stateDirectory; }
    void setStateDirectory(const QString &path);

    // ========== Identity ==========

    QString accountId() const { return m_accountId; }

    // Name shown to the user, defaults to the account ID
    QString displayName() const;
    void setDisplayName(const QString &name);

    bool isSignedIn() const { return m_signedIn; }
    QDateTime signedInAt() const { return m_signedInAt; }

    /**
     * @brief Sign in and record when
     */
    void signIn(const QString &accountId, const QString &remoteFolder);

    /**
     * @brief Forget the account; the remote folder setting is kept
     */
    void signOut();

    // ========== Remote ==========

    QString remoteFolder() const { return m_remoteFolder; }
    void setRemoteFolder(const QString &path);

    // ========== Persistence ==========

    // Load from account.conf; false if there is none
    bool load();

    // Save to account.conf
    bool save();

    // Check if account.conf exists
    bool exists() const;

    QString configFilePath() const;

private:
    QString m_stateDirectory;

    QString m_accountId;
    QString m_displayName;
    QString m_remoteFolder;
    bool m_signedIn = false;
    QDateTime m_signedInAt;
};

#endif // ACCOUNT_H
