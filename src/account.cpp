#include "account.h"

#include <QDir>
#include <QFile>
#include <QSettings>

Account::Account(const QString &stateDirectory)
    : m_stateDirectory(stateDirectory)
{
    // Try to load existing settings if path is set
    if (!m_stateDirectory.isEmpty()) {
        load();
    }
}

void Account::setStateDirectory(const QString &path)
{
    m_stateDirectory = path;
}

QString Account::displayName() const
{
    if (!m_displayName.isEmpty()) {
        return m_displayName;
    }
    return m_accountId;
}

void Account::setDisplayName(const QString &name)
{
    m_displayName = name;
}

void Account::signIn(const QString &accountId, const QString &remoteFolder)
{
    m_accountId = accountId;
    if (!remoteFolder.isEmpty()) {
        m_remoteFolder = QDir::cleanPath(remoteFolder);
    }
    m_signedIn = !m_accountId.isEmpty();
    m_signedInAt = m_signedIn ? QDateTime::currentDateTimeUtc() : QDateTime();
}

void Account::signOut()
{
    m_accountId.clear();
    m_displayName.clear();
    m_signedIn = false;
    m_signedInAt = QDateTime();
}

void Account::setRemoteFolder(const QString &path)
{
    m_remoteFolder = path.isEmpty() ? QString() : QDir::cleanPath(path);
}

// ========== Persistence ==========

bool Account::load()
{
    QString configPath = configFilePath();
    if (configPath.isEmpty() || !QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    m_accountId = settings.value("account/id", QString()).toString();
    m_displayName = settings.value("account/displayName", QString()).toString();
    m_signedIn = settings.value("account/signedIn", false).toBool() && !m_accountId.isEmpty();
    m_signedInAt = QDateTime::fromString(settings.value("account/signedInAt").toString(),
                                         Qt::ISODateWithMs);
    m_remoteFolder = settings.value("remote/folder", QString()).toString();

    return true;
}

bool Account::save()
{
    if (m_stateDirectory.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_stateDirectory);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    settings.setValue("account/id", m_accountId);
    settings.setValue("account/displayName", m_displayName);
    settings.setValue("account/signedIn", m_signedIn);
    if (m_signedInAt.isValid()) {
        settings.setValue("account/signedInAt", m_signedInAt.toString(Qt::ISODateWithMs));
    } else {
        settings.remove("account/signedInAt");
    }
    settings.setValue("remote/folder", m_remoteFolder);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Account::exists() const
{
    return QFile::exists(configFilePath());
}

QString Account::configFilePath() const
{
    if (m_stateDirectory.isEmpty()) {
        return QString();
    }
    return QDir(m_stateDirectory).filePath("account.conf");
}
