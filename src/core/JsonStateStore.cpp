// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "JsonStateStore.h"
#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

JsonStateStore::JsonStateStore(const QString &directory)
    : m_directory(directory)
{
    if (m_directory.isEmpty()) {
        m_directory = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    }
}

JsonStateStore::~JsonStateStore() = default;

QString JsonStateStore::profilesFilePath() const
{
    return m_directory + QStringLiteral("/profiles.json");
}

QString JsonStateStore::historyFilePath() const
{
    return m_directory + QStringLiteral("/device_history.json");
}

QList<Profile> JsonStateStore::loadProfiles()
{
    const auto doc = readDocument(profilesFilePath());
    if (!doc) {
        return {};
    }
    return profilesFromDocument(*doc);
}

QList<Profile> JsonStateStore::profilesFromDocument(const QJsonDocument &doc)
{
    int schemaVersion = 1;
    QJsonArray array;

    if (doc.isArray()) {
        // Files written before the schema envelope existed
        array = doc.array();
    } else if (doc.isObject()) {
        const QJsonObject root = doc.object();
        schemaVersion = root[QStringLiteral("schemaVersion")].toInt(1);
        array = root[QStringLiteral("profiles")].toArray();
        if (schemaVersion > Profile::SCHEMA_VERSION) {
            qCWarning(audioprofilesProfiles) << "Profiles file has newer schema version" << schemaVersion
                                             << "- reading known fields only";
        }
    } else {
        qCWarning(audioprofilesProfiles) << "Profiles file has unexpected layout";
        return {};
    }

    QList<Profile> profiles;
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            continue;
        }
        if (auto profile = Profile::fromJson(value.toObject(), schemaVersion)) {
            profiles.append(*profile);
        }
    }
    return profiles;
}

bool JsonStateStore::saveProfiles(const QList<Profile> &profiles)
{
    QJsonArray array;
    for (const Profile &profile : profiles) {
        array.append(profile.toJson());
    }

    QJsonObject root;
    root[QStringLiteral("schemaVersion")] = Profile::SCHEMA_VERSION;
    root[QStringLiteral("profiles")] = array;

    if (!writeDocument(profilesFilePath(), QJsonDocument(root))) {
        return false;
    }
    qCDebug(audioprofilesProfiles) << "Saved" << profiles.size() << "profiles to" << profilesFilePath();
    return true;
}

QHash<QString, DeviceHistoryEntry> JsonStateStore::loadHistory()
{
    QHash<QString, DeviceHistoryEntry> history;

    const auto doc = readDocument(historyFilePath());
    if (!doc || !doc->isObject()) {
        return history;
    }

    const QJsonObject devices = doc->object()[QStringLiteral("devices")].toObject();
    for (auto it = devices.constBegin(); it != devices.constEnd(); ++it) {
        DeviceHistoryEntry entry = DeviceHistoryEntry::fromJson(it.value().toObject());
        if (entry.device.id.isEmpty()) {
            qCWarning(audioprofilesHistory) << "Skipping unreadable history entry" << it.key();
            continue;
        }
        // The map key is authoritative
        entry.device.id = it.key();
        history.insert(it.key(), entry);
    }
    return history;
}

bool JsonStateStore::saveHistory(const QHash<QString, DeviceHistoryEntry> &history)
{
    QJsonObject devices;
    for (auto it = history.constBegin(); it != history.constEnd(); ++it) {
        devices[it.key()] = it->toJson();
    }

    QJsonObject root;
    root[QStringLiteral("schemaVersion")] = HISTORY_SCHEMA_VERSION;
    root[QStringLiteral("devices")] = devices;

    return writeDocument(historyFilePath(), QJsonDocument(root));
}

std::optional<QJsonDocument> JsonStateStore::readDocument(const QString &path) const
{
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(audioprofilesCore) << "Failed to open" << path << ":" << file.errorString();
        return std::nullopt;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(audioprofilesCore) << "Failed to parse" << path << ":" << error.errorString();
        return std::nullopt;
    }
    return doc;
}

bool JsonStateStore::writeDocument(const QString &path, const QJsonDocument &doc) const
{
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(audioprofilesCore) << "Failed to create directory" << m_directory;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(audioprofilesCore) << "Failed to open" << path << "for writing:" << file.errorString();
        return false;
    }
    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0) {
        qCWarning(audioprofilesCore) << "Failed to write" << path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(audioprofilesCore) << "Failed to commit" << path << ":" << file.errorString();
        return false;
    }
    return true;
}
