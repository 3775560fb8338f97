// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "StateStore.h"

#include <QJsonDocument>
#include <QString>

#include <optional>

/**
 * @brief Stores profiles and device history as JSON files
 *
 * Files live in ~/.config/audioprofiles/ (QStandardPaths::AppConfigLocation)
 * unless another directory is given:
 *   profiles.json        {"schemaVersion": 2, "profiles": [...]}
 *   device_history.json  {"schemaVersion": 1, "devices": {uid: entry}}
 *
 * A profiles file holding a bare array is read as schema version 1.
 * Writes go through QSaveFile so a failed save keeps the previous file.
 */
class JsonStateStore : public StateStore
{
public:
    static constexpr int HISTORY_SCHEMA_VERSION = 1;

    explicit JsonStateStore(const QString &directory = QString());
    ~JsonStateStore() override;

    QList<Profile> loadProfiles() override;
    bool saveProfiles(const QList<Profile> &profiles) override;

    QHash<QString, DeviceHistoryEntry> loadHistory() override;
    bool saveHistory(const QHash<QString, DeviceHistoryEntry> &history) override;

    QString directory() const { return m_directory; }
    QString profilesFilePath() const;
    QString historyFilePath() const;

    /**
     * @brief Decode a profiles document of any supported schema version
     */
    static QList<Profile> profilesFromDocument(const QJsonDocument &doc);

private:
    std::optional<QJsonDocument> readDocument(const QString &path) const;
    bool writeDocument(const QString &path, const QJsonDocument &doc) const;

    QString m_directory;
};
