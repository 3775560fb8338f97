// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QObject>
#include <QString>
#include <QUuid>

/**
 * SettingsManager - Manages daemon settings persistence
 *
 * Stores settings in ~/.config/audioprofilesrc using KSharedConfig.
 * All settings are automatically persisted when changed.
 */
class SettingsManager : public QObject
{
    Q_OBJECT

    // General settings
    Q_PROPERTY(bool notificationsEnabled READ notificationsEnabled WRITE setNotificationsEnabled NOTIFY notificationsEnabledChanged)
    Q_PROPERTY(bool restoreLastProfile READ restoreLastProfile WRITE setRestoreLastProfile NOTIFY restoreLastProfileChanged)

    // Detection settings
    Q_PROPERTY(int debounceInterval READ debounceInterval WRITE setDebounceInterval NOTIFY debounceIntervalChanged)
    Q_PROPERTY(int historyRetentionDays READ historyRetentionDays WRITE setHistoryRetentionDays NOTIFY historyRetentionDaysChanged)
    Q_PROPERTY(int cleanupInterval READ cleanupInterval WRITE setCleanupInterval NOTIFY cleanupIntervalChanged)

public:
    explicit SettingsManager(const QString &configName = QStringLiteral("audioprofilesrc"), QObject *parent = nullptr);
    ~SettingsManager() override = default;

    // General settings
    bool notificationsEnabled() const { return m_notificationsEnabled; }
    void setNotificationsEnabled(bool value);

    bool restoreLastProfile() const { return m_restoreLastProfile; }
    void setRestoreLastProfile(bool value);

    // Detection settings
    int debounceInterval() const { return m_debounceInterval; }
    void setDebounceInterval(int ms);

    int historyRetentionDays() const { return m_historyRetentionDays; }
    void setHistoryRetentionDays(int days);

    /**
     * @brief Minutes between periodic history and profile cleanups
     */
    int cleanupInterval() const { return m_cleanupInterval; }
    void setCleanupInterval(int minutes);

    // State
    QUuid lastUsedProfileId() const { return m_lastUsedProfileId; }
    void setLastUsedProfileId(const QUuid &id);

    bool hasLaunchedBefore() const { return m_hasLaunchedBefore; }
    void setHasLaunchedBefore(bool value);

    bool onboardingCompleted() const { return m_onboardingCompleted; }
    void setOnboardingCompleted(bool value);

    /**
     * Reset all settings to defaults
     */
    void resetToDefaults();

Q_SIGNALS:
    void notificationsEnabledChanged();
    void restoreLastProfileChanged();
    void debounceIntervalChanged();
    void historyRetentionDaysChanged();
    void cleanupIntervalChanged();
    void lastUsedProfileIdChanged();

private:
    void loadSettings();
    void saveSettings();

    QString m_configName;

    // General settings
    bool m_notificationsEnabled = true;
    bool m_restoreLastProfile = true;

    // Detection settings
    int m_debounceInterval = 500;
    int m_historyRetentionDays = 30;
    int m_cleanupInterval = 5;

    // State
    QUuid m_lastUsedProfileId;
    bool m_hasLaunchedBefore = false;
    bool m_onboardingCompleted = false;
};
