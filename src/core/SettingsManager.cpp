// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "SettingsManager.h"
#include "Logging.h"

#include <KConfigGroup>
#include <KSharedConfig>

SettingsManager::SettingsManager(const QString &configName, QObject *parent)
    : QObject(parent)
    , m_configName(configName)
{
    loadSettings();
}

void SettingsManager::loadSettings()
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_configName);

    // General settings
    KConfigGroup general = config->group(QStringLiteral("General"));
    m_notificationsEnabled = general.readEntry(QStringLiteral("NotificationsEnabled"), true);
    m_restoreLastProfile = general.readEntry(QStringLiteral("RestoreLastProfile"), true);

    // Detection settings, out-of-range values fall back to defaults
    KConfigGroup detection = config->group(QStringLiteral("Detection"));
    m_debounceInterval = detection.readEntry(QStringLiteral("DebounceInterval"), 500);
    if (m_debounceInterval < 0) {
        m_debounceInterval = 500;
    }
    m_historyRetentionDays = detection.readEntry(QStringLiteral("HistoryRetentionDays"), 30);
    if (m_historyRetentionDays < 1) {
        m_historyRetentionDays = 30;
    }
    m_cleanupInterval = detection.readEntry(QStringLiteral("CleanupInterval"), 5);
    if (m_cleanupInterval < 1) {
        m_cleanupInterval = 5;
    }

    // State
    KConfigGroup state = config->group(QStringLiteral("State"));
    m_lastUsedProfileId = QUuid::fromString(state.readEntry(QStringLiteral("LastUsedProfileID"), QString()));
    m_hasLaunchedBefore = state.readEntry(QStringLiteral("HasLaunchedBefore"), false);
    m_onboardingCompleted = state.readEntry(QStringLiteral("OnboardingCompleted"), false);

    qCDebug(audioprofilesCore) << "Loaded settings from" << m_configName;
}

void SettingsManager::saveSettings()
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_configName);

    KConfigGroup general = config->group(QStringLiteral("General"));
    general.writeEntry(QStringLiteral("NotificationsEnabled"), m_notificationsEnabled);
    general.writeEntry(QStringLiteral("RestoreLastProfile"), m_restoreLastProfile);

    KConfigGroup detection = config->group(QStringLiteral("Detection"));
    detection.writeEntry(QStringLiteral("DebounceInterval"), m_debounceInterval);
    detection.writeEntry(QStringLiteral("HistoryRetentionDays"), m_historyRetentionDays);
    detection.writeEntry(QStringLiteral("CleanupInterval"), m_cleanupInterval);

    KConfigGroup state = config->group(QStringLiteral("State"));
    if (m_lastUsedProfileId.isNull()) {
        state.deleteEntry(QStringLiteral("LastUsedProfileID"));
    } else {
        state.writeEntry(QStringLiteral("LastUsedProfileID"), m_lastUsedProfileId.toString(QUuid::WithoutBraces));
    }
    state.writeEntry(QStringLiteral("HasLaunchedBefore"), m_hasLaunchedBefore);
    state.writeEntry(QStringLiteral("OnboardingCompleted"), m_onboardingCompleted);

    if (!config->sync()) {
        qCWarning(audioprofilesCore) << "Failed to write settings to" << m_configName;
    }
}

void SettingsManager::setNotificationsEnabled(bool value)
{
    if (m_notificationsEnabled != value) {
        m_notificationsEnabled = value;
        saveSettings();
        Q_EMIT notificationsEnabledChanged();
    }
}

void SettingsManager::setRestoreLastProfile(bool value)
{
    if (m_restoreLastProfile != value) {
        m_restoreLastProfile = value;
        saveSettings();
        Q_EMIT restoreLastProfileChanged();
    }
}

void SettingsManager::setDebounceInterval(int ms)
{
    ms = qMax(0, ms);
    if (m_debounceInterval != ms) {
        m_debounceInterval = ms;
        saveSettings();
        Q_EMIT debounceIntervalChanged();
    }
}

void SettingsManager::setHistoryRetentionDays(int days)
{
    days = qMax(1, days);
    if (m_historyRetentionDays != days) {
        m_historyRetentionDays = days;
        saveSettings();
        Q_EMIT historyRetentionDaysChanged();
    }
}

void SettingsManager::setCleanupInterval(int minutes)
{
    minutes = qMax(1, minutes);
    if (m_cleanupInterval != minutes) {
        m_cleanupInterval = minutes;
        saveSettings();
        Q_EMIT cleanupIntervalChanged();
    }
}

void SettingsManager::setLastUsedProfileId(const QUuid &id)
{
    if (m_lastUsedProfileId != id) {
        m_lastUsedProfileId = id;
        saveSettings();
        Q_EMIT lastUsedProfileIdChanged();
    }
}

void SettingsManager::setHasLaunchedBefore(bool value)
{
    if (m_hasLaunchedBefore != value) {
        m_hasLaunchedBefore = value;
        saveSettings();
    }
}

void SettingsManager::setOnboardingCompleted(bool value)
{
    if (m_onboardingCompleted != value) {
        m_onboardingCompleted = value;
        saveSettings();
    }
}

void SettingsManager::resetToDefaults()
{
    setNotificationsEnabled(true);
    setRestoreLastProfile(true);
    setDebounceInterval(500);
    setHistoryRetentionDays(30);
    setCleanupInterval(5);
}
