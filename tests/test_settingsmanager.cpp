// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

#include <KConfigGroup>
#include <KSharedConfig>

#include "SettingsManager.h"

class TestSettingsManager : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaults();
    void testSettersEmitOnlyOnChange();
    void testValuesPersist();
    void testLastUsedProfileId();
    void testInvalidStoredValuesFallBack();
    void testSettersClampValues();
    void testResetToDefaults();

private:
    QTemporaryDir *m_tempDir = nullptr;
    QString m_configPath;
    int m_configCounter = 0;
};

void TestSettingsManager::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestSettingsManager::cleanupTestCase()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

void TestSettingsManager::init()
{
    // A fresh file per test, KSharedConfig caches open configs by name
    m_configPath = m_tempDir->filePath(QStringLiteral("audioprofilesrc-%1").arg(++m_configCounter));
}

void TestSettingsManager::testDefaults()
{
    SettingsManager settings(m_configPath);

    QVERIFY(settings.notificationsEnabled());
    QVERIFY(settings.restoreLastProfile());
    QCOMPARE(settings.debounceInterval(), 500);
    QCOMPARE(settings.historyRetentionDays(), 30);
    QCOMPARE(settings.cleanupInterval(), 5);
    QVERIFY(settings.lastUsedProfileId().isNull());
    QVERIFY(!settings.hasLaunchedBefore());
    QVERIFY(!settings.onboardingCompleted());
}

void TestSettingsManager::testSettersEmitOnlyOnChange()
{
    SettingsManager settings(m_configPath);
    QSignalSpy notificationsSpy(&settings, &SettingsManager::notificationsEnabledChanged);
    QSignalSpy debounceSpy(&settings, &SettingsManager::debounceIntervalChanged);

    settings.setNotificationsEnabled(true);
    QCOMPARE(notificationsSpy.count(), 0);
    settings.setNotificationsEnabled(false);
    QCOMPARE(notificationsSpy.count(), 1);

    settings.setDebounceInterval(250);
    settings.setDebounceInterval(250);
    QCOMPARE(debounceSpy.count(), 1);
}

void TestSettingsManager::testValuesPersist()
{
    {
        SettingsManager settings(m_configPath);
        settings.setNotificationsEnabled(false);
        settings.setRestoreLastProfile(false);
        settings.setDebounceInterval(1000);
        settings.setHistoryRetentionDays(14);
        settings.setCleanupInterval(10);
        settings.setHasLaunchedBefore(true);
        settings.setOnboardingCompleted(true);
    }

    SettingsManager reloaded(m_configPath);
    QVERIFY(!reloaded.notificationsEnabled());
    QVERIFY(!reloaded.restoreLastProfile());
    QCOMPARE(reloaded.debounceInterval(), 1000);
    QCOMPARE(reloaded.historyRetentionDays(), 14);
    QCOMPARE(reloaded.cleanupInterval(), 10);
    QVERIFY(reloaded.hasLaunchedBefore());
    QVERIFY(reloaded.onboardingCompleted());

    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_configPath);
    QCOMPARE(config->group(QStringLiteral("Detection")).readEntry(QStringLiteral("HistoryRetentionDays"), 0), 14);
}

void TestSettingsManager::testLastUsedProfileId()
{
    const QUuid id = QUuid::createUuid();
    {
        SettingsManager settings(m_configPath);
        QSignalSpy spy(&settings, &SettingsManager::lastUsedProfileIdChanged);
        settings.setLastUsedProfileId(id);
        QCOMPARE(spy.count(), 1);
    }

    SettingsManager reloaded(m_configPath);
    QCOMPARE(reloaded.lastUsedProfileId(), id);

    reloaded.setLastUsedProfileId(QUuid());
    KConfigGroup state = KSharedConfig::openConfig(m_configPath)->group(QStringLiteral("State"));
    QVERIFY(!state.hasKey(QStringLiteral("LastUsedProfileID")));
}

void TestSettingsManager::testInvalidStoredValuesFallBack()
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(m_configPath);
    KConfigGroup detection = config->group(QStringLiteral("Detection"));
    detection.writeEntry(QStringLiteral("DebounceInterval"), -20);
    detection.writeEntry(QStringLiteral("HistoryRetentionDays"), 0);
    detection.writeEntry(QStringLiteral("CleanupInterval"), -1);
    config->group(QStringLiteral("State")).writeEntry(QStringLiteral("LastUsedProfileID"), QStringLiteral("garbage"));
    QVERIFY(config->sync());

    SettingsManager settings(m_configPath);
    QCOMPARE(settings.debounceInterval(), 500);
    QCOMPARE(settings.historyRetentionDays(), 30);
    QCOMPARE(settings.cleanupInterval(), 5);
    QVERIFY(settings.lastUsedProfileId().isNull());
}

void TestSettingsManager::testSettersClampValues()
{
    SettingsManager settings(m_configPath);

    settings.setDebounceInterval(-5);
    QCOMPARE(settings.debounceInterval(), 0);
    settings.setHistoryRetentionDays(0);
    QCOMPARE(settings.historyRetentionDays(), 1);
    settings.setCleanupInterval(-3);
    QCOMPARE(settings.cleanupInterval(), 1);
}

void TestSettingsManager::testResetToDefaults()
{
    SettingsManager settings(m_configPath);
    const QUuid id = QUuid::createUuid();
    settings.setNotificationsEnabled(false);
    settings.setDebounceInterval(900);
    settings.setHistoryRetentionDays(3);
    settings.setLastUsedProfileId(id);

    settings.resetToDefaults();

    QVERIFY(settings.notificationsEnabled());
    QCOMPARE(settings.debounceInterval(), 500);
    QCOMPARE(settings.historyRetentionDays(), 30);
    // Runtime state is not a preference
    QCOMPARE(settings.lastUsedProfileId(), id);
}

QTEST_MAIN(TestSettingsManager)
#include "test_settingsmanager.moc"
