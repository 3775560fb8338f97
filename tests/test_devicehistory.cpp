// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include <QSignalSpy>
#include <QTest>

#include "DeviceHistoryManager.h"
#include "FakeCollaborators.h"

class TestDeviceHistory : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    // Update tests
    void testUpdateAddsNewDevices();
    void testUpdateMarksMissingDevicesInactive();
    void testUpdateIsOrderIndependent();
    void testUpdateRefreshesMetadata();
    void testReappearingDeviceKeepsOneEntry();
    void testUpdatePersists();

    // Query tests
    void testPreviouslySeenExcludesActive();
    void testPreviouslySeenExcludesGivenDevices();
    void testPreviouslySeenSortedByName();
    void testDeviceLookup();

    // Retention tests
    void testPruneRemovesExpiredEntries();
    void testPreviouslySeenNeverReturnsExpired();
    void testLoadPrunesExpiredEntries();
    void testCustomRetention();

    // Removal tests
    void testRemoveEmitsSignal();
    void testRemoveUnknownDevice();

private:
    InMemoryStateStore *m_store = nullptr;
    FakeClock *m_clock = nullptr;
    DeviceHistoryManager *m_history = nullptr;
};

void TestDeviceHistory::init()
{
    m_store = new InMemoryStateStore();
    m_clock = new FakeClock();
    m_history = new DeviceHistoryManager(m_store);
    m_history->setClock(m_clock->clock());
}

void TestDeviceHistory::cleanup()
{
    delete m_history;
    delete m_clock;
    delete m_store;
    m_history = nullptr;
    m_clock = nullptr;
    m_store = nullptr;
}

void TestDeviceHistory::testUpdateAddsNewDevices()
{
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock")),
                       makeDevice(QStringLiteral("mic"), QStringLiteral("Desk Mic"), false, true)});

    QCOMPARE(m_history->count(), 2);
    const auto entry = m_history->entry(QStringLiteral("dock"));
    QVERIFY(entry.has_value());
    QVERIFY(entry->isCurrentlyActive);
    QCOMPARE(entry->lastSeen, m_clock->now());
}

void TestDeviceHistory::testUpdateMarksMissingDevicesInactive()
{
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock")),
                       makeDevice(QStringLiteral("speakers"), QStringLiteral("Speakers"))});
    const QDateTime firstSeen = m_clock->now();

    m_clock->advanceSecs(60);
    m_history->update({makeDevice(QStringLiteral("speakers"), QStringLiteral("Speakers"))});

    const auto dock = m_history->entry(QStringLiteral("dock"));
    QVERIFY(dock.has_value());
    QVERIFY(!dock->isCurrentlyActive);
    QCOMPARE(dock->lastSeen, firstSeen);

    const auto speakers = m_history->entry(QStringLiteral("speakers"));
    QVERIFY(speakers->isCurrentlyActive);
    QCOMPARE(speakers->lastSeen, m_clock->now());
}

void TestDeviceHistory::testUpdateIsOrderIndependent()
{
    const AudioDevice a = makeDevice(QStringLiteral("a"), QStringLiteral("A"));
    const AudioDevice b = makeDevice(QStringLiteral("b"), QStringLiteral("B"));
    const AudioDevice c = makeDevice(QStringLiteral("c"), QStringLiteral("C"));

    m_history->update({a, b, c});
    m_history->update({b, a});
    m_history->update({a, b});

    QVERIFY(m_history->entry(QStringLiteral("a"))->isCurrentlyActive);
    QVERIFY(m_history->entry(QStringLiteral("b"))->isCurrentlyActive);
    QVERIFY(!m_history->entry(QStringLiteral("c"))->isCurrentlyActive);
}

void TestDeviceHistory::testUpdateRefreshesMetadata()
{
    m_history->update({makeDevice(QStringLiteral("bt"), QStringLiteral("Headphones"))});
    m_history->update({makeDevice(QStringLiteral("bt"), QStringLiteral("Work Headphones"), true, true,
                                  AudioDevice::TransportKind::Bluetooth)});

    const auto device = m_history->device(QStringLiteral("bt"));
    QVERIFY(device.has_value());
    QCOMPARE(device->name, QStringLiteral("Work Headphones"));
    QCOMPARE(device->transportKind, AudioDevice::TransportKind::Bluetooth);
    QVERIFY(device->isInput);
}

void TestDeviceHistory::testReappearingDeviceKeepsOneEntry()
{
    const AudioDevice dock = makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock"));
    m_history->update({dock});
    m_clock->advanceSecs(10);
    m_history->update({});
    m_clock->advanceSecs(10);
    m_history->update({dock});

    QCOMPARE(m_history->count(), 1);
    const auto entry = m_history->entry(QStringLiteral("dock"));
    QVERIFY(entry->isCurrentlyActive);
    QCOMPARE(entry->lastSeen, m_clock->now());
}

void TestDeviceHistory::testUpdatePersists()
{
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock"))});

    QCOMPARE(m_store->m_historySaves, 1);
    QVERIFY(m_store->m_history.contains(QStringLiteral("dock")));
}

void TestDeviceHistory::testPreviouslySeenExcludesActive()
{
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock")),
                       makeDevice(QStringLiteral("speakers"), QStringLiteral("Speakers"))});
    m_history->update({makeDevice(QStringLiteral("speakers"), QStringLiteral("Speakers"))});

    const QList<AudioDevice> seen = m_history->previouslySeen({});
    QCOMPARE(seen.size(), 1);
    QCOMPARE(seen.first().id, QStringLiteral("dock"));
}

void TestDeviceHistory::testPreviouslySeenExcludesGivenDevices()
{
    const AudioDevice dock = makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock"));
    const AudioDevice tv = makeDevice(QStringLiteral("tv"), QStringLiteral("TV"));
    m_history->update({dock, tv});
    m_history->update({});

    const QList<AudioDevice> seen = m_history->previouslySeen({dock});
    QCOMPARE(seen.size(), 1);
    QCOMPARE(seen.first().id, QStringLiteral("tv"));
}

void TestDeviceHistory::testPreviouslySeenSortedByName()
{
    m_history->update({makeDevice(QStringLiteral("3"), QStringLiteral("Zebra")),
                       makeDevice(QStringLiteral("1"), QStringLiteral("Alpha")),
                       makeDevice(QStringLiteral("2"), QStringLiteral("Mango"))});
    m_history->update({});

    const QList<AudioDevice> seen = m_history->previouslySeen({});
    QCOMPARE(seen.size(), 3);
    QCOMPARE(seen.at(0).name, QStringLiteral("Alpha"));
    QCOMPARE(seen.at(1).name, QStringLiteral("Mango"));
    QCOMPARE(seen.at(2).name, QStringLiteral("Zebra"));
}

void TestDeviceHistory::testDeviceLookup()
{
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock"))});

    QVERIFY(m_history->device(QStringLiteral("dock")).has_value());
    QVERIFY(!m_history->device(QStringLiteral("unknown")).has_value());
    QVERIFY(!m_history->entry(QStringLiteral("unknown")).has_value());
}

void TestDeviceHistory::testPruneRemovesExpiredEntries()
{
    m_history->update({makeDevice(QStringLiteral("old"), QStringLiteral("Old Headset"))});
    m_clock->advanceDays(29);
    m_history->update({makeDevice(QStringLiteral("recent"), QStringLiteral("Recent Headset"))});

    QCOMPARE(m_history->count(), 2);

    m_clock->advanceDays(2);
    QCOMPARE(m_history->prune(), 1);
    QVERIFY(!m_history->contains(QStringLiteral("old")));
    QVERIFY(m_history->contains(QStringLiteral("recent")));
}

void TestDeviceHistory::testPreviouslySeenNeverReturnsExpired()
{
    m_history->update({makeDevice(QStringLiteral("old"), QStringLiteral("Old Headset"))});
    m_history->update({});

    // Still inside the window
    m_clock->advanceDays(30);
    QCOMPARE(m_history->previouslySeen({}).size(), 1);

    m_clock->advanceSecs(1);
    QVERIFY(m_history->previouslySeen({}).isEmpty());
}

void TestDeviceHistory::testLoadPrunesExpiredEntries()
{
    const QDateTime now = m_clock->now();
    m_store->m_history.insert(QStringLiteral("old"),
                              DeviceHistoryEntry{makeDevice(QStringLiteral("old"), QStringLiteral("Old")),
                                                 now.addDays(-45), false});
    m_store->m_history.insert(QStringLiteral("new"),
                              DeviceHistoryEntry{makeDevice(QStringLiteral("new"), QStringLiteral("New")),
                                                 now.addDays(-2), false});

    m_history->load();

    QCOMPARE(m_history->count(), 1);
    QVERIFY(m_history->contains(QStringLiteral("new")));
    // Expired entries are removed from storage too
    QVERIFY(!m_store->m_history.contains(QStringLiteral("old")));
}

void TestDeviceHistory::testCustomRetention()
{
    m_history->setRetentionDays(7);
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock"))});
    m_history->update({});

    m_clock->advanceDays(8);
    QCOMPARE(m_history->prune(), 1);
}

void TestDeviceHistory::testRemoveEmitsSignal()
{
    m_history->update({makeDevice(QStringLiteral("dock"), QStringLiteral("USB Dock"))});
    QSignalSpy spy(m_history, &DeviceHistoryManager::deviceRemoved);

    QVERIFY(m_history->remove(QStringLiteral("dock")));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(0).toString(), QStringLiteral("dock"));
    QCOMPARE(spy.first().at(1).toString(), QStringLiteral("USB Dock"));
    QVERIFY(!m_history->contains(QStringLiteral("dock")));
    QVERIFY(!m_store->m_history.contains(QStringLiteral("dock")));
}

void TestDeviceHistory::testRemoveUnknownDevice()
{
    QSignalSpy spy(m_history, &DeviceHistoryManager::deviceRemoved);
    QVERIFY(!m_history->remove(QStringLiteral("missing")));
    QCOMPARE(spy.count(), 0);
}

QTEST_MAIN(TestDeviceHistory)
#include "test_devicehistory.moc"
