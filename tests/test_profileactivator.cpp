// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include <QSignalSpy>
#include <QTest>

#include <algorithm>

#include "FakeCollaborators.h"
#include "ProfileActivator.h"

class TestProfileActivator : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testActivateAppliesPreferredMode();
    void testFirstConnectedDeviceWins();
    void testFailedDeviceFallsThrough();
    void testDirectionMustBeSupported();
    void testNothingConnected();
    void testToggleModeReapplies();
    void testRefreshPreservesMode();
    void testSyncDoesNotApply();
    void testDeactivate();

private:
    FakeAudioBackend *m_backend = nullptr;
    ProfileActivator *m_activator = nullptr;
    Profile m_profile;
};

void TestProfileActivator::init()
{
    m_backend = new FakeAudioBackend();
    m_backend->setDevices({makeDevice(QStringLiteral("speakers"), QStringLiteral("Speakers"), true, false,
                                      AudioDevice::TransportKind::BuiltIn),
                           makeDevice(QStringLiteral("headset"), QStringLiteral("Headset"), true, true,
                                      AudioDevice::TransportKind::Bluetooth),
                           makeDevice(QStringLiteral("webcam-mic"), QStringLiteral("Webcam"), false, true)});
    m_activator = new ProfileActivator(m_backend, m_backend);

    m_profile = Profile::createNew(QStringLiteral("Desk"));
    m_profile.publicOutputPriority = {QStringLiteral("speakers")};
    m_profile.publicInputPriority = {QStringLiteral("webcam-mic")};
    m_profile.privateOutputPriority = {QStringLiteral("headset")};
    m_profile.privateInputPriority = {QStringLiteral("headset")};
}

void TestProfileActivator::cleanup()
{
    delete m_activator;
    delete m_backend;
    m_activator = nullptr;
    m_backend = nullptr;
}

void TestProfileActivator::testActivateAppliesPreferredMode()
{
    QSignalSpy profileSpy(m_activator, &ProfileActivator::activeProfileChanged);
    QSignalSpy modeSpy(m_activator, &ProfileActivator::activeModeChanged);
    m_profile.preferredMode = ProfileMode::Private;

    const AppliedDevices applied = m_activator->activate(m_profile);

    QCOMPARE(m_activator->activeMode(), ProfileMode::Private);
    QCOMPARE(m_activator->activeProfile()->id, m_profile.id);
    QCOMPARE(applied.outputId, QStringLiteral("headset"));
    QCOMPARE(applied.inputId, QStringLiteral("headset"));
    QCOMPARE(m_backend->defaultOutput(), QStringLiteral("headset"));
    QCOMPARE(profileSpy.count(), 1);
    QCOMPARE(modeSpy.count(), 1);
}

void TestProfileActivator::testFirstConnectedDeviceWins()
{
    m_profile.publicOutputPriority = {QStringLiteral("unplugged"), QStringLiteral("headset"),
                                      QStringLiteral("speakers")};

    const AppliedDevices applied = m_activator->activate(m_profile);

    QCOMPARE(applied.outputId, QStringLiteral("headset"));
    // The unplugged device is never offered to the sound server
    QCOMPARE(m_backend->setDefaultCalls().first().second, QStringLiteral("headset"));
}

void TestProfileActivator::testFailedDeviceFallsThrough()
{
    m_profile.publicOutputPriority = {QStringLiteral("headset"), QStringLiteral("speakers")};
    m_backend->failFor(QStringLiteral("headset"));

    const AppliedDevices applied = m_activator->activate(m_profile);

    QCOMPARE(applied.outputId, QStringLiteral("speakers"));
    const auto calls = m_backend->setDefaultCalls();
    const int headsetCalls = int(std::count_if(calls.cbegin(), calls.cend(), [](const QPair<DeviceKind, QString> &call) {
        return call.second == QLatin1String("headset");
    }));
    // Tried once, not retried
    QCOMPARE(headsetCalls, 1);
}

void TestProfileActivator::testDirectionMustBeSupported()
{
    // Speakers have no input side
    m_profile.publicInputPriority = {QStringLiteral("speakers"), QStringLiteral("webcam-mic")};

    const AppliedDevices applied = m_activator->activate(m_profile);
    QCOMPARE(applied.inputId, QStringLiteral("webcam-mic"));
}

void TestProfileActivator::testNothingConnected()
{
    m_backend->setDevices({});

    const AppliedDevices applied = m_activator->activate(m_profile);

    QVERIFY(applied.outputId.isEmpty());
    QVERIFY(applied.inputId.isEmpty());
    QVERIFY(m_backend->setDefaultCalls().isEmpty());
    // The profile is active even if nothing could be applied
    QVERIFY(m_activator->activeProfile().has_value());
}

void TestProfileActivator::testToggleModeReapplies()
{
    m_activator->activate(m_profile);
    QCOMPARE(m_backend->defaultOutput(), QStringLiteral("speakers"));
    QSignalSpy modeSpy(m_activator, &ProfileActivator::activeModeChanged);

    m_activator->toggleMode();

    QCOMPARE(m_activator->activeMode(), ProfileMode::Private);
    QCOMPARE(m_backend->defaultOutput(), QStringLiteral("headset"));
    QCOMPARE(modeSpy.count(), 1);
    QCOMPARE(modeSpy.first().at(0).value<ProfileMode>(), ProfileMode::Private);

    m_activator->toggleMode();
    QCOMPARE(m_backend->defaultOutput(), QStringLiteral("speakers"));
}

void TestProfileActivator::testRefreshPreservesMode()
{
    m_activator->activate(m_profile);
    m_activator->toggleMode();

    Profile edited = m_profile;
    edited.privateOutputPriority = {QStringLiteral("speakers")};
    m_activator->refreshActiveProfile(edited, true);

    QCOMPARE(m_activator->activeMode(), ProfileMode::Private);
    QCOMPARE(m_backend->defaultOutput(), QStringLiteral("speakers"));

    m_activator->refreshActiveProfile(edited, false);
    QCOMPARE(m_activator->activeMode(), ProfileMode::Public);
}

void TestProfileActivator::testSyncDoesNotApply()
{
    m_activator->activate(m_profile);
    m_backend->clearCalls();
    QSignalSpy spy(m_activator, &ProfileActivator::activeProfileChanged);

    Profile edited = m_profile;
    edited.publicOutputPriority.clear();
    m_activator->syncActiveProfile(edited);

    QVERIFY(m_backend->setDefaultCalls().isEmpty());
    QCOMPARE(m_activator->activeProfile().value(), edited);
    QCOMPARE(spy.count(), 1);

    // Other profiles are ignored
    m_activator->syncActiveProfile(Profile::createNew(QStringLiteral("Other")));
    QCOMPARE(m_activator->activeProfile()->id, m_profile.id);
}

void TestProfileActivator::testDeactivate()
{
    m_activator->activate(m_profile);
    QSignalSpy spy(m_activator, &ProfileActivator::activeProfileChanged);

    m_activator->deactivate();
    QVERIFY(!m_activator->activeProfile().has_value());
    QCOMPARE(spy.count(), 1);

    m_activator->deactivate();
    QCOMPARE(spy.count(), 1);
}

QTEST_MAIN(TestProfileActivator)
#include "test_profileactivator.moc"
