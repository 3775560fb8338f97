// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include <QTest>

#include "TriggerMatcher.h"

class TestTriggerMatcher : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testNoProfiles();
    void testProfilesWithoutTriggersNeverMatch();
    void testNoTriggerPresent();
    void testSingleMatch();
    void testMostTriggersWins();
    void testTieKeepsEarlierProfile();
    void testPrimaryDeviceFollowsTriggerOrder();
    void testReorderChangesTieWinner();

private:
    static Profile profileWithTriggers(const QString &name, const QStringList &triggers);
};

Profile TestTriggerMatcher::profileWithTriggers(const QString &name, const QStringList &triggers)
{
    Profile profile = Profile::createNew(name);
    profile.triggerDeviceIds = triggers;
    return profile;
}

void TestTriggerMatcher::testNoProfiles()
{
    QVERIFY(!TriggerMatcher::findBestMatch({}, {QStringLiteral("dock")}).has_value());
}

void TestTriggerMatcher::testProfilesWithoutTriggersNeverMatch()
{
    const QList<Profile> profiles = {Profile::createSystemDefault(), Profile::createNew(QStringLiteral("Empty"))};
    QVERIFY(!TriggerMatcher::findBestMatch(profiles, {QStringLiteral("dock")}).has_value());
}

void TestTriggerMatcher::testNoTriggerPresent()
{
    const QList<Profile> profiles = {profileWithTriggers(QStringLiteral("Desk"), {QStringLiteral("dock")})};
    QVERIFY(!TriggerMatcher::findBestMatch(profiles, {QStringLiteral("headset")}).has_value());
    QVERIFY(!TriggerMatcher::findBestMatch(profiles, {}).has_value());
}

void TestTriggerMatcher::testSingleMatch()
{
    const Profile desk = profileWithTriggers(QStringLiteral("Desk"), {QStringLiteral("dock")});
    const auto match = TriggerMatcher::findBestMatch({Profile::createSystemDefault(), desk},
                                                     {QStringLiteral("dock"), QStringLiteral("builtin")});

    QVERIFY(match.has_value());
    QCOMPARE(match->profile.id, desk.id);
    QCOMPARE(match->matchCount, 1);
    QCOMPARE(match->primaryTriggerDevice, QStringLiteral("dock"));
}

void TestTriggerMatcher::testMostTriggersWins()
{
    const Profile desk = profileWithTriggers(QStringLiteral("Desk"), {QStringLiteral("dock")});
    const Profile studio = profileWithTriggers(QStringLiteral("Studio"),
                                               {QStringLiteral("dock"), QStringLiteral("interface")});

    const auto match = TriggerMatcher::findBestMatch({desk, studio},
                                                     {QStringLiteral("dock"), QStringLiteral("interface")});
    QVERIFY(match.has_value());
    QCOMPARE(match->profile.name, QStringLiteral("Studio"));
    QCOMPARE(match->matchCount, 2);
}

void TestTriggerMatcher::testTieKeepsEarlierProfile()
{
    const Profile first = profileWithTriggers(QStringLiteral("First"), {QStringLiteral("dock")});
    const Profile second = profileWithTriggers(QStringLiteral("Second"), {QStringLiteral("dock")});

    const auto match = TriggerMatcher::findBestMatch({first, second}, {QStringLiteral("dock")});
    QVERIFY(match.has_value());
    QCOMPARE(match->profile.name, QStringLiteral("First"));
}

void TestTriggerMatcher::testPrimaryDeviceFollowsTriggerOrder()
{
    const Profile profile = profileWithTriggers(
        QStringLiteral("Studio"), {QStringLiteral("missing"), QStringLiteral("interface"), QStringLiteral("dock")});

    const auto match = TriggerMatcher::findBestMatch({profile}, {QStringLiteral("dock"), QStringLiteral("interface")});
    QVERIFY(match.has_value());
    QCOMPARE(match->matchCount, 2);
    QCOMPARE(match->primaryTriggerDevice, QStringLiteral("interface"));
}

void TestTriggerMatcher::testReorderChangesTieWinner()
{
    const Profile first = profileWithTriggers(QStringLiteral("First"), {QStringLiteral("dock")});
    const Profile second = profileWithTriggers(QStringLiteral("Second"), {QStringLiteral("dock")});

    const auto match = TriggerMatcher::findBestMatch({second, first}, {QStringLiteral("dock")});
    QVERIFY(match.has_value());
    QCOMPARE(match->profile.name, QStringLiteral("Second"));
}

QTEST_MAIN(TestTriggerMatcher)
#include "test_triggermatcher.moc"
