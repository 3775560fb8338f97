// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "HotkeyManager.h"
#include "HotkeyRegistrar.h"
#include "Logging.h"

#include <QPointer>

QString HotkeyConflict::description() const
{
    return QStringLiteral("Hotkey %1 is used by both '%2' and '%3'").arg(hotkey.toString(), first.name, second.name);
}

HotkeyManager::HotkeyManager(HotkeyRegistrar *registrar, QObject *parent)
    : QObject(parent)
    , m_registrar(registrar)
{
}

HotkeyManager::~HotkeyManager() = default;

void HotkeyManager::refreshHotkeys(const QList<Profile> &profiles)
{
    if (!m_registrar) {
        return;
    }

    m_registrar->unregisterAll();
    m_registeredCount = 0;

    QPointer<HotkeyManager> self(this);
    for (const Profile &profile : profiles) {
        if (!profile.hotkey) {
            continue;
        }
        if (!profile.hotkey->isValid()) {
            qCWarning(audioprofilesHotkeys) << "Skipping invalid hotkey for profile" << profile.name;
            continue;
        }

        const QUuid id = profile.id;
        const bool ok = m_registrar->registerHotkey(*profile.hotkey, actionId(id),
                                                    QStringLiteral("Activate profile '%1'").arg(profile.name),
                                                    [self, id]() {
                                                        if (self) {
                                                            Q_EMIT self->hotkeyActivated(id);
                                                        }
                                                    });
        if (ok) {
            ++m_registeredCount;
            qCDebug(audioprofilesHotkeys) << "Registered hotkey" << profile.hotkey->toString() << "for profile"
                                          << profile.name;
        } else {
            qCWarning(audioprofilesHotkeys) << "Failed to register hotkey" << profile.hotkey->toString()
                                            << "for profile" << profile.name;
        }
    }

    qCInfo(audioprofilesHotkeys) << "Registered hotkeys for" << m_registeredCount << "profiles";
}

bool HotkeyManager::handleHotkeyChange(const std::optional<Hotkey> &oldHotkey,
                                       const std::optional<Hotkey> &newHotkey,
                                       const QList<Profile> &profiles)
{
    if (oldHotkey == newHotkey) {
        return false;
    }
    refreshHotkeys(profiles);
    return true;
}

bool HotkeyManager::handleProfileChange(const std::optional<Profile> &oldProfile, const Profile &newProfile,
                                        const QList<Profile> &profiles)
{
    const std::optional<Hotkey> oldHotkey = oldProfile ? oldProfile->hotkey : std::nullopt;
    if (handleHotkeyChange(oldHotkey, newProfile.hotkey, profiles)) {
        return true;
    }
    if (oldProfile && newProfile.hotkey && oldProfile->name != newProfile.name) {
        refreshHotkeys(profiles);
        return true;
    }
    return false;
}

QList<HotkeyConflict> HotkeyManager::findConflicts(const QList<Profile> &profiles, const QUuid &excludingId)
{
    QList<HotkeyConflict> conflicts;

    for (int i = 0; i < profiles.size(); ++i) {
        const Profile &a = profiles.at(i);
        if (!a.hotkey || (!excludingId.isNull() && a.id == excludingId)) {
            continue;
        }
        for (int j = i + 1; j < profiles.size(); ++j) {
            const Profile &b = profiles.at(j);
            if (!b.hotkey || (!excludingId.isNull() && b.id == excludingId)) {
                continue;
            }
            if (a.hotkey->conflicts(*b.hotkey)) {
                conflicts.append(HotkeyConflict{a, b, *a.hotkey});
            }
        }
    }

    return conflicts;
}

std::optional<Profile> HotkeyManager::conflictingProfile(const QList<Profile> &profiles, const Hotkey &hotkey,
                                                         const QUuid &excludingId)
{
    for (const Profile &profile : profiles) {
        if (profile.id == excludingId) {
            continue;
        }
        if (profile.hotkey && profile.hotkey->conflicts(hotkey)) {
            return profile;
        }
    }
    return std::nullopt;
}

QString HotkeyManager::actionId(const QUuid &profileId)
{
    return QStringLiteral("activate-profile-%1").arg(profileId.toString(QUuid::WithoutBraces));
}
