// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Hotkey.h"
#include "Profile.h"

#include <QList>
#include <QObject>
#include <QUuid>

#include <optional>

class HotkeyRegistrar;

/**
 * @brief Two profiles bound to the same key combination
 */
struct HotkeyConflict {
    Profile first;
    Profile second;
    Hotkey hotkey;

    QString description() const;
};

/**
 * @brief Keeps global shortcut registrations in sync with the profile list
 *
 * Each profile with a valid hotkey gets one registration. Pressing it emits
 * hotkeyActivated(), which ProfileController turns into a manual activation.
 */
class HotkeyManager : public QObject
{
    Q_OBJECT

public:
    explicit HotkeyManager(HotkeyRegistrar *registrar, QObject *parent = nullptr);
    ~HotkeyManager() override;

    /**
     * @brief Unregister everything and register one shortcut per profile hotkey
     */
    void refreshHotkeys(const QList<Profile> &profiles);

    /**
     * @brief Refresh registrations only if a profile's hotkey actually changed
     * @return true if a refresh was performed
     */
    bool handleHotkeyChange(const std::optional<Hotkey> &oldHotkey, const std::optional<Hotkey> &newHotkey,
                            const QList<Profile> &profiles);

    /**
     * @brief Refresh after a profile was saved
     *
     * Also refreshes when a profile keeping its hotkey was renamed, so the
     * shortcut label follows the new name.
     * @return true if a refresh was performed
     */
    bool handleProfileChange(const std::optional<Profile> &oldProfile, const Profile &newProfile,
                             const QList<Profile> &profiles);

    int registeredCount() const { return m_registeredCount; }

    /**
     * @brief List every pair of profiles sharing a hotkey
     * @param excludingId Profile to leave out, e.g. the one being edited
     */
    static QList<HotkeyConflict> findConflicts(const QList<Profile> &profiles, const QUuid &excludingId = QUuid());

    /**
     * @brief Find the profile that already uses a hotkey
     */
    static std::optional<Profile> conflictingProfile(const QList<Profile> &profiles, const Hotkey &hotkey,
                                                     const QUuid &excludingId = QUuid());

    /**
     * @brief Stable registration id for a profile's shortcut
     */
    static QString actionId(const QUuid &profileId);

Q_SIGNALS:
    void hotkeyActivated(const QUuid &profileId);

private:
    HotkeyRegistrar *m_registrar = nullptr;
    int m_registeredCount = 0;
};
