// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Profile.h"

#include <QList>
#include <QObject>
#include <QSet>
#include <QString>
#include <QUuid>

#include <optional>

class DeviceHistoryManager;
class StateStore;

/**
 * @brief Owns the ordered profile collection
 *
 * Keeps the "System Default" profile present and first, validates profiles
 * before storing them and strips references to devices that are neither
 * connected nor remembered by the device history. Every mutation is
 * persisted through the StateStore.
 *
 * Activation and hotkey side effects are handled by ProfileController.
 */
class ProfileManager : public QObject
{
    Q_OBJECT

public:
    explicit ProfileManager(StateStore *store, const DeviceHistoryManager *history, QObject *parent = nullptr);
    ~ProfileManager() override;

    /**
     * @brief Load profiles, clean stale device references and ensure System Default
     *
     * Saves immediately if System Default had to be created or cleanup
     * changed anything.
     *
     * @param connectedIds UIDs of the devices present right now
     */
    void load(const QSet<QString> &connectedIds);

    QList<Profile> profiles() const { return m_profiles; }
    int count() const { return m_profiles.size(); }

    std::optional<Profile> profile(const QUuid &id) const;
    std::optional<Profile> systemDefault() const;
    int indexOf(const QUuid &id) const;

    /**
     * @brief Check a profile before storing it
     * @return Error message, empty if the profile is acceptable
     */
    QString validate(const Profile &profile) const;

    /**
     * @brief Insert a new profile or replace the one with the same id
     *
     * Names are trimmed, device lists de-duplicated and an empty icon replaced
     * by the default. Emits errorOccurred() and returns false when validation
     * fails.
     */
    bool upsert(const Profile &profile);

    /**
     * @brief Delete a profile
     * @return false for unknown ids and for System Default
     */
    bool remove(const QUuid &id);

    /**
     * @brief Reorder a profile
     *
     * Indices refer to the full list. System Default cannot be moved and
     * nothing can be moved in front of it.
     *
     * @return true if the order changed
     */
    bool move(int from, int to);

    /**
     * @brief Drop device ids that are neither connected nor in the history
     */
    Profile cleanupInvalidDevices(const Profile &profile, const QSet<QString> &connectedIds) const;

    /**
     * @brief Run cleanupInvalidDevices() over every profile, saving if anything changed
     * @return true if any profile changed
     */
    bool cleanupAll(const QSet<QString> &connectedIds);

    /**
     * @brief Remove a device id from every profile's five lists
     * @return true if any profile referenced the device
     */
    bool stripDevice(const QString &deviceId);

Q_SIGNALS:
    void profilesChanged();
    void errorOccurred(const QString &message);

private:
    static Profile normalized(const Profile &profile);
    static QList<Profile> withSystemDefaultFirst(const QList<Profile> &profiles);
    bool save();

    StateStore *m_store = nullptr;
    const DeviceHistoryManager *m_history = nullptr;
    QList<Profile> m_profiles;
};
