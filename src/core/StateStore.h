// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "AudioDevice.h"
#include "Profile.h"

#include <QHash>
#include <QList>
#include <QString>

/**
 * @brief Storage for the profile collection and the device history
 *
 * Loads never fail: unreadable or corrupt data yields an empty collection.
 * A failed save must leave the previously stored data intact.
 */
class StateStore
{
public:
    virtual ~StateStore() = default;

    virtual QList<Profile> loadProfiles() = 0;
    virtual bool saveProfiles(const QList<Profile> &profiles) = 0;

    virtual QHash<QString, DeviceHistoryEntry> loadHistory() = 0;
    virtual bool saveHistory(const QHash<QString, DeviceHistoryEntry> &history) = 0;
};
