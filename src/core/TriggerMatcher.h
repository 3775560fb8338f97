// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Profile.h"

#include <QList>
#include <QSet>
#include <QString>

#include <optional>

struct TriggerMatch {
    Profile profile;
    int matchCount = 0;
    QString primaryTriggerDevice; // First trigger id, in profile order, that is present
};

/**
 * @brief Picks the profile whose trigger devices best match the present devices
 */
class TriggerMatcher
{
public:
    /**
     * @brief Find the profile with the most present trigger devices
     *
     * Profiles without trigger devices are never selected. Profiles are
     * evaluated in collection order and a tie keeps the earlier profile, so
     * the user controls precedence by reordering the list.
     *
     * @param profiles Profile collection in display order
     * @param currentDeviceIds UIDs of the devices present right now
     * @return std::nullopt if no profile has a present trigger device
     */
    static std::optional<TriggerMatch> findBestMatch(const QList<Profile> &profiles,
                                                     const QSet<QString> &currentDeviceIds);
};
