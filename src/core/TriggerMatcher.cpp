// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "TriggerMatcher.h"
#include "Logging.h"

std::optional<TriggerMatch> TriggerMatcher::findBestMatch(const QList<Profile> &profiles,
                                                          const QSet<QString> &currentDeviceIds)
{
    std::optional<TriggerMatch> best;

    for (const Profile &profile : profiles) {
        if (profile.triggerDeviceIds.isEmpty()) {
            continue;
        }

        int count = 0;
        QString primary;
        for (const QString &triggerId : profile.triggerDeviceIds) {
            if (currentDeviceIds.contains(triggerId)) {
                if (count == 0) {
                    primary = triggerId;
                }
                ++count;
            }
        }

        if (count == 0) {
            continue;
        }

        // Strictly greater: ties keep the earlier profile
        if (!best || count > best->matchCount) {
            best = TriggerMatch{profile, count, primary};
        }
    }

    if (best) {
        qCDebug(audioprofilesTriggers) << "Best match:" << best->profile.name << "with" << best->matchCount
                                       << "trigger devices";
    }
    return best;
}
