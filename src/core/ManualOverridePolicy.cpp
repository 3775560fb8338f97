// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "ManualOverridePolicy.h"
#include "DeviceHistoryManager.h"
#include "Logging.h"

bool ManualOverridePolicy::shouldApplyTrigger(const QStringList &triggerDeviceIds,
                                              const DeviceHistoryManager &history) const
{
    if (!m_lastManualSwitch) {
        return true;
    }

    for (const QString &deviceId : triggerDeviceIds) {
        const auto entry = history.entry(deviceId);
        if (entry && entry->isCurrentlyActive && entry->lastSeen > *m_lastManualSwitch) {
            qCInfo(audioprofilesTriggers) << "Trigger device" << entry->device.name
                                          << "connected after manual switch, allowing auto-switch";
            return true;
        }
    }

    qCInfo(audioprofilesTriggers) << "All trigger devices were connected before manual switch, blocking auto-switch";
    return false;
}
