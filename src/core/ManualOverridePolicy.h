// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QDateTime>
#include <QStringList>

#include <optional>

class DeviceHistoryManager;

/**
 * @brief Suppresses automatic switching after the user picked a profile by hand
 *
 * A manual switch records a timestamp. Afterwards an automatic trigger is only
 * honoured if one of its devices is present and was seen after that moment,
 * i.e. it was plugged in after the user's choice.
 */
class ManualOverridePolicy
{
public:
    void recordManualSwitch(const QDateTime &when) { m_lastManualSwitch = when; }
    void clear() { m_lastManualSwitch.reset(); }

    bool isActive() const { return m_lastManualSwitch.has_value(); }
    std::optional<QDateTime> lastManualSwitch() const { return m_lastManualSwitch; }

    /**
     * @brief Check whether an automatic trigger may override the manual choice
     * @param triggerDeviceIds Trigger devices of the matched profile
     * @param history Source of presence and lastSeen information
     */
    bool shouldApplyTrigger(const QStringList &triggerDeviceIds, const DeviceHistoryManager &history) const;

private:
    std::optional<QDateTime> m_lastManualSwitch;
};
