// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QString>

enum class NotificationKind {
    TriggeredSwitch, // A trigger device connected and a new profile was picked
    FallbackSwitch,  // Trigger devices went away, System Default took over
    ManualSwitch     // The user picked a profile from a menu, hotkey or D-Bus
};

struct NotificationPayload {
    QString profileName;
    QString deviceName; // Trigger device that connected or disconnected, may be empty
    int matchCount = 0;
};

/**
 * @brief Delivers user-facing profile switch notifications
 */
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(NotificationKind kind, const NotificationPayload &payload) = 0;
};
