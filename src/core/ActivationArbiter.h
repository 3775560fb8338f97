// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Notifier.h"
#include "Profile.h"
#include "TriggerMatcher.h"

#include <QList>
#include <QUuid>

#include <optional>

class DeviceHistoryManager;

/**
 * @brief What the orchestrator should do after a trigger evaluation
 */
struct ActivationCommand {
    QUuid profileId;
    // Profile is already active, refresh it in the current mode
    bool reapply = false;
    bool shouldNotify = false;
    NotificationKind notificationKind = NotificationKind::TriggeredSwitch;
    NotificationPayload payload;
};

/**
 * @brief Decides between applying a trigger match and falling back to System Default
 */
class ActivationArbiter
{
public:
    /**
     * @brief Turn a match result into an activation command
     *
     * - A match that is already active is ignored for automatic evaluations
     *   and re-applied (without notification, keeping the mode) for forced ones.
     * - A new match is activated; automatic evaluations notify TriggeredSwitch.
     * - No match falls back to System Default unless it is already active,
     *   notifying FallbackSwitch with the name of the previous profile's first
     *   trigger device when the history still knows it.
     *
     * @param history Used to resolve device names for notifications
     * @return std::nullopt when nothing should change
     */
    static std::optional<ActivationCommand> applyOrFallback(const std::optional<TriggerMatch> &match,
                                                            const std::optional<QUuid> &currentActiveProfileId,
                                                            bool isManualTrigger,
                                                            const QList<Profile> &profiles,
                                                            const DeviceHistoryManager &history);
};
