// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "ActivationArbiter.h"
#include "DeviceHistoryManager.h"
#include "Logging.h"

#include <algorithm>

std::optional<ActivationCommand> ActivationArbiter::applyOrFallback(const std::optional<TriggerMatch> &match,
                                                                    const std::optional<QUuid> &currentActiveProfileId,
                                                                    bool isManualTrigger,
                                                                    const QList<Profile> &profiles,
                                                                    const DeviceHistoryManager &history)
{
    if (match) {
        const bool alreadyActive = currentActiveProfileId && *currentActiveProfileId == match->profile.id;
        if (alreadyActive && !isManualTrigger) {
            qCDebug(audioprofilesTriggers) << "Profile" << match->profile.name << "already active";
            return std::nullopt;
        }

        ActivationCommand command;
        command.profileId = match->profile.id;

        if (alreadyActive) {
            // Forced evaluations re-apply, the profile may have been edited
            qCInfo(audioprofilesTriggers) << "Re-applying profile" << match->profile.name;
            command.reapply = true;
            return command;
        }

        qCInfo(audioprofilesTriggers) << "Auto-detected profile" << match->profile.name << "matched"
                                      << match->matchCount << "trigger device(s), primary:"
                                      << match->primaryTriggerDevice;

        if (!isManualTrigger) {
            const auto device = history.device(match->primaryTriggerDevice);
            command.shouldNotify = true;
            command.notificationKind = NotificationKind::TriggeredSwitch;
            command.payload.profileName = match->profile.name;
            command.payload.deviceName = device ? device->name : match->primaryTriggerDevice;
            command.payload.matchCount = match->matchCount;
        }
        return command;
    }

    auto systemDefault = std::find_if(profiles.cbegin(), profiles.cend(), [](const Profile &p) {
        return p.isSystemDefault();
    });
    if (systemDefault == profiles.cend()) {
        qCWarning(audioprofilesTriggers) << "No System Default profile found to fall back to";
        return std::nullopt;
    }

    if (currentActiveProfileId && *currentActiveProfileId == systemDefault->id) {
        return std::nullopt;
    }

    qCInfo(audioprofilesTriggers) << "No triggers matched, falling back to System Default";

    // Name the device that was lost by looking at what the previous profile was triggered by
    QString lostDevice;
    if (currentActiveProfileId) {
        auto previous = std::find_if(profiles.cbegin(), profiles.cend(), [&](const Profile &p) {
            return p.id == *currentActiveProfileId;
        });
        if (previous != profiles.cend() && !previous->triggerDeviceIds.isEmpty()) {
            if (const auto device = history.device(previous->triggerDeviceIds.first())) {
                lostDevice = device->name;
            }
        }
    }

    ActivationCommand command;
    command.profileId = systemDefault->id;
    command.shouldNotify = true;
    command.notificationKind = NotificationKind::FallbackSwitch;
    command.payload.profileName = systemDefault->name;
    command.payload.deviceName = lostDevice;
    return command;
}
