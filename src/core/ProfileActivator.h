// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Profile.h"

#include <QObject>
#include <QString>

#include <optional>

class DeviceController;
class DeviceEnumerator;

/**
 * @brief Devices chosen when a profile was applied
 *
 * Empty when no candidate in the priority list could be set.
 */
struct AppliedDevices {
    QString outputId;
    QString inputId;
};

/**
 * @brief Applies a profile's device priorities to the sound server
 *
 * Holds the active profile and the active Public/Private mode.
 */
class ProfileActivator : public QObject
{
    Q_OBJECT

public:
    explicit ProfileActivator(DeviceEnumerator *enumerator, DeviceController *controller, QObject *parent = nullptr);
    ~ProfileActivator() override;

    std::optional<Profile> activeProfile() const { return m_activeProfile; }
    ProfileMode activeMode() const { return m_activeMode; }

    /**
     * @brief Make a profile active in its preferred mode and apply it
     */
    AppliedDevices activate(const Profile &profile);

    /**
     * @brief Forget the active profile without touching the sound server
     */
    void deactivate();

    /**
     * @brief Replace the stored definition of the active profile without applying it
     *
     * Used when cleanup edits device lists; ignored for other profiles.
     */
    void syncActiveProfile(const Profile &profile);

    /**
     * @brief Flip between Public and Private and re-apply the active profile
     */
    void toggleMode();

    /**
     * @brief Re-apply an edited definition of the active profile
     * @param preserveMode Keep the current mode instead of the profile's preferred one
     */
    AppliedDevices refreshActiveProfile(const Profile &profile, bool preserveMode = true);

    /**
     * @brief Set the default output and input from the profile's lists for a mode
     *
     * For each direction the first connected device in list order that
     * supports the direction and is accepted by the sound server wins.
     * Failures are logged and the next candidate is tried.
     */
    AppliedDevices apply(const Profile &profile, ProfileMode mode);

Q_SIGNALS:
    void activeProfileChanged();
    void activeModeChanged(ProfileMode mode);

private:
    void setMode(ProfileMode mode);

    DeviceEnumerator *m_enumerator = nullptr;
    DeviceController *m_controller = nullptr;
    std::optional<Profile> m_activeProfile;
    ProfileMode m_activeMode = ProfileMode::Public;
};
