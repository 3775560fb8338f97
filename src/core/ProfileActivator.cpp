// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "ProfileActivator.h"
#include "AudioBackend.h"
#include "Logging.h"

namespace
{
QString applyDirection(DeviceController *controller, const QList<AudioDevice> &devices,
                       const QStringList &priority, DeviceKind kind)
{
    const char *direction = kind == DeviceKind::Output ? "output" : "input";

    for (const QString &deviceId : priority) {
        const AudioDevice *match = nullptr;
        for (const AudioDevice &device : devices) {
            if (device.id == deviceId && device.supports(kind)) {
                match = &device;
                break;
            }
        }
        if (!match) {
            continue;
        }

        if (controller->setDefault(kind, *match)) {
            qCInfo(audioprofilesDevices) << "Set" << direction << "device:" << match->name;
            return match->id;
        }
        qCWarning(audioprofilesDevices) << "Failed to set" << direction << "device:" << match->name;
    }
    return QString();
}
}

ProfileActivator::ProfileActivator(DeviceEnumerator *enumerator, DeviceController *controller, QObject *parent)
    : QObject(parent)
    , m_enumerator(enumerator)
    , m_controller(controller)
{
}

ProfileActivator::~ProfileActivator() = default;

AppliedDevices ProfileActivator::activate(const Profile &profile)
{
    m_activeProfile = profile;

    if (m_activeMode != profile.preferredMode) {
        qCInfo(audioprofilesProfiles) << "Switched to" << profileModeToString(profile.preferredMode)
                                      << "mode (preferred by profile" << profile.name << ")";
    }
    setMode(profile.preferredMode);

    const AppliedDevices applied = apply(profile, m_activeMode);
    qCInfo(audioprofilesProfiles) << "Activated profile:" << profile.name;
    Q_EMIT activeProfileChanged();
    return applied;
}

void ProfileActivator::deactivate()
{
    if (!m_activeProfile) {
        return;
    }
    m_activeProfile.reset();
    Q_EMIT activeProfileChanged();
}

void ProfileActivator::syncActiveProfile(const Profile &profile)
{
    if (!m_activeProfile || m_activeProfile->id != profile.id || *m_activeProfile == profile) {
        return;
    }
    m_activeProfile = profile;
    Q_EMIT activeProfileChanged();
}

void ProfileActivator::toggleMode()
{
    setMode(m_activeMode == ProfileMode::Public ? ProfileMode::Private : ProfileMode::Public);
    if (m_activeProfile) {
        apply(*m_activeProfile, m_activeMode);
    }
    qCInfo(audioprofilesProfiles) << "Switched to" << profileModeToString(m_activeMode) << "mode";
}

AppliedDevices ProfileActivator::refreshActiveProfile(const Profile &profile, bool preserveMode)
{
    setMode(preserveMode ? m_activeMode : profile.preferredMode);
    m_activeProfile = profile;

    const AppliedDevices applied = apply(profile, m_activeMode);
    qCInfo(audioprofilesProfiles) << "Refreshed active profile:" << profile.name << "preserveMode:" << preserveMode;
    Q_EMIT activeProfileChanged();
    return applied;
}

AppliedDevices ProfileActivator::apply(const Profile &profile, ProfileMode mode)
{
    AppliedDevices applied;
    if (!m_enumerator || !m_controller) {
        return applied;
    }

    const QList<AudioDevice> devices = m_enumerator->listCurrentDevices();
    applied.outputId = applyDirection(m_controller, devices, profile.outputPriority(mode), DeviceKind::Output);
    applied.inputId = applyDirection(m_controller, devices, profile.inputPriority(mode), DeviceKind::Input);
    return applied;
}

void ProfileActivator::setMode(ProfileMode mode)
{
    if (m_activeMode == mode) {
        return;
    }
    m_activeMode = mode;
    Q_EMIT activeModeChanged(mode);
}
