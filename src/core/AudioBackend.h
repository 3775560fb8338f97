// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "AudioDevice.h"

#include <QList>
#include <QObject>

/**
 * Interfaces to the sound server. The trigger engine only talks to these;
 * PulseAudioBackend implements all three for PulseAudio and PipeWire-pulse.
 */

class DeviceEnumerator
{
public:
    virtual ~DeviceEnumerator() = default;

    /**
     * @brief List the devices currently present
     * @return Empty list if the sound server cannot be queried
     */
    virtual QList<AudioDevice> listCurrentDevices() = 0;
};

class DeviceController
{
public:
    virtual ~DeviceController() = default;

    /**
     * @brief Make a device the system default for one direction
     *
     * Blocking but bounded; must not retry on failure.
     *
     * @return true if the sound server accepted the change
     */
    virtual bool setDefault(DeviceKind kind, const AudioDevice &device) = 0;
};

/**
 * @brief Publishes device-set snapshots when the sound server reports hardware changes
 *
 * Snapshots arrive un-debounced; bursts are coalesced by the consumer.
 */
class DeviceMonitor : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~DeviceMonitor() override = default;

    /**
     * @brief Start delivering devicesChanged() signals
     */
    virtual void startMonitoring() = 0;

    virtual void stopMonitoring() = 0;

Q_SIGNALS:
    void devicesChanged(const QList<AudioDevice> &devices);
};
