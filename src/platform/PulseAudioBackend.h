// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "AudioBackend.h"

#include <QByteArray>
#include <QList>
#include <QString>

class QProcess;
class QTimer;

/**
 * PulseAudioBackend - Sound server access through pactl
 *
 * Works with PulseAudio and PipeWire's pulse compatibility layer.
 * Devices are identified by the sink/source node name, which is stable
 * across reboots and replugs; the description is the display name.
 *
 * Monitoring runs "pactl subscribe" and publishes a fresh snapshot after
 * sinks, sources or cards are added or removed. The subscription is
 * restarted with exponential back-off if pactl exits.
 */
class PulseAudioBackend : public DeviceMonitor, public DeviceEnumerator, public DeviceController
{
    Q_OBJECT

public:
    static constexpr int PROCESS_TIMEOUT_MS = 3000;
    static constexpr int RESTART_DELAY_MS = 1000;
    static constexpr int MAX_RESTART_DELAY_MS = 30000;

    explicit PulseAudioBackend(QObject *parent = nullptr);
    ~PulseAudioBackend() override;

    QList<AudioDevice> listCurrentDevices() override;
    bool setDefault(DeviceKind kind, const AudioDevice &device) override;

    void startMonitoring() override;
    void stopMonitoring() override;

    bool isMonitoring() const { return m_monitoring; }

    /**
     * @brief Parse the output of "pactl --format=json list sinks|sources"
     *
     * Monitor sources are skipped.
     */
    static QList<AudioDevice> parseDeviceList(const QByteArray &json, DeviceKind kind);

    /**
     * @brief Check whether a "pactl subscribe" line announces a device being added or removed
     *
     * e.g. "Event 'new' on sink #45"
     */
    static bool isDeviceEvent(const QString &line);

    static AudioDevice::TransportKind transportKindFromBus(const QString &bus);

private Q_SLOTS:
    void onSubscribeOutput();
    void onSubscribeFinished();

private:
    QList<AudioDevice> queryDevices(DeviceKind kind) const;
    void launchSubscription();

    QProcess *m_subscribe = nullptr;
    QTimer *m_restartTimer = nullptr;
    QByteArray m_lineBuffer;
    int m_restartDelay = RESTART_DELAY_MS;
    bool m_monitoring = false;
};
