// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "AudioDevice.h"

#include <QList>
#include <QObject>

class QTimer;

/**
 * @brief Coalesces bursts of device snapshots into one
 *
 * Every submit() restarts the quiet-period timer; when it expires the most
 * recent snapshot is delivered through settled().
 */
class DeviceChangeDebouncer : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_INTERVAL_MS = 500;

    explicit DeviceChangeDebouncer(QObject *parent = nullptr);
    ~DeviceChangeDebouncer() override;

    int interval() const;
    void setInterval(int ms);

    bool isPending() const;

    /**
     * @brief Drop the pending snapshot, if any
     */
    void cancel();

public Q_SLOTS:
    void submit(const QList<AudioDevice> &devices);

Q_SIGNALS:
    void settled(const QList<AudioDevice> &devices);

private Q_SLOTS:
    void onDebounceTimeout();

private:
    QTimer *m_debounceTimer = nullptr;
    QList<AudioDevice> m_pending;
};
