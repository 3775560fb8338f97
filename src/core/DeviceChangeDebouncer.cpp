// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "DeviceChangeDebouncer.h"
#include "Logging.h"

#include <QTimer>

DeviceChangeDebouncer::DeviceChangeDebouncer(QObject *parent)
    : QObject(parent)
    , m_debounceTimer(new QTimer(this))
{
    // Hardware enumeration reports a device in several steps
    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(DEFAULT_INTERVAL_MS);
    connect(m_debounceTimer, &QTimer::timeout, this, &DeviceChangeDebouncer::onDebounceTimeout);
}

DeviceChangeDebouncer::~DeviceChangeDebouncer() = default;

int DeviceChangeDebouncer::interval() const
{
    return m_debounceTimer->interval();
}

void DeviceChangeDebouncer::setInterval(int ms)
{
    m_debounceTimer->setInterval(qMax(0, ms));
}

bool DeviceChangeDebouncer::isPending() const
{
    return m_debounceTimer->isActive();
}

void DeviceChangeDebouncer::cancel()
{
    m_debounceTimer->stop();
    m_pending.clear();
}

void DeviceChangeDebouncer::submit(const QList<AudioDevice> &devices)
{
    m_pending = devices;
    m_debounceTimer->start();
}

void DeviceChangeDebouncer::onDebounceTimeout()
{
    qCDebug(audioprofilesDevices) << "Device set settled with" << m_pending.size() << "devices";
    const QList<AudioDevice> devices = m_pending;
    m_pending.clear();
    Q_EMIT settled(devices);
}
