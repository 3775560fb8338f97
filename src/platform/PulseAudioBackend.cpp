// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "PulseAudioBackend.h"
#include "Logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QProcess>
#include <QRegularExpression>
#include <QTimer>

PulseAudioBackend::PulseAudioBackend(QObject *parent)
    : DeviceMonitor(parent)
    , m_restartTimer(new QTimer(this))
{
    m_restartTimer->setSingleShot(true);
    connect(m_restartTimer, &QTimer::timeout, this, &PulseAudioBackend::launchSubscription);
}

PulseAudioBackend::~PulseAudioBackend()
{
    stopMonitoring();
}

QList<AudioDevice> PulseAudioBackend::listCurrentDevices()
{
    QList<AudioDevice> devices = queryDevices(DeviceKind::Output);
    devices.append(queryDevices(DeviceKind::Input));
    return devices;
}

QList<AudioDevice> PulseAudioBackend::queryDevices(DeviceKind kind) const
{
    const QString type = kind == DeviceKind::Output ? QStringLiteral("sinks") : QStringLiteral("sources");

    QProcess pactl;
    pactl.start(QStringLiteral("pactl"), {QStringLiteral("--format=json"), QStringLiteral("list"), type});
    if (!pactl.waitForFinished(PROCESS_TIMEOUT_MS)) {
        qCWarning(audioprofilesDevices) << "pactl list" << type << "timed out:" << pactl.errorString();
        pactl.kill();
        pactl.waitForFinished(PROCESS_TIMEOUT_MS);
        return {};
    }
    if (pactl.exitStatus() != QProcess::NormalExit || pactl.exitCode() != 0) {
        qCWarning(audioprofilesDevices) << "pactl list" << type << "failed:"
                                        << QString::fromUtf8(pactl.readAllStandardError()).trimmed();
        return {};
    }

    return parseDeviceList(pactl.readAllStandardOutput(), kind);
}

QList<AudioDevice> PulseAudioBackend::parseDeviceList(const QByteArray &json, DeviceKind kind)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qCWarning(audioprofilesDevices) << "Failed to parse pactl output:" << error.errorString();
        return {};
    }

    QList<AudioDevice> devices;
    const QJsonArray entries = doc.array();
    for (const QJsonValue &value : entries) {
        const QJsonObject obj = value.toObject();
        const QJsonObject properties = obj[QStringLiteral("properties")].toObject();

        // Monitor sources mirror a sink and are not real inputs
        if (kind == DeviceKind::Input) {
            const QString monitorOf = obj[QStringLiteral("monitor_of_sink")].toString();
            const bool isMonitor = properties[QStringLiteral("device.class")].toString() == QLatin1String("monitor")
                || (!monitorOf.isEmpty() && monitorOf != QLatin1String("n/a"));
            if (isMonitor) {
                continue;
            }
        }

        AudioDevice device;
        device.id = obj[QStringLiteral("name")].toString();
        if (device.id.isEmpty()) {
            continue;
        }
        device.name = obj[QStringLiteral("description")].toString();
        if (device.name.isEmpty()) {
            device.name = device.id;
        }
        device.transportKind = transportKindFromBus(properties[QStringLiteral("device.bus")].toString());
        device.isOutput = kind == DeviceKind::Output;
        device.isInput = kind == DeviceKind::Input;
        devices.append(device);
    }
    return devices;
}

AudioDevice::TransportKind PulseAudioBackend::transportKindFromBus(const QString &bus)
{
    const QString lower = bus.toLower();
    if (lower == QLatin1String("usb")) {
        return AudioDevice::TransportKind::USB;
    }
    if (lower == QLatin1String("bluetooth")) {
        return AudioDevice::TransportKind::Bluetooth;
    }
    if (lower == QLatin1String("pci") || lower == QLatin1String("platform")) {
        return AudioDevice::TransportKind::BuiltIn;
    }
    return AudioDevice::TransportKind::Other;
}

bool PulseAudioBackend::setDefault(DeviceKind kind, const AudioDevice &device)
{
    if (!device.supports(kind)) {
        return false;
    }

    const QString command = kind == DeviceKind::Output ? QStringLiteral("set-default-sink")
                                                       : QStringLiteral("set-default-source");

    QProcess pactl;
    pactl.start(QStringLiteral("pactl"), {command, device.id});
    if (!pactl.waitForFinished(PROCESS_TIMEOUT_MS)) {
        qCWarning(audioprofilesDevices) << "pactl" << command << "timed out for" << device.id;
        pactl.kill();
        pactl.waitForFinished(PROCESS_TIMEOUT_MS);
        return false;
    }
    if (pactl.exitStatus() != QProcess::NormalExit || pactl.exitCode() != 0) {
        qCWarning(audioprofilesDevices) << "pactl" << command << "failed for" << device.id << ":"
                                        << QString::fromUtf8(pactl.readAllStandardError()).trimmed();
        return false;
    }
    return true;
}

void PulseAudioBackend::startMonitoring()
{
    if (m_monitoring) {
        return;
    }
    m_monitoring = true;
    m_restartDelay = RESTART_DELAY_MS;
    launchSubscription();
}

void PulseAudioBackend::stopMonitoring()
{
    m_monitoring = false;
    m_restartTimer->stop();

    if (m_subscribe) {
        // Detach first so the exit is not treated as a crash
        disconnect(m_subscribe, nullptr, this, nullptr);
        m_subscribe->kill();
        m_subscribe->waitForFinished(PROCESS_TIMEOUT_MS);
        m_subscribe->deleteLater();
        m_subscribe = nullptr;
    }
    m_lineBuffer.clear();
}

void PulseAudioBackend::launchSubscription()
{
    if (!m_monitoring) {
        return;
    }

    if (m_subscribe) {
        m_subscribe->deleteLater();
    }
    m_lineBuffer.clear();

    m_subscribe = new QProcess(this);
    connect(m_subscribe, &QProcess::readyReadStandardOutput, this, &PulseAudioBackend::onSubscribeOutput);
    connect(m_subscribe, &QProcess::finished, this, &PulseAudioBackend::onSubscribeFinished);
    connect(m_subscribe, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        // A process that never started emits no finished()
        if (error == QProcess::FailedToStart) {
            qCWarning(audioprofilesDevices) << "Failed to start pactl subscribe";
            onSubscribeFinished();
        }
    });

    m_subscribe->start(QStringLiteral("pactl"), {QStringLiteral("subscribe")});
    qCDebug(audioprofilesDevices) << "Started pactl subscribe";
}

void PulseAudioBackend::onSubscribeOutput()
{
    m_lineBuffer.append(m_subscribe->readAllStandardOutput());

    bool changed = false;
    qsizetype newline = m_lineBuffer.indexOf('\n');
    while (newline >= 0) {
        const QString line = QString::fromUtf8(m_lineBuffer.left(newline)).trimmed();
        m_lineBuffer.remove(0, newline + 1);
        if (isDeviceEvent(line)) {
            qCDebug(audioprofilesDevices) << "Sound server event:" << line;
            changed = true;
        }
        newline = m_lineBuffer.indexOf('\n');
    }

    // The subscription works, forget earlier failures
    m_restartDelay = RESTART_DELAY_MS;

    // One snapshot per chunk of events
    if (changed) {
        Q_EMIT devicesChanged(listCurrentDevices());
    }
}

void PulseAudioBackend::onSubscribeFinished()
{
    if (!m_monitoring || m_restartTimer->isActive()) {
        return;
    }

    qCWarning(audioprofilesDevices) << "pactl subscribe exited, restarting in" << m_restartDelay << "ms";
    m_restartTimer->start(m_restartDelay);
    m_restartDelay = qMin(m_restartDelay * 2, MAX_RESTART_DELAY_MS);
}

bool PulseAudioBackend::isDeviceEvent(const QString &line)
{
    static const QRegularExpression pattern(
        QStringLiteral("^Event '(new|remove)' on (sink|source|card) #\\d+$"));
    return pattern.match(line).hasMatch();
}
