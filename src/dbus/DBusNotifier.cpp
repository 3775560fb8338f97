// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "DBusNotifier.h"
#include "Logging.h"

#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QVariantMap>

#include <KLocalizedString>

static const QString SERVICE_NAME = QStringLiteral("org.freedesktop.Notifications");
static const QString OBJECT_PATH = QStringLiteral("/org/freedesktop/Notifications");
static const QString INTERFACE_NAME = QStringLiteral("org.freedesktop.Notifications");

static constexpr int EXPIRE_TIMEOUT_MS = 4000;

DBusNotifier::DBusNotifier(QObject *parent)
    : QObject(parent)
{
    m_interface = new QDBusInterface(
        SERVICE_NAME,
        OBJECT_PATH,
        INTERFACE_NAME,
        QDBusConnection::sessionBus(),
        this
    );

    if (!m_interface->isValid()) {
        qCWarning(audioprofilesNotify) << "Notification service not available:" << m_interface->lastError().message();
    }
}

DBusNotifier::~DBusNotifier() = default;

QString DBusNotifier::title(NotificationKind kind, const NotificationPayload &payload)
{
    Q_UNUSED(kind)
    return i18nc("@title notification", "Switched to '%1'", payload.profileName);
}

QString DBusNotifier::body(NotificationKind kind, const NotificationPayload &payload)
{
    switch (kind) {
    case NotificationKind::TriggeredSwitch:
        if (payload.matchCount <= 1) {
            return i18nc("@info notification", "%1 connected", payload.deviceName);
        }
        return i18ncp("@info notification",
                      "%2 and %1 other device connected",
                      "%2 and %1 other devices connected",
                      payload.matchCount - 1,
                      payload.deviceName);
    case NotificationKind::FallbackSwitch:
        if (payload.deviceName.isEmpty()) {
            return i18nc("@info notification", "No trigger devices connected");
        }
        return i18nc("@info notification", "%1 disconnected", payload.deviceName);
    case NotificationKind::ManualSwitch:
        break;
    }
    return i18nc("@info notification", "Manually selected");
}

void DBusNotifier::notify(NotificationKind kind, const NotificationPayload &payload)
{
    if (!m_interface->isValid()) {
        qCDebug(audioprofilesNotify) << "Skipping notification, service unavailable";
        return;
    }

    const int key = static_cast<int>(kind);
    const QDBusPendingCall call = m_interface->asyncCall(
        QStringLiteral("Notify"),
        QStringLiteral("AudioProfiles"),
        m_lastIds.value(key, 0u),
        QStringLiteral("audio-card"),
        title(kind, payload),
        body(kind, payload),
        QStringList(),
        QVariantMap(),
        EXPIRE_TIMEOUT_MS
    );

    auto *watcher = new QDBusPendingCallWatcher(call, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, key](QDBusPendingCallWatcher *w) {
        QDBusPendingReply<uint> reply = *w;
        if (reply.isError()) {
            qCWarning(audioprofilesNotify) << "Failed to show notification:" << reply.error().message();
        } else {
            m_lastIds.insert(key, reply.value());
        }
        w->deleteLater();
    });
}
