// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Notifier.h"

#include <QHash>
#include <QObject>
#include <QString>

class QDBusInterface;

/**
 * DBusNotifier - Desktop notifications through org.freedesktop.Notifications
 *
 * Each notification kind replaces the previous notification of the same
 * kind instead of stacking up.
 */
class DBusNotifier : public QObject, public Notifier
{
    Q_OBJECT

public:
    explicit DBusNotifier(QObject *parent = nullptr);
    ~DBusNotifier() override;

    void notify(NotificationKind kind, const NotificationPayload &payload) override;

    /**
     * @brief Localized summary line, e.g. "Switched to 'Work'"
     */
    static QString title(NotificationKind kind, const NotificationPayload &payload);

    /**
     * @brief Localized body, e.g. "USB Dock connected"
     */
    static QString body(NotificationKind kind, const NotificationPayload &payload);

private:
    QDBusInterface *m_interface = nullptr;
    QHash<int, uint> m_lastIds; // NotificationKind -> notification id to replace
};
