// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "HotkeyRegistrar.h"

#include <QList>
#include <QObject>

class QAction;

/**
 * KGlobalAccelRegistrar - Global shortcuts through KGlobalAccel
 *
 * Every registration owns a QAction under the "audioprofiles" component,
 * so the shortcuts also show up in System Settings.
 */
class KGlobalAccelRegistrar : public QObject, public HotkeyRegistrar
{
    Q_OBJECT

public:
    explicit KGlobalAccelRegistrar(QObject *parent = nullptr);
    ~KGlobalAccelRegistrar() override;

    bool registerHotkey(const Hotkey &hotkey, const QString &actionId, const QString &label,
                        std::function<void()> callback) override;
    void unregisterAll() override;

private:
    QList<QAction *> m_actions;
};
