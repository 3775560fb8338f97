// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include "Hotkey.h"

#include <QString>

#include <functional>

/**
 * @brief Binds global shortcuts with the desktop
 */
class HotkeyRegistrar
{
public:
    virtual ~HotkeyRegistrar() = default;

    /**
     * @brief Register a global shortcut
     * @param hotkey Key combination, must be valid
     * @param actionId Stable identifier of the binding
     * @param label Human readable description shown in shortcut settings
     * @param callback Invoked on the main thread when the shortcut is pressed
     * @return true if the binding was accepted
     */
    virtual bool registerHotkey(const Hotkey &hotkey, const QString &actionId, const QString &label,
                                std::function<void()> callback) = 0;

    virtual void unregisterAll() = 0;
};
