// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QJsonObject>
#include <QKeySequence>
#include <QMetaType>
#include <QString>

/**
 * @brief A global shortcut bound to a profile
 *
 * keyCode is a Qt::Key value, modifiers is a Qt::KeyboardModifiers bitmask.
 */
struct Hotkey {
    quint32 keyCode = 0;
    quint32 modifiers = 0;

    /**
     * @brief Two hotkeys conflict when key and modifiers are identical
     */
    bool conflicts(const Hotkey &other) const
    {
        return keyCode == other.keyCode && modifiers == other.modifiers;
    }

    /**
     * @brief A hotkey needs at least one modifier and a non-zero key
     */
    bool isValid() const;

    bool operator==(const Hotkey &other) const { return conflicts(other); }
    bool operator!=(const Hotkey &other) const { return !conflicts(other); }

    QKeySequence toKeySequence() const;

    /**
     * @brief Portable text form, e.g. "Ctrl+Alt+H"
     */
    QString toString() const;

    static Hotkey fromKeySequence(const QKeySequence &sequence);

    QJsonObject toJson() const;
    static Hotkey fromJson(const QJsonObject &obj);
};

Q_DECLARE_METATYPE(Hotkey)
