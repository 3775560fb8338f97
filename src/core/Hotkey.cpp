// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "Hotkey.h"

#include <QKeyCombination>

static constexpr quint32 MODIFIER_MASK = quint32(Qt::ShiftModifier) | quint32(Qt::ControlModifier)
                                       | quint32(Qt::AltModifier) | quint32(Qt::MetaModifier);

bool Hotkey::isValid() const
{
    return keyCode != 0 && (modifiers & MODIFIER_MASK) != 0;
}

QKeySequence Hotkey::toKeySequence() const
{
    if (keyCode == 0) {
        return QKeySequence();
    }
    return QKeySequence(QKeyCombination(Qt::KeyboardModifiers::fromInt(int(modifiers & MODIFIER_MASK)),
                                        static_cast<Qt::Key>(keyCode)));
}

QString Hotkey::toString() const
{
    return toKeySequence().toString(QKeySequence::PortableText);
}

Hotkey Hotkey::fromKeySequence(const QKeySequence &sequence)
{
    Hotkey hotkey;
    if (sequence.isEmpty()) {
        return hotkey;
    }

    const QKeyCombination combination = sequence[0];
    hotkey.keyCode = static_cast<quint32>(combination.key());
    hotkey.modifiers = static_cast<quint32>(combination.keyboardModifiers().toInt()) & MODIFIER_MASK;
    return hotkey;
}

QJsonObject Hotkey::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("keyCode")] = static_cast<qint64>(keyCode);
    obj[QStringLiteral("modifiers")] = static_cast<qint64>(modifiers);
    return obj;
}

Hotkey Hotkey::fromJson(const QJsonObject &obj)
{
    Hotkey hotkey;
    hotkey.keyCode = static_cast<quint32>(obj[QStringLiteral("keyCode")].toInteger());
    hotkey.modifiers = static_cast<quint32>(obj[QStringLiteral("modifiers")].toInteger());
    return hotkey;
}
