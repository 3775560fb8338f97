// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "KGlobalAccelRegistrar.h"
#include "Logging.h"

#include <QAction>

#include <KGlobalAccel>

static const QString COMPONENT_NAME = QStringLiteral("audioprofiles");

KGlobalAccelRegistrar::KGlobalAccelRegistrar(QObject *parent)
    : QObject(parent)
{
}

KGlobalAccelRegistrar::~KGlobalAccelRegistrar()
{
    // Shortcuts stay configured for the next start, only the actions go away
    qDeleteAll(m_actions);
}

bool KGlobalAccelRegistrar::registerHotkey(const Hotkey &hotkey, const QString &actionId, const QString &label,
                                           std::function<void()> callback)
{
    if (!hotkey.isValid()) {
        return false;
    }

    auto *action = new QAction(this);
    action->setObjectName(actionId);
    action->setText(label);
    action->setProperty("componentName", COMPONENT_NAME);

    connect(action, &QAction::triggered, this, [callback = std::move(callback)]() {
        if (callback) {
            callback();
        }
    });

    if (!KGlobalAccel::setGlobalShortcut(action, QList<QKeySequence>() << hotkey.toKeySequence())) {
        qCWarning(audioprofilesHotkeys) << "KGlobalAccel rejected shortcut" << hotkey.toString() << "for" << actionId;
        delete action;
        return false;
    }

    m_actions.append(action);
    return true;
}

void KGlobalAccelRegistrar::unregisterAll()
{
    for (QAction *action : std::as_const(m_actions)) {
        // Drop the binding from kglobalacceld, not just our side of it
        KGlobalAccel::self()->removeAllShortcuts(action);
        delete action;
    }
    m_actions.clear();
}
