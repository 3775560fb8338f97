// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include <QCommandLineParser>
#include <QDBusConnection>
#include <QDBusError>
#include <QGuiApplication>

#include <KLocalizedString>

#include "core/JsonStateStore.h"
#include "core/Logging.h"
#include "core/ProfileController.h"
#include "core/SettingsManager.h"
#include "dbus/DBusNotifier.h"
#include "dbus/ProfilesDBusAdaptor.h"
#include "platform/KGlobalAccelRegistrar.h"
#include "platform/PulseAudioBackend.h"

// Custom message handler to filter noisy Qt warnings
static QtMessageHandler s_originalHandler = nullptr;

void audioprofilesMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    // Suppress QStandardPaths permission warnings (common on immutable distros with 0710 permissions)
    if (type == QtWarningMsg && msg.contains(QStringLiteral("QStandardPaths: wrong permissions on runtime directory"))) {
        return;
    }

    if (s_originalHandler) {
        s_originalHandler(type, context, msg);
    }
}

int main(int argc, char *argv[])
{
    // Install custom message handler before QGuiApplication
    s_originalHandler = qInstallMessageHandler(audioprofilesMessageHandler);

    // QAction and KGlobalAccel need a GUI application, no window is ever shown
    QGuiApplication app(argc, argv);
    QGuiApplication::setQuitOnLastWindowClosed(false);

    // Set application metadata
    KLocalizedString::setApplicationDomain("audioprofiles");
    QGuiApplication::setOrganizationName(QStringLiteral("audioprofiles"));
    QGuiApplication::setOrganizationDomain(QStringLiteral("io.github.audioprofiles"));
    QGuiApplication::setApplicationName(QStringLiteral("audioprofiles"));
    QGuiApplication::setApplicationVersion(QStringLiteral(AUDIOPROFILES_VERSION));
    QGuiApplication::setDesktopFileName(QStringLiteral("io.github.audioprofiles"));

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Switches audio devices automatically when trigger devices connect"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption noDbusOption(QStringLiteral("no-dbus"), i18n("Do not register the D-Bus control interface"));
    parser.addOption(noDbusOption);
    parser.process(app);

    SettingsManager settings;
    JsonStateStore store;
    PulseAudioBackend backend;
    DBusNotifier notifier;
    KGlobalAccelRegistrar hotkeys;

    ProfileController::Dependencies deps;
    deps.enumerator = &backend;
    deps.controller = &backend;
    deps.monitor = &backend;
    deps.store = &store;
    deps.notifier = &notifier;
    deps.hotkeyRegistrar = &hotkeys;
    deps.settings = &settings;

    ProfileController controller(deps);
    ProfilesDBusAdaptor adaptor(&controller);

    if (!parser.isSet(noDbusOption)) {
        QDBusConnection sessionBus = QDBusConnection::sessionBus();
        if (!sessionBus.isConnected()) {
            qCCritical(audioprofilesDBus) << "Cannot connect to the D-Bus session bus";
            return 1;
        }

        // A second instance would fight the first over the default devices
        if (!sessionBus.registerService(ProfilesDBusAdaptor::SERVICE_NAME)) {
            qCCritical(audioprofilesDBus) << "Cannot register D-Bus service:" << sessionBus.lastError().message();
            return 1;
        }

        if (!sessionBus.registerObject(ProfilesDBusAdaptor::OBJECT_PATH, &adaptor,
                                       QDBusConnection::ExportAllSlots | QDBusConnection::ExportAllSignals)) {
            qCCritical(audioprofilesDBus) << "Cannot register D-Bus object:" << sessionBus.lastError().message();
            return 1;
        }

        qCInfo(audioprofilesDBus) << "Service:" << ProfilesDBusAdaptor::SERVICE_NAME;
        qCInfo(audioprofilesDBus) << "Object:" << ProfilesDBusAdaptor::OBJECT_PATH;
    }

    if (!settings.hasLaunchedBefore()) {
        qCInfo(audioprofilesCore) << "First launch";
        settings.setHasLaunchedBefore(true);
    }

    controller.start();
    qCInfo(audioprofilesCore) << "AudioProfiles daemon started";

    const int result = app.exec();
    backend.stopMonitoring();
    return result;
}
