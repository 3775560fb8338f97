// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#include "Logging.h"

// Define logging categories
// Info and above are shown by default; enable debug via QT_LOGGING_RULES

Q_LOGGING_CATEGORY(audioprofilesCore, "audioprofiles.core", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesDevices, "audioprofiles.devices", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesHistory, "audioprofiles.history", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesProfiles, "audioprofiles.profiles", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesTriggers, "audioprofiles.triggers", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesHotkeys, "audioprofiles.hotkeys", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesNotify, "audioprofiles.notify", QtInfoMsg)
Q_LOGGING_CATEGORY(audioprofilesDBus, "audioprofiles.dbus", QtInfoMsg)
