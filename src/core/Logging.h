// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 AudioProfiles Contributors

#pragma once

#include <QLoggingCategory>

/**
 * AudioProfiles Logging Categories
 *
 * Usage:
 *   #include "Logging.h"
 *   qCDebug(audioprofilesTriggers) << "Message";
 *   qCWarning(audioprofilesCore) << "Warning message";
 *
 * Enable debug output via environment variable:
 *   QT_LOGGING_RULES="audioprofiles.*.debug=true" ./build/bin/audioprofilesd
 */

// Orchestration and startup (ProfileController, main)
Q_DECLARE_LOGGING_CATEGORY(audioprofilesCore)

// Device enumeration, monitoring and default-device control
Q_DECLARE_LOGGING_CATEGORY(audioprofilesDevices)

// Device history tracking and pruning
Q_DECLARE_LOGGING_CATEGORY(audioprofilesHistory)

// Profile store, validation and persistence
Q_DECLARE_LOGGING_CATEGORY(audioprofilesProfiles)

// Trigger matching, override policy and auto-switching suspension
Q_DECLARE_LOGGING_CATEGORY(audioprofilesTriggers)

// Global shortcut registration
Q_DECLARE_LOGGING_CATEGORY(audioprofilesHotkeys)

// Desktop notifications
Q_DECLARE_LOGGING_CATEGORY(audioprofilesNotify)

// D-Bus control interface
Q_DECLARE_LOGGING_CATEGORY(audioprofilesDBus)
