// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <chrono>

namespace RPE {

/**
 * @brief Engine-wide constants
 */
namespace Constants {

// Control plane
constexpr const char *BROADCAST_TOPIC = "rpe.broadcast";
constexpr const char *LAUNCHER_TARGET = "rpe.launcher";

constexpr std::chrono::milliseconds DEFAULT_RPC_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_BROADCAST_TIMEOUT{1000};

// Checkpoint bundle format
constexpr int BUNDLE_VERSION = 1;
constexpr const char *CHECKPOINT_FILE_EXTENSION = ".json";

// Scheduler
constexpr int DEFAULT_MAX_TURNS = 100000;

}  // namespace Constants

}  // namespace RPE
