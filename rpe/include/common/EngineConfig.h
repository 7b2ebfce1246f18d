// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/Constants.h"
#include "common/JsonUtils.h"
#include <chrono>
#include <string>

namespace RPE {

/**
 * @brief Engine configuration
 *
 * Sources are applied in order: defaults, JSON document, environment.
 *
 * @code
 * {
 *   "rpc_timeout_ms": 5000,
 *   "broadcast_timeout_ms": 1000,
 *   "checkpoint_directory": "/var/lib/rpe/checkpoints",
 *   "log_level": "info",
 *   "log_directory": "/var/log/rpe",
 *   "log_to_file": true
 * }
 * @endcode
 */
struct EngineConfig {
    std::chrono::milliseconds rpcTimeout = Constants::DEFAULT_RPC_TIMEOUT;
    std::chrono::milliseconds broadcastTimeout = Constants::DEFAULT_BROADCAST_TIMEOUT;

    // Empty keeps checkpoints in memory
    std::string checkpointDirectory;

    std::string logLevel = "info";
    std::string logDirectory;
    bool logToFile = false;

    /**
     * @brief Overlay keys of a JSON object onto this configuration
     *
     * Unknown keys are ignored.
     * @throws ValidationError on a wrong-typed or negative value
     */
    void merge(const json &document);

    /**
     * @brief Overlay RPE_RPC_TIMEOUT_MS, RPE_BROADCAST_TIMEOUT_MS, RPE_CHECKPOINT_DIR and RPE_LOG_LEVEL
     * @throws ValidationError if a timeout variable is not a non-negative integer
     */
    void applyEnvironment();

    json toJson() const;

    static EngineConfig fromJson(const json &document);

    /**
     * @throws ValidationError if the file cannot be read or parsed
     */
    static EngineConfig loadFromFile(const std::string &path);
};

/**
 * @brief Replace the logger backend with a SpdlogBackend built from logLevel, logDirectory and logToFile
 *
 * A file sink writes <logDirectory>/rpe.log when logToFile is set.
 */
void configureLogging(const EngineConfig &config);

}  // namespace RPE
