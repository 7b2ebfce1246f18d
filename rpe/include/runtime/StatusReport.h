// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <optional>
#include <string>

namespace RPE {

/**
 * @brief Snapshot of a process answered to STATUS requests
 */
struct StatusReport {
    std::string pid;
    std::string label;
    bool isTerminal = false;
    bool paused = false;
    std::string pausedMessage;
    std::string processType;
    int64_t creationTime = 0;

    // Kill message, exception text or waiting message
    std::string statusMessage;

    // Set only for FINISHED
    std::optional<bool> successful;

    json toJson() const;

    /**
     * @throws MalformedMessageError if a mandatory key is missing or mistyped
     */
    static StatusReport fromJson(const json &document);
};

}  // namespace RPE
