// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "persistence/Bundle.h"
#include <optional>
#include <string>
#include <vector>

namespace RPE {

/**
 * @brief Identifies one stored checkpoint; an empty tag is the process's latest checkpoint
 */
struct CheckpointKey {
    std::string pid;
    std::string tag;

    bool operator==(const CheckpointKey &other) const {
        return pid == other.pid && tag == other.tag;
    }

    bool operator<(const CheckpointKey &other) const {
        return pid != other.pid ? pid < other.pid : tag < other.tag;
    }
};

/**
 * @brief Storage of checkpoint bundles
 *
 * Implementations must be safe to call from several threads.
 */
class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    /**
     * @brief Store a bundle under (bundle.pid(), tag), replacing any previous one
     * @throws SerializationError if the bundle cannot be stored
     */
    virtual void saveCheckpoint(const Bundle &bundle, const std::string &tag = "") = 0;

    /**
     * @return The bundle, or nullopt if no checkpoint exists for the key
     * @throws ReconstructionError if a stored checkpoint cannot be read back
     */
    virtual std::optional<Bundle> loadCheckpoint(const std::string &pid, const std::string &tag = "") = 0;

    virtual std::vector<CheckpointKey> getCheckpoints() = 0;

    virtual std::vector<CheckpointKey> getProcessCheckpoints(const std::string &pid) = 0;

    virtual bool deleteCheckpoint(const std::string &pid, const std::string &tag = "") = 0;

    /**
     * @return Number of checkpoints deleted
     */
    virtual size_t deleteProcessCheckpoints(const std::string &pid) = 0;
};

}  // namespace RPE
