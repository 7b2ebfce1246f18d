// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "persistence/ICheckpointStore.h"
#include <map>
#include <mutex>

namespace RPE {

/**
 * @brief Checkpoints kept in process memory, lost on restart
 */
class InMemoryCheckpointStore : public ICheckpointStore {
public:
    void saveCheckpoint(const Bundle &bundle, const std::string &tag = "") override;
    std::optional<Bundle> loadCheckpoint(const std::string &pid, const std::string &tag = "") override;
    std::vector<CheckpointKey> getCheckpoints() override;
    std::vector<CheckpointKey> getProcessCheckpoints(const std::string &pid) override;
    bool deleteCheckpoint(const std::string &pid, const std::string &tag = "") override;
    size_t deleteProcessCheckpoints(const std::string &pid) override;

private:
    std::mutex mutex_;
    std::map<CheckpointKey, Bundle> checkpoints_;
};

}  // namespace RPE
