// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "persistence/ICheckpointStore.h"
#include <filesystem>
#include <mutex>

namespace RPE {

/**
 * @brief One JSON document per checkpoint in a directory
 *
 * File names are "<pid>.json" for untagged and "<pid>.<tag>.json" for
 * tagged checkpoints. Pids must not contain '.' or path separators.
 * Files are written to a temporary name first and renamed into place.
 */
class FileCheckpointStore : public ICheckpointStore {
public:
    /**
     * @param directory Created if it does not exist
     * @throws SerializationError if the directory cannot be created
     */
    explicit FileCheckpointStore(const std::filesystem::path &directory);

    void saveCheckpoint(const Bundle &bundle, const std::string &tag = "") override;
    std::optional<Bundle> loadCheckpoint(const std::string &pid, const std::string &tag = "") override;
    std::vector<CheckpointKey> getCheckpoints() override;
    std::vector<CheckpointKey> getProcessCheckpoints(const std::string &pid) override;
    bool deleteCheckpoint(const std::string &pid, const std::string &tag = "") override;
    size_t deleteProcessCheckpoints(const std::string &pid) override;

    const std::filesystem::path &directory() const {
        return directory_;
    }

private:
    std::filesystem::path pathFor(const std::string &pid, const std::string &tag) const;
    static std::optional<CheckpointKey> parseFileName(const std::filesystem::path &path);
    std::vector<CheckpointKey> scanUnlocked() const;

    std::filesystem::path directory_;
    std::mutex mutex_;
};

}  // namespace RPE
