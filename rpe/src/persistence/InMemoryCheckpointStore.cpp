// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "persistence/InMemoryCheckpointStore.h"
#include "common/Exceptions.h"

namespace RPE {

void InMemoryCheckpointStore::saveCheckpoint(const Bundle &bundle, const std::string &tag) {
    if (bundle.pid().empty()) {
        throw SerializationError("Cannot store a bundle without pid");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoints_[CheckpointKey{bundle.pid(), tag}] = bundle;
}

std::optional<Bundle> InMemoryCheckpointStore::loadCheckpoint(const std::string &pid, const std::string &tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.find(CheckpointKey{pid, tag});
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CheckpointKey> InMemoryCheckpointStore::getCheckpoints() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CheckpointKey> keys;
    keys.reserve(checkpoints_.size());
    for (const auto &[key, bundle] : checkpoints_) {
        keys.push_back(key);
    }
    return keys;
}

std::vector<CheckpointKey> InMemoryCheckpointStore::getProcessCheckpoints(const std::string &pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CheckpointKey> keys;
    for (auto it = checkpoints_.lower_bound(CheckpointKey{pid, ""}); it != checkpoints_.end() && it->first.pid == pid;
         ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

bool InMemoryCheckpointStore::deleteCheckpoint(const std::string &pid, const std::string &tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_.erase(CheckpointKey{pid, tag}) > 0;
}

size_t InMemoryCheckpointStore::deleteProcessCheckpoints(const std::string &pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    auto it = checkpoints_.lower_bound(CheckpointKey{pid, ""});
    while (it != checkpoints_.end() && it->first.pid == pid) {
        it = checkpoints_.erase(it);
        removed++;
    }
    return removed;
}

}  // namespace RPE
