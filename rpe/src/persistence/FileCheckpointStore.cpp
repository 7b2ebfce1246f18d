// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "persistence/FileCheckpointStore.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace RPE {

namespace {

bool isValidNamePart(const std::string &part) {
    return part.find('.') == std::string::npos && part.find('/') == std::string::npos &&
           part.find('\\') == std::string::npos;
}

}  // namespace

FileCheckpointStore::FileCheckpointStore(const std::filesystem::path &directory) : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw SerializationError("Cannot create checkpoint directory " + directory_.string() + ": " + ec.message());
    }
    LOG_DEBUG("FileCheckpointStore: Using directory {}", directory_.string());
}

void FileCheckpointStore::saveCheckpoint(const Bundle &bundle, const std::string &tag) {
    const std::string pid = bundle.pid();
    if (pid.empty() || !isValidNamePart(pid)) {
        throw SerializationError("Pid '" + pid + "' cannot be used as a checkpoint file name");
    }
    if (!tag.empty() && tag.find('/') != std::string::npos) {
        throw SerializationError("Tag '" + tag + "' cannot be used as a checkpoint file name");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto target = pathFor(pid, tag);
    auto temporary = target;
    temporary += ".tmp";

    {
        std::ofstream file(temporary, std::ios::trunc);
        if (!file.is_open()) {
            throw SerializationError("Cannot open " + temporary.string() + " for writing");
        }
        file << JsonUtils::toPrettyString(bundle.toJson());
        if (!file.good()) {
            throw SerializationError("Failed writing " + temporary.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temporary, target, ec);
    if (ec) {
        std::filesystem::remove(temporary, ec);
        throw SerializationError("Cannot move checkpoint into place at " + target.string());
    }
}

std::optional<Bundle> FileCheckpointStore::loadCheckpoint(const std::string &pid, const std::string &tag) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto path = pathFor(pid, tag);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ReconstructionError("Cannot open checkpoint " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string error;
    auto document = JsonUtils::parseJson(buffer.str(), &error);
    if (!document) {
        throw ReconstructionError("Corrupted checkpoint " + path.string() + ": " + error);
    }
    return Bundle::fromJson(*document);
}

std::vector<CheckpointKey> FileCheckpointStore::getCheckpoints() {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanUnlocked();
}

std::vector<CheckpointKey> FileCheckpointStore::getProcessCheckpoints(const std::string &pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto keys = scanUnlocked();
    keys.erase(std::remove_if(keys.begin(), keys.end(), [&pid](const CheckpointKey &key) { return key.pid != pid; }),
               keys.end());
    return keys;
}

bool FileCheckpointStore::deleteCheckpoint(const std::string &pid, const std::string &tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return std::filesystem::remove(pathFor(pid, tag), ec);
}

size_t FileCheckpointStore::deleteProcessCheckpoints(const std::string &pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (const auto &key : scanUnlocked()) {
        if (key.pid != pid) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::remove(pathFor(key.pid, key.tag), ec)) {
            removed++;
        }
    }
    return removed;
}

std::filesystem::path FileCheckpointStore::pathFor(const std::string &pid, const std::string &tag) const {
    std::string name = tag.empty() ? pid : pid + "." + tag;
    return directory_ / (name + Constants::CHECKPOINT_FILE_EXTENSION);
}

std::optional<CheckpointKey> FileCheckpointStore::parseFileName(const std::filesystem::path &path) {
    if (path.extension() != Constants::CHECKPOINT_FILE_EXTENSION) {
        return std::nullopt;
    }

    std::string stem = path.stem().string();
    if (stem.empty()) {
        return std::nullopt;
    }

    // Pids never contain '.', everything after the first one is the tag
    auto dot = stem.find('.');
    if (dot == std::string::npos) {
        return CheckpointKey{stem, ""};
    }
    return CheckpointKey{stem.substr(0, dot), stem.substr(dot + 1)};
}

std::vector<CheckpointKey> FileCheckpointStore::scanUnlocked() const {
    std::vector<CheckpointKey> keys;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (auto key = parseFileName(entry.path())) {
            keys.push_back(*key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace RPE
