// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/EngineConfig.h"
#include "persistence/Bundle.h"
#include "persistence/ICheckpointStore.h"
#include <memory>
#include <string>

namespace RPE {

class Process;
struct ProcessContext;

/**
 * @brief Converts processes to and from checkpoint bundles
 *
 * save() captures id, label, inputs, outputs and the process continuation.
 * load() resolves the bundle's type through the TypeRegistry and rebuilds
 * the process in the saved label with the same continuation.
 */
class Persister {
public:
    explicit Persister(std::shared_ptr<ICheckpointStore> store);

    /**
     * @brief In-memory store, or a FileCheckpointStore when checkpointDirectory is set
     */
    static std::shared_ptr<Persister> fromConfig(const EngineConfig &config);

    /**
     * @brief Snapshot a process
     * @throws SerializationError if the process has no type id or a value is not representable
     */
    Bundle save(const Process &process) const;

    /**
     * @brief Reconstruct a process from a bundle
     *
     * The process is restored but not started.
     * @throws ReconstructionError if the type is unknown or the bundle is malformed
     */
    std::shared_ptr<Process> load(const Bundle &bundle, const ProcessContext &context) const;

    /**
     * @brief save() and store under (pid, tag)
     */
    void saveCheckpoint(const Process &process, const std::string &tag = "");

    /**
     * @brief Fetch a stored bundle and load() it
     * @throws ReconstructionError if no such checkpoint exists
     */
    std::shared_ptr<Process> loadCheckpoint(const std::string &pid, const std::string &tag,
                                            const ProcessContext &context) const;

    const std::shared_ptr<ICheckpointStore> &store() const {
        return store_;
    }

private:
    std::shared_ptr<ICheckpointStore> store_;
};

}  // namespace RPE
