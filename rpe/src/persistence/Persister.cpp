// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "persistence/Persister.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/TypeRegistry.h"
#include "persistence/FileCheckpointStore.h"
#include "persistence/InMemoryCheckpointStore.h"
#include "runtime/Process.h"

namespace RPE {

Persister::Persister(std::shared_ptr<ICheckpointStore> store) : store_(std::move(store)) {
    if (!store_) {
        store_ = std::make_shared<InMemoryCheckpointStore>();
    }
}

std::shared_ptr<Persister> Persister::fromConfig(const EngineConfig &config) {
    if (config.checkpointDirectory.empty()) {
        return std::make_shared<Persister>(std::make_shared<InMemoryCheckpointStore>());
    }
    return std::make_shared<Persister>(std::make_shared<FileCheckpointStore>(config.checkpointDirectory));
}

Bundle Persister::save(const Process &process) const {
    if (process.typeId().empty()) {
        throw SerializationError("Process<" + process.pid() + "> has no registered type id");
    }
    if (!process.isInitialized()) {
        throw SerializationError("Process<" + process.pid() + "> has no state to save");
    }

    const auto *state = dynamic_cast<const ProcessStateBase *>(process.currentState());

    json document = {{"version", Constants::BUNDLE_VERSION},
                     {"type_id", process.typeId()},
                     {"pid", process.pid()},
                     {"label", process.currentLabel()},
                     {"inputs", process.inputs()},
                     {"outputs", process.outputs()},
                     {"continuation", process.saveContinuation()},
                     {"paused", process.isPaused()},
                     {"paused_message", process.pausedMessage()},
                     {"state", state ? state->data() : json::object()},
                     {"creation_time", process.creationTime()}};

    std::string badPath;
    if (!JsonUtils::isRepresentable(document, &badPath)) {
        throw SerializationError("Process<" + process.pid() + "> holds a non-representable value at '" + badPath +
                                 "'");
    }

    return Bundle(std::move(document));
}

std::shared_ptr<Process> Persister::load(const Bundle &bundle, const ProcessContext &context) const {
    // Re-validate, the bundle may come from an untrusted store
    Bundle checked = Bundle::fromJson(bundle.toJson());

    if (checked.version() > Constants::BUNDLE_VERSION) {
        throw ReconstructionError("Bundle version " + std::to_string(checked.version()) + " is newer than supported " +
                                  std::to_string(Constants::BUNDLE_VERSION));
    }

    auto factory = TypeRegistry::getInstance().resolve(checked.typeId());
    if (!factory) {
        throw ReconstructionError("Cannot resolve process type '" + checked.typeId() + "'");
    }

    std::shared_ptr<Process> process;
    try {
        process = (*factory)(context, checked.inputs(), checked.pid());
    } catch (const ReconstructionError &) {
        throw;
    } catch (const std::exception &e) {
        throw ReconstructionError("Cannot construct '" + checked.typeId() + "': " + e.what());
    }
    if (!process) {
        throw ReconstructionError("Factory of '" + checked.typeId() + "' returned no process");
    }

    try {
        process->restore(checked);
    } catch (const ReconstructionError &) {
        throw;
    } catch (const std::exception &e) {
        throw ReconstructionError("Cannot restore '" + checked.pid() + "': " + e.what());
    }

    LOG_DEBUG("Persister: Loaded {} of type {} in {}", checked.pid(), checked.typeId(), checked.label());
    return process;
}

void Persister::saveCheckpoint(const Process &process, const std::string &tag) {
    Bundle bundle = save(process);
    store_->saveCheckpoint(bundle, tag);
    LOG_TRACE("Persister: Checkpointed {} in {}", process.pid(), process.currentLabel());
}

std::shared_ptr<Process> Persister::loadCheckpoint(const std::string &pid, const std::string &tag,
                                                   const ProcessContext &context) const {
    auto bundle = store_->loadCheckpoint(pid, tag);
    if (!bundle) {
        throw ReconstructionError("No checkpoint for '" + pid + "'" + (tag.empty() ? "" : " with tag '" + tag + "'"));
    }
    return load(*bundle, context);
}

}  // namespace RPE
