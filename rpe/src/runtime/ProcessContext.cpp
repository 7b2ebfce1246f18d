// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ProcessContext.h"
#include "common/Logger.h"
#include "comms/InMemoryBroker.h"
#include "events/TaskSchedulerImpl.h"
#include "persistence/Persister.h"

namespace RPE {

ProcessContext ProcessContext::fromConfig(const EngineConfig &config, std::shared_ptr<IBroker> broker) {
    configureLogging(config);

    ProcessContext context;
    context.config = config;
    context.scheduler = std::make_shared<TaskSchedulerImpl>(SchedulerMode::AUTOMATIC);
    context.broker = broker ? std::move(broker) : std::make_shared<InMemoryBroker>();
    context.persister = Persister::fromConfig(config);

    LOG_INFO("Host context ready: rpc timeout {} ms, broadcast timeout {} ms, checkpoints {}",
             config.rpcTimeout.count(), config.broadcastTimeout.count(),
             config.checkpointDirectory.empty() ? std::string("in memory") : config.checkpointDirectory);
    return context;
}

}  // namespace RPE
