// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/EngineConfig.h"
#include <memory>

namespace RPE {

class ITaskScheduler;
class IBroker;
class Persister;

/**
 * @brief Collaborators shared by the processes of one host
 *
 * Only the scheduler is mandatory. Without a broker the process has no
 * control-plane binding and broadcasts nothing; without a persister no
 * checkpoints are taken.
 */
struct ProcessContext {
    std::shared_ptr<ITaskScheduler> scheduler;
    std::shared_ptr<IBroker> broker;
    std::shared_ptr<Persister> persister;
    EngineConfig config;

    /**
     * @brief Host startup from a configuration
     *
     * Applies the logging settings through configureLogging(), then creates
     * an AUTOMATIC TaskSchedulerImpl, an InMemoryBroker when no broker is
     * given, and Persister::fromConfig(config).
     *
     * @code
     * auto config = RPE::EngineConfig::loadFromFile("rpe.json");
     * config.applyEnvironment();
     * auto context = RPE::ProcessContext::fromConfig(config);
     * RPE::ProcessLauncher launcher(context);
     * launcher.start();
     * context.scheduler->run();
     * @endcode
     */
    static ProcessContext fromConfig(const EngineConfig &config, std::shared_ptr<IBroker> broker = nullptr);
};

}  // namespace RPE
