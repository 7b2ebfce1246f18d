// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "comms/ProcessLauncher.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/TypeRegistry.h"
#include "events/ITaskScheduler.h"
#include "persistence/Persister.h"
#include "runtime/Process.h"
#include <algorithm>

namespace RPE {

ProcessLauncher::ProcessLauncher(const ProcessContext &context) : context_(context) {
    if (!context_.scheduler) {
        throw InvalidStateError("ProcessLauncher requires a scheduler");
    }
}

ProcessLauncher::~ProcessLauncher() {
    *alive_ = false;
    stop();
}

void ProcessLauncher::start() {
    if (subscription_ || !context_.broker) {
        return;
    }

    auto scheduler = context_.scheduler;
    auto alive = alive_;
    subscription_ = context_.broker->subscribeRpc(
        Constants::LAUNCHER_TARGET, [this, scheduler, alive](const json &document, RpcResponder respond) {
            ControlMessage request;
            try {
                request = ControlMessage::fromJson(document);
            } catch (const MalformedMessageError &e) {
                respond(ControlResponse::failure(JsonUtils::getString(document, "correlation_id"), e.what()).toJson());
                return;
            }

            scheduler->post([this, alive, request, respond]() {
                if (!*alive) {
                    respond(ControlResponse::failure(request.correlationId, "Launcher stopped").toJson());
                    return;
                }
                try {
                    respond(ControlResponse::success(request.correlationId, handle(request)).toJson());
                } catch (const std::exception &e) {
                    LOG_WARN("ProcessLauncher: {} failed: {}", toString(request.kind), e.what());
                    respond(ControlResponse::failure(request.correlationId, e.what()).toJson());
                }
            });
        });

    LOG_INFO("ProcessLauncher: Serving {}", Constants::LAUNCHER_TARGET);
}

void ProcessLauncher::stop() {
    if (subscription_ && context_.broker) {
        context_.broker->unsubscribe(*subscription_);
    }
    subscription_.reset();
}

json ProcessLauncher::handle(const ControlMessage &request) {
    switch (request.kind) {
    case MessageKind::LAUNCH: {
        if (!request.payload.contains("process_type") || !request.payload["process_type"].is_string()) {
            throw MalformedMessageError("LAUNCH without process_type");
        }
        json inputs = request.payload.value("inputs", json::object());
        return launch(request.payload["process_type"].get<std::string>(), inputs)->pid();
    }
    case MessageKind::CONTINUE:
        return continueProcess(request.pid, JsonUtils::getString(request.payload, "tag"))->pid();
    default:
        throw ControlError("Launcher does not serve " + toString(request.kind));
    }
}

std::shared_ptr<Process> ProcessLauncher::launch(const std::string &processType, const json &inputs) {
    auto &registry = TypeRegistry::getInstance();
    json validated = registry.validate(processType, inputs);

    auto factory = registry.resolve(processType);
    if (!factory) {
        throw ValidationError("Unknown process type '" + processType + "'");
    }

    auto process = (*factory)(context_, validated, "");
    if (!process) {
        throw ValidationError("Factory of '" + processType + "' returned no process");
    }
    process->setTypeId(processType);
    process->initialize();
    host(process);
    process->start();

    LOG_INFO("ProcessLauncher: Launched {} as {}", processType, process->pid());
    return process;
}

std::shared_ptr<Process> ProcessLauncher::continueProcess(const std::string &pid, const std::string &tag) {
    if (!context_.persister) {
        throw ReconstructionError("No persister configured, cannot continue " + pid);
    }
    if (find(pid)) {
        throw InvalidStateError("Process " + pid + " is already hosted");
    }

    auto process = context_.persister->loadCheckpoint(pid, tag, context_);
    if (!process->hasTerminated()) {
        host(process);
        process->start();
    }

    LOG_INFO("ProcessLauncher: Continued {} in {}", pid, process->currentLabel());
    return process;
}

void ProcessLauncher::host(const std::shared_ptr<Process> &process) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_[process->pid()] = process;
}

std::shared_ptr<Process> ProcessLauncher::find(const std::string &pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    return it != processes_.end() ? it->second : nullptr;
}

std::vector<std::string> ProcessLauncher::hostedProcesses() const {
    std::vector<std::string> pids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[pid, process] : processes_) {
            pids.push_back(pid);
        }
    }
    std::sort(pids.begin(), pids.end());
    return pids;
}

size_t ProcessLauncher::purgeTerminated() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t released = 0;
    for (auto it = processes_.begin(); it != processes_.end();) {
        if (it->second->hasTerminated()) {
            it = processes_.erase(it);
            released++;
        } else {
            ++it;
        }
    }
    return released;
}

}  // namespace RPE
