// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "comms/ProcessMessageRouter.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "events/ITaskScheduler.h"
#include "runtime/Process.h"

namespace RPE {

ProcessMessageRouter::ProcessMessageRouter(std::weak_ptr<Process> process, std::string pid,
                                           std::shared_ptr<IBroker> broker, std::shared_ptr<ITaskScheduler> scheduler)
    : process_(std::move(process)), pid_(std::move(pid)), broker_(std::move(broker)),
      scheduler_(std::move(scheduler)) {}

ProcessMessageRouter::~ProcessMessageRouter() {
    stop();
}

void ProcessMessageRouter::start() {
    if (rpcSubscription_) {
        return;
    }

    auto process = process_;
    auto pid = pid_;
    auto scheduler = scheduler_;

    rpcSubscription_ = broker_->subscribeRpc(pid_, [process, pid, scheduler](const json &request, RpcResponder respond) {
        onRpc(process, pid, scheduler, request, respond);
    });

    try {
        broadcastSubscription_ =
            broker_->subscribe(Constants::BROADCAST_TOPIC, [process, pid, scheduler](const json &message) {
                onBroadcast(process, pid, scheduler, message);
            });
    } catch (const BrokerError &) {
        broker_->unsubscribe(*rpcSubscription_);
        rpcSubscription_.reset();
        throw;
    }

    LOG_DEBUG("ProcessMessageRouter: Serving control messages for {}", pid_);
}

void ProcessMessageRouter::stop() {
    if (rpcSubscription_) {
        broker_->unsubscribe(*rpcSubscription_);
        rpcSubscription_.reset();
    }
    if (broadcastSubscription_) {
        broker_->unsubscribe(*broadcastSubscription_);
        broadcastSubscription_.reset();
    }
}

json ProcessMessageRouter::apply(Process &process, const ControlMessage &message) {
    const std::string text = JsonUtils::getString(message.payload, "message");

    switch (message.kind) {
    case MessageKind::PLAY:
        return process.play();
    case MessageKind::PAUSE:
        return process.pause(text);
    case MessageKind::KILL:
        return process.kill(text);
    case MessageKind::STATUS:
        return process.status().toJson();
    default:
        throw ControlError("Process " + process.pid() + " does not serve " + toString(message.kind));
    }
}

void ProcessMessageRouter::onRpc(const std::weak_ptr<Process> &process, const std::string &pid,
                                 const std::shared_ptr<ITaskScheduler> &scheduler, const json &request,
                                 const RpcResponder &respond) {
    ControlMessage message;
    try {
        message = ControlMessage::fromJson(request);
    } catch (const MalformedMessageError &e) {
        LOG_WARN("ProcessMessageRouter: Malformed request for {}: {}", pid, e.what());
        respond(ControlResponse::failure(JsonUtils::getString(request, "correlation_id"), e.what()).toJson());
        return;
    }

    if (message.type != MessageType::RPC || message.pid != pid) {
        respond(ControlResponse::failure(message.correlationId, "Request not addressed to " + pid).toJson());
        return;
    }

    // Executed on the process loop thread, the responder outlives this call
    scheduler->post([process, pid, message, respond]() {
        auto target = process.lock();
        if (!target) {
            respond(ControlResponse::failure(message.correlationId, "Process " + pid + " no longer exists").toJson());
            return;
        }

        try {
            json result = apply(*target, message);
            LOG_DEBUG("ProcessMessageRouter: {} {} -> {}", pid, toString(message.kind), result.dump());
            respond(ControlResponse::success(message.correlationId, result).toJson());
        } catch (const std::exception &e) {
            LOG_WARN("ProcessMessageRouter: {} {} failed: {}", pid, toString(message.kind), e.what());
            respond(ControlResponse::failure(message.correlationId, e.what()).toJson());
        }
    });
}

void ProcessMessageRouter::onBroadcast(const std::weak_ptr<Process> &process, const std::string &pid,
                                       const std::shared_ptr<ITaskScheduler> &scheduler, const json &document) {
    ControlMessage message;
    try {
        message = ControlMessage::fromJson(document);
    } catch (const MalformedMessageError &e) {
        LOG_DEBUG("ProcessMessageRouter: Ignoring malformed broadcast: {}", e.what());
        return;
    }

    if (message.kind != MessageKind::PLAY && message.kind != MessageKind::PAUSE && message.kind != MessageKind::KILL) {
        return;
    }
    if (!message.pid.empty() && message.pid != pid) {
        return;
    }

    scheduler->post([process, message]() {
        if (auto target = process.lock()) {
            try {
                apply(*target, message);
            } catch (const std::exception &e) {
                LOG_WARN("ProcessMessageRouter: Broadcast {} failed: {}", toString(message.kind), e.what());
            }
        }
    });
}

}  // namespace RPE
