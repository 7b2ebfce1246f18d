// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "comms/ProcessController.h"
#include "common/Logger.h"

namespace RPE {

namespace {

bool toAck(const json &result) {
    if (!result.is_boolean()) {
        throw MalformedMessageError("Expected boolean acknowledgement, got " + result.dump());
    }
    return result.get<bool>();
}

std::string toPid(const json &result) {
    if (!result.is_string()) {
        throw MalformedMessageError("Expected pid, got " + result.dump());
    }
    return result.get<std::string>();
}

}  // namespace

AsyncProcessController::AsyncProcessController(std::shared_ptr<IBroker> broker, std::chrono::milliseconds timeout)
    : broker_(std::move(broker)), timeout_(timeout) {}

AsyncProcessController::AsyncProcessController(std::shared_ptr<IBroker> broker, const EngineConfig &config)
    : AsyncProcessController(std::move(broker), config.rpcTimeout) {}

ControlFuture<bool> AsyncProcessController::pause(const std::string &pid, const std::string &message) {
    json payload = json::object();
    if (!message.empty()) {
        payload["message"] = message;
    }
    return call<bool>(pid, ControlMessage::rpc(MessageKind::PAUSE, pid, payload), toAck);
}

ControlFuture<bool> AsyncProcessController::play(const std::string &pid) {
    return call<bool>(pid, ControlMessage::rpc(MessageKind::PLAY, pid), toAck);
}

ControlFuture<bool> AsyncProcessController::kill(const std::string &pid, const std::string &message) {
    json payload = json::object();
    if (!message.empty()) {
        payload["message"] = message;
    }
    return call<bool>(pid, ControlMessage::rpc(MessageKind::KILL, pid, payload), toAck);
}

ControlFuture<StatusReport> AsyncProcessController::status(const std::string &pid) {
    return call<StatusReport>(pid, ControlMessage::rpc(MessageKind::STATUS, pid), StatusReport::fromJson);
}

ControlFuture<std::string> AsyncProcessController::launch(const std::string &processType, const json &inputs) {
    json payload = {{"process_type", processType}, {"inputs", inputs}};
    return call<std::string>(Constants::LAUNCHER_TARGET, ControlMessage::rpc(MessageKind::LAUNCH, "", payload),
                             toPid);
}

ControlFuture<std::string> AsyncProcessController::continueProcess(const std::string &pid, const std::string &tag) {
    json payload = json::object();
    if (!tag.empty()) {
        payload["tag"] = tag;
    }
    return call<std::string>(Constants::LAUNCHER_TARGET, ControlMessage::rpc(MessageKind::CONTINUE, pid, payload),
                             toPid);
}

void AsyncProcessController::pauseAll(const std::string &message) {
    json payload = json::object();
    if (!message.empty()) {
        payload["message"] = message;
    }
    broadcastCommand(MessageKind::PAUSE, payload);
}

void AsyncProcessController::playAll() {
    broadcastCommand(MessageKind::PLAY, json::object());
}

void AsyncProcessController::killAll(const std::string &message) {
    json payload = json::object();
    if (!message.empty()) {
        payload["message"] = message;
    }
    broadcastCommand(MessageKind::KILL, payload);
}

ControlFuture<json> AsyncProcessController::send(const std::string &target, const ControlMessage &request) {
    return call<json>(target, request, [](const json &result) { return result; });
}

template <typename T>
ControlFuture<T> AsyncProcessController::call(const std::string &target, const ControlMessage &request,
                                              typename ControlFuture<T>::Converter convert) {
    std::string description = toString(request.kind) + " " + (request.pid.empty() ? target : request.pid);
    LOG_DEBUG("AsyncProcessController: Sending {} ({})", description, request.correlationId);

    try {
        return ControlFuture<T>(broker_->rpcSend(target, request.toJson()), request.correlationId, description,
                                timeout_, std::move(convert));
    } catch (const BrokerError &e) {
        LOG_WARN("AsyncProcessController: {} not sent: {}", description, e.what());
        return ControlFuture<T>::failed(std::current_exception(), description);
    }
}

void AsyncProcessController::broadcastCommand(MessageKind kind, const json &payload) {
    auto delivery = broker_->publish(Constants::BROADCAST_TOPIC, ControlMessage::broadcast(kind, "", payload).toJson());
    if (delivery.wait_for(timeout_) != std::future_status::ready) {
        LOG_WARN("AsyncProcessController: {} broadcast not confirmed within {} ms", toString(kind), timeout_.count());
        return;
    }
    delivery.get();
}

BlockingProcessController::BlockingProcessController(std::shared_ptr<IBroker> broker,
                                                     std::chrono::milliseconds timeout)
    : async_(std::move(broker), timeout) {}

BlockingProcessController::BlockingProcessController(std::shared_ptr<IBroker> broker, const EngineConfig &config)
    : async_(std::move(broker), config) {}

bool BlockingProcessController::pause(const std::string &pid, const std::string &message) {
    return async_.pause(pid, message).get();
}

bool BlockingProcessController::play(const std::string &pid) {
    return async_.play(pid).get();
}

bool BlockingProcessController::kill(const std::string &pid, const std::string &message) {
    return async_.kill(pid, message).get();
}

StatusReport BlockingProcessController::status(const std::string &pid) {
    return async_.status(pid).get();
}

std::string BlockingProcessController::launch(const std::string &processType, const json &inputs) {
    return async_.launch(processType, inputs).get();
}

std::string BlockingProcessController::continueProcess(const std::string &pid, const std::string &tag) {
    return async_.continueProcess(pid, tag).get();
}

void BlockingProcessController::pauseAll(const std::string &message) {
    async_.pauseAll(message);
}

void BlockingProcessController::playAll() {
    async_.playAll();
}

void BlockingProcessController::killAll(const std::string &message) {
    async_.killAll(message);
}

}  // namespace RPE
