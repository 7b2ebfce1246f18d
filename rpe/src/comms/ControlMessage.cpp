// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "comms/ControlMessage.h"
#include "common/Exceptions.h"
#include "common/UniqueIdGenerator.h"

namespace RPE {

std::string toString(MessageType type) {
    return type == MessageType::RPC ? "rpc" : "broadcast";
}

std::string toString(MessageKind kind) {
    switch (kind) {
    case MessageKind::PLAY:
        return "PLAY";
    case MessageKind::PAUSE:
        return "PAUSE";
    case MessageKind::KILL:
        return "KILL";
    case MessageKind::STATUS:
        return "STATUS";
    case MessageKind::STATE_CHANGED:
        return "STATE_CHANGED";
    case MessageKind::LAUNCH:
        return "LAUNCH";
    case MessageKind::CONTINUE:
        return "CONTINUE";
    }
    return "UNKNOWN";
}

std::optional<MessageType> parseMessageType(const std::string &text) {
    if (text == "rpc") {
        return MessageType::RPC;
    }
    if (text == "broadcast") {
        return MessageType::BROADCAST;
    }
    return std::nullopt;
}

std::optional<MessageKind> parseMessageKind(const std::string &text) {
    for (auto kind : {MessageKind::PLAY, MessageKind::PAUSE, MessageKind::KILL, MessageKind::STATUS,
                      MessageKind::STATE_CHANGED, MessageKind::LAUNCH, MessageKind::CONTINUE}) {
        if (toString(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

ControlMessage ControlMessage::rpc(MessageKind kind, const std::string &pid, const json &payload,
                                   const std::string &correlationId) {
    ControlMessage message;
    message.type = MessageType::RPC;
    message.kind = kind;
    message.pid = pid;
    message.correlationId = correlationId.empty() ? UniqueIdGenerator::generateCorrelationId() : correlationId;
    message.payload = payload.is_null() ? json::object() : payload;
    return message;
}

ControlMessage ControlMessage::broadcast(MessageKind kind, const std::string &pid, const json &payload) {
    ControlMessage message;
    message.type = MessageType::BROADCAST;
    message.kind = kind;
    message.pid = pid;
    message.payload = payload.is_null() ? json::object() : payload;
    return message;
}

json ControlMessage::toJson() const {
    json document = {{"type", toString(type)}, {"kind", toString(kind)}, {"pid", pid}, {"payload", payload}};
    if (type == MessageType::RPC) {
        document["correlation_id"] = correlationId;
    }
    return document;
}

ControlMessage ControlMessage::fromJson(const json &document) {
    if (!document.is_object()) {
        throw MalformedMessageError("Control message must be an object");
    }

    auto type = parseMessageType(JsonUtils::getString(document, "type"));
    if (!type) {
        throw MalformedMessageError("Control message has no valid type: " + document.dump());
    }

    auto kind = parseMessageKind(JsonUtils::getString(document, "kind"));
    if (!kind) {
        throw MalformedMessageError("Control message has no valid kind: " + document.dump());
    }

    if (!document.contains("pid") || !document["pid"].is_string()) {
        throw MalformedMessageError("Control message has no pid: " + document.dump());
    }

    ControlMessage message;
    message.type = *type;
    message.kind = *kind;
    message.pid = document["pid"].get<std::string>();

    if (message.type == MessageType::RPC) {
        message.correlationId = JsonUtils::getString(document, "correlation_id");
        if (message.correlationId.empty()) {
            throw MalformedMessageError("RPC message has no correlation_id: " + document.dump());
        }
    }

    if (document.contains("payload") && !document["payload"].is_null()) {
        if (!document["payload"].is_object()) {
            throw MalformedMessageError("Control message payload must be an object");
        }
        message.payload = document["payload"];
    }
    return message;
}

ControlResponse ControlResponse::success(const std::string &correlationId, const json &result) {
    ControlResponse response;
    response.correlationId = correlationId;
    response.ok = true;
    response.result = result;
    return response;
}

ControlResponse ControlResponse::failure(const std::string &correlationId, const std::string &detail) {
    ControlResponse response;
    response.correlationId = correlationId;
    response.ok = false;
    response.errorDetail = detail;
    return response;
}

json ControlResponse::toJson() const {
    json document = {{"correlation_id", correlationId}, {"status", ok ? "ok" : "error"}};
    if (ok) {
        document["result"] = result;
    } else {
        document["error_detail"] = errorDetail;
    }
    return document;
}

ControlResponse ControlResponse::fromJson(const json &document) {
    if (!document.is_object()) {
        throw MalformedMessageError("Control response must be an object");
    }

    std::string status = JsonUtils::getString(document, "status");
    if (status != "ok" && status != "error") {
        throw MalformedMessageError("Control response has no valid status: " + document.dump());
    }

    ControlResponse response;
    response.correlationId = JsonUtils::getString(document, "correlation_id");
    response.ok = status == "ok";
    if (response.ok) {
        response.result = document.value("result", json());
    } else {
        response.errorDetail = JsonUtils::getString(document, "error_detail", "unspecified error");
    }
    return response;
}

}  // namespace RPE
