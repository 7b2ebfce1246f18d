// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <optional>
#include <string>

namespace RPE {

enum class MessageType { RPC, BROADCAST };

enum class MessageKind { PLAY, PAUSE, KILL, STATUS, STATE_CHANGED, LAUNCH, CONTINUE };

std::string toString(MessageType type);
std::string toString(MessageKind kind);
std::optional<MessageType> parseMessageType(const std::string &text);
std::optional<MessageKind> parseMessageKind(const std::string &text);

/**
 * @brief Control-plane envelope
 *
 * Wire form:
 * @code
 * {"type": "rpc", "kind": "KILL", "pid": "proc_...", "correlation_id": "corr_...", "payload": {"message": "..."}}
 * {"type": "broadcast", "kind": "STATE_CHANGED", "pid": "proc_...", "payload": {"from": "RUNNING", "to": "WAITING"}}
 * @endcode
 * A broadcast command (PLAY/PAUSE/KILL) with an empty pid addresses every process.
 */
struct ControlMessage {
    MessageType type = MessageType::RPC;
    MessageKind kind = MessageKind::STATUS;
    std::string pid;
    std::string correlationId;
    json payload = json::object();

    /**
     * @brief RPC request; a correlation id is generated when none is given
     */
    static ControlMessage rpc(MessageKind kind, const std::string &pid, const json &payload = json::object(),
                              const std::string &correlationId = "");

    static ControlMessage broadcast(MessageKind kind, const std::string &pid, const json &payload = json::object());

    json toJson() const;

    /**
     * @throws MalformedMessageError if the envelope does not match the schema
     */
    static ControlMessage fromJson(const json &document);
};

/**
 * @brief RPC response: {"correlation_id", "status": "ok"|"error", "result"|"error_detail"}
 */
struct ControlResponse {
    std::string correlationId;
    bool ok = true;
    json result;
    std::string errorDetail;

    static ControlResponse success(const std::string &correlationId, const json &result);

    static ControlResponse failure(const std::string &correlationId, const std::string &detail);

    json toJson() const;

    /**
     * @throws MalformedMessageError if the response does not match the schema
     */
    static ControlResponse fromJson(const json &document);
};

}  // namespace RPE
