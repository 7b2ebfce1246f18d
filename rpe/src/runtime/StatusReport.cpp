// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/StatusReport.h"
#include "common/Exceptions.h"

namespace RPE {

json StatusReport::toJson() const {
    json document = {{"pid", pid},
                     {"label", label},
                     {"is_terminal", isTerminal},
                     {"paused", paused},
                     {"process_type", processType},
                     {"creation_time", creationTime},
                     {"status_message", statusMessage}};
    if (!pausedMessage.empty()) {
        document["paused_message"] = pausedMessage;
    }
    if (successful.has_value()) {
        document["successful"] = *successful;
    }
    return document;
}

StatusReport StatusReport::fromJson(const json &document) {
    if (!document.is_object() || !document.contains("pid") || !document["pid"].is_string() ||
        !document.contains("label") || !document["label"].is_string() || !document.contains("is_terminal") ||
        !document["is_terminal"].is_boolean() || !document.contains("paused") || !document["paused"].is_boolean()) {
        throw MalformedMessageError("Malformed status report: " + document.dump());
    }

    StatusReport report;
    report.pid = document["pid"].get<std::string>();
    report.label = document["label"].get<std::string>();
    report.isTerminal = document["is_terminal"].get<bool>();
    report.paused = document["paused"].get<bool>();
    report.pausedMessage = JsonUtils::getString(document, "paused_message");
    report.processType = JsonUtils::getString(document, "process_type");
    report.creationTime = JsonUtils::getInt(document, "creation_time");
    report.statusMessage = JsonUtils::getString(document, "status_message");
    if (document.contains("successful") && document["successful"].is_boolean()) {
        report.successful = document["successful"].get<bool>();
    }
    return report;
}

}  // namespace RPE
