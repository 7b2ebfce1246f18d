// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "persistence/Bundle.h"
#include "common/Exceptions.h"

namespace RPE {

namespace {

void requireKey(const json &document, const std::string &key, json::value_t type) {
    if (!document.contains(key)) {
        throw ReconstructionError("Bundle is missing '" + key + "'");
    }
    const auto &value = document[key];
    bool matches = value.type() == type ||
                   (type == json::value_t::number_integer && value.type() == json::value_t::number_unsigned);
    if (!matches) {
        throw ReconstructionError("Bundle key '" + key + "' has type " + value.type_name());
    }
}

}  // namespace

Bundle Bundle::fromJson(const json &document) {
    if (!document.is_object()) {
        throw ReconstructionError("Bundle must be an object, got " + std::string(document.type_name()));
    }

    requireKey(document, "type_id", json::value_t::string);
    requireKey(document, "pid", json::value_t::string);
    requireKey(document, "label", json::value_t::string);
    requireKey(document, "inputs", json::value_t::object);
    requireKey(document, "outputs", json::value_t::object);
    requireKey(document, "continuation", json::value_t::object);

    if (document["pid"].get<std::string>().empty()) {
        throw ReconstructionError("Bundle has an empty pid");
    }
    if (document.contains("version") && !document["version"].is_number_integer()) {
        throw ReconstructionError("Bundle version must be an integer");
    }

    return Bundle(document);
}

int Bundle::version() const {
    return static_cast<int>(JsonUtils::getInt(document_, "version", 1));
}

std::string Bundle::typeId() const {
    return JsonUtils::getString(document_, "type_id");
}

std::string Bundle::pid() const {
    return JsonUtils::getString(document_, "pid");
}

std::string Bundle::label() const {
    return JsonUtils::getString(document_, "label");
}

json Bundle::inputs() const {
    return document_.value("inputs", json::object());
}

json Bundle::outputs() const {
    return document_.value("outputs", json::object());
}

json Bundle::continuation() const {
    return document_.value("continuation", json::object());
}

bool Bundle::paused() const {
    return JsonUtils::getBool(document_, "paused");
}

std::string Bundle::pausedMessage() const {
    return JsonUtils::getString(document_, "paused_message");
}

json Bundle::state() const {
    return document_.value("state", json::object());
}

int64_t Bundle::creationTime() const {
    return JsonUtils::getInt(document_, "creation_time");
}

}  // namespace RPE
