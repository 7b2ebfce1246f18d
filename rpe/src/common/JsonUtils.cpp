// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <chrono>
#include <cmath>

namespace RPE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int64_t JsonUtils::getInt(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    return value.get<int64_t>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_boolean()) {
        return defaultValue;
    }

    return value.get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

bool JsonUtils::isRepresentable(const json &value, std::string *pathOut, const std::string &path) {
    if (value.is_binary()) {
        if (pathOut) {
            *pathOut = path.empty() ? "<root>" : path;
        }
        return false;
    }

    if (value.is_number_float()) {
        double number = value.get<double>();
        if (std::isnan(number) || std::isinf(number)) {
            if (pathOut) {
                *pathOut = path.empty() ? "<root>" : path;
            }
            return false;
        }
        return true;
    }

    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            std::string childPath = path.empty() ? it.key() : path + "." + it.key();
            if (!isRepresentable(it.value(), pathOut, childPath)) {
                return false;
            }
        }
    } else if (value.is_array()) {
        for (size_t i = 0; i < value.size(); ++i) {
            if (!isRepresentable(value[i], pathOut, path + "[" + std::to_string(i) + "]")) {
                return false;
            }
        }
    }

    return true;
}

int64_t JsonUtils::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace RPE
