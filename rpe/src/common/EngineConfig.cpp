// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/EngineConfig.h"
#include "backends/SpdlogBackend.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

namespace RPE {

namespace {

std::chrono::milliseconds readTimeout(const json &document, const std::string &key,
                                      std::chrono::milliseconds current) {
    if (!document.contains(key)) {
        return current;
    }
    const auto &value = document[key];
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ValidationError("Config key '" + key + "' must be a non-negative integer, got " + value.dump());
    }
    return std::chrono::milliseconds(value.get<int64_t>());
}

std::string readString(const json &document, const std::string &key, const std::string &current) {
    if (!document.contains(key)) {
        return current;
    }
    const auto &value = document[key];
    if (!value.is_string()) {
        throw ValidationError("Config key '" + key + "' must be a string, got " + value.dump());
    }
    return value.get<std::string>();
}

std::chrono::milliseconds parseTimeoutVariable(const char *name, const std::string &text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0) {
            throw ValidationError(std::string(name) + " must be a non-negative integer, got '" + text + "'");
        }
        return std::chrono::milliseconds(value);
    } catch (const std::invalid_argument &) {
        throw ValidationError(std::string(name) + " must be a non-negative integer, got '" + text + "'");
    } catch (const std::out_of_range &) {
        throw ValidationError(std::string(name) + " is out of range: '" + text + "'");
    }
}

}  // namespace

void EngineConfig::merge(const json &document) {
    if (!document.is_object()) {
        throw ValidationError("Engine configuration must be a JSON object");
    }

    rpcTimeout = readTimeout(document, "rpc_timeout_ms", rpcTimeout);
    broadcastTimeout = readTimeout(document, "broadcast_timeout_ms", broadcastTimeout);
    checkpointDirectory = readString(document, "checkpoint_directory", checkpointDirectory);
    logLevel = readString(document, "log_level", logLevel);
    logDirectory = readString(document, "log_directory", logDirectory);

    if (document.contains("log_to_file")) {
        if (!document["log_to_file"].is_boolean()) {
            throw ValidationError("Config key 'log_to_file' must be a boolean");
        }
        logToFile = document["log_to_file"].get<bool>();
    }
}

void EngineConfig::applyEnvironment() {
    if (const char *value = std::getenv("RPE_RPC_TIMEOUT_MS")) {
        rpcTimeout = parseTimeoutVariable("RPE_RPC_TIMEOUT_MS", value);
    }
    if (const char *value = std::getenv("RPE_BROADCAST_TIMEOUT_MS")) {
        broadcastTimeout = parseTimeoutVariable("RPE_BROADCAST_TIMEOUT_MS", value);
    }
    if (const char *value = std::getenv("RPE_CHECKPOINT_DIR")) {
        checkpointDirectory = value;
    }
    if (const char *value = std::getenv("RPE_LOG_LEVEL")) {
        logLevel = value;
    }
}

json EngineConfig::toJson() const {
    return json{{"rpc_timeout_ms", rpcTimeout.count()},
                {"broadcast_timeout_ms", broadcastTimeout.count()},
                {"checkpoint_directory", checkpointDirectory},
                {"log_level", logLevel},
                {"log_directory", logDirectory},
                {"log_to_file", logToFile}};
}

EngineConfig EngineConfig::fromJson(const json &document) {
    EngineConfig config;
    config.merge(document);
    return config;
}

EngineConfig EngineConfig::loadFromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string error;
    auto document = JsonUtils::parseJson(buffer.str(), &error);
    if (!document) {
        throw ValidationError("Cannot parse config file " + path + ": " + error);
    }

    LOG_DEBUG("EngineConfig: Loaded configuration from {}", path);
    return fromJson(*document);
}

void configureLogging(const EngineConfig &config) {
    Logger::setBackend(std::make_unique<SpdlogBackend>(config.logDirectory, config.logToFile));
    Logger::setLevel(parseLogLevel(config.logLevel));
    LOG_DEBUG("Logging at '{}'{}", config.logLevel,
              config.logToFile && !config.logDirectory.empty() ? " into " + config.logDirectory : "");
}

}  // namespace RPE
