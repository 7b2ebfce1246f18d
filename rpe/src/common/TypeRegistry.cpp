// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/TypeRegistry.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include <algorithm>
#include <mutex>

namespace RPE {

TypeRegistry &TypeRegistry::getInstance() {
    static TypeRegistry instance;
    return instance;
}

bool TypeRegistry::registerType(const std::string &typeId, ProcessFactory factory, InputValidator validator) {
    if (typeId.empty() || !factory) {
        LOG_ERROR("TypeRegistry: Cannot register type with empty id or null factory");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (types_.find(typeId) != types_.end()) {
        LOG_WARN("TypeRegistry: Type '{}' already registered", typeId);
        return false;
    }

    types_[typeId] = Entry{std::move(factory), std::move(validator)};
    LOG_DEBUG("TypeRegistry: Registered process type '{}'", typeId);
    return true;
}

bool TypeRegistry::isRegisteredType(const std::string &typeId) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return types_.find(typeId) != types_.end();
}

std::optional<ProcessFactory> TypeRegistry::resolve(const std::string &typeId) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = types_.find(typeId);
    if (it == types_.end()) {
        LOG_DEBUG("TypeRegistry: Type '{}' not found", typeId);
        return std::nullopt;
    }
    return it->second.factory;
}

std::string TypeRegistry::findTypeId(const std::type_index &type) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = typeIds_.find(type);
    return it != typeIds_.end() ? it->second : "";
}

json TypeRegistry::validate(const std::string &typeId, const json &inputs) {
    InputValidator validator;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = types_.find(typeId);
        if (it == types_.end()) {
            throw ValidationError("Unknown process type '" + typeId + "'");
        }
        validator = it->second.validator;
    }

    if (!inputs.is_object()) {
        throw ValidationError("Inputs of '" + typeId + "' must be an object, got " + inputs.type_name());
    }

    // Validator runs outside the lock, it may consult the registry itself
    return validator ? validator(inputs) : inputs;
}

bool TypeRegistry::unregisterType(const std::string &typeId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (types_.erase(typeId) == 0) {
        return false;
    }
    for (auto it = typeIds_.begin(); it != typeIds_.end();) {
        if (it->second == typeId) {
            it = typeIds_.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

std::vector<std::string> TypeRegistry::getRegisteredTypes() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto &[typeId, entry] : types_) {
        result.push_back(typeId);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void TypeRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    types_.clear();
    typeIds_.clear();
}

}  // namespace RPE
