// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace RPE {

class Process;
struct ProcessContext;

/**
 * @brief Creates an uninitialized process instance of a registered type
 *
 * The returned process has not entered any state yet. Callers either
 * initialize() it (fresh launch) or restore it from a bundle.
 */
using ProcessFactory =
    std::function<std::shared_ptr<Process>(const ProcessContext &context, const json &inputs, const std::string &pid)>;

/**
 * @brief Validates (and may normalize) launch inputs, throws ValidationError
 */
using InputValidator = std::function<json(const json &inputs)>;

/**
 * @brief Registry mapping process type ids to constructors
 *
 * Used by the launcher to create processes by name and by the Persister
 * to resolve a bundle's type_id back to a constructor.
 */
class TypeRegistry {
public:
    static TypeRegistry &getInstance();

    /**
     * @brief Register a process type
     * @param typeId Type identifier written into bundles
     * @param factory Constructor for the type
     * @param validator Optional input validator applied at launch
     * @return true if registration succeeded
     */
    bool registerType(const std::string &typeId, ProcessFactory factory, InputValidator validator = nullptr);

    /**
     * @brief Register a Process subclass constructible from (context, inputs, pid)
     */
    template <typename T> bool registerProcessType(const std::string &typeId, InputValidator validator = nullptr) {
        ProcessFactory factory = [](const ProcessContext &context, const json &inputs, const std::string &pid) {
            return std::static_pointer_cast<Process>(std::make_shared<T>(context, inputs, pid));
        };
        if (!registerType(typeId, std::move(factory), std::move(validator))) {
            return false;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        typeIds_[std::type_index(typeid(T))] = typeId;
        return true;
    }

    bool isRegisteredType(const std::string &typeId);

    /**
     * @brief Resolve a type id to its factory
     * @return Factory, or nullopt if the type is unknown
     */
    std::optional<ProcessFactory> resolve(const std::string &typeId);

    /**
     * @brief Type id registered for a C++ type, empty if none
     */
    std::string findTypeId(const std::type_index &type);

    /**
     * @brief Run the type's validator over launch inputs
     * @throws ValidationError if the type is unknown or the inputs are rejected
     */
    json validate(const std::string &typeId, const json &inputs);

    bool unregisterType(const std::string &typeId);

    std::vector<std::string> getRegisteredTypes();

    /**
     * @brief Clear all registrations (mainly for testing)
     */
    void clear();

private:
    TypeRegistry() = default;
    ~TypeRegistry() = default;

    TypeRegistry(const TypeRegistry &) = delete;
    TypeRegistry &operator=(const TypeRegistry &) = delete;
    TypeRegistry(TypeRegistry &&) = delete;
    TypeRegistry &operator=(TypeRegistry &&) = delete;

    struct Entry {
        ProcessFactory factory;
        InputValidator validator;
    };

    std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> types_;
    std::unordered_map<std::type_index, std::string> typeIds_;
};

}  // namespace RPE
