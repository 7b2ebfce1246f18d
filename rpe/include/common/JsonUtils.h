// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace RPE {

using json = nlohmann::json;

/**
 * @brief JSON helpers shared by the persistence and control layers
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Safely get string value from JSON object
     * @return String value or default when missing or not a string
     */
    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    /**
     * @brief Safely get integer value from JSON object
     * @return Integer value or default when missing or not an integer
     */
    static int64_t getInt(const json &object, const std::string &key, int64_t defaultValue = 0);

    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Find the first value a schemaless document cannot carry
     *
     * NaN, infinities and binary values are rejected. The path of the
     * offending value is written to pathOut (e.g. "outputs.values[2]").
     *
     * @return true if every value in the tree is representable
     */
    static bool isRepresentable(const json &value, std::string *pathOut = nullptr, const std::string &path = "");

    /**
     * @brief Milliseconds since the Unix epoch
     */
    static int64_t nowMillis();
};

}  // namespace RPE
