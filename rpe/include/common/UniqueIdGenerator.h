// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace RPE {

/**
 * @brief Thread-safe generator for process ids, correlation ids and task names
 *
 * IDs have the form prefix_timestamp_counter_random. The wall-clock
 * timestamp keeps ids unique across host restarts, the counter keeps
 * them unique within one host.
 */
class UniqueIdGenerator {
public:
    static std::string generateProcessId();

    static std::string generateCorrelationId();

    static std::string generateUniqueId(const std::string &prefix);

    /**
     * @brief Check if ID matches the prefix_timestamp_counter_random shape
     */
    static bool isGeneratedId(const std::string &id);

private:
    static std::atomic<uint64_t> globalCounter_;
    static std::mt19937_64 rng_;
    static std::mutex rngMutex_;

    static std::string generateBaseId(const std::string &prefix);
    static uint64_t getCurrentTimestamp();
    static uint64_t getRandomComponent();
};

}  // namespace RPE
