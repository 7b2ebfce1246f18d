// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/UniqueIdGenerator.h"
#include "common/Logger.h"

#include <chrono>
#include <sstream>

namespace RPE {

std::atomic<uint64_t> UniqueIdGenerator::globalCounter_{0};
std::mt19937_64 UniqueIdGenerator::rng_{std::random_device{}()};
std::mutex UniqueIdGenerator::rngMutex_;

std::string UniqueIdGenerator::generateProcessId() {
    return generateBaseId("proc");
}

std::string UniqueIdGenerator::generateCorrelationId() {
    return generateBaseId("corr");
}

std::string UniqueIdGenerator::generateUniqueId(const std::string &prefix) {
    return generateBaseId(prefix.empty() ? "id" : prefix);
}

bool UniqueIdGenerator::isGeneratedId(const std::string &id) {
    if (id.empty()) {
        return false;
    }

    size_t underscoreCount = 0;
    for (char c : id) {
        if (c == '_') {
            underscoreCount++;
        }
    }

    // prefix_timestamp_counter_random
    return underscoreCount == 3;
}

std::string UniqueIdGenerator::generateBaseId(const std::string &prefix) {
    uint64_t globalCount = globalCounter_.fetch_add(1);
    uint64_t timestamp = getCurrentTimestamp();
    uint64_t randomComponent = getRandomComponent();

    std::ostringstream oss;
    oss << prefix << "_" << timestamp << "_" << globalCount << "_" << std::hex << randomComponent;

    std::string id = oss.str();
    LOG_TRACE("UniqueIdGenerator: Generated ID: {}", id);
    return id;
}

uint64_t UniqueIdGenerator::getCurrentTimestamp() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

uint64_t UniqueIdGenerator::getRandomComponent() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    // Lower 16 bits keep the id short
    return rng_() & 0xFFFF;
}

}  // namespace RPE
