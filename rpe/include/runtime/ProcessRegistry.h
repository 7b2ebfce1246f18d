// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace RPE {

class Process;

/**
 * @brief Process-wide map of live processes (pid -> process)
 *
 * Processes insert themselves when initialized or restored and remove
 * themselves on their terminal transition. Entries are weak: the registry
 * never keeps a process alive. One mutex covers every access since both
 * scheduler turns and inbound message handlers use it.
 */
class ProcessRegistry {
public:
    static ProcessRegistry &getInstance();

    /**
     * @brief Register a live process under its pid
     * @return false if another live process already owns the pid
     */
    bool registerProcess(const std::shared_ptr<Process> &process);

    /**
     * @brief Remove the entry for pid if it belongs to the given instance
     */
    bool unregisterProcess(const std::string &pid, const Process *process);

    /**
     * @return The live process, or nullptr if unknown or already destroyed
     */
    std::shared_ptr<Process> find(const std::string &pid) const;

    bool hasProcess(const std::string &pid) const;

    /**
     * @brief Pids of all live processes, sorted
     */
    std::vector<std::string> listProcesses() const;

    size_t size() const;

    /**
     * @brief Clear all entries (mainly for testing)
     */
    void clear();

private:
    ProcessRegistry() = default;
    ~ProcessRegistry() = default;

    ProcessRegistry(const ProcessRegistry &) = delete;
    ProcessRegistry &operator=(const ProcessRegistry &) = delete;

    struct Entry {
        std::weak_ptr<Process> process;
        const Process *instance = nullptr;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> processes_;
};

}  // namespace RPE
