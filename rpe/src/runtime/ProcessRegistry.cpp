// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ProcessRegistry.h"
#include "common/Logger.h"
#include "runtime/Process.h"
#include <algorithm>

namespace RPE {

ProcessRegistry &ProcessRegistry::getInstance() {
    static ProcessRegistry instance;
    return instance;
}

bool ProcessRegistry::registerProcess(const std::shared_ptr<Process> &process) {
    if (!process) {
        LOG_ERROR("ProcessRegistry: Cannot register null process");
        return false;
    }

    const std::string &pid = process->pid();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = processes_.find(pid);
    if (it != processes_.end() && !it->second.process.expired() && it->second.instance != process.get()) {
        LOG_ERROR("ProcessRegistry: Pid '{}' already owned by a live process", pid);
        return false;
    }

    processes_[pid] = Entry{process, process.get()};
    LOG_DEBUG("ProcessRegistry: Registered '{}' (live processes: {})", pid, processes_.size());
    return true;
}

bool ProcessRegistry::unregisterProcess(const std::string &pid, const Process *process) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = processes_.find(pid);
    if (it == processes_.end() || it->second.instance != process) {
        return false;
    }

    processes_.erase(it);
    LOG_DEBUG("ProcessRegistry: Unregistered '{}' (live processes: {})", pid, processes_.size());
    return true;
}

std::shared_ptr<Process> ProcessRegistry::find(const std::string &pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    return it != processes_.end() ? it->second.process.lock() : nullptr;
}

bool ProcessRegistry::hasProcess(const std::string &pid) const {
    return find(pid) != nullptr;
}

std::vector<std::string> ProcessRegistry::listProcesses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> pids;
    for (const auto &[pid, entry] : processes_) {
        if (!entry.process.expired()) {
            pids.push_back(pid);
        }
    }
    std::sort(pids.begin(), pids.end());
    return pids;
}

size_t ProcessRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

void ProcessRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.clear();
}

}  // namespace RPE
