// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "statemachine/TransitionTable.h"

namespace RPE {

TransitionTable &TransitionTable::allow(const std::string &from, const std::set<std::string> &targets) {
    auto &allowed = edges_[from];
    for (const auto &target : targets) {
        allowed.insert(target);
        edges_.try_emplace(target);
    }
    return *this;
}

TransitionTable &TransitionTable::terminal(const std::string &label) {
    edges_.try_emplace(label);
    return *this;
}

bool TransitionTable::isAllowed(const std::string &from, const std::string &to) const {
    auto it = edges_.find(from);
    if (it == edges_.end()) {
        return false;
    }
    return it->second.count(to) > 0;
}

bool TransitionTable::isTerminal(const std::string &label) const {
    auto it = edges_.find(label);
    return it != edges_.end() && it->second.empty();
}

bool TransitionTable::hasLabel(const std::string &label) const {
    return edges_.find(label) != edges_.end();
}

std::set<std::string> TransitionTable::allowedTargets(const std::string &from) const {
    auto it = edges_.find(from);
    return it != edges_.end() ? it->second : std::set<std::string>{};
}

std::vector<std::string> TransitionTable::labels() const {
    std::vector<std::string> result;
    result.reserve(edges_.size());
    for (const auto &[label, targets] : edges_) {
        result.push_back(label);
    }
    return result;
}

}  // namespace RPE
