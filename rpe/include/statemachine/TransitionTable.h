// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace RPE {

/**
 * @brief Source label -> allowed target labels
 *
 * A known label with no outgoing edge is terminal.
 */
class TransitionTable {
public:
    TransitionTable() = default;

    /**
     * @brief Declare the allowed targets of a label (accumulates over calls)
     *
     * Targets are declared as known labels too, so a target that never
     * appears as a source is terminal.
     */
    TransitionTable &allow(const std::string &from, const std::set<std::string> &targets);

    /**
     * @brief Declare a label without outgoing edges
     */
    TransitionTable &terminal(const std::string &label);

    bool isAllowed(const std::string &from, const std::string &to) const;

    bool isTerminal(const std::string &label) const;

    bool hasLabel(const std::string &label) const;

    std::set<std::string> allowedTargets(const std::string &from) const;

    std::vector<std::string> labels() const;

private:
    std::map<std::string, std::set<std::string>> edges_;
};

}  // namespace RPE
