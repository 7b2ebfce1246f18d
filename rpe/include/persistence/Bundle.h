// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <string>

namespace RPE {

/**
 * @brief Portable snapshot of a process, sufficient to reconstruct it
 *
 * Document layout:
 * @code
 * {
 *   "version": 1,
 *   "type_id": "workflow.counter",
 *   "pid": "proc_1730000000000_3_a4f2",
 *   "label": "WAITING",
 *   "inputs": {...},
 *   "outputs": {...},
 *   "continuation": {"next": "run", ...},
 *   "paused": false,
 *   "paused_message": "",
 *   "state": {"message": "Waiting on: child"},
 *   "creation_time": 1730000000000
 * }
 * @endcode
 */
class Bundle {
public:
    Bundle() = default;

    /**
     * @brief Validate and wrap a bundle document
     * @throws ReconstructionError if a mandatory key is missing or mistyped
     */
    static Bundle fromJson(const json &document);

    const json &toJson() const {
        return document_;
    }

    int version() const;
    std::string typeId() const;
    std::string pid() const;
    std::string label() const;
    json inputs() const;
    json outputs() const;
    json continuation() const;
    bool paused() const;
    std::string pausedMessage() const;
    json state() const;
    int64_t creationTime() const;

    bool operator==(const Bundle &other) const {
        return document_ == other.document_;
    }

private:
    friend class Persister;

    explicit Bundle(json document) : document_(std::move(document)) {}

    json document_ = json::object();
};

}  // namespace RPE
