// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "comms/ControlMessage.h"
#include "common/Exceptions.h"
#include <chrono>
#include <functional>
#include <future>
#include <string>

namespace RPE {

/**
 * @brief Pending result of a control RPC
 *
 * get() waits at most the RPC timeout and decodes the response:
 * - no response in time: ControlTimeoutError
 * - explicit error acknowledgement: ControlError
 * - transport failures (BrokerError, UnroutableError) are rethrown as is
 */
template <typename T> class ControlFuture {
public:
    using Converter = std::function<T(const json &result)>;

    ControlFuture(std::future<json> response, std::string correlationId, std::string description,
                  std::chrono::milliseconds timeout, Converter convert)
        : response_(std::move(response)), correlationId_(std::move(correlationId)),
          description_(std::move(description)), timeout_(timeout), convert_(std::move(convert)) {}

    ControlFuture(ControlFuture &&) = default;
    ControlFuture &operator=(ControlFuture &&) = default;

    /**
     * @brief Future already failed with error (e.g. broker unreachable at send time)
     */
    static ControlFuture failed(std::exception_ptr error, std::string description) {
        std::promise<json> promise;
        promise.set_exception(error);
        return ControlFuture(promise.get_future(), "", std::move(description), std::chrono::milliseconds(0), nullptr);
    }

    bool isReady() const {
        return response_.valid() && response_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
    }

    std::future_status waitFor(std::chrono::milliseconds timeout) const {
        return response_.wait_for(timeout);
    }

    const std::string &correlationId() const {
        return correlationId_;
    }

    T get() {
        if (!response_.valid()) {
            throw ControlError(description_ + ": result already retrieved");
        }
        if (response_.wait_for(timeout_) != std::future_status::ready) {
            throw ControlTimeoutError(description_ + ": no response within " + std::to_string(timeout_.count()) +
                                      " ms");
        }

        json document;
        try {
            document = response_.get();
        } catch (const std::future_error &) {
            throw ControlError(description_ + ": responder went away without answering");
        }

        ControlResponse response = ControlResponse::fromJson(document);
        if (response.correlationId != correlationId_) {
            throw MalformedMessageError(description_ + ": response correlation id '" + response.correlationId +
                                        "' does not match request '" + correlationId_ + "'");
        }
        if (!response.ok) {
            throw ControlError(description_ + " failed: " + response.errorDetail);
        }
        return convert_(response.result);
    }

private:
    std::future<json> response_;
    std::string correlationId_;
    std::string description_;
    std::chrono::milliseconds timeout_;
    Converter convert_;
};

}  // namespace RPE
