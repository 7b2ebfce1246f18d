// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <source_location>
#include <string>

namespace RPE {

/**
 * @brief Severity of an engine log line
 *
 * Ordered so that a backend can filter with a single comparison.
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Sink for engine log lines
 *
 * A host embedding the engine installs its own backend to collect process
 * lifecycle lines next to its other logs. SpdlogBackend is installed when
 * none is set.
 *
 * @code
 * class JournalBackend : public RPE::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         if (level >= minLevel_) {
 *             journal_.append(level, message, loc.file_name(), loc.line());
 *         }
 *     }
 *     void setLevel(LogLevel level) override { minLevel_ = level; }
 *     void flush() override { journal_.sync(); }
 * };
 *
 * RPE::Logger::setBackend(std::make_unique<JournalBackend>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Emit one formatted line
     *
     * @param level Severity
     * @param message Text already prefixed with the calling function
     * @param loc Call site
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Lines below this level are dropped
     */
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 * @param name Level name, case-insensitive
 * @param fallback Level returned for unknown names
 */
LogLevel parseLogLevel(const std::string &name, LogLevel fallback = LogLevel::Info);

}  // namespace RPE
