// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <shared_mutex>

namespace RPE {

// Static member initialization
std::unique_ptr<ILoggerBackend> Logger::backend_;

// Writers (setBackend/initialize) take the lock exclusively, log calls share it
static std::shared_mutex backend_mutex;

LogLevel parseLogLevel(const std::string &name, LogLevel fallback) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) { return std::tolower(c); });

    if (level == "trace") {
        return LogLevel::Trace;
    } else if (level == "debug") {
        return LogLevel::Debug;
    } else if (level == "info") {
        return LogLevel::Info;
    } else if (level == "warn" || level == "warning") {
        return LogLevel::Warn;
    } else if (level == "err" || level == "error") {
        return LogLevel::Error;
    } else if (level == "critical") {
        return LogLevel::Critical;
    } else if (level == "off") {
        return LogLevel::Off;
    }
    return fallback;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::unique_lock<std::shared_mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::unique_lock<std::shared_mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::unique_lock<std::shared_mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    initialize();
    std::shared_lock<std::shared_mutex> lock(backend_mutex);
    if (backend_) {
        backend_->setLevel(level);
    }
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    std::shared_lock<std::shared_mutex> lock(backend_mutex);
    if (backend_) {
        backend_->flush();
    }
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    {
        std::shared_lock<std::shared_mutex> lock(backend_mutex);
        if (backend_) {
            backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
            return;
        }
    }
    initialize();
    std::shared_lock<std::shared_mutex> lock(backend_mutex);
    if (backend_) {
        backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "UnknownFunction";
    }

    // Work backwards from the opening parenthesis
    size_t name_end = paren_pos;
    while (name_end > 0 && (std::isspace(static_cast<unsigned char>(full_name[name_end - 1])) ||
                            full_name[name_end - 1] == ')')) {
        name_end--;
    }

    // Last space outside template parameters marks the start of the qualified name
    size_t name_start = 0;
    size_t space_pos = std::string::npos;
    int angle_bracket_count = 0;
    int paren_count = 0;
    for (size_t i = 0; i < name_end; i++) {
        char c = full_name[i];
        if (c == '<') {
            angle_bracket_count++;
        } else if (c == '>') {
            angle_bracket_count--;
        } else if (c == '(') {
            paren_count++;
        } else if (c == ')') {
            paren_count--;
        } else if (c == ' ' && angle_bracket_count == 0 && paren_count == 0) {
            space_pos = i;
        }
    }

    if (space_pos != std::string::npos) {
        name_start = space_pos + 1;
    }

    std::string qualified_name = full_name.substr(name_start, name_end - name_start);
    while (!qualified_name.empty() && (std::isspace(static_cast<unsigned char>(qualified_name[0])) ||
                                       qualified_name[0] == '*' || qualified_name[0] == '&')) {
        qualified_name = qualified_name.substr(1);
    }

    // Strip template arguments
    std::string result;
    int angle_count = 0;
    for (char c : qualified_name) {
        if (c == '<') {
            angle_count++;
        } else if (c == '>') {
            angle_count--;
        } else if (angle_count == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace RPE
