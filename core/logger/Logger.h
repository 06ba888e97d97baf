/*
 * Copyright 2025 eventsift Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "spdlog/spdlog.h"

namespace eventsift {

// Collects ("key", value)("key", value) pairs into a single log line.
class LogKV {
public:
    template <typename T>
    LogKV& operator()(const char* key, const T& value) {
        if (!mFirst) {
            mStream << '\t';
        }
        mFirst = false;
        mStream << key << ':' << value;
        return *this;
    }

    std::string Str() const { return mStream.str(); }

private:
    std::ostringstream mStream;
    bool mFirst = true;
};

class Logger {
public:
    static const std::string kMainLoggerName;
    static const std::string kDiagnosticLoggerName;

    static Logger& Instance() {
        static Logger sInstance;
        return sInstance;
    }

    // Main logger, stderr with timestamp and level.
    std::shared_ptr<spdlog::logger> GetMainLogger();
    // Free text channel for user-facing diagnostics, no pattern decoration.
    std::shared_ptr<spdlog::logger> GetDiagnosticLogger();

    void SetLevel(spdlog::level::level_enum level);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> getOrCreate(const std::string& name, const std::string& pattern);

    std::mutex mMux;
};

extern std::shared_ptr<spdlog::logger> sLogger;

} // namespace eventsift

#define EVENTSIFT_LOG(logger, level, kv) \
    do { \
        if ((logger) && (logger)->should_log(level)) { \
            (logger)->log(level, "{}", (::eventsift::LogKV() kv).Str()); \
        } \
    } while (0)

#define LOG_DEBUG(logger, kv) EVENTSIFT_LOG(logger, spdlog::level::debug, kv)
#define LOG_INFO(logger, kv) EVENTSIFT_LOG(logger, spdlog::level::info, kv)
#define LOG_WARNING(logger, kv) EVENTSIFT_LOG(logger, spdlog::level::warn, kv)
#define LOG_ERROR(logger, kv) EVENTSIFT_LOG(logger, spdlog::level::err, kv)
