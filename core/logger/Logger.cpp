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

#include "logger/Logger.h"

#include "spdlog/sinks/stdout_sinks.h"

namespace eventsift {

const std::string Logger::kMainLoggerName = "/eventsift";
const std::string Logger::kDiagnosticLoggerName = "/eventsift/diagnostic";

std::shared_ptr<spdlog::logger> sLogger = Logger::Instance().GetMainLogger();

std::shared_ptr<spdlog::logger> Logger::GetMainLogger() {
    return getOrCreate(kMainLoggerName, "[%Y-%m-%d %H:%M:%S.%f]\t[%l]\t[%n]\t%v");
}

std::shared_ptr<spdlog::logger> Logger::GetDiagnosticLogger() {
    return getOrCreate(kDiagnosticLoggerName, "%v");
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    GetMainLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::getOrCreate(const std::string& name, const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mMux);
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    logger = spdlog::stderr_logger_mt(name);
    logger->set_pattern(pattern);
    return logger;
}

} // namespace eventsift
