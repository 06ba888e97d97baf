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
#include <string>

#include "absl/time/time.h"
#include "spdlog/spdlog.h"

#include "filter/EventFilter.h"

namespace eventsift {

struct TimeOfDay {
    int mHours = 0;
    int mMinutes = 0;
    int mSeconds = 0;
};

/**
 * @brief 时间窗口过滤器
 *
 * 以输入中最后一个事件的日期（及其纳秒部分、时区）加上around指定的时刻作为锚点，
 * 保留lastTimestamp落在[锚点-duration, 锚点+duration]闭区间内的事件。
 *
 * around格式非法时向诊断通道输出一行说明，并返回std::nullopt。
 * 输入为空时同样视为无法执行，调用方（EventFilterChain）负责在空输入时不调用本过滤器。
 */
class AroundEventFilter : public EventFilter {
public:
    static const std::string sName;

    // diagnostic为空时使用Logger::GetDiagnosticLogger()（stderr）
    AroundEventFilter(std::string around,
                      absl::Duration duration,
                      std::shared_ptr<spdlog::logger> diagnostic = nullptr);

    const std::string& Name() const override { return sName; }
    std::optional<EventList> Filter(EventView events) const override;

    const std::string& GetAround() const { return mAround; }
    absl::Duration GetDuration() const { return mDuration; }

    // Accepts "HH:MM" and "HH:MM:SS" with digit-only components. Values are not range checked.
    static bool ParseTimeOfDay(const std::string& around, TimeOfDay& tod, std::string& errorMsg);

private:
    absl::Time anchorFor(const EventTime& reference, const TimeOfDay& tod) const;

    std::string mAround;
    absl::Duration mDuration;
    std::shared_ptr<spdlog::logger> mDiagnostic;
};

} // namespace eventsift
