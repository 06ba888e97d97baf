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
#include <sstream>
#include <string>
#include <vector>

#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"

#include "models/KubeEvent.h"

namespace eventsift {

inline KubeEvent MakeEvent(const std::string& ns,
                           const std::string& name,
                           const std::string& kind = "Pod",
                           const std::string& apiVersion = "v1",
                           KubeEventType type = KubeEventType::Normal) {
    KubeEvent event;
    event.mType = type;
    event.mInvolvedObject.mNamespace = ns;
    event.mInvolvedObject.mName = name;
    event.mInvolvedObject.mUid = "uid-" + ns + "-" + name;
    event.mInvolvedObject.mKind = kind;
    event.mInvolvedObject.mApiVersion = apiVersion;
    event.mLastTimestamp.mTime = absl::UnixEpoch();
    return event;
}

inline EventTime MakeTime(int hh, int mm, int ss, const absl::TimeZone& zone = absl::UTCTimeZone()) {
    EventTime t;
    t.mZone = zone;
    t.mTime = absl::FromCivil(absl::CivilSecond(2024, 3, 15, hh, mm, ss), zone);
    return t;
}

inline EventList ToPointers(const std::vector<KubeEvent>& events) {
    EventList res;
    for (const auto& event : events) {
        res.push_back(&event);
    }
    return res;
}

// spdlog logger writing into a string stream, for asserting on diagnostic output
class CapturedLogger {
public:
    explicit CapturedLogger(const std::string& name)
        : mLogger(std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::ostream_sink_mt>(mStream))) {
        mLogger->set_pattern("%v");
    }

    std::shared_ptr<spdlog::logger> Get() const { return mLogger; }
    std::string Output() const { return mStream.str(); }

private:
    std::ostringstream mStream;
    std::shared_ptr<spdlog::logger> mLogger;
};

} // namespace eventsift
