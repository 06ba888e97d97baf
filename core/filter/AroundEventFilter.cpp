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

#include "filter/AroundEventFilter.h"

#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/time/civil_time.h"

#include "logger/Logger.h"

using namespace std;

namespace eventsift {

const string AroundEventFilter::sName = "filter_around";

AroundEventFilter::AroundEventFilter(string around, absl::Duration duration, shared_ptr<spdlog::logger> diagnostic)
    : mAround(std::move(around)), mDuration(duration), mDiagnostic(std::move(diagnostic)) {
    if (!mDiagnostic) {
        mDiagnostic = Logger::Instance().GetDiagnosticLogger();
    }
}

bool AroundEventFilter::ParseTimeOfDay(const string& around, TimeOfDay& tod, string& errorMsg) {
    vector<string> parts = absl::StrSplit(around, ':');
    if (parts.size() < 2 || parts.size() > 3) {
        errorMsg = absl::StrCat("must be HH:MM or HH:MM:SS, got ", parts.size(), " part(s)");
        return false;
    }

    static const char* kPartNames[] = {"hours", "minutes", "seconds"};
    int values[3] = {0, 0, 0};
    for (size_t i = 0; i < parts.size(); ++i) {
        // SimpleAtoi tolerates surrounding whitespace, a component must be digits only
        if (absl::StripAsciiWhitespace(parts[i]) != parts[i] || !absl::SimpleAtoi(parts[i], &values[i])) {
            errorMsg = absl::StrCat(kPartNames[i], " component \"", parts[i], "\" is not an integer");
            return false;
        }
    }
    tod.mHours = values[0];
    tod.mMinutes = values[1];
    tod.mSeconds = values[2];
    return true;
}

absl::Time AroundEventFilter::anchorFor(const EventTime& reference, const TimeOfDay& tod) const {
    // ToUnixSeconds floors, so the remainder is in [0, 1s) for any instant
    absl::Duration subsecond = reference.mTime - absl::FromUnixSeconds(absl::ToUnixSeconds(reference.mTime));
    absl::CivilDay day = absl::ToCivilDay(reference.mTime, reference.mZone);
    // CivilSecond normalizes out of range fields, 25:00 lands on the next day
    absl::CivilSecond anchor(day.year(), day.month(), day.day(), tod.mHours, tod.mMinutes, tod.mSeconds);
    return absl::FromCivil(anchor, reference.mZone) + subsecond;
}

optional<EventList> AroundEventFilter::Filter(EventView events) const {
    if (events.empty()) {
        mDiagnostic->error(absl::StrCat("cannot apply around time \"", mAround, "\": no events to take the date from"));
        return nullopt;
    }

    TimeOfDay tod;
    string errorMsg;
    if (!ParseTimeOfDay(mAround, tod, errorMsg)) {
        mDiagnostic->error(absl::StrCat("invalid around time \"", mAround, "\": ", errorMsg));
        return nullopt;
    }

    const EventTime& reference = events.back()->mLastTimestamp;
    absl::Time anchor = anchorFor(reference, tod);
    absl::Time lower = anchor - mDuration;
    absl::Time upper = anchor + mDuration;
    LOG_DEBUG(sLogger,
              ("around anchor", absl::FormatTime(absl::RFC3339_full, anchor, reference.mZone))(
                  "reference", reference.ToString())("duration", absl::FormatDuration(mDuration))(
                  "events", events.size()));

    EventList res;
    for (const KubeEvent* event : events) {
        const absl::Time& t = event->mLastTimestamp.mTime;
        if (t > upper || t < lower) {
            continue;
        }
        res.push_back(event);
    }
    return res;
}

} // namespace eventsift
