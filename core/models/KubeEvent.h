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

#include <string>
#include <vector>

#include "absl/time/time.h"

#include "models/ArrayView.h"

namespace eventsift {

enum class KubeEventType {
    Normal,
    Warning,
};

// Reference to the object an event is about.
struct ObjectReference {
    std::string mNamespace;
    std::string mName;
    std::string mUid;
    std::string mKind;
    // "group/version", or just "version" for the core group
    std::string mApiVersion;
};

struct EventTime {
    absl::Time mTime;
    absl::TimeZone mZone = absl::UTCTimeZone();

    std::string ToString() const;
};

/**
 * @brief Cluster event as handed over by the retrieval layer.
 *
 * Filters only ever read events and select them by address, an event is never copied or
 * modified on its way through a chain.
 */
struct KubeEvent {
    KubeEventType mType = KubeEventType::Normal;
    ObjectReference mInvolvedObject;
    std::string mReason;
    std::string mReportingComponent;
    EventTime mLastTimestamp;
};

using EventList = std::vector<const KubeEvent*>;
using EventView = ArrayView<const KubeEvent*>;

} // namespace eventsift
