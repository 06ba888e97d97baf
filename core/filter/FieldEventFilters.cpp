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

#include "filter/FieldEventFilters.h"

using namespace std;

namespace eventsift {

const string WarningEventFilter::sName = "filter_warning";
const string NamespaceEventFilter::sName = "filter_namespace";
const string NameEventFilter::sName = "filter_name";
const string ReasonEventFilter::sName = "filter_reason";
const string UidEventFilter::sName = "filter_uid";
const string ComponentEventFilter::sName = "filter_component";

optional<EventList> WarningEventFilter::Filter(EventView events) const {
    EventList res;
    for (const KubeEvent* event : events) {
        if (event->mType != KubeEventType::Warning) {
            continue;
        }
        res.push_back(event);
    }
    return res;
}

AcceptorEventFilter::AcceptorEventFilter(shared_ptr<const StringAcceptor> acceptor) : mAcceptor(std::move(acceptor)) {
    if (!mAcceptor) {
        mAcceptor = make_shared<AcceptSet>();
    }
}

optional<EventList> AcceptorEventFilter::Filter(EventView events) const {
    EventList res;
    for (const KubeEvent* event : events) {
        if (mAcceptor->Accepts(FieldOf(*event))) {
            res.push_back(event);
        }
    }
    return res;
}

} // namespace eventsift
