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

#include "filter/EventFilterChain.h"

#include "logger/Logger.h"

using namespace std;

namespace eventsift {

const string EventFilterChain::sName = "filter_chain";

EventFilterChain::EventFilterChain(vector<shared_ptr<const EventFilter>> filters) {
    for (auto& filter : filters) {
        Add(std::move(filter));
    }
}

void EventFilterChain::Add(shared_ptr<const EventFilter> filter) {
    if (!filter) {
        LOG_WARNING(sLogger, ("ignore null filter", "")("position", mFilters.size()));
        return;
    }
    mFilters.emplace_back(std::move(filter));
}

optional<EventList> EventFilterChain::Filter(EventView events) const {
    EventList current = events.ToVector();
    for (size_t i = 0; i < mFilters.size(); ++i) {
        if (current.empty()) {
            LOG_DEBUG(sLogger, ("no events left, skip remaining filters", mFilters.size() - i));
            break;
        }
        const auto& filter = mFilters[i];
        optional<EventList> res = filter->Filter(EventView(current));
        if (!res) {
            LOG_WARNING(sLogger, ("filter could not run, abort chain", filter->Name())("position", i));
            return nullopt;
        }
        LOG_DEBUG(sLogger, ("filter applied", filter->Name())("in", current.size())("out", res->size()));
        current = std::move(*res);
    }
    return current;
}

} // namespace eventsift
