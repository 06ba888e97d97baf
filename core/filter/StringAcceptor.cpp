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

#include "filter/StringAcceptor.h"

namespace eventsift {

AcceptSet::AcceptSet(const std::vector<std::string>& values) : mValues(values.begin(), values.end()) {
}

bool AcceptSet::Accepts(const std::string& candidate) const {
    if (mValues.empty()) {
        return true;
    }
    return mValues.find(candidate) != mValues.end();
}

std::shared_ptr<const StringAcceptor> MakeAcceptSet(const std::vector<std::string>& values) {
    return std::make_shared<AcceptSet>(values);
}

} // namespace eventsift
