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

#include "models/GroupKind.h"

#include <algorithm>

#include "absl/strings/str_cat.h"

#include "logger/Logger.h"

using namespace std;

namespace eventsift {

string GroupKind::ToString() const {
    if (mGroup.empty()) {
        return mKind;
    }
    return absl::StrCat(mKind, ".", mGroup);
}

bool ParseGroupVersion(const string& apiVersion, GroupVersion& gv, string& errorMsg) {
    gv = GroupVersion();
    if (apiVersion.empty() || apiVersion == "/") {
        return true;
    }
    switch (count(apiVersion.begin(), apiVersion.end(), '/')) {
        case 0:
            gv.mVersion = apiVersion;
            return true;
        case 1: {
            size_t pos = apiVersion.find('/');
            gv.mGroup = apiVersion.substr(0, pos);
            gv.mVersion = apiVersion.substr(pos + 1);
            return true;
        }
        default:
            errorMsg = "unexpected GroupVersion string: " + apiVersion;
            return false;
    }
}

GroupKind ResolveGroupKind(const ObjectReference& ref) {
    GroupVersion gv;
    string errorMsg;
    if (!ParseGroupVersion(ref.mApiVersion, gv, errorMsg)) {
        LOG_DEBUG(sLogger, ("use raw apiVersion as group", errorMsg)("kind", ref.mKind)("name", ref.mName));
        return GroupKind(ref.mApiVersion, ref.mKind);
    }
    return GroupKind(gv.mGroup, ref.mKind);
}

} // namespace eventsift
