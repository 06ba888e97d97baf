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
#include <tuple>
#include <utility>

#include "models/KubeEvent.h"

namespace eventsift {

struct GroupVersion {
    std::string mGroup;
    std::string mVersion;
};

// Plain value pair. "*" and a leading "-" carry no meaning here.
struct GroupKind {
    std::string mGroup;
    std::string mKind;

    GroupKind() = default;
    GroupKind(std::string group, std::string kind) : mGroup(std::move(group)), mKind(std::move(kind)) {}

    bool operator==(const GroupKind& rhs) const { return mGroup == rhs.mGroup && mKind == rhs.mKind; }
    bool operator!=(const GroupKind& rhs) const { return !(*this == rhs); }
    bool operator<(const GroupKind& rhs) const {
        return std::tie(mGroup, mKind) < std::tie(rhs.mGroup, rhs.mKind);
    }

    // "Kind.group", or "Kind" for the core group
    std::string ToString() const;
};

/**
 * @brief 解析apiVersion为group与version
 *
 * "" 或 "/" 得到空的group/version；不含"/"时整体为version(core group)；
 * 恰好一个"/"时拆分；多于一个"/"视为非法。
 *
 * @return 解析成功返回true，失败返回false并设置errorMsg
 */
bool ParseGroupVersion(const std::string& apiVersion, GroupVersion& gv, std::string& errorMsg);

// Group and kind of the object an event refers to. An apiVersion that cannot be parsed is taken
// as the group verbatim.
GroupKind ResolveGroupKind(const ObjectReference& ref);

} // namespace eventsift
