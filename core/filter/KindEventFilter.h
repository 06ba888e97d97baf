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

#include <map>
#include <set>
#include <string>
#include <vector>

#include "filter/EventFilter.h"
#include "filter/KindRule.h"

namespace eventsift {

enum class KindMatchMode {
    // Exact and wildcard passes of the first matcher generation, including the double append of an event
    // hit by both an exact and a wildcard inclusion, and a wildcard exclusion not retracting an
    // exact inclusion. Rules are evaluated through their GroupKind keys, see KindRule::HasKeyForm.
    kLegacy,
    // Any matching exclusion drops the event, otherwise any matching inclusion keeps it once.
    kExclusionFirst,
};

const char* KindMatchModeToString(KindMatchMode mode);
bool KindMatchModeFromString(const std::string& str, KindMatchMode& mode);

/**
 * @brief 按涉及对象的(group, kind)过滤事件
 *
 * 规则支持精确匹配、group通配("*", Kind)、kind通配(group, "*")、全通配以及以"-"表示的排除。
 * 规则集为空时不保留任何事件。
 */
class KindEventFilter : public EventFilter {
public:
    static const std::string sName;

    explicit KindEventFilter(std::vector<KindRule> rules, KindMatchMode mode = KindMatchMode::kExclusionFirst);
    explicit KindEventFilter(const std::map<GroupKind, bool>& ruleSet,
                             KindMatchMode mode = KindMatchMode::kExclusionFirst);

    const std::string& Name() const override { return sName; }
    std::optional<EventList> Filter(EventView events) const override;

    KindMatchMode GetMode() const { return mMode; }
    const std::vector<KindRule>& GetRules() const { return mRules; }

private:
    void legacyMatch(const KubeEvent* event, const GroupKind& actual, EventList& res) const;
    bool exclusionFirstMatch(const GroupKind& actual) const;

    std::vector<KindRule> mRules;
    // rules rendered back to their string keys, the legacy pass works on these
    std::set<GroupKind> mKeys;
    KindMatchMode mMode;
};

} // namespace eventsift
