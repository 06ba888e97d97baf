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

#include "filter/KindEventFilter.h"

#include "absl/strings/str_join.h"

#include "logger/Logger.h"

using namespace std;

namespace eventsift {

const string KindEventFilter::sName = "filter_kind";

const char* KindMatchModeToString(KindMatchMode mode) {
    switch (mode) {
        case KindMatchMode::kLegacy:
            return "legacy";
        case KindMatchMode::kExclusionFirst:
            return "exclusion_first";
    }
    return "unknown";
}

bool KindMatchModeFromString(const string& str, KindMatchMode& mode) {
    if (str == "legacy") {
        mode = KindMatchMode::kLegacy;
        return true;
    }
    if (str == "exclusion_first") {
        mode = KindMatchMode::kExclusionFirst;
        return true;
    }
    return false;
}

KindEventFilter::KindEventFilter(vector<KindRule> rules, KindMatchMode mode) : mRules(std::move(rules)), mMode(mode) {
    for (const auto& rule : mRules) {
        if (mMode == KindMatchMode::kLegacy && !rule.HasKeyForm()) {
            LOG_WARNING(sLogger,
                        ("kind rule has no key form, legacy mode evaluates it as", rule.ToGroupKind().ToString())(
                            "rule", rule.ToString()));
        }
        mKeys.insert(rule.ToGroupKind());
    }
    LOG_DEBUG(sLogger,
              ("kind filter created", KindMatchModeToString(mMode))(
                  "rules", absl::StrJoin(mRules, "; ", [](string* out, const KindRule& rule) {
                      out->append(rule.ToString());
                  })));
}

KindEventFilter::KindEventFilter(const map<GroupKind, bool>& ruleSet, KindMatchMode mode)
    : KindEventFilter(KindRulesFromRuleSet(ruleSet), mode) {
}

optional<EventList> KindEventFilter::Filter(EventView events) const {
    EventList res;
    for (const KubeEvent* event : events) {
        GroupKind actual = ResolveGroupKind(event->mInvolvedObject);
        if (mMode == KindMatchMode::kLegacy) {
            legacyMatch(event, actual, res);
        } else if (exclusionFirstMatch(actual)) {
            res.push_back(event);
        }
    }
    return res;
}

void KindEventFilter::legacyMatch(const KubeEvent* event, const GroupKind& actual, EventList& res) const {
    GroupKind antiMatch(actual.mGroup, kKindNegationPrefix + actual.mKind);

    if (mKeys.count(antiMatch) > 0) {
        return;
    }
    if (mKeys.count(actual) > 0) {
        res.push_back(event);
    }

    // an exact inclusion above is kept even if a wildcard exclusion matches
    for (const auto& key : mKeys) {
        if (key.mGroup == kKindWildcard && key.mKind == antiMatch.mKind) {
            return;
        }
        if (key.mKind == kKindNegationPrefix + kKindWildcard && key.mGroup == actual.mGroup) {
            return;
        }
    }

    for (const auto& key : mKeys) {
        if ((key.mGroup == kKindWildcard && key.mKind == kKindWildcard)
            || (key.mGroup == kKindWildcard && key.mKind == actual.mKind)
            || (key.mKind == kKindWildcard && key.mGroup == actual.mGroup)) {
            res.push_back(event);
            return;
        }
    }
}

bool KindEventFilter::exclusionFirstMatch(const GroupKind& actual) const {
    bool included = false;
    for (const auto& rule : mRules) {
        if (!rule.Matches(actual)) {
            continue;
        }
        if (rule.mNegate) {
            return false;
        }
        included = true;
    }
    return included;
}

} // namespace eventsift
