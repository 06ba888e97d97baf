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

#include "filter/KindRule.h"

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

using namespace std;

namespace eventsift {

const string kKindWildcard = "*";
const string kKindNegationPrefix = "-";

KindPattern KindPattern::FromString(const string& value) {
    if (value == kKindWildcard) {
        return Any();
    }
    return Concrete(value);
}

KindRule KindRule::FromGroupKind(const GroupKind& key) {
    KindRule rule;
    rule.mGroup = KindPattern::FromString(key.mGroup);
    if (absl::StartsWith(key.mKind, kKindNegationPrefix)) {
        rule.mNegate = true;
        rule.mKind = KindPattern::FromString(key.mKind.substr(kKindNegationPrefix.size()));
    } else {
        rule.mKind = KindPattern::FromString(key.mKind);
    }
    return rule;
}

GroupKind KindRule::ToGroupKind() const {
    string kind = mKind.ToString();
    if (mNegate) {
        kind = kKindNegationPrefix + kind;
    }
    return GroupKind(mGroup.ToString(), kind);
}

string KindRule::ToString() const {
    return absl::StrCat(mNegate ? "exclude " : "include ", "group=", mGroup.ToString(), " kind=", mKind.ToString());
}

vector<KindRule> KindRulesFromRuleSet(const map<GroupKind, bool>& ruleSet) {
    vector<KindRule> rules;
    rules.reserve(ruleSet.size());
    for (const auto& item : ruleSet) {
        rules.emplace_back(KindRule::FromGroupKind(item.first));
    }
    return rules;
}

} // namespace eventsift
