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
#include <string>
#include <vector>

#include "models/GroupKind.h"

namespace eventsift {

extern const std::string kKindWildcard;
extern const std::string kKindNegationPrefix;

// Either a concrete value or the "*" wildcard.
class KindPattern {
public:
    static KindPattern Any() { return KindPattern(true, std::string()); }
    // Matched literally in exclusion-first mode. A value of "*" has no key form of its own, see
    // KindRule::HasKeyForm.
    static KindPattern Concrete(std::string value) { return KindPattern(false, std::move(value)); }
    // "*" becomes Any, everything else is taken literally
    static KindPattern FromString(const std::string& value);

    bool IsAny() const { return mAny; }
    const std::string& Value() const { return mValue; }

    bool Matches(const std::string& actual) const { return mAny || mValue == actual; }
    std::string ToString() const { return mAny ? kKindWildcard : mValue; }

    bool operator==(const KindPattern& rhs) const { return mAny == rhs.mAny && mValue == rhs.mValue; }

private:
    KindPattern(bool any, std::string value) : mAny(any), mValue(std::move(value)) {}

    bool mAny;
    std::string mValue;
};

/**
 * @brief 单条kind/group匹配规则
 *
 * 配置侧的GroupKind键以字符串形式编码语义：kind以"-"开头表示排除，"*"表示通配。
 * FromGroupKind将其转换为显式的带标记规则，ToGroupKind可无损还原。
 */
struct KindRule {
    KindPattern mGroup = KindPattern::Any();
    KindPattern mKind = KindPattern::Any();
    bool mNegate = false;

    static KindRule FromGroupKind(const GroupKind& key);
    GroupKind ToGroupKind() const;

    bool Matches(const GroupKind& actual) const { return mGroup.Matches(actual.mGroup) && mKind.Matches(actual.mKind); }
    std::string ToString() const;

    // False for rules built directly with Concrete("*") or a positive kind starting with "-":
    // their key reads as a wildcard or an exclusion, so legacy mode sees a different rule.
    bool HasKeyForm() const { return FromGroupKind(ToGroupKind()) == *this; }

    bool operator==(const KindRule& rhs) const {
        return mGroup == rhs.mGroup && mKind == rhs.mKind && mNegate == rhs.mNegate;
    }
};

// Only presence in the map is significant, the mapped flag is ignored. Rules come out in key order.
std::vector<KindRule> KindRulesFromRuleSet(const std::map<GroupKind, bool>& ruleSet);

} // namespace eventsift
