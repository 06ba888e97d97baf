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

#include <map>
#include <string>
#include <vector>

#include "filter/KindEventFilter.h"
#include "filter/KindRule.h"
#include "unittest/Unittest.h"
#include "unittest/filter/FilterTestUtil.h"

using namespace std;

namespace eventsift {

class KindEventFilterUnittest : public testing::Test {
public:
    void SetUp() override {
        mEvents.clear();
        mEvents.push_back(MakeEvent("default", "web", "Deployment", "apps/v1"));
        mEvents.push_back(MakeEvent("default", "web-1", "Pod", "v1"));
        mEvents.push_back(MakeEvent("default", "web-abc", "ReplicaSet", "apps/v1"));
        mEvents.push_back(MakeEvent("default", "job-1", "Pod", "batch/v1"));
        mEvents.push_back(MakeEvent("default", "node-1", "Node", "v1"));
        mInput = ToPointers(mEvents);
    }

    void TestKindRuleFromGroupKind();
    void TestKindRuleRoundTrip();
    void TestKindMatchModeString();
    void TestExactInclusion();
    void TestMatchAll();
    void TestGroupWildcardExclusion();
    void TestKindWildcardInclusion();
    void TestKindWildcardExclusion();
    void TestExactExclusion();
    void TestLegacyDuplicatesExactAndWildcard();
    void TestLegacyWildcardExclusionKeepsExactInclusion();
    void TestExclusionFirstAppliesExclusionsBeforeInclusions();
    void TestExclusionFirstNegatedMatchAll();
    void TestUnparseableApiVersion();
    void TestEmptyRuleSet();
    void TestRuleFlagValueIgnored();
    void TestRuleWithoutKeyForm();

private:
    EventList run(const map<GroupKind, bool>& ruleSet, KindMatchMode mode) {
        KindEventFilter filter(ruleSet, mode);
        auto res = filter.Filter(mInput);
        EXPECT_TRUE(res.has_value());
        return res ? *res : EventList();
    }

    vector<KubeEvent> mEvents;
    EventList mInput;
};

void KindEventFilterUnittest::TestKindRuleFromGroupKind() {
    KindRule exact = KindRule::FromGroupKind(GroupKind("apps", "Deployment"));
    EVENTSIFT_TEST_FALSE(exact.mNegate);
    EVENTSIFT_TEST_FALSE(exact.mGroup.IsAny());
    EVENTSIFT_TEST_EQUAL("apps", exact.mGroup.Value());
    EVENTSIFT_TEST_EQUAL("Deployment", exact.mKind.Value());
    EVENTSIFT_TEST_EQUAL("include group=apps kind=Deployment", exact.ToString());

    KindRule negative = KindRule::FromGroupKind(GroupKind("", "-Pod"));
    EVENTSIFT_TEST_TRUE(negative.mNegate);
    EVENTSIFT_TEST_EQUAL("", negative.mGroup.Value());
    EVENTSIFT_TEST_EQUAL("Pod", negative.mKind.Value());
    EVENTSIFT_TEST_EQUAL("exclude group= kind=Pod", negative.ToString());

    KindRule anyGroup = KindRule::FromGroupKind(GroupKind("*", "-Pod"));
    EVENTSIFT_TEST_TRUE(anyGroup.mNegate);
    EVENTSIFT_TEST_TRUE(anyGroup.mGroup.IsAny());
    EVENTSIFT_TEST_EQUAL("Pod", anyGroup.mKind.Value());

    KindRule anyKind = KindRule::FromGroupKind(GroupKind("apps", "-*"));
    EVENTSIFT_TEST_TRUE(anyKind.mNegate);
    EVENTSIFT_TEST_TRUE(anyKind.mKind.IsAny());

    KindRule all = KindRule::FromGroupKind(GroupKind("*", "*"));
    EVENTSIFT_TEST_FALSE(all.mNegate);
    EVENTSIFT_TEST_TRUE(all.mGroup.IsAny());
    EVENTSIFT_TEST_TRUE(all.mKind.IsAny());
    EVENTSIFT_TEST_TRUE(all.Matches(GroupKind("anything", "Whatever")));
}

void KindEventFilterUnittest::TestKindRuleRoundTrip() {
    vector<GroupKind> keys = {GroupKind("apps", "Deployment"),
                              GroupKind("", "-Pod"),
                              GroupKind("*", "-Pod"),
                              GroupKind("apps", "-*"),
                              GroupKind("*", "*"),
                              GroupKind("*", "-*"),
                              GroupKind("", "-"),
                              GroupKind("x", "--Pod")};
    for (const auto& key : keys) {
        EVENTSIFT_TEST_EQUAL(key, KindRule::FromGroupKind(key).ToGroupKind()) << key.ToString();
    }
}

void KindEventFilterUnittest::TestKindMatchModeString() {
    KindMatchMode mode = KindMatchMode::kExclusionFirst;
    EVENTSIFT_TEST_TRUE(KindMatchModeFromString("legacy", mode));
    EVENTSIFT_TEST_TRUE(mode == KindMatchMode::kLegacy);
    EVENTSIFT_TEST_TRUE(KindMatchModeFromString("exclusion_first", mode));
    EVENTSIFT_TEST_TRUE(mode == KindMatchMode::kExclusionFirst);
    EVENTSIFT_TEST_FALSE(KindMatchModeFromString("strict", mode));
    EVENTSIFT_TEST_EQUAL(string("legacy"), KindMatchModeToString(KindMatchMode::kLegacy));
}

void KindEventFilterUnittest::TestExactInclusion() {
    map<GroupKind, bool> ruleSet = {{GroupKind("apps", "Deployment"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_EQUAL_FATAL(1U, res.size());
        EVENTSIFT_TEST_EQUAL(&mEvents[0], res[0]);
    }
}

void KindEventFilterUnittest::TestMatchAll() {
    map<GroupKind, bool> ruleSet = {{GroupKind("*", "*"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_TRUE(mInput == res);
    }
}

void KindEventFilterUnittest::TestGroupWildcardExclusion() {
    // 只有排除规则时不会包含任何其他事件
    map<GroupKind, bool> ruleSet = {{GroupKind("*", "-Pod"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EVENTSIFT_TEST_TRUE(run(ruleSet, mode).empty());
    }

    // 与全通配组合时，所有group下的Pod都被排除
    ruleSet[GroupKind("*", "*")] = true;
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_EQUAL_FATAL(3U, res.size());
        EVENTSIFT_TEST_EQUAL(&mEvents[0], res[0]);
        EVENTSIFT_TEST_EQUAL(&mEvents[2], res[1]);
        EVENTSIFT_TEST_EQUAL(&mEvents[4], res[2]);
    }
}

void KindEventFilterUnittest::TestKindWildcardInclusion() {
    map<GroupKind, bool> ruleSet = {{GroupKind("apps", "*"), true}, {GroupKind("*", "Node"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_EQUAL_FATAL(3U, res.size());
        EVENTSIFT_TEST_EQUAL(&mEvents[0], res[0]);
        EVENTSIFT_TEST_EQUAL(&mEvents[2], res[1]);
        EVENTSIFT_TEST_EQUAL(&mEvents[4], res[2]);
    }
}

void KindEventFilterUnittest::TestKindWildcardExclusion() {
    map<GroupKind, bool> ruleSet = {{GroupKind("apps", "-*"), true}, {GroupKind("*", "*"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_EQUAL_FATAL(3U, res.size());
        EVENTSIFT_TEST_EQUAL(&mEvents[1], res[0]);
        EVENTSIFT_TEST_EQUAL(&mEvents[3], res[1]);
        EVENTSIFT_TEST_EQUAL(&mEvents[4], res[2]);
    }
}

void KindEventFilterUnittest::TestExactExclusion() {
    // core group的Pod被排除，batch group的Pod不受影响
    map<GroupKind, bool> ruleSet = {{GroupKind("", "-Pod"), true}, {GroupKind("*", "*"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_EQUAL_FATAL(4U, res.size());
        EVENTSIFT_TEST_EQUAL(&mEvents[0], res[0]);
        EVENTSIFT_TEST_EQUAL(&mEvents[2], res[1]);
        EVENTSIFT_TEST_EQUAL(&mEvents[3], res[2]);
        EVENTSIFT_TEST_EQUAL(&mEvents[4], res[3]);
    }

    // 精确排除优先于精确包含
    map<GroupKind, bool> conflict = {{GroupKind("", "-Pod"), true}, {GroupKind("", "Pod"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EVENTSIFT_TEST_TRUE(run(conflict, mode).empty());
    }
}

void KindEventFilterUnittest::TestLegacyDuplicatesExactAndWildcard() {
    map<GroupKind, bool> ruleSet = {{GroupKind("apps", "Deployment"), true}, {GroupKind("*", "*"), true}};
    EventList res = run(ruleSet, KindMatchMode::kLegacy);
    EVENTSIFT_TEST_EQUAL_FATAL(6U, res.size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], res[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[0], res[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[1], res[2]);
    EVENTSIFT_TEST_EQUAL(&mEvents[2], res[3]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], res[4]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], res[5]);

    res = run(ruleSet, KindMatchMode::kExclusionFirst);
    EVENTSIFT_TEST_TRUE(mInput == res);
}

void KindEventFilterUnittest::TestLegacyWildcardExclusionKeepsExactInclusion() {
    map<GroupKind, bool> ruleSet = {{GroupKind("apps", "Deployment"), true}, {GroupKind("apps", "-*"), true}};
    EventList res = run(ruleSet, KindMatchMode::kLegacy);
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res.size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], res[0]);

    EVENTSIFT_TEST_TRUE(run(ruleSet, KindMatchMode::kExclusionFirst).empty());
}

void KindEventFilterUnittest::TestExclusionFirstAppliesExclusionsBeforeInclusions() {
    // 规则顺序不影响结果：排除总是优先
    vector<KindRule> rules = {KindRule::FromGroupKind(GroupKind("*", "*")),
                              KindRule::FromGroupKind(GroupKind("*", "Pod")),
                              KindRule::FromGroupKind(GroupKind("batch", "-Pod"))};
    KindEventFilter filter(rules);
    EVENTSIFT_TEST_TRUE(filter.GetMode() == KindMatchMode::kExclusionFirst);
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(4U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[1], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[2], (*res)[2]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[3]);
}

void KindEventFilterUnittest::TestExclusionFirstNegatedMatchAll() {
    map<GroupKind, bool> ruleSet = {{GroupKind("*", "-*"), true}, {GroupKind("*", "*"), true}};
    EVENTSIFT_TEST_TRUE(run(ruleSet, KindMatchMode::kExclusionFirst).empty());
    // "-*"与"*"组合在字符串键语义下对真实对象不产生排除
    EVENTSIFT_TEST_TRUE(mInput == run(ruleSet, KindMatchMode::kLegacy));
}

void KindEventFilterUnittest::TestUnparseableApiVersion() {
    vector<KubeEvent> events = {MakeEvent("default", "w", "Widget", "example.com/v1/extra")};
    EventList input = ToPointers(events);
    map<GroupKind, bool> ruleSet = {{GroupKind("example.com/v1/extra", "Widget"), true}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        KindEventFilter filter(ruleSet, mode);
        auto res = filter.Filter(input);
        EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
        EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
        EVENTSIFT_TEST_EQUAL(&events[0], (*res)[0]);
    }
}

void KindEventFilterUnittest::TestEmptyRuleSet() {
    map<GroupKind, bool> ruleSet;
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EVENTSIFT_TEST_TRUE(run(ruleSet, mode).empty());
    }
}

void KindEventFilterUnittest::TestRuleFlagValueIgnored() {
    map<GroupKind, bool> ruleSet = {{GroupKind("", "Node"), false}};
    for (auto mode : {KindMatchMode::kLegacy, KindMatchMode::kExclusionFirst}) {
        EventList res = run(ruleSet, mode);
        EVENTSIFT_TEST_EQUAL_FATAL(1U, res.size());
        EVENTSIFT_TEST_EQUAL(&mEvents[4], res[0]);
    }
}

void KindEventFilterUnittest::TestRuleWithoutKeyForm() {
    vector<KubeEvent> events = {MakeEvent("default", "w", "Widget", "*/v1"), MakeEvent("default", "p", "Pod", "v1")};
    EventList input = ToPointers(events);

    // 字面量"*"的group只匹配group恰为"*"的对象
    KindRule literal;
    literal.mGroup = KindPattern::Concrete("*");
    literal.mKind = KindPattern::Any();
    EVENTSIFT_TEST_FALSE(literal.HasKeyForm());
    EVENTSIFT_TEST_TRUE(KindRule::FromGroupKind(GroupKind("apps", "-*")).HasKeyForm());

    KindEventFilter exclusionFirst(vector<KindRule>{literal});
    EVENTSIFT_TEST_EQUAL_FATAL(1U, exclusionFirst.GetRules().size());
    EVENTSIFT_TEST_TRUE(exclusionFirst.GetRules()[0] == literal);
    auto res = exclusionFirst.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[0], (*res)[0]);

    // legacy模式按键("*", "*")解释，即全通配
    KindEventFilter legacy(vector<KindRule>{literal}, KindMatchMode::kLegacy);
    res = legacy.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(input == *res);

    // 以"-"开头的正向具体kind在legacy模式下被当作排除
    KindRule dashKind;
    dashKind.mGroup = KindPattern::Concrete("");
    dashKind.mKind = KindPattern::Concrete("-Pod");
    EVENTSIFT_TEST_FALSE(dashKind.HasKeyForm());
    EVENTSIFT_TEST_TRUE(KindRule::FromGroupKind(dashKind.ToGroupKind()).mNegate);
}

UNIT_TEST_CASE(KindEventFilterUnittest, TestKindRuleFromGroupKind)
UNIT_TEST_CASE(KindEventFilterUnittest, TestKindRuleRoundTrip)
UNIT_TEST_CASE(KindEventFilterUnittest, TestKindMatchModeString)
UNIT_TEST_CASE(KindEventFilterUnittest, TestExactInclusion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestMatchAll)
UNIT_TEST_CASE(KindEventFilterUnittest, TestGroupWildcardExclusion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestKindWildcardInclusion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestKindWildcardExclusion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestExactExclusion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestLegacyDuplicatesExactAndWildcard)
UNIT_TEST_CASE(KindEventFilterUnittest, TestLegacyWildcardExclusionKeepsExactInclusion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestExclusionFirstAppliesExclusionsBeforeInclusions)
UNIT_TEST_CASE(KindEventFilterUnittest, TestExclusionFirstNegatedMatchAll)
UNIT_TEST_CASE(KindEventFilterUnittest, TestUnparseableApiVersion)
UNIT_TEST_CASE(KindEventFilterUnittest, TestEmptyRuleSet)
UNIT_TEST_CASE(KindEventFilterUnittest, TestRuleFlagValueIgnored)
UNIT_TEST_CASE(KindEventFilterUnittest, TestRuleWithoutKeyForm)

} // namespace eventsift

UNIT_TEST_MAIN
