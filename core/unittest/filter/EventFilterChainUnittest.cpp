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

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "filter/AroundEventFilter.h"
#include "filter/EventFilterChain.h"
#include "filter/FieldEventFilters.h"
#include "filter/KindEventFilter.h"
#include "unittest/Unittest.h"
#include "unittest/filter/FilterTestUtil.h"

using namespace std;

namespace eventsift {

namespace {
// Counts invocations and passes everything through.
class CountingFilter : public EventFilter {
public:
    static const string sName;

    const string& Name() const override { return sName; }
    optional<EventList> Filter(EventView events) const override {
        ++mCalls;
        return events.ToVector();
    }

    int Calls() const { return mCalls.load(); }

private:
    mutable atomic_int mCalls{0};
};
const string CountingFilter::sName = "filter_counting";
} // namespace

class EventFilterChainUnittest : public testing::Test {
public:
    void SetUp() override {
        mEvents.clear();
        mEvents.push_back(MakeEvent("default", "web-1", "Pod", "v1", KubeEventType::Warning));
        mEvents.push_back(MakeEvent("kube-system", "dns", "Pod", "v1", KubeEventType::Warning));
        mEvents.push_back(MakeEvent("default", "web", "Deployment", "apps/v1", KubeEventType::Normal));
        mEvents.push_back(MakeEvent("default", "web", "Deployment", "apps/v1", KubeEventType::Warning));
        mEvents[0].mLastTimestamp = MakeTime(9, 50, 0);
        mEvents[1].mLastTimestamp = MakeTime(9, 59, 0);
        mEvents[2].mLastTimestamp = MakeTime(10, 0, 0);
        mEvents[3].mLastTimestamp = MakeTime(10, 1, 0);
        mInput = ToPointers(mEvents);
    }

    void TestEmptyChainReturnsCopy();
    void TestStagesAppliedInOrder();
    void TestAroundUsesFilteredSet();
    void TestAbsentStageAbortsChain();
    void TestStopsOnEmptySequence();
    void TestNullFilterIgnored();
    void TestFilterSharedAcrossChains();
    void TestNestedChain();

private:
    vector<KubeEvent> mEvents;
    EventList mInput;
};

void EventFilterChainUnittest::TestEmptyChainReturnsCopy() {
    EventFilterChain chain;
    EVENTSIFT_TEST_TRUE(chain.Empty());
    auto res = chain.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(mInput == *res);
    EVENTSIFT_TEST_NOT_EQUAL(mInput.data(), res->data());

    res = chain.Filter(EventView());
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(res->empty());
}

void EventFilterChainUnittest::TestStagesAppliedInOrder() {
    EventFilterChain chain;
    chain.Add(make_shared<WarningEventFilter>());
    chain.Add(make_shared<NamespaceEventFilter>(MakeAcceptSet({"default"})));
    chain.Add(make_shared<KindEventFilter>(map<GroupKind, bool>{{GroupKind("apps", "Deployment"), true}}));
    EVENTSIFT_TEST_EQUAL(3U, chain.Size());

    auto res = chain.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[0]);
}

void EventFilterChainUnittest::TestAroundUsesFilteredSet() {
    // namespace过滤后最后一个事件为10:01，锚点日期取自该事件
    CapturedLogger diagnostic("chain_around");
    EventFilterChain chain;
    chain.Add(make_shared<NamespaceEventFilter>(MakeAcceptSet({"default"})));
    chain.Add(make_shared<AroundEventFilter>("10:00", absl::Minutes(2), diagnostic.Get()));

    auto res = chain.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(2U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[2], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[1]);
    EVENTSIFT_TEST_TRUE(diagnostic.Output().empty());
}

void EventFilterChainUnittest::TestAbsentStageAbortsChain() {
    CapturedLogger diagnostic("chain_absent");
    auto counting = make_shared<CountingFilter>();
    EventFilterChain chain;
    chain.Add(make_shared<AroundEventFilter>("bad", absl::Minutes(2), diagnostic.Get()));
    chain.Add(counting);

    auto res = chain.Filter(mInput);
    EVENTSIFT_TEST_FALSE(res.has_value());
    EVENTSIFT_TEST_EQUAL(0, counting->Calls());
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("bad") != string::npos);
}

void EventFilterChainUnittest::TestStopsOnEmptySequence() {
    CapturedLogger diagnostic("chain_empty");
    auto counting = make_shared<CountingFilter>();
    EventFilterChain chain;
    chain.Add(make_shared<NamespaceEventFilter>(MakeAcceptSet({"missing"})));
    chain.Add(make_shared<AroundEventFilter>("10:00", absl::Minutes(2), diagnostic.Get()));
    chain.Add(counting);

    auto res = chain.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(res->empty());
    EVENTSIFT_TEST_EQUAL(0, counting->Calls());
    EVENTSIFT_TEST_TRUE(diagnostic.Output().empty());
}

void EventFilterChainUnittest::TestNullFilterIgnored() {
    EventFilterChain chain;
    chain.Add(nullptr);
    EVENTSIFT_TEST_TRUE(chain.Empty());
    auto res = chain.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(mInput == *res);
}

void EventFilterChainUnittest::TestFilterSharedAcrossChains() {
    auto warning = make_shared<WarningEventFilter>();
    auto counting = make_shared<CountingFilter>();
    EventFilterChain first({warning, counting});
    EventFilterChain second({counting, make_shared<NameEventFilter>(MakeAcceptSet({"dns"}))});

    auto res1 = first.Filter(mInput);
    auto res2 = second.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res1.has_value());
    EVENTSIFT_TEST_TRUE_FATAL(res2.has_value());
    EVENTSIFT_TEST_EQUAL(3U, res1->size());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res2->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[1], (*res2)[0]);
    EVENTSIFT_TEST_EQUAL(2, counting->Calls());
    // 输入未被修改
    EVENTSIFT_TEST_EQUAL(4U, mInput.size());
}

void EventFilterChainUnittest::TestNestedChain() {
    auto inner = make_shared<EventFilterChain>();
    inner->Add(make_shared<WarningEventFilter>());
    EventFilterChain outer;
    outer.Add(inner);
    outer.Add(make_shared<ReasonEventFilter>(MakeAcceptSet({})));

    auto res = outer.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[1], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[2]);
}

UNIT_TEST_CASE(EventFilterChainUnittest, TestEmptyChainReturnsCopy)
UNIT_TEST_CASE(EventFilterChainUnittest, TestStagesAppliedInOrder)
UNIT_TEST_CASE(EventFilterChainUnittest, TestAroundUsesFilteredSet)
UNIT_TEST_CASE(EventFilterChainUnittest, TestAbsentStageAbortsChain)
UNIT_TEST_CASE(EventFilterChainUnittest, TestStopsOnEmptySequence)
UNIT_TEST_CASE(EventFilterChainUnittest, TestNullFilterIgnored)
UNIT_TEST_CASE(EventFilterChainUnittest, TestFilterSharedAcrossChains)
UNIT_TEST_CASE(EventFilterChainUnittest, TestNestedChain)

} // namespace eventsift

UNIT_TEST_MAIN
