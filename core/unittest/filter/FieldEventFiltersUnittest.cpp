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

#include <memory>
#include <string>
#include <vector>

#include "filter/FieldEventFilters.h"
#include "filter/StringAcceptor.h"
#include "unittest/Unittest.h"
#include "unittest/filter/FilterTestUtil.h"

using namespace std;

namespace eventsift {

class FieldEventFiltersUnittest : public testing::Test {
public:
    void SetUp() override {
        mEvents.clear();
        mEvents.push_back(MakeEvent("default", "web-1", "Pod", "v1", KubeEventType::Warning));
        mEvents.push_back(MakeEvent("kube-system", "dns", "Pod", "v1", KubeEventType::Normal));
        mEvents.push_back(MakeEvent("default", "web", "Deployment", "apps/v1", KubeEventType::Normal));
        mEvents.push_back(MakeEvent("monitoring", "prom-0", "Pod", "v1", KubeEventType::Warning));
        mEvents.push_back(MakeEvent("default", "web-1", "Pod", "v1", KubeEventType::Warning));
        mEvents[0].mReason = "BackOff";
        mEvents[1].mReason = "Scheduled";
        mEvents[2].mReason = "ScalingReplicaSet";
        mEvents[3].mReason = "FailedMount";
        mEvents[4].mReason = "BackOff";
        mEvents[0].mReportingComponent = "kubelet";
        mEvents[1].mReportingComponent = "default-scheduler";
        mEvents[2].mReportingComponent = "deployment-controller";
        mEvents[3].mReportingComponent = "kubelet";
        mEvents[4].mReportingComponent = "kubelet";
        mInput = ToPointers(mEvents);
    }

    void TestAcceptSet();
    void TestWarningFilter();
    void TestNamespaceFilter();
    void TestNameFilter();
    void TestReasonFilter();
    void TestUidFilter();
    void TestComponentFilter();
    void TestEmptySetKeepsInput();
    void TestRepeatedEventKeepsMultiplicity();
    void TestNullAcceptorKeepsInput();
    void TestEmptyInput();
    void TestCustomAcceptor();

private:
    vector<KubeEvent> mEvents;
    EventList mInput;
};

void FieldEventFiltersUnittest::TestAcceptSet() {
    AcceptSet empty;
    EVENTSIFT_TEST_TRUE(empty.AcceptsAll());
    EVENTSIFT_TEST_TRUE(empty.Accepts(""));
    EVENTSIFT_TEST_TRUE(empty.Accepts("anything"));

    AcceptSet set(vector<string>{"a", "b", "a"});
    EVENTSIFT_TEST_FALSE(set.AcceptsAll());
    EVENTSIFT_TEST_EQUAL(2U, set.Size());
    EVENTSIFT_TEST_TRUE(set.Accepts("a"));
    EVENTSIFT_TEST_TRUE(set.Accepts("b"));
    EVENTSIFT_TEST_FALSE(set.Accepts("c"));
    EVENTSIFT_TEST_FALSE(set.Accepts(""));
}

void FieldEventFiltersUnittest::TestWarningFilter() {
    WarningEventFilter filter;
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[2]);
    for (const auto* event : *res) {
        EVENTSIFT_TEST_TRUE(event->mType == KubeEventType::Warning);
    }
}

void FieldEventFiltersUnittest::TestNamespaceFilter() {
    NamespaceEventFilter filter(MakeAcceptSet({"default"}));
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[2], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[2]);

    NamespaceEventFilter multi(MakeAcceptSet({"monitoring", "kube-system"}));
    res = multi.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(2U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[1], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[1]);
}

void FieldEventFiltersUnittest::TestNameFilter() {
    NameEventFilter filter(MakeAcceptSet({"web-1"}));
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(2U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[1]);

    // 名称需完全一致
    NameEventFilter prefix(MakeAcceptSet({"web"}));
    res = prefix.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[2], (*res)[0]);
}

void FieldEventFiltersUnittest::TestReasonFilter() {
    ReasonEventFilter filter(MakeAcceptSet({"BackOff", "FailedMount"}));
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[2]);
}

void FieldEventFiltersUnittest::TestUidFilter() {
    UidEventFilter filter(MakeAcceptSet({"uid-kube-system-dns"}));
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[1], (*res)[0]);

    UidEventFilter none(MakeAcceptSet({"uid-missing"}));
    res = none.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(res->empty());
}

void FieldEventFiltersUnittest::TestComponentFilter() {
    ComponentEventFilter filter(MakeAcceptSet({"kubelet"}));
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[2]);
}

void FieldEventFiltersUnittest::TestEmptySetKeepsInput() {
    // 同一事件出现多次时，结果中保留相同次数
    EventList input = mInput;
    input.push_back(&mEvents[1]);
    input.push_back(&mEvents[1]);

    auto acceptAll = MakeAcceptSet({});
    vector<unique_ptr<EventFilter>> filters;
    filters.emplace_back(make_unique<NamespaceEventFilter>(acceptAll));
    filters.emplace_back(make_unique<NameEventFilter>(acceptAll));
    filters.emplace_back(make_unique<ReasonEventFilter>(acceptAll));
    filters.emplace_back(make_unique<UidEventFilter>(acceptAll));
    filters.emplace_back(make_unique<ComponentEventFilter>(acceptAll));
    for (const auto& filter : filters) {
        auto res = filter->Filter(input);
        EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
        EVENTSIFT_TEST_TRUE(input == *res) << filter->Name();
    }
}

void FieldEventFiltersUnittest::TestRepeatedEventKeepsMultiplicity() {
    EventList input = {&mEvents[1], &mEvents[0], &mEvents[1], &mEvents[3], &mEvents[1]};

    NamespaceEventFilter ns(MakeAcceptSet({"kube-system"}));
    auto res = ns.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    for (const auto* event : *res) {
        EVENTSIFT_TEST_EQUAL(&mEvents[1], event);
    }

    WarningEventFilter warning;
    res = warning.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(2U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[3], (*res)[1]);
}

void FieldEventFiltersUnittest::TestNullAcceptorKeepsInput() {
    ReasonEventFilter filter(nullptr);
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(mInput == *res);
}

void FieldEventFiltersUnittest::TestEmptyInput() {
    WarningEventFilter warning;
    auto res = warning.Filter(EventView());
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(res->empty());

    NamespaceEventFilter ns(MakeAcceptSet({"default"}));
    res = ns.Filter(EventView());
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_TRUE(res->empty());
}

namespace {
class PrefixAcceptor : public StringAcceptor {
public:
    explicit PrefixAcceptor(string prefix) : mPrefix(std::move(prefix)) {}
    bool Accepts(const string& candidate) const override { return candidate.compare(0, mPrefix.size(), mPrefix) == 0; }

private:
    string mPrefix;
};
} // namespace

void FieldEventFiltersUnittest::TestCustomAcceptor() {
    NameEventFilter filter(make_shared<PrefixAcceptor>("web"));
    auto res = filter.Filter(mInput);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&mEvents[0], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&mEvents[2], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&mEvents[4], (*res)[2]);
}

UNIT_TEST_CASE(FieldEventFiltersUnittest, TestAcceptSet)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestWarningFilter)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestNamespaceFilter)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestNameFilter)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestReasonFilter)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestUidFilter)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestComponentFilter)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestEmptySetKeepsInput)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestRepeatedEventKeepsMultiplicity)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestNullAcceptorKeepsInput)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestEmptyInput)
UNIT_TEST_CASE(FieldEventFiltersUnittest, TestCustomAcceptor)

} // namespace eventsift

UNIT_TEST_MAIN
