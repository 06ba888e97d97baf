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

#include "json/json.h"

#include "filter/AroundEventFilter.h"
#include "filter/EventFilterChainBuilder.h"
#include "filter/FieldEventFilters.h"
#include "unittest/Unittest.h"
#include "unittest/filter/FilterTestUtil.h"

using namespace std;

namespace eventsift {

class EventFilterChainBuilderUnittest : public testing::Test {
public:
    void TestParseEmptyConfig();
    void TestParseFullConfig();
    void TestParseInvalidConfig();
    void TestBuildStageOrder();
    void TestBuildSkipsEmptyLists();
    void TestBuildFromJsonAndFilter();
    void TestGetConfigDescription();

private:
    static bool parse(const string& content, Json::Value& config) {
        Json::CharReaderBuilder builder;
        unique_ptr<Json::CharReader> reader(builder.newCharReader());
        string errs;
        return reader->parse(content.data(), content.data() + content.size(), &config, &errs);
    }

    static vector<string> stageNames(const EventFilterChain& chain) {
        vector<string> names;
        for (const auto& filter : chain.GetFilters()) {
            names.push_back(filter->Name());
        }
        return names;
    }
};

void EventFilterChainBuilderUnittest::TestParseEmptyConfig() {
    Json::Value config(Json::objectValue);
    EventFilterChainBuilder::FilterConfig filterConfig;
    string errorMsg;
    EVENTSIFT_TEST_TRUE(EventFilterChainBuilder::ParseFromJson(config, filterConfig, errorMsg));
    EVENTSIFT_TEST_FALSE(filterConfig.mWarningsOnly);
    EVENTSIFT_TEST_TRUE(filterConfig.mNamespaces.empty());
    EVENTSIFT_TEST_TRUE(filterConfig.mKinds.empty());
    EVENTSIFT_TEST_TRUE(filterConfig.mKindMatchMode == KindMatchMode::kExclusionFirst);
    EVENTSIFT_TEST_TRUE(filterConfig.mAround.empty());
    EVENTSIFT_TEST_TRUE(filterConfig.mAroundDuration == absl::Minutes(15));
}

void EventFilterChainBuilderUnittest::TestParseFullConfig() {
    Json::Value config;
    EVENTSIFT_TEST_TRUE_FATAL(parse(R"JSON(
        {
            "WarningsOnly": true,
            "Namespaces": ["default", "kube-system"],
            "Names": ["web"],
            "UIDs": ["uid-1"],
            "Reasons": ["BackOff"],
            "Components": ["kubelet"],
            "Kinds": [
                {"Group": "apps", "Kind": "Deployment"},
                {"Group": "*", "Kind": "-Pod"},
                {"Kind": "Node"}
            ],
            "KindMatchMode": "legacy",
            "Around": "10:00",
            "AroundDuration": "1m30s"
        }
    )JSON",
                                    config));

    EventFilterChainBuilder::FilterConfig filterConfig;
    string errorMsg;
    EVENTSIFT_TEST_TRUE_FATAL(EventFilterChainBuilder::ParseFromJson(config, filterConfig, errorMsg));
    EVENTSIFT_TEST_TRUE(filterConfig.mWarningsOnly);
    EVENTSIFT_TEST_EQUAL(2U, filterConfig.mNamespaces.size());
    EVENTSIFT_TEST_EQUAL("web", filterConfig.mNames[0]);
    EVENTSIFT_TEST_EQUAL("uid-1", filterConfig.mUids[0]);
    EVENTSIFT_TEST_EQUAL("BackOff", filterConfig.mReasons[0]);
    EVENTSIFT_TEST_EQUAL("kubelet", filterConfig.mComponents[0]);
    EVENTSIFT_TEST_EQUAL(3U, filterConfig.mKinds.size());
    EVENTSIFT_TEST_EQUAL(1U, filterConfig.mKinds.count(GroupKind("apps", "Deployment")));
    EVENTSIFT_TEST_EQUAL(1U, filterConfig.mKinds.count(GroupKind("*", "-Pod")));
    EVENTSIFT_TEST_EQUAL(1U, filterConfig.mKinds.count(GroupKind("", "Node")));
    EVENTSIFT_TEST_TRUE(filterConfig.mKindMatchMode == KindMatchMode::kLegacy);
    EVENTSIFT_TEST_EQUAL("10:00", filterConfig.mAround);
    EVENTSIFT_TEST_TRUE(filterConfig.mAroundDuration == absl::Seconds(90));
}

void EventFilterChainBuilderUnittest::TestParseInvalidConfig() {
    vector<string> invalidConfigs = {
        R"([1, 2])",
        R"({"WarningsOnly": "yes"})",
        R"({"Namespaces": "default"})",
        R"({"Names": [1]})",
        R"({"Kinds": {"Kind": "Pod"}})",
        R"({"Kinds": ["Pod"]})",
        R"({"Kinds": [{"Group": "apps"}]})",
        R"({"Kinds": [{"Kind": ""}]})",
        R"({"KindMatchMode": "strict"})",
        R"({"Around": 10})",
        R"({"AroundDuration": "two minutes"})",
        R"({"AroundDuration": "-2m"})",
    };
    for (const auto& content : invalidConfigs) {
        Json::Value config;
        EVENTSIFT_TEST_TRUE_FATAL(parse(content, config)) << content;
        EventFilterChainBuilder::FilterConfig filterConfig;
        string errorMsg;
        EVENTSIFT_TEST_FALSE(EventFilterChainBuilder::ParseFromJson(config, filterConfig, errorMsg)) << content;
        EVENTSIFT_TEST_FALSE(errorMsg.empty()) << content;
    }
}

void EventFilterChainBuilderUnittest::TestBuildStageOrder() {
    EventFilterChainBuilder::FilterConfig filterConfig;
    filterConfig.mWarningsOnly = true;
    filterConfig.mNamespaces = {"default"};
    filterConfig.mNames = {"web"};
    filterConfig.mUids = {"uid"};
    filterConfig.mReasons = {"BackOff"};
    filterConfig.mComponents = {"kubelet"};
    filterConfig.mKinds[GroupKind("*", "*")] = true;
    filterConfig.mAround = "10:00";

    EventFilterChain chain;
    EventFilterChainBuilder::Build(filterConfig, chain);
    vector<string> expected = {WarningEventFilter::sName,
                               NamespaceEventFilter::sName,
                               NameEventFilter::sName,
                               UidEventFilter::sName,
                               ReasonEventFilter::sName,
                               ComponentEventFilter::sName,
                               KindEventFilter::sName,
                               AroundEventFilter::sName};
    EVENTSIFT_TEST_TRUE(expected == stageNames(chain));

    auto kind = dynamic_pointer_cast<const KindEventFilter>(chain.GetFilters()[6]);
    EVENTSIFT_TEST_TRUE_FATAL(kind != nullptr);
    EVENTSIFT_TEST_TRUE(kind->GetMode() == KindMatchMode::kExclusionFirst);
    EVENTSIFT_TEST_EQUAL_FATAL(1U, kind->GetRules().size());
    EVENTSIFT_TEST_TRUE(kind->GetRules()[0].mGroup.IsAny());
    EVENTSIFT_TEST_TRUE(kind->GetRules()[0].mKind.IsAny());

    auto around = dynamic_pointer_cast<const AroundEventFilter>(chain.GetFilters()[7]);
    EVENTSIFT_TEST_TRUE_FATAL(around != nullptr);
    EVENTSIFT_TEST_EQUAL("10:00", around->GetAround());
    EVENTSIFT_TEST_TRUE(around->GetDuration() == absl::Minutes(15));
}

void EventFilterChainBuilderUnittest::TestBuildSkipsEmptyLists() {
    EventFilterChainBuilder::FilterConfig filterConfig;
    filterConfig.mReasons = {"BackOff"};

    EventFilterChain chain;
    EventFilterChainBuilder::Build(filterConfig, chain);
    vector<string> expected = {ReasonEventFilter::sName};
    EVENTSIFT_TEST_TRUE(expected == stageNames(chain));
}

void EventFilterChainBuilderUnittest::TestBuildFromJsonAndFilter() {
    vector<KubeEvent> events;
    events.push_back(MakeEvent("default", "web", "Deployment", "apps/v1", KubeEventType::Warning));
    events.push_back(MakeEvent("default", "web-1", "Pod", "v1", KubeEventType::Warning));
    events.push_back(MakeEvent("default", "web-abc", "ReplicaSet", "apps/v1", KubeEventType::Normal));
    events.push_back(MakeEvent("other", "api", "Deployment", "apps/v1", KubeEventType::Warning));
    events.push_back(MakeEvent("default", "web", "Deployment", "apps/v1", KubeEventType::Warning));
    events[0].mLastTimestamp = MakeTime(9, 0, 0);
    events[1].mLastTimestamp = MakeTime(10, 0, 0);
    events[2].mLastTimestamp = MakeTime(10, 0, 0);
    events[3].mLastTimestamp = MakeTime(10, 0, 0);
    events[4].mLastTimestamp = MakeTime(10, 4, 0);
    EventList input = ToPointers(events);

    Json::Value config;
    EVENTSIFT_TEST_TRUE_FATAL(parse(R"JSON(
        {
            "WarningsOnly": true,
            "Namespaces": ["default"],
            "Kinds": [{"Group": "apps", "Kind": "*"}],
            "Around": "10:00",
            "AroundDuration": "5m"
        }
    )JSON",
                                    config));

    CapturedLogger diagnostic("builder_filter");
    EventFilterChain chain;
    string errorMsg;
    EVENTSIFT_TEST_TRUE_FATAL(EventFilterChainBuilder::BuildFromJson(config, chain, errorMsg, diagnostic.Get()));
    auto res = chain.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[4], (*res)[0]);

    // 非法around通过注入的诊断通道输出
    config["Around"] = "bad";
    EventFilterChain badChain;
    EVENTSIFT_TEST_TRUE_FATAL(EventFilterChainBuilder::BuildFromJson(config, badChain, errorMsg, diagnostic.Get()));
    EVENTSIFT_TEST_FALSE(badChain.Filter(input).has_value());
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("\"bad\"") != string::npos);
}

void EventFilterChainBuilderUnittest::TestGetConfigDescription() {
    EventFilterChainBuilder::FilterConfig filterConfig;
    EVENTSIFT_TEST_EQUAL("warnings_only=false", EventFilterChainBuilder::GetConfigDescription(filterConfig));

    filterConfig.mNamespaces = {"a", "b"};
    filterConfig.mKinds[GroupKind("apps", "Deployment")] = true;
    filterConfig.mAround = "10:00";
    filterConfig.mAroundDuration = absl::Minutes(2);
    string description = EventFilterChainBuilder::GetConfigDescription(filterConfig);
    EVENTSIFT_TEST_TRUE(description.find("namespaces=[a,b]") != string::npos);
    EVENTSIFT_TEST_TRUE(description.find("kinds=[Deployment.apps]") != string::npos);
    EVENTSIFT_TEST_TRUE(description.find("kind_match_mode=exclusion_first") != string::npos);
    EVENTSIFT_TEST_TRUE(description.find("around=10:00") != string::npos);
    EVENTSIFT_TEST_TRUE(description.find("around_duration=2m") != string::npos);
}

UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestParseEmptyConfig)
UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestParseFullConfig)
UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestParseInvalidConfig)
UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestBuildStageOrder)
UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestBuildSkipsEmptyLists)
UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestBuildFromJsonAndFilter)
UNIT_TEST_CASE(EventFilterChainBuilderUnittest, TestGetConfigDescription)

} // namespace eventsift

UNIT_TEST_MAIN
