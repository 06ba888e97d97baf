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

#include <string>

#include "models/GroupKind.h"
#include "unittest/Unittest.h"

using namespace std;

namespace eventsift {

class GroupKindUnittest : public testing::Test {
public:
    void TestParseCoreGroup();
    void TestParseNamedGroup();
    void TestParseEmpty();
    void TestParseTooManySlashes();
    void TestResolveGroupKind();
    void TestResolveFallsBackToRawApiVersion();
    void TestEqualityIsLiteral();
    void TestToString();
};

void GroupKindUnittest::TestParseCoreGroup() {
    GroupVersion gv;
    string errorMsg;
    EVENTSIFT_TEST_TRUE(ParseGroupVersion("v1", gv, errorMsg));
    EVENTSIFT_TEST_EQUAL("", gv.mGroup);
    EVENTSIFT_TEST_EQUAL("v1", gv.mVersion);
}

void GroupKindUnittest::TestParseNamedGroup() {
    GroupVersion gv;
    string errorMsg;
    EVENTSIFT_TEST_TRUE(ParseGroupVersion("apps/v1", gv, errorMsg));
    EVENTSIFT_TEST_EQUAL("apps", gv.mGroup);
    EVENTSIFT_TEST_EQUAL("v1", gv.mVersion);

    EVENTSIFT_TEST_TRUE(ParseGroupVersion("batch/", gv, errorMsg));
    EVENTSIFT_TEST_EQUAL("batch", gv.mGroup);
    EVENTSIFT_TEST_EQUAL("", gv.mVersion);
}

void GroupKindUnittest::TestParseEmpty() {
    GroupVersion gv;
    string errorMsg;
    EVENTSIFT_TEST_TRUE(ParseGroupVersion("", gv, errorMsg));
    EVENTSIFT_TEST_TRUE(gv.mGroup.empty());
    EVENTSIFT_TEST_TRUE(gv.mVersion.empty());

    EVENTSIFT_TEST_TRUE(ParseGroupVersion("/", gv, errorMsg));
    EVENTSIFT_TEST_TRUE(gv.mGroup.empty());
    EVENTSIFT_TEST_TRUE(gv.mVersion.empty());
}

void GroupKindUnittest::TestParseTooManySlashes() {
    GroupVersion gv;
    string errorMsg;
    EVENTSIFT_TEST_FALSE(ParseGroupVersion("a/b/c", gv, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("a/b/c") != string::npos);
}

void GroupKindUnittest::TestResolveGroupKind() {
    ObjectReference ref;
    ref.mKind = "Deployment";
    ref.mApiVersion = "apps/v1";
    EVENTSIFT_TEST_EQUAL(GroupKind("apps", "Deployment"), ResolveGroupKind(ref));

    ref.mKind = "Pod";
    ref.mApiVersion = "v1";
    EVENTSIFT_TEST_EQUAL(GroupKind("", "Pod"), ResolveGroupKind(ref));
}

void GroupKindUnittest::TestResolveFallsBackToRawApiVersion() {
    ObjectReference ref;
    ref.mKind = "Widget";
    ref.mApiVersion = "example.com/v1/extra";
    GroupKind gk = ResolveGroupKind(ref);
    EVENTSIFT_TEST_EQUAL("example.com/v1/extra", gk.mGroup);
    EVENTSIFT_TEST_EQUAL("Widget", gk.mKind);
}

void GroupKindUnittest::TestEqualityIsLiteral() {
    EVENTSIFT_TEST_TRUE(GroupKind("*", "-Pod") == GroupKind("*", "-Pod"));
    EVENTSIFT_TEST_TRUE(GroupKind("*", "Pod") != GroupKind("", "Pod"));
    EVENTSIFT_TEST_TRUE(GroupKind("", "-Pod") != GroupKind("", "Pod"));
    EVENTSIFT_TEST_TRUE(GroupKind("a", "Z") < GroupKind("b", "A"));
}

void GroupKindUnittest::TestToString() {
    EVENTSIFT_TEST_EQUAL("Pod", GroupKind("", "Pod").ToString());
    EVENTSIFT_TEST_EQUAL("Deployment.apps", GroupKind("apps", "Deployment").ToString());
}

UNIT_TEST_CASE(GroupKindUnittest, TestParseCoreGroup)
UNIT_TEST_CASE(GroupKindUnittest, TestParseNamedGroup)
UNIT_TEST_CASE(GroupKindUnittest, TestParseEmpty)
UNIT_TEST_CASE(GroupKindUnittest, TestParseTooManySlashes)
UNIT_TEST_CASE(GroupKindUnittest, TestResolveGroupKind)
UNIT_TEST_CASE(GroupKindUnittest, TestResolveFallsBackToRawApiVersion)
UNIT_TEST_CASE(GroupKindUnittest, TestEqualityIsLiteral)
UNIT_TEST_CASE(GroupKindUnittest, TestToString)

} // namespace eventsift

UNIT_TEST_MAIN
