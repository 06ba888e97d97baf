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
#include <vector>

#include "json/json.h"

#include "common/ParamExtractor.h"
#include "unittest/Unittest.h"

using namespace std;

namespace eventsift {

class ParamExtractorUnittest : public testing::Test {
public:
    void TestGetOptionalBoolParam();
    void TestGetOptionalStringParam();
    void TestGetMandatoryStringParam();
    void TestGetOptionalListParam();
    void TestIsValidList();
};

void ParamExtractorUnittest::TestGetOptionalBoolParam() {
    Json::Value config;
    string errorMsg;
    bool param = false;

    config["flag"] = true;
    EVENTSIFT_TEST_TRUE(GetOptionalBoolParam(config, "flag", param, errorMsg));
    EVENTSIFT_TEST_TRUE(param);

    param = true;
    EVENTSIFT_TEST_TRUE(GetOptionalBoolParam(config, "missing", param, errorMsg));
    EVENTSIFT_TEST_TRUE(param);
    EVENTSIFT_TEST_TRUE(errorMsg.empty());

    config["flag"] = "true";
    EVENTSIFT_TEST_FALSE(GetOptionalBoolParam(config, "flag", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("param flag is not of type bool", errorMsg);
}

void ParamExtractorUnittest::TestGetOptionalStringParam() {
    Json::Value config;
    string errorMsg;
    string param = "default";

    EVENTSIFT_TEST_TRUE(GetOptionalStringParam(config, "key", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("default", param);

    config["key"] = "value";
    EVENTSIFT_TEST_TRUE(GetOptionalStringParam(config, "key", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("value", param);

    config["key"] = 1;
    EVENTSIFT_TEST_FALSE(GetOptionalStringParam(config, "key", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("param key is not of type string", errorMsg);
    EVENTSIFT_TEST_EQUAL("value", param);
}

void ParamExtractorUnittest::TestGetMandatoryStringParam() {
    Json::Value config;
    string errorMsg;
    string param;

    EVENTSIFT_TEST_FALSE(GetMandatoryStringParam(config, "Kind", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("mandatory string param Kind is missing", errorMsg);

    config["Kind"] = "Pod";
    EVENTSIFT_TEST_TRUE(GetMandatoryStringParam(config, "Kind", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("Pod", param);

    config["Kind"] = Json::Value(Json::arrayValue);
    EVENTSIFT_TEST_FALSE(GetMandatoryStringParam(config, "Kind", param, errorMsg));
}

void ParamExtractorUnittest::TestGetOptionalListParam() {
    Json::Value config;
    string errorMsg;
    vector<string> param = {"keep"};

    EVENTSIFT_TEST_TRUE(GetOptionalListParam(config, "list", param, errorMsg));
    EVENTSIFT_TEST_EQUAL(1U, param.size());

    config["list"].append("a");
    config["list"].append("b");
    EVENTSIFT_TEST_TRUE(GetOptionalListParam(config, "list", param, errorMsg));
    EVENTSIFT_TEST_EQUAL_FATAL(2U, param.size());
    EVENTSIFT_TEST_EQUAL("a", param[0]);
    EVENTSIFT_TEST_EQUAL("b", param[1]);

    // 元素类型错误时不修改param
    config["list"].append(3);
    EVENTSIFT_TEST_FALSE(GetOptionalListParam(config, "list", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("element in list param list is not of type string", errorMsg);
    EVENTSIFT_TEST_EQUAL(2U, param.size());

    config["list"] = "a";
    EVENTSIFT_TEST_FALSE(GetOptionalListParam(config, "list", param, errorMsg));
    EVENTSIFT_TEST_EQUAL("param list is not of type list", errorMsg);
}

void ParamExtractorUnittest::TestIsValidList() {
    Json::Value config;
    string errorMsg;
    EVENTSIFT_TEST_FALSE(IsValidList(config, "Kinds", errorMsg));
    EVENTSIFT_TEST_FALSE(errorMsg.empty());

    config["Kinds"] = Json::Value(Json::arrayValue);
    EVENTSIFT_TEST_TRUE(IsValidList(config, "Kinds", errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.empty());

    config["Kinds"] = Json::Value(Json::objectValue);
    EVENTSIFT_TEST_FALSE(IsValidList(config, "Kinds", errorMsg));
}

UNIT_TEST_CASE(ParamExtractorUnittest, TestGetOptionalBoolParam)
UNIT_TEST_CASE(ParamExtractorUnittest, TestGetOptionalStringParam)
UNIT_TEST_CASE(ParamExtractorUnittest, TestGetMandatoryStringParam)
UNIT_TEST_CASE(ParamExtractorUnittest, TestGetOptionalListParam)
UNIT_TEST_CASE(ParamExtractorUnittest, TestIsValidList)

} // namespace eventsift

UNIT_TEST_MAIN
