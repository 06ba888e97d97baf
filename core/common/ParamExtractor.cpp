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

#include "common/ParamExtractor.h"

using namespace std;

namespace eventsift {

bool GetOptionalBoolParam(const Json::Value& config, const string& key, bool& param, string& errorMsg) {
    errorMsg.clear();
    const Json::Value* itr = config.find(key.c_str(), key.c_str() + key.length());
    if (itr) {
        if (!itr->isBool()) {
            errorMsg = "param " + key + " is not of type bool";
            return false;
        }
        param = itr->asBool();
    }
    return true;
}

bool GetOptionalStringParam(const Json::Value& config, const string& key, string& param, string& errorMsg) {
    errorMsg.clear();
    const Json::Value* itr = config.find(key.c_str(), key.c_str() + key.length());
    if (itr) {
        if (!itr->isString()) {
            errorMsg = "param " + key + " is not of type string";
            return false;
        }
        param = itr->asString();
    }
    return true;
}

bool GetMandatoryStringParam(const Json::Value& config, const string& key, string& param, string& errorMsg) {
    errorMsg.clear();
    if (!config.isMember(key)) {
        errorMsg = "mandatory string param " + key + " is missing";
        return false;
    }
    return GetOptionalStringParam(config, key, param, errorMsg);
}

bool GetOptionalListParam(const Json::Value& config, const string& key, vector<string>& param, string& errorMsg) {
    errorMsg.clear();
    const Json::Value* itr = config.find(key.c_str(), key.c_str() + key.length());
    if (!itr) {
        return true;
    }
    if (!itr->isArray()) {
        errorMsg = "param " + key + " is not of type list";
        return false;
    }
    vector<string> values;
    for (const auto& item : *itr) {
        if (!item.isString()) {
            errorMsg = "element in list param " + key + " is not of type string";
            return false;
        }
        values.emplace_back(item.asString());
    }
    param = std::move(values);
    return true;
}

bool IsValidList(const Json::Value& config, const string& key, string& errorMsg) {
    errorMsg.clear();
    const Json::Value* itr = config.find(key.c_str(), key.c_str() + key.length());
    if (!itr) {
        errorMsg = "param " + key + " is missing";
        return false;
    }
    if (!itr->isArray()) {
        errorMsg = "param " + key + " is not of type list";
        return false;
    }
    return true;
}

} // namespace eventsift
