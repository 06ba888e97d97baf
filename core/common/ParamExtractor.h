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

#include <string>
#include <vector>

#include "json/json.h"

namespace eventsift {

// All Get*Param helpers leave param untouched and return true when the key is absent.
// On a type mismatch they return false and fill errorMsg.

bool GetOptionalBoolParam(const Json::Value& config, const std::string& key, bool& param, std::string& errorMsg);

bool GetOptionalStringParam(const Json::Value& config,
                            const std::string& key,
                            std::string& param,
                            std::string& errorMsg);

bool GetMandatoryStringParam(const Json::Value& config,
                             const std::string& key,
                             std::string& param,
                             std::string& errorMsg);

bool GetOptionalListParam(const Json::Value& config,
                          const std::string& key,
                          std::vector<std::string>& param,
                          std::string& errorMsg);

bool IsValidList(const Json::Value& config, const std::string& key, std::string& errorMsg);

} // namespace eventsift
