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

#include "filter/EventFilterChainBuilder.h"

#include <sstream>

#include "absl/strings/str_join.h"

#include "common/ParamExtractor.h"
#include "filter/AroundEventFilter.h"
#include "filter/FieldEventFilters.h"
#include "filter/StringAcceptor.h"
#include "logger/Logger.h"

using namespace std;

namespace eventsift {

bool EventFilterChainBuilder::ParseFromJson(const Json::Value& config, FilterConfig& filterConfig, string& errorMsg) {
    if (!config.isObject()) {
        errorMsg = "filter config is not of type object";
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }

    FilterConfig parsed;
    bool ok = GetOptionalBoolParam(config, "WarningsOnly", parsed.mWarningsOnly, errorMsg)
        && GetOptionalListParam(config, "Namespaces", parsed.mNamespaces, errorMsg)
        && GetOptionalListParam(config, "Names", parsed.mNames, errorMsg)
        && GetOptionalListParam(config, "UIDs", parsed.mUids, errorMsg)
        && GetOptionalListParam(config, "Reasons", parsed.mReasons, errorMsg)
        && GetOptionalListParam(config, "Components", parsed.mComponents, errorMsg);
    if (!ok) {
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }

    if (config.isMember("Kinds") && !parseKinds(config, parsed.mKinds, errorMsg)) {
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }

    string mode;
    if (!GetOptionalStringParam(config, "KindMatchMode", mode, errorMsg)) {
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }
    if (!mode.empty() && !KindMatchModeFromString(mode, parsed.mKindMatchMode)) {
        errorMsg = "param KindMatchMode is not valid: " + mode;
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }

    if (!GetOptionalStringParam(config, "Around", parsed.mAround, errorMsg)) {
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }

    string duration;
    if (!GetOptionalStringParam(config, "AroundDuration", duration, errorMsg)) {
        LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
        return false;
    }
    if (!duration.empty()) {
        if (!absl::ParseDuration(duration, &parsed.mAroundDuration)) {
            errorMsg = "param AroundDuration is not a valid duration: " + duration;
            LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
            return false;
        }
        if (parsed.mAroundDuration < absl::ZeroDuration()) {
            errorMsg = "param AroundDuration must not be negative: " + duration;
            LOG_ERROR(sLogger, ("invalid filter config", errorMsg));
            return false;
        }
    }

    filterConfig = std::move(parsed);
    return true;
}

bool EventFilterChainBuilder::parseKinds(const Json::Value& config, map<GroupKind, bool>& kinds, string& errorMsg) {
    if (!IsValidList(config, "Kinds", errorMsg)) {
        return false;
    }
    for (const auto& item : config["Kinds"]) {
        if (!item.isObject()) {
            errorMsg = "element in list param Kinds is not of type object";
            return false;
        }
        GroupKind key;
        if (!GetMandatoryStringParam(item, "Kind", key.mKind, errorMsg)) {
            return false;
        }
        if (key.mKind.empty()) {
            errorMsg = "param Kind in Kinds is empty";
            return false;
        }
        if (!GetOptionalStringParam(item, "Group", key.mGroup, errorMsg)) {
            return false;
        }
        kinds[key] = true;
    }
    return true;
}

void EventFilterChainBuilder::Build(const FilterConfig& filterConfig,
                                    EventFilterChain& chain,
                                    shared_ptr<spdlog::logger> diagnostic) {
    if (filterConfig.mWarningsOnly) {
        chain.Add(make_shared<WarningEventFilter>());
    }
    if (!filterConfig.mNamespaces.empty()) {
        chain.Add(make_shared<NamespaceEventFilter>(MakeAcceptSet(filterConfig.mNamespaces)));
    }
    if (!filterConfig.mNames.empty()) {
        chain.Add(make_shared<NameEventFilter>(MakeAcceptSet(filterConfig.mNames)));
    }
    if (!filterConfig.mUids.empty()) {
        chain.Add(make_shared<UidEventFilter>(MakeAcceptSet(filterConfig.mUids)));
    }
    if (!filterConfig.mReasons.empty()) {
        chain.Add(make_shared<ReasonEventFilter>(MakeAcceptSet(filterConfig.mReasons)));
    }
    if (!filterConfig.mComponents.empty()) {
        chain.Add(make_shared<ComponentEventFilter>(MakeAcceptSet(filterConfig.mComponents)));
    }
    if (!filterConfig.mKinds.empty()) {
        chain.Add(make_shared<KindEventFilter>(filterConfig.mKinds, filterConfig.mKindMatchMode));
    }
    if (!filterConfig.mAround.empty()) {
        chain.Add(
            make_shared<AroundEventFilter>(filterConfig.mAround, filterConfig.mAroundDuration, std::move(diagnostic)));
    }
    LOG_INFO(sLogger,
             ("event filter chain built", GetConfigDescription(filterConfig))("filters", chain.Size()));
}

bool EventFilterChainBuilder::BuildFromJson(const Json::Value& config,
                                            EventFilterChain& chain,
                                            string& errorMsg,
                                            shared_ptr<spdlog::logger> diagnostic) {
    FilterConfig filterConfig;
    if (!ParseFromJson(config, filterConfig, errorMsg)) {
        return false;
    }
    Build(filterConfig, chain, std::move(diagnostic));
    return true;
}

string EventFilterChainBuilder::GetConfigDescription(const FilterConfig& filterConfig) {
    ostringstream oss;
    oss << "warnings_only=" << (filterConfig.mWarningsOnly ? "true" : "false");
    if (!filterConfig.mNamespaces.empty()) {
        oss << ", namespaces=[" << absl::StrJoin(filterConfig.mNamespaces, ",") << "]";
    }
    if (!filterConfig.mNames.empty()) {
        oss << ", names=[" << absl::StrJoin(filterConfig.mNames, ",") << "]";
    }
    if (!filterConfig.mUids.empty()) {
        oss << ", uids=[" << absl::StrJoin(filterConfig.mUids, ",") << "]";
    }
    if (!filterConfig.mReasons.empty()) {
        oss << ", reasons=[" << absl::StrJoin(filterConfig.mReasons, ",") << "]";
    }
    if (!filterConfig.mComponents.empty()) {
        oss << ", components=[" << absl::StrJoin(filterConfig.mComponents, ",") << "]";
    }
    if (!filterConfig.mKinds.empty()) {
        vector<string> kinds;
        for (const auto& item : filterConfig.mKinds) {
            kinds.emplace_back(item.first.ToString());
        }
        oss << ", kinds=[" << absl::StrJoin(kinds, ",") << "]"
            << ", kind_match_mode=" << KindMatchModeToString(filterConfig.mKindMatchMode);
    }
    if (!filterConfig.mAround.empty()) {
        oss << ", around=" << filterConfig.mAround
            << ", around_duration=" << absl::FormatDuration(filterConfig.mAroundDuration);
    }
    return oss.str();
}

} // namespace eventsift
