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
#include <memory>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "json/json.h"
#include "spdlog/spdlog.h"

#include "filter/EventFilterChain.h"
#include "filter/KindEventFilter.h"

namespace eventsift {

/**
 * @brief 根据过滤配置构建EventFilterChain
 *
 * 过滤器顺序固定：warnings -> namespaces -> names -> uids -> reasons -> components -> kinds -> around。
 * 列表类配置为空时不添加对应过滤器；around放在最后，以便锚点日期取自已过滤的事件。
 */
class EventFilterChainBuilder {
public:
    struct FilterConfig {
        bool mWarningsOnly = false;
        std::vector<std::string> mNamespaces;
        std::vector<std::string> mNames;
        std::vector<std::string> mUids;
        std::vector<std::string> mReasons;
        std::vector<std::string> mComponents;
        std::map<GroupKind, bool> mKinds;
        KindMatchMode mKindMatchMode = KindMatchMode::kExclusionFirst;
        std::string mAround;
        absl::Duration mAroundDuration = absl::Minutes(15);
    };

    /**
     * @brief 从JSON解析过滤配置
     *
     * 支持的键：WarningsOnly, Namespaces, Names, UIDs, Reasons, Components,
     * Kinds([{"Group": "...", "Kind": "..."}]), KindMatchMode("legacy"/"exclusion_first"),
     * Around("HH:MM[:SS]"), AroundDuration("2m", "1m30s"...)
     *
     * @return 成功返回true，失败返回false并设置errorMsg
     */
    static bool ParseFromJson(const Json::Value& config, FilterConfig& filterConfig, std::string& errorMsg);

    // diagnostic is handed to the around filter, null means the default stderr channel
    static void Build(const FilterConfig& filterConfig,
                      EventFilterChain& chain,
                      std::shared_ptr<spdlog::logger> diagnostic = nullptr);

    static bool BuildFromJson(const Json::Value& config,
                              EventFilterChain& chain,
                              std::string& errorMsg,
                              std::shared_ptr<spdlog::logger> diagnostic = nullptr);

    static std::string GetConfigDescription(const FilterConfig& filterConfig);

private:
    EventFilterChainBuilder() = default;
    ~EventFilterChainBuilder() = default;

    static bool parseKinds(const Json::Value& config, std::map<GroupKind, bool>& kinds, std::string& errorMsg);
};

} // namespace eventsift
