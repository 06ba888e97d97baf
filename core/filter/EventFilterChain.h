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

#include <memory>
#include <string>
#include <vector>

#include "filter/EventFilter.h"

namespace eventsift {

/**
 * @brief 按顺序组合多个过滤器，前一级的输出作为后一级的输入
 *
 * - 过滤器列表为空时返回输入的拷贝
 * - 中间结果为空时提前结束并返回空结果，后续过滤器不会在空输入上执行
 * - 某一级返回std::nullopt时整个链返回std::nullopt
 *
 * 过滤器以shared_ptr持有，同一个过滤器实例可以出现在多个链中。
 */
class EventFilterChain : public EventFilter {
public:
    static const std::string sName;

    EventFilterChain() = default;
    explicit EventFilterChain(std::vector<std::shared_ptr<const EventFilter>> filters);

    const std::string& Name() const override { return sName; }
    std::optional<EventList> Filter(EventView events) const override;

    void Add(std::shared_ptr<const EventFilter> filter);

    size_t Size() const { return mFilters.size(); }
    bool Empty() const { return mFilters.empty(); }
    const std::vector<std::shared_ptr<const EventFilter>>& GetFilters() const { return mFilters; }

private:
    std::vector<std::shared_ptr<const EventFilter>> mFilters;
};

} // namespace eventsift
