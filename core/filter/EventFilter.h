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

#include <optional>
#include <string>

#include "models/KubeEvent.h"

namespace eventsift {

/**
 * @brief 事件过滤器接口
 *
 * 输入为只读的事件视图，输出为新分配的子序列（保持原有相对顺序，不复制也不修改事件）。
 * 返回std::nullopt表示过滤器无法执行（例如配置非法），与"全部被过滤掉"的空结果区分。
 */
class EventFilter {
public:
    virtual ~EventFilter() = default;

    virtual const std::string& Name() const = 0;
    virtual std::optional<EventList> Filter(EventView events) const = 0;
};

} // namespace eventsift
