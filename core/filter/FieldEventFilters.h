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

#include "filter/EventFilter.h"
#include "filter/StringAcceptor.h"

namespace eventsift {

class WarningEventFilter : public EventFilter {
public:
    static const std::string sName;

    const std::string& Name() const override { return sName; }
    std::optional<EventList> Filter(EventView events) const override;
};

/**
 * @brief 基于单个字符串字段的过滤器基类
 *
 * 子类只需给出取值字段，集合判断委托给StringAcceptor（空集合表示全部接受）。
 */
class AcceptorEventFilter : public EventFilter {
public:
    explicit AcceptorEventFilter(std::shared_ptr<const StringAcceptor> acceptor);

    std::optional<EventList> Filter(EventView events) const override;

protected:
    virtual const std::string& FieldOf(const KubeEvent& event) const = 0;

private:
    std::shared_ptr<const StringAcceptor> mAcceptor;
};

class NamespaceEventFilter : public AcceptorEventFilter {
public:
    static const std::string sName;

    using AcceptorEventFilter::AcceptorEventFilter;
    const std::string& Name() const override { return sName; }

protected:
    const std::string& FieldOf(const KubeEvent& event) const override { return event.mInvolvedObject.mNamespace; }
};

class NameEventFilter : public AcceptorEventFilter {
public:
    static const std::string sName;

    using AcceptorEventFilter::AcceptorEventFilter;
    const std::string& Name() const override { return sName; }

protected:
    const std::string& FieldOf(const KubeEvent& event) const override { return event.mInvolvedObject.mName; }
};

class ReasonEventFilter : public AcceptorEventFilter {
public:
    static const std::string sName;

    using AcceptorEventFilter::AcceptorEventFilter;
    const std::string& Name() const override { return sName; }

protected:
    const std::string& FieldOf(const KubeEvent& event) const override { return event.mReason; }
};

class UidEventFilter : public AcceptorEventFilter {
public:
    static const std::string sName;

    using AcceptorEventFilter::AcceptorEventFilter;
    const std::string& Name() const override { return sName; }

protected:
    const std::string& FieldOf(const KubeEvent& event) const override { return event.mInvolvedObject.mUid; }
};

class ComponentEventFilter : public AcceptorEventFilter {
public:
    static const std::string sName;

    using AcceptorEventFilter::AcceptorEventFilter;
    const std::string& Name() const override { return sName; }

protected:
    const std::string& FieldOf(const KubeEvent& event) const override { return event.mReportingComponent; }
};

} // namespace eventsift
