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
#include <unordered_set>
#include <utility>
#include <vector>

namespace eventsift {

class StringAcceptor {
public:
    virtual ~StringAcceptor() = default;

    virtual bool Accepts(const std::string& candidate) const = 0;
};

// Empty set accepts every candidate, otherwise membership decides.
class AcceptSet : public StringAcceptor {
public:
    AcceptSet() = default;
    explicit AcceptSet(const std::vector<std::string>& values);
    explicit AcceptSet(std::unordered_set<std::string> values) : mValues(std::move(values)) {}

    bool Accepts(const std::string& candidate) const override;

    bool AcceptsAll() const { return mValues.empty(); }
    size_t Size() const { return mValues.size(); }

private:
    std::unordered_set<std::string> mValues;
};

std::shared_ptr<const StringAcceptor> MakeAcceptSet(const std::vector<std::string>& values);

} // namespace eventsift
