// Copyright 2025 eventsift Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <algorithm>
#include <vector>

#include "models/ArrayView.h"
#include "models/KubeEvent.h"
#include "unittest/Unittest.h"

namespace eventsift {

class ArrayViewUnittest : public ::testing::Test {
public:
    void TestDefaultConstructor();
    void TestVectorConstructor();
    void TestPointerConstructor();
    void TestFrontBack();
    void TestIterator();
    void TestToVectorIsCopy();
    void TestEventView();
};

void ArrayViewUnittest::TestDefaultConstructor() {
    ArrayView<int> view;
    EVENTSIFT_TEST_EQUAL(0U, view.size());
    EVENTSIFT_TEST_TRUE(view.empty());
    EVENTSIFT_TEST_TRUE(view.begin() == view.end());
    EVENTSIFT_TEST_TRUE(view.ToVector().empty());
}

void ArrayViewUnittest::TestVectorConstructor() {
    std::vector<int> vec = {1, 2, 3};
    ArrayView<int> view(vec);
    EVENTSIFT_TEST_EQUAL(3U, view.size());
    EVENTSIFT_TEST_FALSE(view.empty());
    for (size_t i = 0; i < vec.size(); ++i) {
        EVENTSIFT_TEST_EQUAL(&vec[i], &view[i]);
    }
}

void ArrayViewUnittest::TestPointerConstructor() {
    const int arr[] = {1, 2, 3, 4, 5};
    // 只使用前3个元素
    ArrayView<int> view(arr, 3);
    EVENTSIFT_TEST_EQUAL(3U, view.size());
    EVENTSIFT_TEST_EQUAL(3, view.back());
}

void ArrayViewUnittest::TestFrontBack() {
    std::vector<int> vec = {7, 8, 9};
    ArrayView<int> view(vec);
    EVENTSIFT_TEST_EQUAL(7, view.front());
    EVENTSIFT_TEST_EQUAL(9, view.back());
}

void ArrayViewUnittest::TestIterator() {
    std::vector<int> vec = {1, 2, 3, 4};
    ArrayView<int> view(vec);
    int sum = 0;
    for (int v : view) {
        sum += v;
    }
    EVENTSIFT_TEST_EQUAL(10, sum);
    EVENTSIFT_TEST_EQUAL(2, std::count_if(view.begin(), view.end(), [](int v) { return v % 2 == 0; }));
}

void ArrayViewUnittest::TestToVectorIsCopy() {
    std::vector<int> vec = {1, 2};
    ArrayView<int> view(vec);
    std::vector<int> copy = view.ToVector();
    copy[0] = 100;
    EVENTSIFT_TEST_EQUAL(1, vec[0]);
    EVENTSIFT_TEST_EQUAL(1, view[0]);
}

void ArrayViewUnittest::TestEventView() {
    KubeEvent e1;
    KubeEvent e2;
    EventList list = {&e1, &e2};
    EventView view(list);
    EVENTSIFT_TEST_EQUAL(&e1, view.front());
    EVENTSIFT_TEST_EQUAL(&e2, view.back());
}

UNIT_TEST_CASE(ArrayViewUnittest, TestDefaultConstructor)
UNIT_TEST_CASE(ArrayViewUnittest, TestVectorConstructor)
UNIT_TEST_CASE(ArrayViewUnittest, TestPointerConstructor)
UNIT_TEST_CASE(ArrayViewUnittest, TestFrontBack)
UNIT_TEST_CASE(ArrayViewUnittest, TestIterator)
UNIT_TEST_CASE(ArrayViewUnittest, TestToVectorIsCopy)
UNIT_TEST_CASE(ArrayViewUnittest, TestEventView)

} // namespace eventsift

UNIT_TEST_MAIN
