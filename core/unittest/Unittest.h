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

#include "gtest/gtest.h"

#include "logger/Logger.h"

#define EVENTSIFT_TEST_TRUE(x) EXPECT_TRUE(x)
#define EVENTSIFT_TEST_FALSE(x) EXPECT_FALSE(x)
#define EVENTSIFT_TEST_EQUAL(a, b) EXPECT_EQ(a, b)
#define EVENTSIFT_TEST_NOT_EQUAL(a, b) EXPECT_NE(a, b)
#define EVENTSIFT_TEST_TRUE_FATAL(x) ASSERT_TRUE(x)
#define EVENTSIFT_TEST_EQUAL_FATAL(a, b) ASSERT_EQ(a, b)

#define UNIT_TEST_CASE(cls, name) \
    TEST_F(cls, name) { \
        name(); \
    }

#define UNIT_TEST_MAIN \
    int main(int argc, char** argv) { \
        ::testing::InitGoogleTest(&argc, argv); \
        ::eventsift::Logger::Instance().SetLevel(spdlog::level::debug); \
        return RUN_ALL_TESTS(); \
    }
