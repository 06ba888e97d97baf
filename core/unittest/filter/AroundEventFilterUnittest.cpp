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

#include <string>
#include <vector>

#include "filter/AroundEventFilter.h"
#include "unittest/Unittest.h"
#include "unittest/filter/FilterTestUtil.h"

using namespace std;

namespace eventsift {

class AroundEventFilterUnittest : public testing::Test {
public:
    void TestParseTimeOfDay();
    void TestParseTimeOfDayInvalid();
    void TestWindowBoundsInclusive();
    void TestAnchorDateFromLastEvent();
    void TestSecondsAndSubsecond();
    void TestSubsecondBeyondNanosRange();
    void TestWhitespaceAroundReportsDiagnostic();
    void TestTimeZoneOfReference();
    void TestHourOverflowRollsToNextDay();
    void TestInvalidAroundReportsDiagnostic();
    void TestNonNumericAroundReportsDiagnostic();
    void TestEmptyInputReportsDiagnostic();
    void TestZeroDuration();

private:
    static KubeEvent at(const EventTime& t) {
        KubeEvent event = MakeEvent("default", "web");
        event.mLastTimestamp = t;
        return event;
    }
};

void AroundEventFilterUnittest::TestParseTimeOfDay() {
    TimeOfDay tod;
    string errorMsg;
    EVENTSIFT_TEST_TRUE(AroundEventFilter::ParseTimeOfDay("10:00", tod, errorMsg));
    EVENTSIFT_TEST_EQUAL(10, tod.mHours);
    EVENTSIFT_TEST_EQUAL(0, tod.mMinutes);
    EVENTSIFT_TEST_EQUAL(0, tod.mSeconds);

    EVENTSIFT_TEST_TRUE(AroundEventFilter::ParseTimeOfDay("07:05:09", tod, errorMsg));
    EVENTSIFT_TEST_EQUAL(7, tod.mHours);
    EVENTSIFT_TEST_EQUAL(5, tod.mMinutes);
    EVENTSIFT_TEST_EQUAL(9, tod.mSeconds);
}

void AroundEventFilterUnittest::TestParseTimeOfDayInvalid() {
    TimeOfDay tod;
    string errorMsg;
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("bad", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("HH:MM") != string::npos);

    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("1:2:3:4", tod, errorMsg));
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("", tod, errorMsg));

    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("aa:00", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("hours") != string::npos);
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("10:", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("minutes") != string::npos);
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("10:00:xx", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("seconds") != string::npos);

    // 各部分必须为纯数字，不允许首尾空白
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay(" 10:00", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("hours") != string::npos);
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("10: 05", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("minutes") != string::npos);
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("10:05 ", tod, errorMsg));
    EVENTSIFT_TEST_FALSE(AroundEventFilter::ParseTimeOfDay("10:05:\t1", tod, errorMsg));
    EVENTSIFT_TEST_TRUE(errorMsg.find("seconds") != string::npos);
}

void AroundEventFilterUnittest::TestWindowBoundsInclusive() {
    vector<KubeEvent> events = {at(MakeTime(9, 57, 59)),
                                at(MakeTime(9, 58, 0)),
                                at(MakeTime(10, 0, 0)),
                                at(MakeTime(10, 3, 0)),
                                at(MakeTime(10, 2, 0))};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_bounds");
    AroundEventFilter filter("10:00", absl::Minutes(2), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(3U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[1], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&events[2], (*res)[1]);
    EVENTSIFT_TEST_EQUAL(&events[4], (*res)[2]);
    EVENTSIFT_TEST_TRUE(diagnostic.Output().empty());
}

void AroundEventFilterUnittest::TestAnchorDateFromLastEvent() {
    // 最后一个事件在次日，锚点日期取次日
    EventTime dayOne = MakeTime(10, 0, 0);
    EventTime dayTwo = dayOne;
    dayTwo.mTime += absl::Hours(24);
    vector<KubeEvent> events = {at(dayOne), at(dayTwo)};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_date");
    AroundEventFilter filter("10:00", absl::Minutes(5), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[1], (*res)[0]);
}

void AroundEventFilterUnittest::TestSecondsAndSubsecond() {
    // 锚点继承参考事件的纳秒部分：锚点为10:00:30.5，窗口为[10:00:29.5, 10:00:31.5]
    EventTime reference = MakeTime(11, 0, 0);
    reference.mTime += absl::Milliseconds(500);
    EventTime early = MakeTime(10, 0, 29);
    EventTime lowerBound = early;
    lowerBound.mTime += absl::Milliseconds(500);
    EventTime upperBound = MakeTime(10, 0, 31);
    upperBound.mTime += absl::Milliseconds(500);
    EventTime late = MakeTime(10, 0, 32);

    vector<KubeEvent> events = {at(early), at(lowerBound), at(upperBound), at(late), at(reference)};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_subsecond");
    AroundEventFilter filter("10:00:30", absl::Seconds(1), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(2U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[1], (*res)[0]);
    EVENTSIFT_TEST_EQUAL(&events[2], (*res)[1]);
}

void AroundEventFilterUnittest::TestSubsecondBeyondNanosRange() {
    // 2262年之后的时间无法用int64纳秒表示，锚点仍需继承参考事件的250ms
    EventTime reference;
    reference.mTime = absl::FromCivil(absl::CivilSecond(2300, 1, 1, 10, 5, 0), absl::UTCTimeZone())
        + absl::Milliseconds(250);
    EventTime anchor;
    anchor.mTime = absl::FromCivil(absl::CivilSecond(2300, 1, 1, 10, 0, 0), absl::UTCTimeZone())
        + absl::Milliseconds(250);
    EventTime beforeAnchor = anchor;
    beforeAnchor.mTime -= absl::Milliseconds(1);
    EventTime afterAnchor = anchor;
    afterAnchor.mTime += absl::Milliseconds(1);

    vector<KubeEvent> events = {at(beforeAnchor), at(anchor), at(afterAnchor), at(reference)};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_far_future");
    AroundEventFilter filter("10:00", absl::ZeroDuration(), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[1], (*res)[0]);
}

void AroundEventFilterUnittest::TestWhitespaceAroundReportsDiagnostic() {
    vector<KubeEvent> events = {at(MakeTime(10, 5, 0))};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_whitespace");
    AroundEventFilter filter("10: 05", absl::Minutes(2), diagnostic.Get());
    EVENTSIFT_TEST_FALSE(filter.Filter(input).has_value());
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("minutes component \" 05\"") != string::npos);
}

void AroundEventFilterUnittest::TestTimeZoneOfReference() {
    // 参考事件记录于UTC+8，around按该时区解释
    absl::TimeZone shanghai = absl::FixedTimeZone(8 * 3600);
    EventTime reference = MakeTime(12, 0, 0, shanghai);
    EVENTSIFT_TEST_EQUAL("2024-03-15T12:00:00+08:00", reference.ToString());
    EventTime inWindow = MakeTime(2, 1, 0); // 10:01 in UTC+8
    EventTime outWindow = MakeTime(10, 1, 0); // 18:01 in UTC+8
    vector<KubeEvent> events = {at(inWindow), at(outWindow), at(reference)};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_zone");
    AroundEventFilter filter("10:00", absl::Minutes(2), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[0], (*res)[0]);
}

void AroundEventFilterUnittest::TestHourOverflowRollsToNextDay() {
    EventTime reference = MakeTime(23, 0, 0);
    EventTime nextDay = MakeTime(1, 0, 0);
    nextDay.mTime += absl::Hours(24);
    vector<KubeEvent> events = {at(nextDay), at(reference)};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_overflow");
    AroundEventFilter filter("25:00", absl::Minutes(1), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[0], (*res)[0]);
}

void AroundEventFilterUnittest::TestInvalidAroundReportsDiagnostic() {
    vector<KubeEvent> events = {at(MakeTime(10, 0, 0))};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_invalid");
    AroundEventFilter filter("bad", absl::Minutes(2), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_FALSE(res.has_value());
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("\"bad\"") != string::npos);
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("HH:MM or HH:MM:SS") != string::npos);
}

void AroundEventFilterUnittest::TestNonNumericAroundReportsDiagnostic() {
    vector<KubeEvent> events = {at(MakeTime(10, 0, 0))};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_non_numeric");
    AroundEventFilter filter("10:3x", absl::Minutes(2), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_FALSE(res.has_value());
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("10:3x") != string::npos);
    EVENTSIFT_TEST_TRUE(diagnostic.Output().find("minutes component \"3x\"") != string::npos);
}

void AroundEventFilterUnittest::TestEmptyInputReportsDiagnostic() {
    CapturedLogger diagnostic("around_empty");
    AroundEventFilter filter("10:00", absl::Minutes(2), diagnostic.Get());
    auto res = filter.Filter(EventView());
    EVENTSIFT_TEST_FALSE(res.has_value());
    EVENTSIFT_TEST_FALSE(diagnostic.Output().empty());
}

void AroundEventFilterUnittest::TestZeroDuration() {
    vector<KubeEvent> events = {at(MakeTime(9, 59, 59)), at(MakeTime(10, 0, 0)), at(MakeTime(10, 0, 1))};
    EventList input = ToPointers(events);

    CapturedLogger diagnostic("around_zero");
    AroundEventFilter filter("10:00", absl::ZeroDuration(), diagnostic.Get());
    auto res = filter.Filter(input);
    EVENTSIFT_TEST_TRUE_FATAL(res.has_value());
    EVENTSIFT_TEST_EQUAL_FATAL(1U, res->size());
    EVENTSIFT_TEST_EQUAL(&events[1], (*res)[0]);
}

UNIT_TEST_CASE(AroundEventFilterUnittest, TestParseTimeOfDay)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestParseTimeOfDayInvalid)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestWindowBoundsInclusive)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestAnchorDateFromLastEvent)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestSecondsAndSubsecond)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestSubsecondBeyondNanosRange)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestWhitespaceAroundReportsDiagnostic)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestTimeZoneOfReference)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestHourOverflowRollsToNextDay)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestInvalidAroundReportsDiagnostic)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestNonNumericAroundReportsDiagnostic)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestEmptyInputReportsDiagnostic)
UNIT_TEST_CASE(AroundEventFilterUnittest, TestZeroDuration)

} // namespace eventsift

UNIT_TEST_MAIN
