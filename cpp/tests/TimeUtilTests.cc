/** \file   TimeUtilTests.cc
 *  \brief  Tests for the TimeUtil module.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "TimeUtil.h"
#include "UnitTest.h"


TEST(ParseRFC1123DateTime) {
    time_t date_time;
    CHECK_TRUE(TimeUtil::ParseRFC1123DateTime("Sun, 06 Nov 1994 08:49:37 GMT", &date_time));
    CHECK_EQ(date_time, static_cast<time_t>(784111777));

    CHECK_TRUE(TimeUtil::ParseRFC1123DateTime("Sun, 06 Nov 1994 09:49:37 +0100", &date_time));
    CHECK_EQ(date_time, static_cast<time_t>(784111777));

    CHECK_TRUE(TimeUtil::ParseRFC1123DateTime("06 Nov 94 03:49 EST", &date_time));
    CHECK_EQ(date_time, static_cast<time_t>(784111740));
}


TEST(MalformedDateTimesAreRejected) {
    time_t date_time;
    CHECK_FALSE(TimeUtil::ParseRFC1123DateTime("120", &date_time));
    CHECK_EQ(date_time, TimeUtil::BAD_TIME_T);
    CHECK_FALSE(TimeUtil::ParseRFC1123DateTime("Sun, 06 Nov 1994 08:49:37 XYZ", &date_time));
    CHECK_FALSE(TimeUtil::ParseRFC1123DateTime("Sun, 06 Foo 1994 08:49:37 GMT", &date_time));
    CHECK_FALSE(TimeUtil::ParseRFC1123DateTime("", &date_time));
}


TEST(TimeTToString) {
    CHECK_EQ(TimeUtil::TimeTToString(784111777, "%Y.%m.%d.%H.%M.%S", TimeUtil::UTC), "1994.11.06.08.49.37");
}


TEST_MAIN(TimeUtilTests)
