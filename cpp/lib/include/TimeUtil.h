/** \file   TimeUtil.h
 *  \brief  Declarations of time-related utility functions.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#pragma once


#include <limits>
#include <string>
#include <cstdint>
#include <ctime>


namespace TimeUtil {


constexpr time_t BAD_TIME_T = std::numeric_limits<time_t>::min();


const std::string DEFAULT_FORMAT("%Y-%m-%d %T");
const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!


enum TimeZone { LOCAL, UTC };


/** \brief  Convert a time from a time_t to a string.
 *  \param  the_time   The time to convert.
 *  \param  format     The format of the result, in strftime(3) format.
 *  \param  time_zone  Whether to use local time (the default) or UTC.
 *  \return The converted time.
 */
std::string TimeTToString(const time_t &the_time, const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** \brief   Get the current date and time as a string.
 *  \param   format     The format of the result, in strftime(3) format.
 *  \param   time_zone  Whether to use local time (the default) or UTC.
 */
std::string GetCurrentDateAndTime(const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** Returns elapsed time since the Unix epoch rounded to the nearest millisecond. */
uint64_t GetCurrentTimeInMilliseconds();


/** Attempts to sleep at least "sleep_interval" milliseconds.  Unlike a plain nanosleep(2) we resume sleeping if a
    signal interrupts us. */
void Millisleep(const uint64_t sleep_interval);


/** \brief Parses a date/time in RFC1123 date and time format, e.g. "Wed, 21 Oct 2015 07:28:00 GMT".
 *  \note The returned time is UTC time.
 *  \note If an error occurred we return false and set "*date_time" to BAD_TIME_T.
 */
bool ParseRFC1123DateTime(const std::string &date_time_candidate, time_t * const date_time);


} // namespace TimeUtil
