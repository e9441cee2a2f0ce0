/** \file   TimeUtil.cc
 *  \brief  Implementation of time-related utility functions.
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
#include "TimeUtil.h"
#include <vector>
#include <cerrno>
#include <cstring>
#include <sys/time.h>
#include "StringUtil.h"
#include "util.h"


namespace TimeUtil {


std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    struct tm tm;
    if (unlikely((time_zone == LOCAL ? ::localtime_r(&the_time, &tm) : ::gmtime_r(&the_time, &tm)) == nullptr))
        throw std::runtime_error("in TimeUtil::TimeTToString: time conversion error!");

    char time_buf[50 + 1];
    const size_t result_length(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm));
    if (unlikely(result_length == 0))
        throw std::runtime_error("in TimeUtil::TimeTToString: bad format \"" + format + "\"!");

    return std::string(time_buf, result_length);
}


std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    time_t now;
    std::time(&now);
    return TimeTToString(now, format, time_zone);
}


uint64_t GetCurrentTimeInMilliseconds() {
    timeval time_val;
    ::gettimeofday(&time_val, nullptr);
    return 1000ULL * time_val.tv_sec + (time_val.tv_usec + 500ULL) / 1000ULL;
}


void Millisleep(const uint64_t sleep_interval) {
    timespec time_spec;
    time_spec.tv_sec  = sleep_interval / 1000;
    time_spec.tv_nsec = (sleep_interval % 1000) * 1000000L;
    while (::nanosleep(&time_spec, &time_spec) == -1 and errno == EINTR)
        /* Intentionally empty! */;
}


// See https://www.rfc-editor.org/rfc/rfc822.txt section 5.1.  "adjustment" has to be added to the local time to get UTC.
static bool ZoneAdjustment(const std::string &rfc822_zone, time_t * const adjustment) {
    if (rfc822_zone == "GMT" or rfc822_zone == "UT" or rfc822_zone == "UTC" or rfc822_zone == "Z")
        *adjustment = 0;
    else if (rfc822_zone == "EST")
        *adjustment = +5 * 3600;
    else if (rfc822_zone == "EDT")
        *adjustment = +4 * 3600;
    else if (rfc822_zone == "CST")
        *adjustment = +6 * 3600;
    else if (rfc822_zone == "CDT")
        *adjustment = +5 * 3600;
    else if (rfc822_zone == "MST")
        *adjustment = +7 * 3600;
    else if (rfc822_zone == "MDT")
        *adjustment = +6 * 3600;
    else if (rfc822_zone == "PST")
        *adjustment = +8 * 3600;
    else if (rfc822_zone == "PDT")
        *adjustment = +7 * 3600;
    else if (rfc822_zone.length() == 5 and (rfc822_zone[0] == '+' or rfc822_zone[0] == '-')
             and StringUtil::IsUnsignedDecimalNumber(rfc822_zone.substr(1)))
    {
        time_t offset(((rfc822_zone[1] - '0') * 10 + (rfc822_zone[2] - '0')) * 3600
                      + ((rfc822_zone[3] - '0') * 10 + (rfc822_zone[4] - '0')) * 60);
        *adjustment = rfc822_zone[0] == '+' ? -offset : offset;
    } else // Unrecognized time zone.
        return false;

    return true;
}


// In order to understand this insanity, have a look at section 5.1 of RFC822.  Please note that we also support 4-digit
// years as specified by RFC1123.
bool ParseRFC1123DateTime(const std::string &date_time_candidate, time_t * const date_time) {
    *date_time = BAD_TIME_T;

    const auto first_comma_pos(date_time_candidate.find(','));
    const std::string::size_type start_pos(first_comma_pos == std::string::npos ? 0 : first_comma_pos + 1);

    // Expected components: day, month name, year, time and zone.
    std::vector<std::string> components;
    if (StringUtil::Split(StringUtil::TrimWhite(date_time_candidate.substr(start_pos)), ' ', &components) != 5)
        return false;

    const bool double_digit_year(components[2].length() == 2);
    if (not double_digit_year and components[2].length() != 4)
        return false;
    const bool has_seconds(components[3].length() == 8);
    if (not has_seconds and components[3].length() != 5)
        return false;

    time_t zone_adjustment;
    if (not ZoneAdjustment(components[4], &zone_adjustment))
        return false;

    std::string format(double_digit_year ? "%d %b %y %H:%M" : "%d %b %Y %H:%M");
    if (has_seconds)
        format += ":%S";

    components.pop_back();
    const std::string simplified_candidate(StringUtil::Join(components, " "));

    struct tm tm;
    std::memset(&tm, 0, sizeof tm);
    const char * const first_not_processed(::strptime(simplified_candidate.c_str(), format.c_str(), &tm));
    if (first_not_processed == nullptr or *first_not_processed != '\0')
        return false;

    const time_t utc_time(::timegm(&tm));
    if (unlikely(utc_time == static_cast<time_t>(-1)))
        return false;

    *date_time = utc_time + zone_adjustment;
    return true;
}


} // namespace TimeUtil
