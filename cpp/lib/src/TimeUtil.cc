/** \file   TimeUtil.cc
 *  \brief  Implementation of time-related utility functions.
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
#include <cerrno>
#include <cstdint>
#include <time.h>


namespace TimeUtil {


std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    return TimeTToString(std::time(nullptr), format, time_zone);
}


std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    struct tm tm;
    if (time_zone == LOCAL)
        ::localtime_r(&the_time, &tm);
    else
        ::gmtime_r(&the_time, &tm);

    char time_buf[100];
    const size_t length(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm));
    return std::string(time_buf, length);
}


void Millisleep(const unsigned sleep_interval) {
    if (sleep_interval == 0)
        return;

    timespec time_spec, remaining;
    time_spec.tv_sec = sleep_interval / 1000u;
    time_spec.tv_nsec = static_cast<long>(sleep_interval % 1000u) * 1000000L;

    // nanosleep(2) may be interrupted by signals, in which case we continue with the remaining time:
    while (::nanosleep(&time_spec, &remaining) == -1 and errno == EINTR)
        time_spec = remaining;
    errno = 0;
}


uint64_t GetCurrentTimeInMilliseconds() {
    timespec now;
    ::clock_gettime(CLOCK_MONOTONIC, &now);
    return static_cast<uint64_t>(now.tv_sec) * 1000u + static_cast<uint64_t>(now.tv_nsec) / 1000000u;
}


} // namespace TimeUtil
