/** \file   TimeLimit.cc
 *  \brief  Implementation of class TimeLimit.
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
#include "TimeLimit.h"
#include "TimeUtil.h"


void TimeLimit::initialize(const unsigned time_limit) {
    limit_ = time_limit;
    expire_time_ = TimeUtil::GetCurrentTimeInMilliseconds() + time_limit;
}


bool TimeLimit::limitExceeded() const {
    return TimeUtil::GetCurrentTimeInMilliseconds() >= expire_time_;
}


unsigned TimeLimit::getRemainingTime() const {
    const uint64_t now(TimeUtil::GetCurrentTimeInMilliseconds());
    return (now >= expire_time_) ? 0 : static_cast<unsigned>(expire_time_ - now);
}
