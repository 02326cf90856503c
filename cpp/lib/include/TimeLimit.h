/** \file   TimeLimit.h
 *  \brief  Declaration of class TimeLimit.
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
#pragma once


#include <cstdint>


/** \class  TimeLimit
 *  \brief  Represents a time limit placed upon some operation.
 *
 *  A time limit is specified in milliseconds when the object is created.  From that point on, limitExceeded() tells
 *  whether the limit has been reached and getRemainingTime() how much time is left.  Every network and subprocess
 *  operation in this library takes a TimeLimit.
 */
class TimeLimit {
    uint64_t expire_time_; // Monotonic milliseconds.
    unsigned limit_;

public:
    /** \brief  Construct a TimeLimit by specifying the limit.
     *  \param  time_limit  The time until expiration, in milliseconds.
     *  \note   This constructor is deliberately not explicit, so that unsigned values can be used in place of
     *          TimeLimit objects in function calls.
     */
    TimeLimit(const unsigned time_limit) { initialize(time_limit); }

    bool limitExceeded() const;

    /** \return The time remaining until the limit has been reached (in milliseconds) or 0 if the limit is already
     *          exceeded.
     */
    unsigned getRemainingTime() const;

    inline unsigned getLimit() const { return limit_; }

    /** Restart by using the stored limit. */
    void restart() { initialize(limit_); }

private:
    void initialize(const unsigned time_limit);
};
