/** \file    TimeLimit.h
 *  \brief   Implements class TimeLimit.
 */

/*
 *  \copyright 2005-2009 Project iVia.
 *  \copyright 2005-2009 The Regents of The University of California.
 *  \copyright 2017-2026 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <cstdint>


/** \class  TimeLimit
 *  \brief  Represents a time limit placed upon some operation.
 *
 *  A time limit is specified (in milliseconds) when the object is created.  From that point on, limitExceeded() can
 *  be used to test whether the limit has been reached, and getRemainingTime() to measure the time left.
 */
class TimeLimit {
    uint64_t expire_time_; // milliseconds since the epoch
    unsigned limit_;

public:
    /** \brief  Construct a TimeLimit by specifying the limit.
     *  \param  time_limit  The time until expiration, in milliseconds.
     *  \note   This constructor is deliberately not explicit, so that unsigned values can be used in place of
     *          TimeLimit objects in function calls.
     */
    TimeLimit(const unsigned time_limit) { initialize(time_limit); }

    /** \brief   Test whether the time limit has been exceeded.
     *  \return  True if the time limit has been exceeded, otherwise false.
     */
    bool limitExceeded() const;

    /** \return  The time remaining until the limit has been reached (in milliseconds) or 0 if the limit is already
     *           exceeded.
     */
    unsigned getRemainingTime() const;

    inline unsigned getLimit() const { return limit_; }

    /** Restart by using the stored limit. */
    void restart() { initialize(limit_); }

    /** Sleep until the limit has been exceeded. */
    void sleepUntilExpired() const;

private:
    void initialize(const unsigned time_limit);
};
