/** \file    TimeLimit.cc
 *  \brief   Implementation of class TimeLimit.
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
#include "TimeLimit.h"
#include "TimeUtil.h"


void TimeLimit::initialize(const unsigned time_limit) {
    limit_ = time_limit;
    expire_time_ = TimeUtil::GetCurrentTimeInMilliseconds() + time_limit;
}


unsigned TimeLimit::getRemainingTime() const {
    const uint64_t now(TimeUtil::GetCurrentTimeInMilliseconds());
    return now >= expire_time_ ? 0 : static_cast<unsigned>(expire_time_ - now);
}


bool TimeLimit::limitExceeded() const {
    return TimeUtil::GetCurrentTimeInMilliseconds() >= expire_time_;
}


void TimeLimit::sleepUntilExpired() const {
    TimeUtil::Millisleep(getRemainingTime());
}
