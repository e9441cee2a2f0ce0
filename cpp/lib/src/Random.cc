/** \file    Random.cc
 *  \brief   Implementations of random variable related utility functions.
 */

/*
 *  Copyright 2004-2009 Project iVia.
 *  Copyright 2004-2009 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "Random.h"
#include <mutex>
#include "TimeUtil.h"


namespace Random {


void SeedOnce() {
    static std::once_flag seeded;
    std::call_once(seeded, []() { ::srandom(static_cast<unsigned>(TimeUtil::GetCurrentTimeInMilliseconds())); });
}


size_t Below(const size_t n) {
    SeedOnce();
    return static_cast<size_t>((::random() / (static_cast<double>(RAND_MAX) + 1.0)) * n);
}


} // namespace Random
