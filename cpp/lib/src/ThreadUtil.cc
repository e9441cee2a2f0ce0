/** \file    ThreadUtil.cc
 *  \brief   Implementation of thread-related utility functions.
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen.
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
#include "ThreadUtil.h"
#include <cerrno>


namespace ThreadUtil {


Semaphore::Semaphore(const unsigned initial_count): initial_count_(initial_count) {
    if (::sem_init(&semaphore_, 0, initial_count) != 0)
        throw std::runtime_error("in ThreadUtil::Semaphore::Semaphore: sem_init(3) failed!");
}


Semaphore::~Semaphore() {
    if (::sem_destroy(&semaphore_) != 0)
        logger->warning("in ThreadUtil::Semaphore::~Semaphore: sem_destroy(3) failed!");
}


void Semaphore::wait() {
try_again:
    if (::sem_wait(&semaphore_) != 0) {
        if (errno == EINTR) {
            errno = 0;
            goto try_again;
        }
        throw std::runtime_error("in ThreadUtil::Semaphore::wait: sem_wait(3) failed!");
    }
}


void Semaphore::post() {
    if (::sem_post(&semaphore_) != 0)
        throw std::runtime_error("in ThreadUtil::Semaphore::post: sem_post(3) failed!");
}


} // namespace ThreadUtil
