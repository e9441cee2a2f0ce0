/** \file    FileLocker.cc
 *  \brief   Implementation of class FileLocker.
 */

/*
 *  Copyright 2020-2026 University Library of Tübingen
 *  Copyright 2004-2005 Project iVia.
 *  Copyright 2004-2005 The Regents of The University of California.
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
#include "FileLocker.h"
#include <stdexcept>
#include <string>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include "TimeLimit.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


const unsigned POLL_INTERVAL(20); // ms


void InitLockStruct(const short type, struct flock * const lock_struct) {
    std::memset(lock_struct, 0, sizeof(*lock_struct));
    lock_struct->l_type = type;          /* F_RDLCK, F_WRLCK, F_UNLCK    */
    lock_struct->l_whence = SEEK_SET;    /* SEEK_SET, SEEK_CUR, SEEK_END */
    lock_struct->l_start = 0;            /* Offset from l_whence         */
    lock_struct->l_len = 0;              /* length, 0 = to EOF           */
}


} // unnamed namespace


FileLocker::FileLocker(const int fd, const LockType lock_type, const unsigned timeout): lock_fd_(fd) {
    struct flock lock_struct;
    InitLockStruct(static_cast<short>((lock_type == READ_ONLY) ? F_RDLCK : F_WRLCK), &lock_struct);

    if (timeout == 0) {
        while (::fcntl(lock_fd_, F_SETLKW, &lock_struct) == -1) {
            if (errno != EINTR)
                throw std::runtime_error("in FileLocker::FileLocker: fcntl(2) failed! (" + std::string(std::strerror(errno)) + ")");
            errno = 0;
        }
        return;
    }

    // Poll instead of relying on alarm(2) which would be shared by all threads of the process.
    const TimeLimit time_limit(timeout * 1000);
    while (::fcntl(lock_fd_, F_SETLK, &lock_struct) == -1) {
        if (errno != EACCES and errno != EAGAIN and errno != EINTR)
            throw std::runtime_error("in FileLocker::FileLocker: fcntl(2) failed! (" + std::string(std::strerror(errno)) + ")");
        errno = 0;
        if (time_limit.limitExceeded())
            throw std::runtime_error("in FileLocker::FileLocker: failed to acquire a lock on file descriptor "
                                     + std::to_string(lock_fd_) + " within " + std::to_string(timeout) + " seconds!");
        TimeUtil::Millisleep(POLL_INTERVAL);
    }
}


FileLocker::~FileLocker() {
    struct flock lock_struct;
    InitLockStruct(F_UNLCK, &lock_struct);

    if (::fcntl(lock_fd_, F_SETLK, &lock_struct) == -1)
        LOG_WARNING("fcntl(2) failed to unlock file descriptor " + std::to_string(lock_fd_) + "! (" + std::to_string(errno) + ")");
}
