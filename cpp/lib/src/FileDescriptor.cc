/** \file    FileDescriptor.cc
 *  \brief   Implementation of class FileDescriptor.
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2026 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "FileDescriptor.h"
#include <unistd.h>
#include "util.h"


bool FileDescriptor::close() {
    if (unlikely(fd_ == -1))
        return true;

    const bool success(::close(fd_) == 0);
    fd_ = -1;
    return success;
}


const FileDescriptor &FileDescriptor::operator=(const int new_fd) {
    if (likely(fd_ != -1))
        ::close(fd_);

    fd_ = new_fd;

    return *this;
}


int FileDescriptor::release() {
    const int retval(fd_);
    fd_ = -1;
    return retval;
}
