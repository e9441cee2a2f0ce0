/** \file    FileUtil.h
 *  \brief   Declaration of file-related utility functions.
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#pragma once


#include <string>
#include <vector>
#include <sys/types.h>


namespace FileUtil {


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and removes it when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool remove_when_out_of_scope_;

public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD", const bool remove_when_out_of_scope = true);
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory();

    const std::string &getDirectoryPath() const { return path_; }
};


/** \return The size of the file named by "path".  Throws if the file can't be stat'ed. */
off_t GetFileSize(const std::string &path);


bool WriteString(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);


/** \brief  Test whether a path exists.
 *  \param  path           The path to test.
 *  \param  error_message  If not nullptr, an explanation of why "path" is inaccessible will be stored here.
 */
bool Exists(const std::string &path, std::string * const error_message = nullptr);


bool IsDirectory(const std::string &dir_name);


/** \return The directory part of "path" or the empty string if "path" contains no slash. */
std::string GetDirname(const std::string &path);


/** \brief  Create a directory.
 *  \param  recursive  If true, also create missing parent directories.
 *  \return True if the directory exists afterwards, else false.
 */
bool MakeDirectory(const std::string &path, const bool recursive = false, const mode_t mode = 0755);


/** \brief  Collects the names of the regular files in "directory" that start with "prefix".
 *  \return False if "directory" could not be read.
 *  \note   The names are returned in lexicographical order and do not include the directory.
 */
bool GetFileNamesWithPrefix(const std::string &directory, const std::string &prefix, std::vector<std::string> * const filenames);


bool DeleteFile(const std::string &path);


/** \brief Deletes "dir_name" and everything below it. */
bool RemoveDirectory(const std::string &dir_name);


} // namespace FileUtil
