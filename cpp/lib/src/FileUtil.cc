/** \file    FileUtil.cc
 *  \brief   Implementation of file-related utility functions.
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
#include "FileUtil.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix, const bool remove_when_out_of_scope)
    : remove_when_out_of_scope_(remove_when_out_of_scope)
{
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(&path_template[0]));
    if (path == nullptr)
        throw std::runtime_error("in FileUtil::AutoTempDirectory::AutoTempDirectory: mkdtemp(3) for path prefix \""
                                 + path_prefix + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        throw std::runtime_error("in FileUtil::AutoTempDirectory::AutoTempDirectory: realpath(3) for path \"" + std::string(path)
                                 + "\" failed!");
    path_ = resolved_path;
}


AutoTempDirectory::~AutoTempDirectory() {
    if (remove_when_out_of_scope_ and not RemoveDirectory(path_))
        LOG_WARNING("can't remove \"" + path_ + "\"!");
}


off_t GetFileSize(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        throw std::runtime_error("in FileUtil::GetFileSize: can't stat(2) \"" + path + "\"!");

    return stat_buf.st_size;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    return not output.bad();
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    const off_t file_size(GetFileSize(path));
    data->resize(file_size);
    input.read(&(*data)[0], file_size);
    return not input.bad();
}


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == 0)
        return true;

    if (error_message != nullptr)
        *error_message = "can't stat(2) \"" + path + "\": " + std::string(std::strerror(errno));
    errno = 0;
    return false;
}


bool IsDirectory(const std::string &dir_name) {
    struct stat statbuf;
    if (::stat(dir_name.c_str(), &statbuf) != 0) {
        errno = 0;
        return false;
    }

    return S_ISDIR(statbuf.st_mode);
}


std::string GetDirname(const std::string &path) {
    if (unlikely(path.empty()))
        return "";

    const auto last_slash_pos(path.rfind('/'));
    if (last_slash_pos == std::string::npos)
        return "";
    return path.substr(0, last_slash_pos);
}


bool MakeDirectory(const std::string &path, const bool recursive, const mode_t mode) {
    if (unlikely(path.empty()))
        return false;

    // In NON-recursive mode we make a single attempt to create the directory:
    if (not recursive) {
        errno = 0;
        if (::mkdir(path.c_str(), mode) == 0)
            return true;
        const bool dir_exists(errno == EEXIST and IsDirectory(path));
        if (dir_exists)
            errno = 0;
        return dir_exists;
    }

    std::vector<std::string> path_components;
    StringUtil::Split(path, '/', &path_components, /* suppress_empty_components = */ true);

    std::string path_so_far;
    if (path[0] == '/')
        path_so_far += "/";
    for (const auto &path_component : path_components) {
        path_so_far += path_component;
        path_so_far += '/';
        errno = 0;
        if (::mkdir(path_so_far.c_str(), mode) == -1 and errno != EEXIST)
            return false;
        if (errno == EEXIST and not IsDirectory(path_so_far))
            return false;
    }

    errno = 0;
    return true;
}


bool GetFileNamesWithPrefix(const std::string &directory, const std::string &prefix, std::vector<std::string> * const filenames) {
    filenames->clear();

    DIR * const dir_handle(::opendir(directory.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        const std::string filename(entry->d_name);
        if (filename == "." or filename == ".." or not StringUtil::StartsWith(filename, prefix))
            continue;
        if (not IsDirectory(directory + "/" + filename))
            filenames->emplace_back(filename);
    }
    ::closedir(dir_handle);

    std::sort(filenames->begin(), filenames->end());
    return true;
}


bool DeleteFile(const std::string &path) {
    return ::unlink(path.c_str()) == 0;
}


bool RemoveDirectory(const std::string &dir_name) {
    DIR * const dir_handle(::opendir(dir_name.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    bool success(true);
    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;

        const std::string path(dir_name + "/" + std::string(entry->d_name));
        if (IsDirectory(path)) {
            if (unlikely(not RemoveDirectory(path)))
                success = false;
        } else if (unlikely(::unlink(path.c_str()) != 0))
            success = false;
    }
    ::closedir(dir_handle);

    return ::rmdir(dir_name.c_str()) == 0 and success;
}


} // namespace FileUtil
