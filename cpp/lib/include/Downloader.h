/** \file    Downloader.h
 *  \brief   An HttpTransport that is implemented on top of libcurl.
 */

/*
 *  Copyright 2008 Project iVia.
 *  Copyright 2008 The Regents of The University of California.
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
#pragma once


#include <mutex>
#include <string>
#include <curl/curl.h>
#include "HttpTransport.h"


/** \class  Downloader
 *  \brief  Executes HTTP GET and HEAD requests with libcurl.
 *  \note   Every request uses its own easy handle.  All requests of one Downloader share DNS lookups, cookies, TLS
 *          sessions and the connection pool through a single share handle that is created when it is first needed and
 *          released by close().
 */
class Downloader : public HttpTransport {
    std::mutex share_handle_mutex_;
    CURLSH *share_handle_;
    std::mutex share_mutexes_[CURL_LOCK_DATA_LAST];
public:
    static const long DEFAULT_MAX_REDIRECTS = 10;
    static const long DEFAULT_DNS_CACHE_TIMEOUT = 60; // In s
public:
    Downloader();
    virtual ~Downloader();

    bool perform(const HttpRequest &request, HttpReply * const reply) override;
    void close() override;

    Downloader(const Downloader &) = delete;
    const Downloader &operator=(const Downloader &) = delete;
private:
    CURLSH *getShareHandle();
    static std::string BuildUrl(CURL * const easy_handle, const HttpRequest &request);
    static size_t WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    static size_t HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    static void LockFunction(CURL *handle, curl_lock_data data, curl_lock_access access, void *this_pointer);
    static void UnlockFunction(CURL *handle, curl_lock_data data, void *this_pointer);
};
