/** \file    Downloader.cc
 *  \brief   Implementation of class Downloader.
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

#include "Downloader.h"
#include <memory>
#include <cstring>
#include <strings.h>
#include "StringUtil.h"
#include "util.h"


namespace {


// Calls curl_global_init() before the first Downloader gets constructed.
class CurlGlobalInitialiser {
public:
    CurlGlobalInitialiser() {
        if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK))
            throw std::runtime_error("in CurlGlobalInitialiser: curl_global_init() failed!");
    }
    ~CurlGlobalInitialiser() { ::curl_global_cleanup(); }
};


void InitCurlOnce() {
    static CurlGlobalInitialiser initialiser;
}


struct EasyHandleDeleter {
    void operator()(CURL * const easy_handle) const { ::curl_easy_cleanup(easy_handle); }
};


struct HeaderListDeleter {
    void operator()(curl_slist * const header_list) const { ::curl_slist_free_all(header_list); }
};


template <typename OptionType> bool CurlEasySetopt(CURL * const easy_handle, const CURLoption option, OptionType value,
                                                   const std::string &caller_info, HttpReply * const reply)
{
    const CURLcode curl_error_code(::curl_easy_setopt(easy_handle, option, value));
    if (likely(curl_error_code == CURLE_OK))
        return true;

    reply->error_message_ = "curl_easy_setopt(" + caller_info + ") failed: " + ::curl_easy_strerror(curl_error_code);
    return false;
}


} // unnamed namespace


Downloader::Downloader(): share_handle_(nullptr) {
    InitCurlOnce();
}


Downloader::~Downloader() {
    close();
}


void Downloader::close() {
    std::lock_guard<std::mutex> mutex_locker(share_handle_mutex_);
    if (share_handle_ == nullptr)
        return;

    const CURLSHcode share_error_code(::curl_share_cleanup(share_handle_));
    if (unlikely(share_error_code != CURLSHE_OK))
        LOG_WARNING("curl_share_cleanup() failed: " + std::string(::curl_share_strerror(share_error_code)));
    share_handle_ = nullptr;
}


CURLSH *Downloader::getShareHandle() {
    std::lock_guard<std::mutex> mutex_locker(share_handle_mutex_);
    if (share_handle_ != nullptr)
        return share_handle_;

    share_handle_ = ::curl_share_init();
    if (unlikely(share_handle_ == nullptr)) {
        LOG_WARNING("curl_share_init() failed!");
        return nullptr;
    }

    ::curl_share_setopt(share_handle_, CURLSHOPT_USERDATA, reinterpret_cast<void *>(this));
    ::curl_share_setopt(share_handle_, CURLSHOPT_LOCKFUNC, LockFunction);
    ::curl_share_setopt(share_handle_, CURLSHOPT_UNLOCKFUNC, UnlockFunction);
    for (const auto lock_data : { CURL_LOCK_DATA_DNS, CURL_LOCK_DATA_COOKIE, CURL_LOCK_DATA_SSL_SESSION, CURL_LOCK_DATA_CONNECT }) {
        if (unlikely(::curl_share_setopt(share_handle_, CURLSHOPT_SHARE, lock_data) != CURLSHE_OK))
            LOG_WARNING("failed to share lock data type " + std::to_string(lock_data) + "!");
    }

    return share_handle_;
}


std::string Downloader::BuildUrl(CURL * const easy_handle, const HttpRequest &request) {
    if (request.query_parameters_.empty())
        return request.url_;

    std::string url(request.url_);
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    bool first(true);
    for (const auto &name_and_value : request.query_parameters_) {
        if (not first)
            url += '&';
        first = false;

        char * const escaped_name(::curl_easy_escape(easy_handle, name_and_value.first.c_str(),
                                                     static_cast<int>(name_and_value.first.length())));
        char * const escaped_value(::curl_easy_escape(easy_handle, name_and_value.second.c_str(),
                                                      static_cast<int>(name_and_value.second.length())));
        if (escaped_name != nullptr and escaped_value != nullptr)
            url += std::string(escaped_name) + "=" + std::string(escaped_value);
        ::curl_free(escaped_name);
        ::curl_free(escaped_value);
    }

    return url;
}


bool Downloader::perform(const HttpRequest &request, HttpReply * const reply) {
    reply->clear();

    std::unique_ptr<CURL, EasyHandleDeleter> easy_handle(::curl_easy_init());
    if (unlikely(easy_handle == nullptr)) {
        reply->error_message_ = "curl_easy_init() failed!";
        return false;
    }

    CURLSH * const share_handle(getShareHandle());
    if (share_handle != nullptr and not CurlEasySetopt(easy_handle.get(), CURLOPT_SHARE, share_handle, "CURLOPT_SHARE", reply))
        return false;

    std::unique_ptr<curl_slist, HeaderListDeleter> header_list;
    for (const auto &header : request.headers_) {
        curl_slist * const new_list(::curl_slist_append(header_list.get(), header.c_str()));
        if (unlikely(new_list == nullptr)) {
            reply->error_message_ = "curl_slist_append() failed!";
            return false;
        }
        header_list.release();
        header_list.reset(new_list);
    }

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';
    const std::string url(BuildUrl(easy_handle.get(), request));
    CURL * const handle(easy_handle.get());
    if (not CurlEasySetopt(handle, CURLOPT_URL, url.c_str(), "CURLOPT_URL", reply)
        or not CurlEasySetopt(handle, CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL", reply)
        or not CurlEasySetopt(handle, CURLOPT_NOPROGRESS, 1L, "CURLOPT_NOPROGRESS", reply)
        or not CurlEasySetopt(handle, CURLOPT_ERRORBUFFER, error_buffer, "CURLOPT_ERRORBUFFER", reply)
        or not CurlEasySetopt(handle, CURLOPT_FOLLOWLOCATION, 1L, "CURLOPT_FOLLOWLOCATION", reply)
        or not CurlEasySetopt(handle, CURLOPT_MAXREDIRS, DEFAULT_MAX_REDIRECTS, "CURLOPT_MAXREDIRS", reply)
        or not CurlEasySetopt(handle, CURLOPT_AUTOREFERER, 1L, "CURLOPT_AUTOREFERER", reply)
        or not CurlEasySetopt(handle, CURLOPT_DNS_CACHE_TIMEOUT, DEFAULT_DNS_CACHE_TIMEOUT, "CURLOPT_DNS_CACHE_TIMEOUT", reply)
        or not CurlEasySetopt(handle, CURLOPT_COOKIEFILE, "", "CURLOPT_COOKIEFILE", reply)
        or not CurlEasySetopt(handle, CURLOPT_ACCEPT_ENCODING, "", "CURLOPT_ACCEPT_ENCODING", reply)
        or not CurlEasySetopt(handle, CURLOPT_WRITEFUNCTION, WriteFunction, "CURLOPT_WRITEFUNCTION", reply)
        or not CurlEasySetopt(handle, CURLOPT_WRITEDATA, reinterpret_cast<void *>(reply), "CURLOPT_WRITEDATA", reply)
        or not CurlEasySetopt(handle, CURLOPT_HEADERFUNCTION, HeaderFunction, "CURLOPT_HEADERFUNCTION", reply)
        or not CurlEasySetopt(handle, CURLOPT_HEADERDATA, reinterpret_cast<void *>(reply), "CURLOPT_HEADERDATA", reply)
        or not CurlEasySetopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.time_limit_), "CURLOPT_TIMEOUT_MS", reply))
        return false;

    if (header_list != nullptr and not CurlEasySetopt(handle, CURLOPT_HTTPHEADER, header_list.get(), "CURLOPT_HTTPHEADER", reply))
        return false;

    if (request.method_ == HttpRequest::HEAD) {
        if (not CurlEasySetopt(handle, CURLOPT_NOBODY, 1L, "CURLOPT_NOBODY", reply))
            return false;
    } else if (not CurlEasySetopt(handle, CURLOPT_HTTPGET, 1L, "CURLOPT_HTTPGET", reply))
        return false;

    const CURLcode curl_error_code(::curl_easy_perform(handle));
    if (curl_error_code != CURLE_OK) {
        reply->error_message_ = (error_buffer[0] != '\0') ? std::string(error_buffer) : std::string(::curl_easy_strerror(curl_error_code));
        return false;
    }

    long response_code;
    if (unlikely(::curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response_code) != CURLE_OK)) {
        reply->error_message_ = "failed to retrieve the response code!";
        return false;
    }
    reply->status_code_ = static_cast<int>(response_code);

    char *effective_url(nullptr);
    if (::curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK and effective_url != nullptr)
        reply->effective_url_ = effective_url;
    else
        reply->effective_url_ = url;

    return true;
}


size_t Downloader::WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    HttpReply * const reply(reinterpret_cast<HttpReply *>(this_pointer));
    const size_t total_size(size * nmemb);
    reply->body_.append(reinterpret_cast<char *>(data), total_size);
    return total_size;
}


size_t Downloader::HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    HttpReply * const reply(reinterpret_cast<HttpReply *>(this_pointer));
    const size_t total_size(size * nmemb);
    const std::string header_line(reinterpret_cast<char *>(data), total_size);

    // A new status line means we're following a redirect and headers of earlier responses no longer apply.
    if (StringUtil::StartsWith(header_line, "HTTP/")) {
        reply->retry_after_.clear();
        return total_size;
    }

    static const std::string RETRY_AFTER("Retry-After:");
    if (::strncasecmp(header_line.c_str(), RETRY_AFTER.c_str(), RETRY_AFTER.length()) == 0)
        reply->retry_after_ = StringUtil::TrimWhite(header_line.substr(RETRY_AFTER.length()));

    return total_size;
}


void Downloader::LockFunction(CURL * /* handle */, curl_lock_data data, curl_lock_access /* access */, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    downloader->share_mutexes_[data].lock();
}


void Downloader::UnlockFunction(CURL * /* handle */, curl_lock_data data, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    downloader->share_mutexes_[data].unlock();
}
