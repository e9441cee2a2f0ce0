/** \file   ScriptedHttpTransport.h
 *  \brief  An in-memory HttpTransport for tests.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "HttpTransport.h"
#include "StringUtil.h"


// Answers requests by calling a handler instead of talking to the network and remembers every request.
class ScriptedHttpTransport : public HttpTransport {
public:
    // Returns false to simulate a transport-level failure.
    typedef std::function<bool(const HttpRequest &request, HttpReply * const reply)> Handler;
private:
    const Handler handler_;
    mutable std::mutex mutex_;
    std::vector<HttpRequest> requests_;
    unsigned close_count_;
public:
    explicit ScriptedHttpTransport(const Handler &handler): handler_(handler), close_count_(0) { }

    bool perform(const HttpRequest &request, HttpReply * const reply) override {
        {
            std::lock_guard<std::mutex> mutex_locker(mutex_);
            requests_.emplace_back(request);
        }

        reply->clear();
        return handler_(request, reply);
    }

    void close() override {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        ++close_count_;
    }

    std::vector<HttpRequest> getRequests() const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        return requests_;
    }

    unsigned countRequests(const std::string &url) const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        unsigned count(0);
        for (const auto &request : requests_) {
            if (request.url_ == url)
                ++count;
        }
        return count;
    }

    unsigned countRequests(const HttpRequest::Method method, const std::string &url) const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        unsigned count(0);
        for (const auto &request : requests_) {
            if (request.method_ == method and request.url_ == url)
                ++count;
        }
        return count;
    }

    unsigned countRobotsDotTxtRequests() const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        unsigned count(0);
        for (const auto &request : requests_) {
            if (StringUtil::EndsWith(request.url_, "/robots.txt"))
                ++count;
        }
        return count;
    }

    unsigned getCloseCount() const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        return close_count_;
    }

    static bool Reply(HttpReply * const reply, const int status_code, const std::string &body = "",
                      const std::string &retry_after = "")
    {
        reply->status_code_ = status_code;
        reply->body_ = body;
        reply->retry_after_ = retry_after;
        return true;
    }

    static bool IsRobotsDotTxtRequest(const HttpRequest &request) { return StringUtil::EndsWith(request.url_, "/robots.txt"); }
};
