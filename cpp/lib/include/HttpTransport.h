/** \file   HttpTransport.h
 *  \brief  The interface through which the link checker talks HTTP.
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


#include <string>
#include <utility>
#include <vector>


struct HttpRequest {
    enum Method { GET, HEAD };

    Method method_;
    std::string url_;
    std::vector<std::pair<std::string, std::string>> query_parameters_; // Will be appended to "url_", URL-encoded.
    std::vector<std::string> headers_;                                   // Complete header lines, e.g. "User-Agent: x".
    unsigned time_limit_;                                                // In ms.  0 means no limit.

public:
    HttpRequest(const Method method, const std::string &url, const std::vector<std::string> &headers = {},
                const unsigned time_limit = 0)
        : method_(method), url_(url), headers_(headers), time_limit_(time_limit) { }

    static std::string MethodToString(const Method method) { return method == GET ? "GET" : "HEAD"; }
};


struct HttpReply {
    int status_code_;
    std::string effective_url_; // The URL we ended up at after following all redirects.
    std::string body_;
    std::string retry_after_;   // The raw value of a "Retry-After" header, if there was one.
    std::string error_message_;

public:
    HttpReply(): status_code_(-1) { }
    void clear() { status_code_ = -1; effective_url_.clear(); body_.clear(); retry_after_.clear(); error_message_.clear(); }
};


class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /** \brief  Executes exactly one request.
     *  \return False if no HTTP response could be obtained, e.g. on timeouts, refused connections or malformed URL's.
     *          In that case "reply->error_message_" describes the problem.
     *  \note   Must be safe to call concurrently from multiple threads.  Never throws.
     */
    virtual bool perform(const HttpRequest &request, HttpReply * const reply) = 0;

    /** \brief Releases resources that are shared between requests.  Later requests reacquire them as needed. */
    virtual void close() { }
};
