/** \file   PolitenessFetcher.h
 *  \brief  An HTTP client that respects robots.txt, ignorelists and rate limits.
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


#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "HttpTransport.h"
#include "LinkCheckerUtil.h"
#include "ThreadUtil.h"
#include "util.h"


namespace LinkChecker {


// What a request produced.  A status code of -1 means that no usable response was obtained.
struct Response {
    std::string url_;
    int status_code_;
    std::string body_;

public:
    Response(const std::string &url, const int status_code, const std::string &body)
        : url_(url), status_code_(status_code), body_(body) { }

    static Response Sentinel(const std::string &url) { return Response(url, -1, ""); }
    inline bool isSentinel() const { return status_code_ == -1; }
};


typedef std::vector<std::pair<std::string, std::string>> QueryParameters;


/** \class  PolitenessFetcher
 *  \brief  Issues GET and HEAD requests while limiting the number of concurrent requests, honouring robots.txt and an
 *          ignorelist of domains and retrying with backoff when servers return unusable responses.
 *  \note   All public member functions are safe to call concurrently and never throw.  Every failure turns into a
 *          sentinel response.
 */
class PolitenessFetcher {
public:
    struct Params {
        std::vector<std::string> headers_;  // Complete header lines, e.g. "User-Agent: foo".
        unsigned max_concurrent_requests_;
        unsigned max_retries_;
        unsigned max_wait_;                 // Per request, in seconds.
        std::set<std::string> ignorelist_;  // Domains that will never be contacted.
        bool enforce_ignorelist_;
        bool enforce_robots_policy_;
        bool check_domains_only_;           // If true, a URL counts as accessible if its domain may be crawled.

    public:
        explicit Params(const std::vector<std::string> &headers = {}, const unsigned max_retries = DEFAULT_MAX_RETRIES,
                        const unsigned max_concurrent_requests = DEFAULT_MAX_CONCURRENT_REQUESTS,
                        const unsigned max_wait = DEFAULT_MAX_WAIT, const std::set<std::string> &ignorelist = {},
                        const bool enforce_ignorelist = true, const bool enforce_robots_policy = true,
                        const bool check_domains_only = false)
            : headers_(headers), max_concurrent_requests_(max_concurrent_requests), max_retries_(max_retries),
              max_wait_(max_wait), ignorelist_(ignorelist), enforce_ignorelist_(enforce_ignorelist),
              enforce_robots_policy_(enforce_robots_policy), check_domains_only_(check_domains_only) { }
    };

    static const unsigned DEFAULT_MAX_RETRIES = 2;
    static const unsigned DEFAULT_MAX_CONCURRENT_REQUESTS = 5;
    static const unsigned DEFAULT_MAX_WAIT = 60;
    static const unsigned MAX_BACKOFF = 60; // In seconds.
    static const unsigned MAX_RETRY_AFTER = 300; // In seconds.  Servers that ask for longer waits are not retried.

    // Status codes that end the retry loop.  Most of them do not mean that a resource is available!
    static const std::set<int> ACCEPTED_STATUS_CODES;

private:
    std::shared_ptr<HttpTransport> transport_;
    Logger * const logger_;
    mutable std::mutex params_mutex_;
    Params params_;
    std::shared_ptr<ThreadUtil::Semaphore> request_gate_;
    Util::SingleFlightMap<bool> redirect_policies_; // Domain => does it redirect elsewhere?
    Util::SingleFlightMap<bool> robots_policies_;   // Domain => may it be crawled?

public:
    PolitenessFetcher(const std::shared_ptr<HttpTransport> &transport, const Params &params = Params(),
                      Logger * const logger = ::logger);

    inline Response get(const std::string &url, const QueryParameters &query_parameters = {}) {
        return request("GET", url, query_parameters);
    }
    inline Response head(const std::string &url, const QueryParameters &query_parameters = {}) {
        return request("HEAD", url, query_parameters);
    }

    /** \brief  Checks whether "url" may be accessed and, if so, sends the request.
     *  \param  method  Must be "GET" or "HEAD".
     */
    Response request(const std::string &method, const std::string &url, const QueryParameters &query_parameters = {});

    /** \brief Releases connections and other resources shared between requests. */
    void close() { transport_->close(); }

    Params getParams() const;
    void setUserAgent(const std::string &user_agent);
    void setHeader(const std::string &name, const std::string &value);
    void setIgnorelist(const std::set<std::string> &ignorelist);
    void setCheckDomainsOnly(const bool check_domains_only);
    void setMaxRetries(const unsigned max_retries);
    void setMaxWait(const unsigned max_wait);

    /** \note Requests that are already waiting for or holding a slot are not affected. */
    void setMaxConcurrentRequests(const unsigned max_concurrent_requests);

    /** \brief  Determines how long to wait before the next attempt.
     *  \param  retry_after  The value of a "Retry-After" header, either an HTTP date or a number of seconds, or empty.
     *  \param  attempt      The number of attempts that have been made so far.
     *  \return The delay in seconds.  Only the exponential backoff is capped, a "Retry-After" value is returned as is.
     */
    static double GetBackoff(const std::string &retry_after, const unsigned attempt);

private:
    // Sends a request, retrying if "allow_retries" is true.
    Response send(const HttpRequest::Method method, const std::string &url, const QueryParameters &query_parameters,
                  const bool allow_retries);

    // Returns the URL that "url" ends up at after following redirects.
    std::string resolveRedirect(const std::string &url);

    // Fetches and evaluates the robots.txt file of "domain" at most once per domain.
    bool robotsAllowAccess(const std::string &domain, const std::string &url);
    bool fetchRobotsPolicy(const std::string &domain, const std::string &url);

    bool canAccess(const std::string &method, const std::string &url, const Params &params, bool * const robots_allowed);
};


} // namespace LinkChecker
