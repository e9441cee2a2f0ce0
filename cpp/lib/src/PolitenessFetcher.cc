/** \file   PolitenessFetcher.cc
 *  \brief  Implementation of class PolitenessFetcher.
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
#include "PolitenessFetcher.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <strings.h>
#include "Random.h"
#include "RobotsDotTxt.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "UrlUtil.h"


namespace LinkChecker {


const unsigned PolitenessFetcher::DEFAULT_MAX_RETRIES;
const unsigned PolitenessFetcher::DEFAULT_MAX_CONCURRENT_REQUESTS;
const unsigned PolitenessFetcher::DEFAULT_MAX_WAIT;
const unsigned PolitenessFetcher::MAX_BACKOFF;
const std::set<int> PolitenessFetcher::ACCEPTED_STATUS_CODES{ 200, 202, 400, 401, 403, 404, 410, 429, 451, 503 };


PolitenessFetcher::PolitenessFetcher(const std::shared_ptr<HttpTransport> &transport, const Params &params, Logger * const logger)
    : transport_(transport), logger_(logger), params_(params)
{
    if (unlikely(transport_ == nullptr))
        throw std::runtime_error("in LinkChecker::PolitenessFetcher::PolitenessFetcher: missing transport!");
    if (params_.max_concurrent_requests_ == 0)
        params_.max_concurrent_requests_ = 1;
    request_gate_.reset(new ThreadUtil::Semaphore(params_.max_concurrent_requests_));

    LOG_DEBUG_TO(logger_, "max. retries: " + std::to_string(params_.max_retries_) + ", max. concurrent requests: "
                          + std::to_string(params_.max_concurrent_requests_) + ", max. wait: " + std::to_string(params_.max_wait_)
                          + "s, ignorelist: " + StringUtil::Join(params_.ignorelist_, ",") + ", enforce ignorelist: "
                          + (params_.enforce_ignorelist_ ? "true" : "false") + ", enforce robots policy: "
                          + (params_.enforce_robots_policy_ ? "true" : "false") + ", check domains only: "
                          + (params_.check_domains_only_ ? "true" : "false"));
}


PolitenessFetcher::Params PolitenessFetcher::getParams() const {
    std::lock_guard<std::mutex> params_locker(params_mutex_);
    return params_;
}


void PolitenessFetcher::setUserAgent(const std::string &user_agent) {
    setHeader("User-Agent", user_agent);
}


void PolitenessFetcher::setHeader(const std::string &name, const std::string &value) {
    const std::string new_header(name + ": " + value);
    const std::string prefix(name + ":");

    std::lock_guard<std::mutex> params_locker(params_mutex_);
    for (auto &header : params_.headers_) {
        if (::strncasecmp(header.c_str(), prefix.c_str(), prefix.length()) == 0) {
            header = new_header;
            return;
        }
    }
    params_.headers_.emplace_back(new_header);
}


void PolitenessFetcher::setIgnorelist(const std::set<std::string> &ignorelist) {
    std::lock_guard<std::mutex> params_locker(params_mutex_);
    params_.ignorelist_ = ignorelist;
}


void PolitenessFetcher::setCheckDomainsOnly(const bool check_domains_only) {
    std::lock_guard<std::mutex> params_locker(params_mutex_);
    params_.check_domains_only_ = check_domains_only;
}


void PolitenessFetcher::setMaxRetries(const unsigned max_retries) {
    std::lock_guard<std::mutex> params_locker(params_mutex_);
    params_.max_retries_ = max_retries;
}


void PolitenessFetcher::setMaxWait(const unsigned max_wait) {
    std::lock_guard<std::mutex> params_locker(params_mutex_);
    params_.max_wait_ = max_wait;
}


void PolitenessFetcher::setMaxConcurrentRequests(const unsigned max_concurrent_requests) {
    std::lock_guard<std::mutex> params_locker(params_mutex_);
    params_.max_concurrent_requests_ = std::max(max_concurrent_requests, 1u);
    request_gate_.reset(new ThreadUtil::Semaphore(params_.max_concurrent_requests_));
}


double PolitenessFetcher::GetBackoff(const std::string &retry_after, const unsigned attempt) {
    const Random::Uniform jitter(0.0, 1.0);

    if (not retry_after.empty()) {
        time_t retry_time;
        if (TimeUtil::ParseRFC1123DateTime(retry_after, &retry_time))
            return std::max(0.0, std::difftime(retry_time, std::time(nullptr)));

        unsigned seconds;
        if (StringUtil::ToUnsigned(retry_after, &seconds))
            return seconds + jitter();
    }

    return std::min(std::pow(2.0, attempt) + jitter(), static_cast<double>(MAX_BACKOFF));
}


Response PolitenessFetcher::send(const HttpRequest::Method method, const std::string &url, const QueryParameters &query_parameters,
                                 const bool allow_retries)
{
    const std::string method_name(HttpRequest::MethodToString(method));
    std::shared_ptr<ThreadUtil::Semaphore> request_gate;
    Params params;
    {
        std::lock_guard<std::mutex> params_locker(params_mutex_);
        request_gate = request_gate_;
        params = params_;
    }

    HttpRequest request(method, url, params.headers_, params.max_wait_ * 1000);
    request.query_parameters_ = query_parameters;

    const unsigned max_attempts(allow_retries ? params.max_retries_ + 1 : 1);
    Response response(Response::Sentinel(url));
    unsigned attempt(1);
    for (/* Intentionally empty! */; attempt <= max_attempts; ++attempt) {
        LOG_DEBUG_TO(logger_, "sending HTTP " + method_name + " request to URL \"" + url + "\" (attempt " + std::to_string(attempt) + ").");

        HttpReply reply;
        bool success;
        {
            const ThreadUtil::SemaphoreLocker request_slot(request_gate);
            success = transport_->perform(request, &reply);
        }

        if (success) {
            response = Response(reply.effective_url_.empty() ? url : reply.effective_url_, reply.status_code_,
                                method == HttpRequest::HEAD ? "" : reply.body_);
            LOG_DEBUG_TO(logger_, "received status " + std::to_string(reply.status_code_) + " from URL \"" + url + "\".");
        } else {
            LOG_WARNING_TO(logger_, "Failed to send HTTP " + method_name + " request to URL \"" + url + "\" - " + reply.error_message_);
            response = Response::Sentinel(url);
        }

        const bool has_accepted_status_code(ACCEPTED_STATUS_CODES.find(response.status_code_) != ACCEPTED_STATUS_CODES.cend());
        if (has_accepted_status_code and (method == HttpRequest::HEAD or not response.body_.empty()))
            return response;
        if (attempt == max_attempts)
            break;

        const double backoff(GetBackoff(reply.retry_after_, attempt));
        if (backoff > MAX_RETRY_AFTER) {
            LOG_WARNING_TO(logger_, "not retrying URL \"" + url + "\" - Server asked for a wait of " + StringUtil::ToString(backoff, 0)
                                    + "s.");
            break;
        }
        LOG_DEBUG_TO(logger_, "waiting " + StringUtil::ToString(backoff, 2) + "s before retrying URL \"" + url + "\".");
        TimeUtil::Millisleep(static_cast<uint64_t>(backoff * 1000.0));
    }

    if (not allow_retries)
        return response;

    // Once the retries are used up, an empty body no longer disqualifies a response.
    if (ACCEPTED_STATUS_CODES.find(response.status_code_) != ACCEPTED_STATUS_CODES.cend())
        return response;

    LOG_WARNING_TO(logger_, "Failed to send HTTP " + method_name + " request to URL \"" + url
                            + "\" - Server returned invalid response after " + std::to_string(attempt - 1) + " retries.");
    return Response::Sentinel(url);
}


std::string PolitenessFetcher::resolveRedirect(const std::string &url) {
    const std::string domain(UrlUtil::GetDomain(url));

    // Persistent identifiers often claim to be the final destination even though they forward elsewhere, so we
    // ask the server where we actually end up.
    bool redirects;
    if (redirect_policies_.lookup(domain, &redirects) and not redirects)
        return url;

    const Response response(send(HttpRequest::HEAD, url, {}, /* allow_retries = */ false));
    const std::string target((response.isSentinel() or response.url_.empty()) ? url : response.url_);
    redirect_policies_.insertIfAbsent(domain, target != url);

    return target;
}


bool PolitenessFetcher::fetchRobotsPolicy(const std::string &domain, const std::string &url) {
    // If we can't find a robots.txt file we assume that we may crawl.
    bool allowed(true);

    if (domain.empty())
        LOG_WARNING_TO(logger_, "Failed to find robots.txt file for URL \"" + url + "\" - URL is missing components.");
    else {
        const Response response(send(HttpRequest::GET, UrlUtil::GetRobotsDotTxtUrl(domain), {}, /* allow_retries = */ false));
        if (response.isSentinel())
            LOG_WARNING_TO(logger_, "Failed to find robots.txt file for URL \"" + url + "\" - No file found.");
        else if (response.status_code_ == 200)
            allowed = RobotsDotTxt(response.body_).accessAllowed("*", UrlUtil::GetPath(url));
        else if (response.status_code_ >= 400 and response.status_code_ <= 499)
            allowed = false;
    }

    LOG_DEBUG_TO(logger_, "Recorded robots.txt check value of " + std::string(allowed ? "true" : "false") + " for domain \""
                          + domain + "\".");
    return allowed;
}


bool PolitenessFetcher::robotsAllowAccess(const std::string &domain, const std::string &url) {
    return robots_policies_.get(domain, [this, &domain, &url]() { return fetchRobotsPolicy(domain, url); });
}


bool PolitenessFetcher::canAccess(const std::string &method, const std::string &url, const Params &params, bool * const robots_allowed) {
    *robots_allowed = true;
    if (not params.enforce_ignorelist_ and not params.enforce_robots_policy_)
        return true;

    // Ignored domains must not even see the redirect probe.
    const std::string original_domain(UrlUtil::GetDomain(url));
    if (params.enforce_ignorelist_ and params.ignorelist_.find(original_domain) != params.ignorelist_.cend()) {
        LOG_WARNING_TO(logger_, "Failed to send HTTP " + method + " request to URL \"" + url + "\" - Domain was in ignorelist.");
        return false;
    }

    const std::string target(resolveRedirect(url));
    const std::string domain(UrlUtil::GetDomain(target));
    LOG_DEBUG_TO(logger_, "Resolved URL \"" + url + "\" to URL \"" + target + "\" under domain \"" + domain + "\".");

    if (params.enforce_ignorelist_ and params.ignorelist_.find(domain) != params.ignorelist_.cend()) {
        LOG_WARNING_TO(logger_, "Failed to send HTTP " + method + " request to URL \"" + url + "\" - Domain was in ignorelist.");
        return false;
    }

    if (params.enforce_robots_policy_) {
        *robots_allowed = robotsAllowAccess(domain, url);
        if (not *robots_allowed) {
            LOG_WARNING_TO(logger_, "Failed to send HTTP " + method + " request to URL \"" + url
                                    + "\" - URL domain does not allow crawling.");
            return false;
        }
    }

    return true;
}


Response PolitenessFetcher::request(const std::string &method, const std::string &url, const QueryParameters &query_parameters) {
    if (method != "GET" and method != "HEAD") {
        LOG_WARNING_TO(logger_, "Failed to send HTTP " + method + " request to URL \"" + url + "\" - Method was not of type GET or HEAD.");
        return Response::Sentinel(url);
    }

    try {
        const Params params(getParams());
        bool robots_allowed;
        if (not canAccess(method, url, params, &robots_allowed))
            return Response::Sentinel(url);

        if (params.check_domains_only_)
            return robots_allowed ? Response(url, 200, "") : Response::Sentinel(url);

        return send(method == "GET" ? HttpRequest::GET : HttpRequest::HEAD, url, query_parameters, /* allow_retries = */ true);
    } catch (const std::exception &x) {
        LOG_WARNING_TO(logger_, "Failed to send HTTP " + method + " request to URL \"" + url + "\" - " + std::string(x.what()));
        return Response::Sentinel(url);
    }
}


} // namespace LinkChecker
