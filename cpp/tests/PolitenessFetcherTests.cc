/** \file   PolitenessFetcherTests.cc
 *  \brief  Tests for LinkChecker::PolitenessFetcher.
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
#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include "PolitenessFetcher.h"
#include "ScriptedHttpTransport.h"
#include "TimeUtil.h"
#include "UnitTest.h"


namespace {


// Neither the ignorelist nor robots.txt are consulted, so only the request itself reaches the transport.
LinkChecker::PolitenessFetcher::Params UnrestrictedParams(const unsigned max_retries) {
    return LinkChecker::PolitenessFetcher::Params({}, max_retries, /* max_concurrent_requests = */ 5, /* max_wait = */ 5,
                                                  /* ignorelist = */ {}, /* enforce_ignorelist = */ false,
                                                  /* enforce_robots_policy = */ false);
}


LinkChecker::PolitenessFetcher::Params PoliteParams(const std::set<std::string> &ignorelist = {}, const bool check_domains_only = false) {
    return LinkChecker::PolitenessFetcher::Params({}, /* max_retries = */ 0, /* max_concurrent_requests = */ 5, /* max_wait = */ 5,
                                                  ignorelist, /* enforce_ignorelist = */ true, /* enforce_robots_policy = */ true,
                                                  check_domains_only);
}


} // unnamed namespace


TEST(RobotsDotTxtIsFetchedOncePerDomain) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &request, HttpReply * const reply) {
        if (request.url_ == "https://slow.example/robots.txt") {
            TimeUtil::Millisleep(200);
            return ScriptedHttpTransport::Reply(reply, 200, "User-agent: *\nDisallow: /private/\n");
        }
        if (request.url_ == "https://strict.example/robots.txt")
            return ScriptedHttpTransport::Reply(reply, 403, "Forbidden");
        return ScriptedHttpTransport::Reply(reply, 200);
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, PoliteParams());

    const unsigned REQUEST_COUNT(10);
    std::vector<int> slow_status_codes(REQUEST_COUNT), strict_status_codes(REQUEST_COUNT);
    std::vector<std::thread> threads;
    for (unsigned i(0); i < REQUEST_COUNT; ++i) {
        threads.emplace_back([&fetcher, &slow_status_codes, &strict_status_codes, i]() {
            slow_status_codes[i] = fetcher.head("https://slow.example/public/" + std::to_string(i)).status_code_;
            strict_status_codes[i] = fetcher.head("https://strict.example/page/" + std::to_string(i)).status_code_;
        });
    }
    for (auto &thread : threads)
        thread.join();

    CHECK_EQ(transport->countRequests("https://slow.example/robots.txt"), 1u);
    CHECK_EQ(transport->countRequests("https://strict.example/robots.txt"), 1u);
    for (unsigned i(0); i < REQUEST_COUNT; ++i) {
        CHECK_EQ(slow_status_codes[i], 200);
        CHECK_EQ(strict_status_codes[i], -1);
        // At most the redirect lookup, never the request itself.
        CHECK_LE(transport->countRequests(HttpRequest::HEAD, "https://strict.example/page/" + std::to_string(i)), 1u);
    }
}


TEST(RetriesEndInTheSentinel) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        return ScriptedHttpTransport::Reply(reply, 500, "Internal Server Error", /* retry_after = */ "0");
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(/* max_retries = */ 2));

    const LinkChecker::Response response(fetcher.get("https://broken.example/"));
    CHECK_TRUE(response.isSentinel());
    CHECK_EQ(response.url_, "https://broken.example/");
    CHECK_EQ(response.body_, "");
    CHECK_EQ(transport->countRequests(HttpRequest::GET, "https://broken.example/"), 3u);
}


TEST(RetryAfterIsHonoured) {
    std::mutex mutex;
    std::vector<uint64_t> attempt_times;
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([&mutex, &attempt_times](const HttpRequest &,
                                                                                                             HttpReply * const reply) {
        std::lock_guard<std::mutex> mutex_locker(mutex);
        attempt_times.emplace_back(TimeUtil::GetCurrentTimeInMilliseconds());
        if (attempt_times.size() == 1)
            return ScriptedHttpTransport::Reply(reply, 500, "", /* retry_after = */ "2");
        return ScriptedHttpTransport::Reply(reply, 200, "Welcome back!");
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(/* max_retries = */ 1));

    const LinkChecker::Response response(fetcher.get("https://busy.example/"));
    CHECK_EQ(response.status_code_, 200);
    CHECK_EQ(response.body_, "Welcome back!");
    CHECK_EQ(attempt_times.size(), 2u);
    if (attempt_times.size() == 2)
        CHECK_GE(attempt_times[1] - attempt_times[0], 2000u);
}


TEST(ExcessiveRetryAfterEndsTheRetries) {
    const std::vector<std::string> retry_after_values{ "4294968", "Fri, 01 Jan 2100 00:00:00 GMT" };
    for (const auto &retry_after : retry_after_values) {
        const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([&retry_after](const HttpRequest &,
                                                                                                        HttpReply * const reply) {
            return ScriptedHttpTransport::Reply(reply, 500, "", retry_after);
        }));
        LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(/* max_retries = */ 2));

        const uint64_t start_time(TimeUtil::GetCurrentTimeInMilliseconds());
        const LinkChecker::Response response(fetcher.get("https://overloaded.example/"));
        CHECK_TRUE(response.isSentinel());
        CHECK_EQ(transport->getRequests().size(), 1u);
        CHECK_LT(TimeUtil::GetCurrentTimeInMilliseconds() - start_time, 5000u);
    }

    // Even a long wait is reported as requested rather than wrapped around.
    CHECK_GE(LinkChecker::PolitenessFetcher::GetBackoff("4294968", 1), 4294968.0);
    CHECK_GT(LinkChecker::PolitenessFetcher::GetBackoff("Fri, 01 Jan 2100 00:00:00 GMT", 1), 1.0e9);
}


TEST(AcceptedStatusCodesEndTheRetries) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        return ScriptedHttpTransport::Reply(reply, 404);
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(/* max_retries = */ 2));

    CHECK_EQ(fetcher.head("https://gone.example/x").status_code_, 404);
    CHECK_EQ(transport->getRequests().size(), 1u);
}


TEST(EmptyBodiesAreAcceptedOnceRetriesAreUsedUp) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        return ScriptedHttpTransport::Reply(reply, 200, "", /* retry_after = */ "0");
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(/* max_retries = */ 1));

    const LinkChecker::Response response(fetcher.get("https://empty.example/"));
    CHECK_EQ(response.status_code_, 200);
    CHECK_EQ(transport->getRequests().size(), 2u);
}


TEST(TransportFailuresYieldTheSentinel) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        reply->error_message_ = "Connection refused";
        return false;
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(/* max_retries = */ 0));

    CHECK_TRUE(fetcher.head("https://down.example/").isSentinel());
    CHECK_EQ(transport->getRequests().size(), 1u);
}


TEST(IgnoredDomainsAreNeverContacted) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        return ScriptedHttpTransport::Reply(reply, 200, "ok");
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, PoliteParams({ "ignored.example" }));

    CHECK_TRUE(fetcher.head("https://www.ignored.example/x").isSentinel());
    CHECK_TRUE(fetcher.get("https://ignored.example/").isSentinel());
    CHECK_TRUE(transport->getRequests().empty());

    fetcher.setIgnorelist({});
    CHECK_EQ(fetcher.head("https://www.ignored.example/x").status_code_, 200);
}


TEST(RedirectsIntoIgnoredDomainsAreBlocked) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &request, HttpReply * const reply) {
        if (request.url_ == "https://short.example/abc")
            reply->effective_url_ = "https://www.ignored.example/target";
        return ScriptedHttpTransport::Reply(reply, 200);
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, PoliteParams({ "ignored.example" }));

    CHECK_TRUE(fetcher.head("https://short.example/abc").isSentinel());
    CHECK_EQ(transport->getRequests().size(), 1u); // The redirect lookup.
    CHECK_EQ(transport->countRobotsDotTxtRequests(), 0u);
}


TEST(RobotsPolicyIsEvaluatedForTheRedirectTarget) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &request, HttpReply * const reply) {
        if (request.url_ == "https://doi.example/10.1234/5678")
            reply->effective_url_ = "https://publisher.example/articles/5678";
        if (request.url_ == "https://publisher.example/robots.txt")
            return ScriptedHttpTransport::Reply(reply, 200, "User-agent: *\nDisallow:\n");
        return ScriptedHttpTransport::Reply(reply, 200);
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, PoliteParams());

    const LinkChecker::Response response(fetcher.head("https://doi.example/10.1234/5678"));
    CHECK_EQ(response.status_code_, 200);
    CHECK_EQ(response.url_, "https://publisher.example/articles/5678");
    CHECK_EQ(transport->countRequests("https://publisher.example/robots.txt"), 1u);
    CHECK_EQ(transport->countRequests("https://doi.example/robots.txt"), 0u);
}


TEST(RobotsClientErrorsDenyAccess) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &request, HttpReply * const reply) {
        if (request.url_ == "https://missing-robots.example/robots.txt")
            return ScriptedHttpTransport::Reply(reply, 404);
        if (request.url_ == "https://flaky-robots.example/robots.txt")
            return ScriptedHttpTransport::Reply(reply, 500);
        if (request.url_ == "https://private.example/robots.txt")
            return ScriptedHttpTransport::Reply(reply, 200, "User-agent: *\nDisallow: /private/\n");
        return ScriptedHttpTransport::Reply(reply, 200);
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, PoliteParams());

    CHECK_TRUE(fetcher.head("https://missing-robots.example/page").isSentinel());
    CHECK_EQ(fetcher.head("https://flaky-robots.example/page").status_code_, 200);
    CHECK_TRUE(fetcher.head("https://private.example/private/page").isSentinel());
}


TEST(DomainOnlyModeSkipsTheRequest) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &request, HttpReply * const reply) {
        if (request.url_ == "https://closed.example/robots.txt")
            return ScriptedHttpTransport::Reply(reply, 200, "User-agent: *\nDisallow: /\n");
        if (ScriptedHttpTransport::IsRobotsDotTxtRequest(request))
            return ScriptedHttpTransport::Reply(reply, 200, "");
        return ScriptedHttpTransport::Reply(reply, 404);
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, PoliteParams({}, /* check_domains_only = */ true));

    const LinkChecker::Response response(fetcher.head("https://open.example/gone"));
    CHECK_EQ(response.status_code_, 200);
    CHECK_EQ(response.url_, "https://open.example/gone");
    CHECK_EQ(transport->countRequests(HttpRequest::HEAD, "https://open.example/gone"), 1u); // Only the redirect lookup.

    CHECK_TRUE(fetcher.head("https://closed.example/anything").isSentinel());

    fetcher.setCheckDomainsOnly(false);
    CHECK_EQ(fetcher.head("https://open.example/gone").status_code_, 404);
}


TEST(OnlyGetAndHeadAreSupported) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        return ScriptedHttpTransport::Reply(reply, 200, "ok");
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(0));

    CHECK_TRUE(fetcher.request("POST", "https://example.com/").isSentinel());
    CHECK_TRUE(transport->getRequests().empty());
    CHECK_EQ(fetcher.request("GET", "https://example.com/").status_code_, 200);
}


TEST(HeadersAndQueryParametersAreSent) {
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([](const HttpRequest &, HttpReply * const reply) {
        return ScriptedHttpTransport::Reply(reply, 200, "ok");
    }));
    LinkChecker::PolitenessFetcher fetcher(transport, UnrestrictedParams(0));
    fetcher.setUserAgent("First Agent");
    fetcher.setUserAgent("Second Agent");
    fetcher.setHeader("wskey", "secret");

    fetcher.get("https://api.example/search", { { "startIndex", "1" }, { "itemsPerPage", "50" } });
    const auto requests(transport->getRequests());
    CHECK_EQ(requests.size(), 1u);
    if (requests.size() != 1)
        return;

    const auto &headers(requests[0].headers_);
    CHECK_EQ(headers.size(), 2u);
    CHECK_TRUE(std::find(headers.cbegin(), headers.cend(), "User-Agent: Second Agent") != headers.cend());
    CHECK_TRUE(std::find(headers.cbegin(), headers.cend(), "wskey: secret") != headers.cend());
    CHECK_EQ(requests[0].query_parameters_.size(), 2u);
    CHECK_EQ(requests[0].time_limit_, 5000u);
}


TEST(ConcurrentRequestsAreLimited) {
    std::atomic<unsigned> in_flight(0), max_in_flight(0);
    const std::shared_ptr<ScriptedHttpTransport> transport(new ScriptedHttpTransport([&in_flight, &max_in_flight](const HttpRequest &,
                                                                                                                 HttpReply * const reply) {
        const unsigned now_in_flight(++in_flight);
        unsigned previous_max(max_in_flight.load());
        while (now_in_flight > previous_max and not max_in_flight.compare_exchange_weak(previous_max, now_in_flight))
            ;
        TimeUtil::Millisleep(50);
        --in_flight;
        return ScriptedHttpTransport::Reply(reply, 200);
    }));
    LinkChecker::PolitenessFetcher::Params params(UnrestrictedParams(0));
    params.max_concurrent_requests_ = 2;
    LinkChecker::PolitenessFetcher fetcher(transport, params);

    std::vector<std::thread> threads;
    for (unsigned i(0); i < 8; ++i)
        threads.emplace_back([&fetcher, i]() { fetcher.head("https://example.com/" + std::to_string(i)); });
    for (auto &thread : threads)
        thread.join();

    CHECK_EQ(transport->getRequests().size(), 8u);
    CHECK_LE(max_in_flight.load(), 2u);
}


TEST(BackoffIntervals) {
    // Exponential backoff plus less than a second of jitter, capped.
    const double first_backoff(LinkChecker::PolitenessFetcher::GetBackoff("", 1));
    CHECK_GE(first_backoff, 2.0);
    CHECK_LT(first_backoff, 3.0);
    const double third_backoff(LinkChecker::PolitenessFetcher::GetBackoff("", 3));
    CHECK_GE(third_backoff, 8.0);
    CHECK_LT(third_backoff, 9.0);
    CHECK_LE(LinkChecker::PolitenessFetcher::GetBackoff("", 10), 60.0);

    const double retry_after_seconds(LinkChecker::PolitenessFetcher::GetBackoff("5", 1));
    CHECK_GE(retry_after_seconds, 5.0);
    CHECK_LT(retry_after_seconds, 6.0);

    CHECK_EQ(LinkChecker::PolitenessFetcher::GetBackoff("Wed, 21 Oct 2015 07:28:00 GMT", 1), 0.0);
    const double retry_after_date(LinkChecker::PolitenessFetcher::GetBackoff(
        TimeUtil::TimeTToString(std::time(nullptr) + 30, "%a, %d %b %Y %H:%M:%S GMT", TimeUtil::UTC), 1));
    CHECK_GE(retry_after_date, 28.0);
    CHECK_LE(retry_after_date, 30.0);

    // Unparsable values fall back to exponential backoff.
    const double garbage_backoff(LinkChecker::PolitenessFetcher::GetBackoff("soon", 2));
    CHECK_GE(garbage_backoff, 4.0);
    CHECK_LT(garbage_backoff, 5.0);
}


TEST_MAIN(PolitenessFetcherTests)
