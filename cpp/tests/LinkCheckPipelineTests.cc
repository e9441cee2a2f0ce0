/** \file   LinkCheckPipelineTests.cc
 *  \brief  End-to-end tests for LinkChecker::LinkCheckPipeline.
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
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>
#include "FileUtil.h"
#include "KnowledgeBaseClient.h"
#include "LinkCheckPipeline.h"
#include "PolitenessFetcher.h"
#include "RecordStore.h"
#include "ScriptedHttpTransport.h"
#include "UnitTest.h"
#include "util.h"


namespace {


const std::string ENDPOINT("https://kb.example/collections/search");


// Everything the pipeline reported, per channel.
struct Messages {
    std::vector<std::string> discover_, check_, analyze_, failures_;
    std::vector<LinkChecker::LinkCheckPipeline::State> states_seen_at_stage_start_;
    unsigned stop_count_;
    std::function<void(const std::string &)> check_progress_hook_; // Called after a check progress message was recorded.

public:
    Messages(): stop_count_(0) { }

    bool contains(const std::vector<std::string> &channel, const std::string &message) const {
        return std::find(channel.cbegin(), channel.cend(), message) != channel.cend();
    }
};


LinkChecker::LinkCheckPipeline::Callbacks MakeCallbacks(Messages * const messages, LinkChecker::LinkCheckPipeline ** const pipeline) {
    LinkChecker::LinkCheckPipeline::Callbacks callbacks;
    const auto record_state([messages, pipeline]() {
        if (*pipeline != nullptr)
            messages->states_seen_at_stage_start_.emplace_back((*pipeline)->getState());
    });

    callbacks.on_discover_start_ = [messages, record_state](const std::string &message) {
        record_state();
        messages->discover_.emplace_back(message);
    };
    callbacks.on_discover_progress_ = [messages](const std::string &message) { messages->discover_.emplace_back(message); };
    callbacks.on_discover_end_ = [messages](const std::string &message) { messages->discover_.emplace_back(message); };
    callbacks.on_check_start_ = [messages, record_state](const std::string &message) {
        record_state();
        messages->check_.emplace_back(message);
    };
    callbacks.on_check_progress_ = [messages](const std::string &message) {
        messages->check_.emplace_back(message);
        if (messages->check_progress_hook_)
            messages->check_progress_hook_(message);
    };
    callbacks.on_check_end_ = [messages](const std::string &message) { messages->check_.emplace_back(message); };
    callbacks.on_analyze_start_ = [messages, record_state](const std::string &message) {
        record_state();
        messages->analyze_.emplace_back(message);
    };
    callbacks.on_analyze_progress_ = [messages](const std::string &message) { messages->analyze_.emplace_back(message); };
    callbacks.on_analyze_end_ = [messages](const std::string &message) { messages->analyze_.emplace_back(message); };
    callbacks.on_failure_ = [messages](const std::string &message) { messages->failures_.emplace_back(message); };
    callbacks.on_stop_ = [messages]() { ++messages->stop_count_; };

    return callbacks;
}


std::string GetQueryParameter(const HttpRequest &request, const std::string &name) {
    for (const auto &name_and_value : request.query_parameters_) {
        if (name_and_value.first == name)
            return name_and_value.second;
    }
    return "";
}


// A Knowledge Base with two collections and a Web where good.example works and bad.example doesn't.
bool AnswerRequest(const HttpRequest &request, HttpReply * const reply, const int connection_test_status_code) {
    if (request.url_ == ENDPOINT) {
        if (connection_test_status_code != 200)
            return ScriptedHttpTransport::Reply(reply, connection_test_status_code, "{\"error\": \"nope\"}");
        if (GetQueryParameter(request, "startIndex") != "1")
            return ScriptedHttpTransport::Reply(reply, 200, "{\"entries\": []}");
        return ScriptedHttpTransport::Reply(reply, 200, "{\"os:totalResults\": \"2\", \"entries\": ["
            "{\"kb:collection_uid\": \"C1\", \"title\": \"  Collection 1 \", \"links\": [{\"rel\": \"enclosure\", \"href\": \"https://kb.example/kbart/C1\"}]}, "
            "{\"kb:collection_uid\": \"C2\", \"title\": \"Collection 2\", \"links\": [{\"rel\": \"enclosure\", \"href\": \"https://kb.example/kbart/C2\"}]}]}");
    }

    if (request.url_ == "https://kb.example/kbart/C1")
        return ScriptedHttpTransport::Reply(reply, 200, "publication_title\ttitle_url\toclc_number\n"
                                                        "Good Journal\thttps://good.example/a\t1\n"
                                                        "Bad Journal\thttps://bad.example/b\t2\n");
    if (request.url_ == "https://kb.example/kbart/C2")
        return ScriptedHttpTransport::Reply(reply, 200, "publication_title\ttitle_url\toclc_number\n"
                                                        "Another Good Journal\thttps://good.example/c\t3\n"
                                                        "Print Only\t\t4\n");

    if (ScriptedHttpTransport::IsRobotsDotTxtRequest(request))
        return ScriptedHttpTransport::Reply(reply, 200, "User-agent: *\nDisallow:\n");
    if (StringUtil::StartsWith(request.url_, "https://bad.example/"))
        return ScriptedHttpTransport::Reply(reply, 404, "Not Found");
    return ScriptedHttpTransport::Reply(reply, 200, "Hello");
}


// Owns everything a test pipeline needs.
class PipelineFixture {
    FileUtil::AutoTempDirectory temp_dir_;
public:
    std::shared_ptr<ScriptedHttpTransport> transport_;
    Messages messages_;
    LinkChecker::LinkCheckPipeline *pipeline_pointer_;
    std::unique_ptr<LinkChecker::LinkCheckPipeline> pipeline_;
public:
    explicit PipelineFixture(const int connection_test_status_code = 200, const std::string &wskey = "secret-key",
                             const std::set<std::string> &ignorelist = {}, const unsigned max_concurrent_requests = 3,
                             Logger * const logger = ::logger)
        : temp_dir_("/tmp/LinkCheckPipelineTests"), pipeline_pointer_(nullptr)
    {
        transport_.reset(new ScriptedHttpTransport([connection_test_status_code](const HttpRequest &request, HttpReply * const reply) {
            return AnswerRequest(request, reply, connection_test_status_code);
        }));
        const std::shared_ptr<LinkChecker::KnowledgeBaseClient> knowledge_base_client(new LinkChecker::KnowledgeBaseClient(
            transport_, wskey, ENDPOINT, /* max_retries = */ 0, /* max_concurrent_requests = */ 3, /* max_wait = */ 5));
        const std::shared_ptr<LinkChecker::PolitenessFetcher> fetcher(new LinkChecker::PolitenessFetcher(
            transport_, LinkChecker::PolitenessFetcher::Params({ "User-Agent: Test Agent" }, /* max_retries = */ 0,
                                                               max_concurrent_requests, /* max_wait = */ 5, ignorelist)));
        pipeline_.reset(new LinkChecker::LinkCheckPipeline(knowledge_base_client, fetcher, wskey, getResourceStorePath(),
                                                           getResultsStorePath(), /* retain_stores = */ false,
                                                           MakeCallbacks(&messages_, &pipeline_pointer_), logger));
        pipeline_pointer_ = pipeline_.get();
    }

    const std::string &getDirectoryPath() const { return temp_dir_.getDirectoryPath(); }
    std::string getResourceStorePath() const { return getDirectoryPath() + "/caches/resource_cache.csv"; }
    std::string getResultsStorePath() const { return temp_dir_.getDirectoryPath() + "/caches/results_cache.csv"; }

    void seedResources(const std::vector<LinkChecker::ResourceRecord> &resources) {
        LinkChecker::RecordStore resource_store(getResourceStorePath(), LinkChecker::RESOURCE_SCHEMA, /* retain = */ true);
        for (const auto &resource : resources)
            CHECK_TRUE(resource_store.append(LinkChecker::Record(resource)));
    }

    // Maps links to the status codes in the results store.
    std::map<std::string, int> getResults() const {
        std::map<std::string, int> links_to_status_codes;
        const std::unique_ptr<LinkChecker::RecordStream> stream(pipeline_->getResultsStore().stream(/* randomize = */ false));
        LinkChecker::Record record{ LinkChecker::ResourceRecord() };
        while (stream->next(&record))
            links_to_status_codes[record.getResource().link_] = record.getStatusCode();
        return links_to_status_codes;
    }
};


const std::vector<LinkChecker::ResourceRecord> GOOD_AND_BAD_RESOURCES{
    LinkChecker::ResourceRecord("C1", "1", "Good Journal", "https://good.example/a"),
    LinkChecker::ResourceRecord("C1", "2", "Bad Journal", "https://bad.example/b"),
};


} // unnamed namespace


TEST(BrokenCollectionIsReportedAtThreshold) {
    PipelineFixture fixture;
    fixture.seedResources(GOOD_AND_BAD_RESOURCES);

    fixture.pipeline_->check();
    const auto results(fixture.getResults());
    CHECK_EQ(results.size(), 2u);
    CHECK_EQ(results.at("https://good.example/a"), 200);
    CHECK_EQ(results.at("https://bad.example/b"), 404);

    const auto &check_messages(fixture.messages_.check_);
    CHECK_TRUE(not check_messages.empty() and check_messages.front() == "Identified 2 links.");
    CHECK_TRUE(fixture.messages_.contains(check_messages, "Checking links. Please do not exit..."));
    CHECK_TRUE(fixture.messages_.contains(check_messages, "Checked 1 / 2 links."));
    CHECK_TRUE(fixture.messages_.contains(check_messages, "Checked 2 / 2 links."));
    CHECK_TRUE(not check_messages.empty() and check_messages.back() == "Check complete.");

    const auto broken_collections(fixture.pipeline_->analyze(0.5));
    CHECK_EQ(broken_collections.size(), 1u);
    if (broken_collections.size() == 1) {
        CHECK_EQ(broken_collections[0].collection_id_, "C1");
        CHECK_EQ(broken_collections[0].broken_count_, 1u);
        CHECK_EQ(broken_collections[0].total_count_, 2u);
        CHECK_NEAR(broken_collections[0].broken_ratio_, 0.5, 1e-9);
    }

    const std::vector<std::string> expected_analyze_messages{
        "Calculating percentages...", "50.0% (1 / 2) of links in collection C1 could not be accessed.",
        "Analysis complete. 1 collection(s) exceeded the failure threshold."
    };
    CHECK_TRUE(fixture.messages_.analyze_ == expected_analyze_messages);
}


TEST(BrokenCollectionBelowThresholdIsNotReported) {
    PipelineFixture fixture;
    fixture.seedResources(GOOD_AND_BAD_RESOURCES);

    fixture.pipeline_->check();
    CHECK_TRUE(fixture.pipeline_->analyze(0.6).empty());
    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.analyze_, "Analysis complete. 0 collection(s) exceeded the failure threshold."));
}


TEST(IgnoredDomainsAreRecordedAsUnavailable) {
    PipelineFixture fixture(200, "secret-key", { "ignored.example" });
    fixture.seedResources({ LinkChecker::ResourceRecord("C3", "9", "Ignored Journal", "https://www.ignored.example/journal"),
                            LinkChecker::ResourceRecord("C3", "10", "Good Journal", "https://good.example/d") });

    fixture.pipeline_->check();
    const auto results(fixture.getResults());
    CHECK_EQ(results.size(), 2u);
    CHECK_EQ(results.at("https://www.ignored.example/journal"), -1);
    CHECK_EQ(results.at("https://good.example/d"), 200);

    for (const auto &request : fixture.transport_->getRequests())
        CHECK_EQ(request.url_.find("ignored.example"), std::string::npos);

    const auto broken_collections(fixture.pipeline_->analyze(0.5));
    CHECK_EQ(broken_collections.size(), 1u);
    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.analyze_,
                                          "50.0% (1 / 2) of links in collection C3 could not be accessed."));
}


TEST(InvalidCredentialFailsTheRun) {
    PipelineFixture fixture(/* connection_test_status_code = */ 401);

    CHECK_FALSE(fixture.pipeline_->run(/* full_scan = */ true, 0.5));
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::FAILED);

    const std::vector<std::string> expected_failures{ "Failed to retrieve online resources from OCLC: The WSKey was invalid." };
    CHECK_TRUE(fixture.messages_.failures_ == expected_failures);
    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.discover_,
                                          "Search complete. Found 0 online resource(s) across 0 collection(s)."));
    CHECK_TRUE(fixture.messages_.check_.empty());
    CHECK_TRUE(fixture.messages_.analyze_.empty());
    CHECK_EQ(fixture.messages_.stop_count_, 1u);
    CHECK_EQ(fixture.pipeline_->getResultsStore().count(), 0u);
}


TEST(UnreachableKnowledgeBaseFailsTheRun) {
    PipelineFixture fixture(/* connection_test_status_code = */ 500);

    CHECK_FALSE(fixture.pipeline_->run(/* full_scan = */ true, 0.5));
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::FAILED);
    const std::vector<std::string> expected_failures{
        "Failed to retrieve online resources from OCLC: Could not connect to the OCLC WorldCat Knowledge Base API endpoint."
    };
    CHECK_TRUE(fixture.messages_.failures_ == expected_failures);
    CHECK_TRUE(fixture.messages_.check_.empty());
}


TEST(FailedRunKeepsEarlierResources) {
    PipelineFixture fixture(/* connection_test_status_code = */ 401);
    fixture.seedResources(GOOD_AND_BAD_RESOURCES);

    CHECK_FALSE(fixture.pipeline_->run(/* full_scan = */ true, 0.5));
    CHECK_EQ(fixture.pipeline_->getResourceStore().count(), 2u);
}


TEST(FailingProgressCallbackDoesNotStallTheCheck) {
    PipelineFixture fixture(200, "secret-key", {}, /* max_concurrent_requests = */ 1);
    std::vector<LinkChecker::ResourceRecord> resources;
    for (unsigned resource_no(1); resource_no <= 10; ++resource_no)
        resources.emplace_back("C1", std::to_string(resource_no), "Journal " + std::to_string(resource_no),
                               "https://good.example/" + std::to_string(resource_no));
    fixture.seedResources(resources);

    unsigned progress_message_count(0);
    fixture.messages_.check_progress_hook_ = [&progress_message_count](const std::string &) {
        if (++progress_message_count >= 2)
            throw std::runtime_error("display went away");
    };

    fixture.pipeline_->check();
    CHECK_EQ(fixture.pipeline_->getResultsStore().count(), 10u);
    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.check_, "Checked 10 / 10 links."));
    CHECK_TRUE(not fixture.messages_.check_.empty() and fixture.messages_.check_.back() == "Check complete.");
}


TEST(ProgressMessagesAreLogged) {
    const FileUtil::AutoTempDirectory log_dir("/tmp/LinkCheckPipelineTestsLogs");
    const std::string log_path(log_dir.getDirectoryPath() + "/pipeline.log");
    Logger pipeline_logger;
    pipeline_logger.setMinimumLogLevel(Logger::LL_INFO);
    CHECK_TRUE(pipeline_logger.redirectOutput(log_path));

    {
        PipelineFixture fixture(200, "secret-key", {}, /* max_concurrent_requests = */ 3, &pipeline_logger);
        fixture.seedResources(GOOD_AND_BAD_RESOURCES);
        fixture.pipeline_->check();
    }

    std::string log_contents;
    CHECK_TRUE(FileUtil::ReadString(log_path, &log_contents));
    CHECK_NE(log_contents.find("Identified 2 links."), std::string::npos);
    CHECK_NE(log_contents.find("Checked 1 / 2 links."), std::string::npos);
    CHECK_NE(log_contents.find("Checked 2 / 2 links."), std::string::npos);
    CHECK_NE(log_contents.find("Check complete."), std::string::npos);
}


TEST(MissingCredentialPreventsTheRun) {
    PipelineFixture fixture(200, /* wskey = */ "  ");

    CHECK_FALSE(fixture.pipeline_->run(/* full_scan = */ true, 0.5));
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::FAILED);
    const std::vector<std::string> expected_failures{
        "Failed to run the link checker: No WSKey was found. Please add a WSKey to the config file."
    };
    CHECK_TRUE(fixture.messages_.failures_ == expected_failures);
    CHECK_TRUE(fixture.messages_.discover_.empty());
    CHECK_TRUE(fixture.transport_->getRequests().empty());
    CHECK_EQ(fixture.messages_.stop_count_, 1u);

    // Supplying a credential makes the same pipeline usable.
    fixture.pipeline_->updateSettings("secret-key", "Test Agent", {}, /* check_domains_only = */ false);
    CHECK_TRUE(fixture.pipeline_->run(/* full_scan = */ true, 0.5));
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::DONE);
}


TEST(FullRun) {
    PipelineFixture fixture;
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::IDLE);

    CHECK_TRUE(fixture.pipeline_->run(/* full_scan = */ true, 0.5));
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::DONE);
    CHECK_TRUE(fixture.messages_.failures_.empty());
    CHECK_EQ(fixture.messages_.stop_count_, 1u);

    const auto &discover_messages(fixture.messages_.discover_);
    CHECK_TRUE(not discover_messages.empty() and discover_messages.front() == "Searching for resources. Please do not exit...");
    CHECK_TRUE(fixture.messages_.contains(discover_messages, "Cached 2 online resources for collection Collection 1."));
    CHECK_TRUE(fixture.messages_.contains(discover_messages, "Cached 1 online resources for collection Collection 2."));
    CHECK_TRUE(not discover_messages.empty()
               and discover_messages.back() == "Search complete. Found 3 online resource(s) across 2 collection(s).");

    CHECK_EQ(fixture.pipeline_->getResourceStore().count(), 3u);
    const auto results(fixture.getResults());
    CHECK_EQ(results.size(), 3u);
    CHECK_EQ(results.at("https://bad.example/b"), 404);
    CHECK_EQ(results.at("https://good.example/c"), 200);

    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.analyze_,
                                          "50.0% (1 / 2) of links in collection C1 could not be accessed."));
    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.analyze_,
                                          "Analysis complete. 1 collection(s) exceeded the failure threshold."));

    const std::vector<LinkChecker::LinkCheckPipeline::State> expected_states{
        LinkChecker::LinkCheckPipeline::DISCOVERING, LinkChecker::LinkCheckPipeline::CHECKING, LinkChecker::LinkCheckPipeline::ANALYZING
    };
    CHECK_TRUE(fixture.messages_.states_seen_at_stage_start_ == expected_states);

    // Both clients release their connections at the end of their stage.
    CHECK_GE(fixture.transport_->getCloseCount(), 2u);
}


TEST(DomainOnlyRunDoesNotRequestTheLinks) {
    PipelineFixture fixture;

    CHECK_TRUE(fixture.pipeline_->run(/* full_scan = */ false, 0.5));
    const auto results(fixture.getResults());
    CHECK_EQ(results.size(), 3u);
    for (const auto &link_and_status_code : results)
        CHECK_EQ(link_and_status_code.second, 200);
    CHECK_TRUE(fixture.messages_.contains(fixture.messages_.analyze_,
                                          "Analysis complete. 0 collection(s) exceeded the failure threshold."));
}


TEST(StagesCanResumeFromExistingStores) {
    PipelineFixture fixture;
    fixture.seedResources(GOOD_AND_BAD_RESOURCES);

    // Checking twice replaces the earlier results instead of adding to them.
    fixture.pipeline_->check();
    fixture.pipeline_->check();
    CHECK_EQ(fixture.pipeline_->getResultsStore().count(), 2u);
    CHECK_TRUE(fixture.pipeline_->getState() == LinkChecker::LinkCheckPipeline::IDLE);
}


TEST(CollectionAnalysisRatios) {
    CHECK_NEAR(LinkChecker::CollectionAnalysis("C", 1, 3).broken_ratio_, 0.33, 1e-9);
    CHECK_NEAR(LinkChecker::CollectionAnalysis("C", 2, 3).broken_ratio_, 0.67, 1e-9);
    CHECK_NEAR(LinkChecker::CollectionAnalysis("C", 0, 0).broken_ratio_, 0.0, 1e-9);
    CHECK_NEAR(LinkChecker::CollectionAnalysis("C", 5, 5).broken_ratio_, 1.0, 1e-9);

    // Exact halves go to the even neighbour.
    CHECK_NEAR(LinkChecker::CollectionAnalysis("C", 1, 8).broken_ratio_, 0.12, 1e-9);
    CHECK_NEAR(LinkChecker::CollectionAnalysis("C", 3, 8).broken_ratio_, 0.38, 1e-9);
}


TEST_MAIN(LinkCheckPipelineTests)
