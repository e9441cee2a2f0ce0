/** \file   LinkCheckPipeline.cc
 *  \brief  Implementation of class LinkCheckPipeline.
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
#include "LinkCheckPipeline.h"
#include <algorithm>
#include <unordered_map>
#include <cmath>
#include "LinkCheckerUtil.h"
#include "StringUtil.h"


namespace LinkChecker {


namespace {


// Closes "buffer" when the last of its consumers goes away, so that a producer can't block forever.
template <typename ItemType>
class LastConsumerCloser {
    ThreadUtil::ThreadSafeCounter<unsigned> * const remaining_consumer_count_;
    SharedBuffer<ItemType> * const buffer_;
public:
    LastConsumerCloser(ThreadUtil::ThreadSafeCounter<unsigned> * const remaining_consumer_count, SharedBuffer<ItemType> * const buffer)
        : remaining_consumer_count_(remaining_consumer_count), buffer_(buffer) { }
    ~LastConsumerCloser() {
        if (--*remaining_consumer_count_ == 0)
            buffer_->close();
    }
};


} // unnamed namespace


const std::string LinkCheckPipeline::RESOURCE_STORE_FILENAME("resource_cache.csv");
const std::string LinkCheckPipeline::RESULTS_STORE_FILENAME("results_cache.csv");


CollectionAnalysis::CollectionAnalysis(const std::string &collection_id, const unsigned broken_count, const unsigned total_count)
    : collection_id_(collection_id), broken_count_(broken_count), total_count_(total_count),
      broken_ratio_(total_count == 0 ? 0.0 : std::nearbyint(100.0 * broken_count / total_count) / 100.0)
{
}


LinkCheckPipeline::LinkCheckPipeline(const std::shared_ptr<KnowledgeBaseClient> &knowledge_base_client,
                                     const std::shared_ptr<PolitenessFetcher> &fetcher, const std::string &wskey,
                                     const std::string &resource_store_path, const std::string &results_store_path,
                                     const bool retain_stores, const Callbacks &callbacks, Logger * const logger)
    : logger_(logger), knowledge_base_client_(knowledge_base_client), fetcher_(fetcher),
      resource_store_(resource_store_path, RESOURCE_SCHEMA, retain_stores, logger),
      results_store_(results_store_path, CHECKED_SCHEMA, retain_stores, logger), callbacks_(callbacks), state_(IDLE),
      wskey_(wskey)
{
    if (unlikely(knowledge_base_client_ == nullptr or fetcher_ == nullptr))
        throw std::runtime_error("in LinkChecker::LinkCheckPipeline::LinkCheckPipeline: missing client!");
}


LinkCheckPipeline::State LinkCheckPipeline::getState() const {
    std::lock_guard<std::mutex> state_locker(state_mutex_);
    return state_;
}


void LinkCheckPipeline::setState(const State new_state) {
    std::lock_guard<std::mutex> state_locker(state_mutex_);
    LOG_DEBUG_TO(logger_, "state transition: " + StateToString(state_) + " -> " + StateToString(new_state));
    state_ = new_state;
}


void LinkCheckPipeline::notify(const MessageCallback &callback, const std::string &message) {
    std::lock_guard<std::mutex> callback_locker(callback_mutex_);
    deliver(callback, message);
}


void LinkCheckPipeline::deliver(const MessageCallback &callback, const std::string &message) {
    LOG_INFO_TO(logger_, message);
    if (not callback)
        return;

    try {
        callback(message);
    } catch (const std::exception &x) {
        LOG_WARNING_TO(logger_, "callback failed for message \"" + message + "\": " + std::string(x.what()));
    }
}


void LinkCheckPipeline::notifyStop() {
    if (not callbacks_.on_stop_)
        return;

    std::lock_guard<std::mutex> callback_locker(callback_mutex_);
    try {
        callbacks_.on_stop_();
    } catch (const std::exception &x) {
        LOG_WARNING_TO(logger_, "stop callback failed: " + std::string(x.what()));
    }
}


void LinkCheckPipeline::updateSettings(const std::string &wskey, const std::string &user_agent,
                                       const std::set<std::string> &ignorelist, const bool check_domains_only)
{
    {
        std::lock_guard<std::mutex> state_locker(state_mutex_);
        wskey_ = wskey;
    }
    knowledge_base_client_->setApiKey(wskey);
    fetcher_->setUserAgent(user_agent);
    fetcher_->setIgnorelist(ignorelist);
    fetcher_->setCheckDomainsOnly(check_domains_only);
}


bool LinkCheckPipeline::run(const bool full_scan, const double failure_threshold) {
    bool have_wskey;
    {
        std::lock_guard<std::mutex> state_locker(state_mutex_);
        if (state_ == DISCOVERING or state_ == CHECKING or state_ == ANALYZING) {
            LOG_WARNING_TO(logger_, "can't start a run while the pipeline is " + StateToString(state_) + "!");
            return false;
        }

        have_wskey = not StringUtil::TrimWhite(wskey_).empty();
        state_ = have_wskey ? DISCOVERING : FAILED;
    }

    if (not have_wskey) {
        notify(callbacks_.on_failure_, "Failed to run the link checker: No WSKey was found. "
                                       "Please add a WSKey to the config file.");
        notifyStop();
        return false;
    }

    fetcher_->setCheckDomainsOnly(not full_scan);

    if (not discover()) {
        setState(FAILED);
        notifyStop();
        return false;
    }

    setState(CHECKING);
    check();

    setState(ANALYZING);
    analyze(failure_threshold);

    setState(DONE);
    notifyStop();
    return true;
}


unsigned LinkCheckPipeline::cacheResources(const CollectionDescriptor &collection) {
    unsigned count(0);
    for (const auto &resource : knowledge_base_client_->getResources(collection)) {
        if (resource.empty())
            continue;
        if (resource_store_.append(Record(resource)))
            ++count;
    }

    notify(callbacks_.on_discover_progress_, "Cached " + std::to_string(count) + " online resources for collection "
                                             + StringUtil::TrimWhite(collection.title_) + ".");
    return count;
}


bool LinkCheckPipeline::discover() {
    notify(callbacks_.on_discover_start_, "Searching for resources. Please do not exit...");

    bool success(true);
    unsigned collection_total(0), resource_total(0);
    const int test_code(knowledge_base_client_->getConnectionTestResult());
    if (test_code == 200) {
        // Resources from an earlier run are only discarded once we know that we can replace them.
        if (not resource_store_.clear())
            LOG_WARNING_TO(logger_, "new resources will be added to the old contents of \"" + resource_store_.getPath() + "\"!");

        ThreadUtil::ThreadSafeCounter<unsigned> running_tasklet_count(0);
        std::vector<std::unique_ptr<Util::Tasklet<CollectionDescriptor, unsigned>>> tasklets;
        for (const auto &collection : knowledge_base_client_->getCollections()) {
            tasklets.emplace_back(new Util::Tasklet<CollectionDescriptor, unsigned>(
                &running_tasklet_count, "cache resources of collection \"" + collection.id_ + "\"",
                [this](const CollectionDescriptor &parameter, unsigned * const count) { *count = cacheResources(parameter); },
                std::unique_ptr<unsigned>(new unsigned(0)), collection, logger_));
            try {
                tasklets.back()->start();
            } catch (const std::runtime_error &x) {
                LOG_WARNING_TO(logger_, std::string(x.what()) + " Caching the resources on the current thread instead.");
                tasklets.pop_back();
                resource_total += cacheResources(collection);
            }
            ++collection_total;
        }

        for (auto &tasklet : tasklets) {
            const std::unique_ptr<unsigned> count(tasklet->getResult());
            if (count != nullptr)
                resource_total += *count;
        }
    } else {
        success = false;
        if (test_code == 401)
            notify(callbacks_.on_failure_, "Failed to retrieve online resources from OCLC: The WSKey was invalid.");
        else
            notify(callbacks_.on_failure_, "Failed to retrieve online resources from OCLC: Could not connect to the OCLC "
                                           "WorldCat Knowledge Base API endpoint.");
    }
    knowledge_base_client_->close();

    notify(callbacks_.on_discover_end_, "Search complete. Found " + std::to_string(resource_total) + " online resource(s) across "
                                        + std::to_string(collection_total) + " collection(s).");
    return success;
}


void LinkCheckPipeline::checkResource(const ResourceRecord &resource, ThreadUtil::ThreadSafeCounter<unsigned> * const checked_count,
                                      const unsigned total_count)
{
    const Response response(fetcher_->head(resource.link_));
    if (not results_store_.append(Record(CheckedRecord(resource, response.status_code_))))
        LOG_WARNING_TO(logger_, "failed to store the result for \"" + resource.link_ + "\"!");

    // Counting under the lock keeps the progress messages in order.
    std::lock_guard<std::mutex> callback_locker(callback_mutex_);
    const unsigned checked(++*checked_count);
    deliver(callbacks_.on_check_progress_, "Checked " + std::to_string(checked) + " / " + std::to_string(total_count) + " links.");
}


void LinkCheckPipeline::checkResources(SharedBuffer<ResourceRecord> * const pending_resources,
                                       ThreadUtil::ThreadSafeCounter<unsigned> * const checked_count, const unsigned total_count)
{
    ResourceRecord resource;
    while (pending_resources->pop_front(&resource))
        checkResource(resource, checked_count, total_count);
}


void LinkCheckPipeline::check() {
    const unsigned total_count(static_cast<unsigned>(resource_store_.count()));
    notify(callbacks_.on_check_start_, "Identified " + std::to_string(total_count) + " links.");
    notify(callbacks_.on_check_progress_, "Checking links. Please do not exit...");
    if (not results_store_.clear())
        LOG_WARNING_TO(logger_, "new results will be added to the old contents of \"" + results_store_.getPath() + "\"!");

    // Each worker has at most one request in flight, so more workers than request slots would just wait.
    const unsigned worker_count(std::max(fetcher_->getParams().max_concurrent_requests_, 1u));
    SharedBuffer<ResourceRecord> pending_resources(2 * worker_count);
    ThreadUtil::ThreadSafeCounter<unsigned> checked_count(0), running_worker_count(0), remaining_worker_count(worker_count);

    std::vector<std::unique_ptr<Util::Tasklet<unsigned, unsigned>>> workers;
    for (unsigned worker_no(1); worker_no <= worker_count; ++worker_no) {
        workers.emplace_back(new Util::Tasklet<unsigned, unsigned>(
            &running_worker_count, "link check worker #" + std::to_string(worker_no),
            [this, &pending_resources, &checked_count, &remaining_worker_count, total_count](const unsigned /* worker_no */,
                                                                                          unsigned * const)
            {
                const LastConsumerCloser<ResourceRecord> closer(&remaining_worker_count, &pending_resources);
                checkResources(&pending_resources, &checked_count, total_count);
            },
            std::unique_ptr<unsigned>(new unsigned(0)), worker_no, logger_));
        try {
            workers.back()->start();
        } catch (const std::runtime_error &x) {
            LOG_WARNING_TO(logger_, x.what());
            workers.pop_back();
            if (--remaining_worker_count == 0)
                pending_resources.close();
        }
    }

    // Randomising the order makes it unlikely that we hit the same domain many times in a row.
    const std::unique_ptr<RecordStream> stream(resource_store_.stream(/* randomize = */ true));
    Record record((ResourceRecord()));
    while (stream->next(&record)) {
        // Once all workers are gone we check the remaining links ourselves.
        if (not pending_resources.push_back(record.getResource()))
            checkResource(record.getResource(), &checked_count, total_count);
    }
    pending_resources.close();

    for (auto &worker : workers) {
        worker->await();
        if (worker->getStatus() != Util::Tasklet<unsigned, unsigned>::COMPLETED_SUCCESS)
            LOG_WARNING_TO(logger_, "\"" + worker->toString() + "\" did not complete successfully!");
    }

    // Workers that quit early may have left links behind.
    ResourceRecord leftover_resource;
    while (pending_resources.pop_front(&leftover_resource))
        checkResource(leftover_resource, &checked_count, total_count);
    fetcher_->close();

    notify(callbacks_.on_check_end_, "Check complete.");
}


std::vector<CollectionAnalysis> LinkCheckPipeline::analyze(const double failure_threshold) {
    notify(callbacks_.on_analyze_start_, "Calculating percentages...");

    std::vector<std::string> collection_ids; // In order of first appearance.
    std::unordered_map<std::string, std::pair<unsigned, unsigned>> collection_ids_to_broken_and_total_counts;
    const std::unique_ptr<RecordStream> stream(results_store_.stream(/* randomize = */ false));
    Record record((ResourceRecord()));
    while (stream->next(&record)) {
        if (unlikely(record.getKind() != Record::CHECKED)) {
            LOG_WARNING_TO(logger_, "skipping " + Record::KindToString(record.getKind()) + " in \"" + results_store_.getPath() + "\"!");
            continue;
        }

        const std::string &collection_id(record.getResource().collection_id_);
        auto counts(collection_ids_to_broken_and_total_counts.find(collection_id));
        if (counts == collection_ids_to_broken_and_total_counts.end()) {
            collection_ids.emplace_back(collection_id);
            counts = collection_ids_to_broken_and_total_counts.emplace(collection_id, std::make_pair(0u, 0u)).first;
        }

        // Anything but a 200 counts as broken, including the rejections that end the retry loop.
        if (record.getStatusCode() != 200)
            ++counts->second.first;
        ++counts->second.second;
    }

    std::vector<CollectionAnalysis> broken_collections;
    for (const auto &collection_id : collection_ids) {
        const auto &counts(collection_ids_to_broken_and_total_counts[collection_id]);
        const CollectionAnalysis analysis(collection_id, counts.first, counts.second);
        if (analysis.broken_ratio_ < failure_threshold)
            continue;

        notify(callbacks_.on_analyze_progress_, StringUtil::ToString(analysis.broken_ratio_ * 100.0, 1) + "% ("
                                                + std::to_string(analysis.broken_count_) + " / " + std::to_string(analysis.total_count_)
                                                + ") of links in collection " + collection_id + " could not be accessed.");
        broken_collections.emplace_back(analysis);
    }

    notify(callbacks_.on_analyze_end_, "Analysis complete. " + std::to_string(broken_collections.size())
                                       + " collection(s) exceeded the failure threshold.");
    return broken_collections;
}


std::string LinkCheckPipeline::StateToString(const State state) {
    switch (state) {
    case IDLE:
        return "IDLE";
    case DISCOVERING:
        return "DISCOVERING";
    case CHECKING:
        return "CHECKING";
    case ANALYZING:
        return "ANALYZING";
    case DONE:
        return "DONE";
    case FAILED:
        return "FAILED";
    }

    throw std::runtime_error("in LinkChecker::LinkCheckPipeline::StateToString: unknown state " + std::to_string(state) + "!");
}


} // namespace LinkChecker
