/** \file   LinkCheckPipeline.h
 *  \brief  Runs the discover, check and analyze stages of the link checker.
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
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "KnowledgeBaseClient.h"
#include "PolitenessFetcher.h"
#include "RecordStore.h"
#include "SharedBuffer.h"
#include "ThreadUtil.h"
#include "util.h"


namespace LinkChecker {


// The outcome of checking the links of one collection.
struct CollectionAnalysis {
    std::string collection_id_;
    unsigned broken_count_;
    unsigned total_count_;
    double broken_ratio_; // Rounded to 2 decimal places, ties to even.

public:
    CollectionAnalysis(const std::string &collection_id, const unsigned broken_count, const unsigned total_count);
};


/** \class  LinkCheckPipeline
 *  \brief  Finds the online resources of all collections, checks whether their links can be accessed and reports the
 *          collections with too many broken links.
 *
 *  The "discover" stage writes one record per resource to the resource store.  The "check" stage reads that store in
 *  random order, sends a HEAD request per link and writes the resource plus the status code to the results store.  The
 *  "analyze" stage reads the results store.  The stages may be run one at a time, e.g. to resume from stores that an
 *  earlier process left behind.  run() executes all of them in order.
 */
class LinkCheckPipeline {
public:
    enum State { IDLE, DISCOVERING, CHECKING, ANALYZING, DONE, FAILED };

    typedef std::function<void(const std::string &message)> MessageCallback;

    // Unset callbacks are ignored.  Callbacks are never invoked concurrently.
    struct Callbacks {
        MessageCallback on_discover_start_;
        MessageCallback on_discover_progress_;
        MessageCallback on_discover_end_;
        MessageCallback on_check_start_;
        MessageCallback on_check_progress_;
        MessageCallback on_check_end_;
        MessageCallback on_analyze_start_;
        MessageCallback on_analyze_progress_;
        MessageCallback on_analyze_end_;
        MessageCallback on_failure_;
        std::function<void()> on_stop_;
    };

    static const std::string RESOURCE_STORE_FILENAME;
    static const std::string RESULTS_STORE_FILENAME;
private:
    Logger * const logger_;
    std::shared_ptr<KnowledgeBaseClient> knowledge_base_client_;
    std::shared_ptr<PolitenessFetcher> fetcher_;
    RecordStore resource_store_;
    RecordStore results_store_;
    const Callbacks callbacks_;
    mutable std::mutex state_mutex_;
    State state_;
    std::string wskey_;
    std::mutex callback_mutex_;
public:
    /** \param retain_stores  If false, the contents of existing stores will be discarded. */
    LinkCheckPipeline(const std::shared_ptr<KnowledgeBaseClient> &knowledge_base_client,
                      const std::shared_ptr<PolitenessFetcher> &fetcher, const std::string &wskey,
                      const std::string &resource_store_path, const std::string &results_store_path, const bool retain_stores,
                      const Callbacks &callbacks = Callbacks(), Logger * const logger = ::logger);

    State getState() const;
    inline const RecordStore &getResourceStore() const { return resource_store_; }
    inline const RecordStore &getResultsStore() const { return results_store_; }

    /** \brief Hands new settings to the clients without recreating them. */
    void updateSettings(const std::string &wskey, const std::string &user_agent, const std::set<std::string> &ignorelist,
                        const bool check_domains_only);

    /** \brief  Runs all three stages.
     *  \param  full_scan  If false, a link only counts as accessible if its domain may be crawled and no request is sent
     *                     to the link itself.
     *  \return True if the run reached the DONE state, false if it ended in the FAILED state.
     *  \note   Refuses to run without a WSKey or while another run is in progress.
     */
    bool run(const bool full_scan, const double failure_threshold);

    /** \brief  Replaces the contents of the resource store with the resources of all collections.
     *  \return False if the Knowledge Base rejected our credential or could not be reached.
     */
    bool discover();

    /** \brief Replaces the contents of the results store with the outcome of checking each link in the resource store. */
    void check();

    /** \return The collections whose ratio of broken links is at least "failure_threshold", in the order in which they
     *          first appear in the results store.
     */
    std::vector<CollectionAnalysis> analyze(const double failure_threshold);

    static std::string StateToString(const State state);
private:
    void setState(const State new_state);
    void notify(const MessageCallback &callback, const std::string &message);

    // Must be called with "callback_mutex_" held.  Exceptions thrown by "callback" are logged and dropped.
    void deliver(const MessageCallback &callback, const std::string &message);

    void notifyStop();
    unsigned cacheResources(const CollectionDescriptor &collection);
    void checkResource(const ResourceRecord &resource, ThreadUtil::ThreadSafeCounter<unsigned> * const checked_count,
                       const unsigned total_count);
    void checkResources(SharedBuffer<ResourceRecord> * const pending_resources, ThreadUtil::ThreadSafeCounter<unsigned> * const checked_count,
                        const unsigned total_count);
};


} // namespace LinkChecker
