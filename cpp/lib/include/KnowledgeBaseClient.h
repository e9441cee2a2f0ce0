/** \file   KnowledgeBaseClient.h
 *  \brief  A client for the OCLC WorldCat Knowledge Base API.
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
#include <string>
#include <vector>
#include "HttpTransport.h"
#include "LinkCheckerRecord.h"
#include "PolitenessFetcher.h"
#include "util.h"


namespace LinkChecker {


// Identifies a collection and tells us where to find the list of its resources.
struct CollectionDescriptor {
    std::string id_;
    std::string title_;
    std::string download_link_;

public:
    CollectionDescriptor() = default;
    CollectionDescriptor(const std::string &id, const std::string &title, const std::string &download_link)
        : id_(id), title_(title), download_link_(download_link) { }

    bool empty() const { return download_link_.empty(); }
};


/** \class  KnowledgeBaseClient
 *  \brief  Retrieves the collections that an institution has enabled in the OCLC WorldCat Knowledge Base and the
 *          resources contained in them.
 *  \note   The credential (a "WSKey") is sent as a "wskey" header.  The client trusts the API endpoint, so neither the
 *          ignorelist nor robots.txt apply to its requests.
 */
class KnowledgeBaseClient {
    Logger * const logger_;
    const std::string endpoint_;
    PolitenessFetcher fetcher_;
public:
    static const std::string DEFAULT_ENDPOINT;
    static const unsigned PAGE_SIZE = 50;
    static const unsigned DEFAULT_MAX_RETRIES = 2;
    static const unsigned DEFAULT_MAX_CONCURRENT_REQUESTS = 10;
    static const unsigned DEFAULT_MAX_WAIT = 300; // In seconds.

public:
    KnowledgeBaseClient(const std::shared_ptr<HttpTransport> &transport, const std::string &api_key,
                        const std::string &endpoint = DEFAULT_ENDPOINT, const unsigned max_retries = DEFAULT_MAX_RETRIES,
                        const unsigned max_concurrent_requests = DEFAULT_MAX_CONCURRENT_REQUESTS,
                        const unsigned max_wait = DEFAULT_MAX_WAIT, Logger * const logger = ::logger);

    inline const std::string &getEndpoint() const { return endpoint_; }
    void setApiKey(const std::string &api_key);

    /** \return The status code of a minimal query or -1 if the endpoint could not be reached. */
    int getConnectionTestResult();

    /** \return The number of collections that the institution has enabled or 0 if that could not be determined. */
    unsigned getTotalCollections();

    /** \brief  Retrieves all collections, PAGE_SIZE at a time.  The pages are requested concurrently.
     *  \note   If a page can't be retrieved or parsed, the result consists of a single empty descriptor.
     */
    std::vector<CollectionDescriptor> getCollections();

    /** \brief  Downloads and parses the KBART file of "collection".
     *  \note   If that fails, the result consists of a single resource that has nothing but the collection ID.
     */
    std::vector<ResourceRecord> getResources(const CollectionDescriptor &collection);

    void close() { fetcher_.close(); }
private:
    Response get(const std::string &url, const QueryParameters &query_parameters = {});
};


} // namespace LinkChecker
