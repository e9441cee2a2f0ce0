/** \file   KnowledgeBaseClient.cc
 *  \brief  Implementation of class KnowledgeBaseClient.
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
#include "KnowledgeBaseClient.h"
#include <algorithm>
#include <sstream>
#include "JSON.h"
#include "LinkCheckerUtil.h"
#include "StringUtil.h"
#include "ThreadUtil.h"


namespace LinkChecker {


const std::string KnowledgeBaseClient::DEFAULT_ENDPOINT("https://worldcat.org/webservices/kb/rest/collections/search");
const unsigned KnowledgeBaseClient::PAGE_SIZE;


KnowledgeBaseClient::KnowledgeBaseClient(const std::shared_ptr<HttpTransport> &transport, const std::string &api_key,
                                         const std::string &endpoint, const unsigned max_retries,
                                         const unsigned max_concurrent_requests, const unsigned max_wait, Logger * const logger)
    : logger_(logger), endpoint_(endpoint),
      fetcher_(transport,
               PolitenessFetcher::Params({ "wskey: " + api_key }, max_retries, max_concurrent_requests, max_wait, /* ignorelist = */ {},
                                         /* enforce_ignorelist = */ false, /* enforce_robots_policy = */ false,
                                         /* check_domains_only = */ false),
               logger)
{
}


void KnowledgeBaseClient::setApiKey(const std::string &api_key) {
    fetcher_.setHeader("wskey", api_key);
}


Response KnowledgeBaseClient::get(const std::string &url, const QueryParameters &query_parameters) {
    const Response response(fetcher_.get(url, query_parameters));

    switch (response.status_code_) {
    case 200:
    case 202:
        break;
    case 401:
    case 403:
        LOG_WARNING_TO(logger_, "Failed to connect to OCLC WorldCat Knowledge Base - User provided invalid or expired WSKey.");
        break;
    case 405:
        LOG_WARNING_TO(logger_, "Failed to connect to OCLC WorldCat Knowledge Base - Service does not support HTTP GET requests.");
        break;
    default:
        LOG_WARNING_TO(logger_, "Failed to connect to OCLC WorldCat Knowledge Base - Could not connect to API endpoint at URL \""
                                + url + "\".");
    }

    return response;
}


int KnowledgeBaseClient::getConnectionTestResult() {
    return get(endpoint_, { { "startIndex", "1" }, { "itemsPerPage", "1" } }).status_code_;
}


namespace {


bool ParseJSONObject(const std::string &json_document, std::shared_ptr<const JSON::ObjectNode> * const object_node,
                     std::string * const error_message)
{
    JSON::Parser parser(json_document);
    std::shared_ptr<JSON::JSONNode> tree_root;
    if (not parser.parse(&tree_root)) {
        *error_message = parser.getErrorMessage();
        return false;
    }

    if (tree_root->getType() != JSON::JSONNode::OBJECT_NODE) {
        *error_message = "top-level node is a " + JSON::JSONNode::TypeToString(tree_root->getType()) + "!";
        return false;
    }

    *object_node = std::static_pointer_cast<const JSON::ObjectNode>(tree_root);
    return true;
}


} // unnamed namespace


unsigned KnowledgeBaseClient::getTotalCollections() {
    const Response response(get(endpoint_, { { "startIndex", "1" }, { "itemsPerPage", "1" } }));
    if (response.status_code_ != 200)
        return 0;

    std::shared_ptr<const JSON::ObjectNode> search_results;
    std::string error_message;
    if (not ParseJSONObject(response.body_, &search_results, &error_message)) {
        LOG_WARNING_TO(logger_, "can't determine the number of collections: " + error_message);
        return 0;
    }

    unsigned total;
    if (not StringUtil::ToUnsigned(StringUtil::TrimWhite(search_results->getScalarAsString("os:totalResults", "0")), &total))
        return 0;

    return total;
}


namespace {


// Each entry carries one link with the relation type "enclosure".  It points at the collection's KBART file.
std::string GetEnclosureLink(const JSON::ObjectNode &entry) {
    const auto links(entry.getOptionalArrayNode("links"));
    if (links == nullptr)
        return "";

    for (size_t i(0); i < links->size(); ++i) {
        const auto link(links->getOptionalObjectNode(i));
        if (link != nullptr and link->getOptionalStringValue("rel") == "enclosure")
            return link->getOptionalStringValue("href");
    }

    return "";
}


} // unnamed namespace


std::vector<CollectionDescriptor> KnowledgeBaseClient::getCollections() {
    typedef std::pair<unsigned, unsigned> Batch; // start index and item count
    typedef Util::Tasklet<Batch, Response> PageTasklet;

    const unsigned total(getTotalCollections());
    ThreadUtil::ThreadSafeCounter<unsigned> running_tasklets;
    std::vector<std::unique_ptr<PageTasklet>> page_tasklets;
    for (unsigned start(1); start <= total; start += PAGE_SIZE) {
        const Batch batch(start, std::min(PAGE_SIZE, total - start + 1));
        page_tasklets.emplace_back(new PageTasklet(
            &running_tasklets, "collections " + std::to_string(batch.first) + "+" + std::to_string(batch.second),
            [this](const Batch &page, Response * const response) {
                *response = get(endpoint_, { { "startIndex", std::to_string(page.first) }, { "itemsPerPage", std::to_string(page.second) } });
            },
            std::unique_ptr<Response>(new Response(Response::Sentinel(endpoint_))), batch, logger_));
        try {
            page_tasklets.back()->start();
        } catch (const std::runtime_error &x) {
            // A tasklet that never ran has no result, which ends the paging below.
            LOG_WARNING_TO(logger_, x.what());
        }
    }

    std::vector<CollectionDescriptor> collections;
    for (auto &page_tasklet : page_tasklets) {
        const std::unique_ptr<Response> response(page_tasklet->getResult());

        std::shared_ptr<const JSON::ObjectNode> search_results;
        std::string error_message;
        if (response == nullptr or not ParseJSONObject(response->body_, &search_results, &error_message)) {
            LOG_WARNING_TO(logger_, "Failed to retrieve collections from OCLC - API did not return a JSON object.");
            collections.emplace_back();
            break;
        }

        const auto entries(search_results->getOptionalArrayNode("entries"));
        if (entries == nullptr) {
            LOG_WARNING_TO(logger_, "Failed to retrieve collections from OCLC - missing \"entries\" in the results for "
                                    + page_tasklet->toString() + ".");
            collections.emplace_back();
            break;
        }

        for (size_t i(0); i < entries->size(); ++i) {
            const auto entry(entries->getOptionalObjectNode(i));
            if (entry == nullptr) {
                LOG_WARNING_TO(logger_, "skipping an entry that is not a JSON object in the results for " + page_tasklet->toString() + ".");
                continue;
            }

            collections.emplace_back(entry->getScalarAsString("kb:collection_uid"), entry->getOptionalStringValue("title"),
                                     GetEnclosureLink(*entry));
        }
    }

    return collections;
}


namespace {


const std::string RESOURCE_ID_COLUMN("oclc_number");
const std::string TITLE_COLUMN("publication_title");
const std::string LINK_COLUMN("title_url");


// Splits a tab-separated line into its values.  A trailing carriage return gets removed.
void SplitKBARTLine(std::string line, std::vector<std::string> * const values) {
    if (not line.empty() and line.back() == '\r')
        line.pop_back();
    StringUtil::Split(line, '\t', values, /* suppress_empty_components = */ false);
}


bool ParseKBART(const std::string &collection_id, const std::string &kbart, std::vector<ResourceRecord> * const resources) {
    std::istringstream input(kbart);
    std::string line;
    if (not std::getline(input, line))
        return false;

    std::vector<std::string> column_names;
    SplitKBARTLine(line, &column_names);
    for (auto &column_name : column_names)
        StringUtil::TrimWhite(&column_name);

    const auto resource_id_column(std::find(column_names.cbegin(), column_names.cend(), RESOURCE_ID_COLUMN));
    const auto title_column(std::find(column_names.cbegin(), column_names.cend(), TITLE_COLUMN));
    const auto link_column(std::find(column_names.cbegin(), column_names.cend(), LINK_COLUMN));
    if (resource_id_column == column_names.cend() or title_column == column_names.cend() or link_column == column_names.cend())
        return false;

    const size_t resource_id_index(resource_id_column - column_names.cbegin());
    const size_t title_index(title_column - column_names.cbegin());
    const size_t link_index(link_column - column_names.cbegin());

    std::vector<std::string> values;
    while (std::getline(input, line)) {
        SplitKBARTLine(line, &values);
        if (values.empty())
            continue;

        values.resize(column_names.size());
        resources->emplace_back(collection_id, values[resource_id_index], values[title_index],
                                StringUtil::TrimWhite(values[link_index]));
    }

    return true;
}


} // unnamed namespace


std::vector<ResourceRecord> KnowledgeBaseClient::getResources(const CollectionDescriptor &collection) {
    std::vector<ResourceRecord> resources;

    const Response response(get(collection.download_link_));
    if (response.isSentinel() or response.status_code_ >= 400) {
        LOG_WARNING_TO(logger_, "Failed to find resources for collection " + collection.id_ + " - Could not download KBART from OCLC.");
        resources.emplace_back(collection.id_, "", "", "");
        return resources;
    }

    if (not ParseKBART(collection.id_, response.body_, &resources)) {
        LOG_WARNING_TO(logger_, "Failed to find resources for collection " + collection.id_ + " - API did not return KBART.");
        resources.clear();
        resources.emplace_back(collection.id_, "", "", "");
    }

    return resources;
}


} // namespace LinkChecker
