/** \file   LinkCheckerConfig.h
 *  \brief  The settings of the link checker.
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


#include <set>
#include <string>
#include "StringUtil.h"
#include "util.h"


class IniFile;


namespace LinkChecker {


// Limits that apply to one HTTP client.
struct ClientSettings {
    unsigned max_retries_;
    unsigned max_concurrent_requests_;
    unsigned max_wait_; // In seconds.

public:
    ClientSettings(const unsigned max_retries, const unsigned max_concurrent_requests, const unsigned max_wait)
        : max_retries_(max_retries), max_concurrent_requests_(max_concurrent_requests), max_wait_(max_wait) { }
};


/** \class  LinkCheckerConfig
 *  \brief  Holds the operator-modifiable settings.
 *
 *  The settings are read from an INI file with a mandatory "Link Checker" section and optional "Fetcher" and
 *  "Knowledge Base" sections:
 *
 *      [Link Checker]
 *      wskey             = <API credential>
 *      user_agent        = <User-Agent header value>
 *      ignorelist        = example.com, example.org
 *      failure_threshold = 0.25
 *
 *      [Fetcher]
 *      max_retries             = 2
 *      max_concurrent_requests = 5
 *      max_wait                = 60
 *
 *      [Knowledge Base]
 *      endpoint                = https://worldcat.org/webservices/kb/rest/collections/search
 *      max_retries             = 2
 *      max_concurrent_requests = 10
 *      max_wait                = 300
 */
class LinkCheckerConfig {
public:
    // Unvalidated settings as an operator entered them.
    struct Candidate {
        std::string wskey_;
        std::string user_agent_;
        std::string ignorelist_; // Comma-separated domains.
        std::string failure_threshold_;

    public:
        Candidate(const std::string &wskey, const std::string &user_agent, const std::string &ignorelist,
                  const std::string &failure_threshold)
            : wskey_(wskey), user_agent_(user_agent), ignorelist_(ignorelist), failure_threshold_(failure_threshold) { }
    };

    static const std::string SECTION_NAME;
    static const std::string DEFAULT_USER_AGENT;
private:
    Logger * const logger_;
    std::string wskey_;
    std::string user_agent_;
    std::set<std::string> ignorelist_;
    double failure_threshold_;
    ClientSettings fetcher_settings_;
    ClientSettings knowledge_base_settings_;
    std::string knowledge_base_endpoint_;
public:
    // Default settings, without a credential.
    explicit LinkCheckerConfig(Logger * const logger = ::logger);

    /** \note Throws if the file can't be read, the "Link Checker" section is missing or a value is malformed. */
    explicit LinkCheckerConfig(const IniFile &ini_file, Logger * const logger = ::logger);

    inline const std::string &getWSKey() const { return wskey_; }
    inline bool hasWSKey() const { return not StringUtil::TrimWhite(wskey_).empty(); }

    /** \return The configured User-Agent or DEFAULT_USER_AGENT if none was configured. */
    inline const std::string &getUserAgent() const { return user_agent_.empty() ? DEFAULT_USER_AGENT : user_agent_; }

    inline const std::set<std::string> &getIgnorelist() const { return ignorelist_; }
    inline double getFailureThreshold() const { return failure_threshold_; }
    inline const ClientSettings &getFetcherSettings() const { return fetcher_settings_; }
    inline const ClientSettings &getKnowledgeBaseSettings() const { return knowledge_base_settings_; }
    inline const std::string &getKnowledgeBaseEndpoint() const { return knowledge_base_endpoint_; }

    /** \brief  Validates "candidate" and takes over the acceptable values.
     *  \return An empty string if all values were accepted, otherwise a description of the problems.
     *  \note   An unacceptable credential, User-Agent or threshold leaves the previous value in place.  Unacceptable
     *          ignorelist entries are dropped.
     */
    std::string update(const Candidate &candidate);

    /** \brief Renders the settings in the format that the constructor reads. */
    std::string toString() const;

    /** \return True if "domain" is a bare registrable domain like "example.co.uk". */
    static bool IsIgnorableDomain(const std::string &domain);

    /** \brief  Parses a failure threshold.
     *  \return False unless "s" is a number between 0.0 and 1.0.  The threshold is rounded to 3 decimal places.
     */
    static bool ParseFailureThreshold(const std::string &s, double * const failure_threshold);
private:
    // Parses "ignorelist" and reports entries that aren't domains in "rejected_entries".
    static std::set<std::string> ParseIgnorelist(const std::string &ignorelist, std::set<std::string> * const rejected_entries);
};


} // namespace LinkChecker
