/** \file   LinkCheckerConfig.cc
 *  \brief  Implementation of class LinkCheckerConfig.
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
#include "LinkCheckerConfig.h"
#include <cmath>
#include "IniFile.h"
#include "KnowledgeBaseClient.h"
#include "PolitenessFetcher.h"
#include "UrlUtil.h"


namespace LinkChecker {


const std::string LinkCheckerConfig::SECTION_NAME("Link Checker");
const std::string LinkCheckerConfig::DEFAULT_USER_AGENT("UB Link Checker");


namespace {


ClientSettings ReadClientSettings(const IniFile &ini_file, const std::string &section_name, const ClientSettings &defaults) {
    const IniFile::Section * const section(ini_file.getSection(section_name));
    if (section == nullptr)
        return defaults;

    const ClientSettings settings(section->getUnsigned("max_retries", defaults.max_retries_),
                                  section->getUnsigned("max_concurrent_requests", defaults.max_concurrent_requests_),
                                  section->getUnsigned("max_wait", defaults.max_wait_));
    if (unlikely(settings.max_concurrent_requests_ == 0))
        throw std::runtime_error("in ReadClientSettings: \"max_concurrent_requests\" in section \"" + section_name
                                 + "\" of \"" + ini_file.getFilename() + "\" must be positive!");

    return settings;
}


} // unnamed namespace


LinkCheckerConfig::LinkCheckerConfig(Logger * const logger)
    : logger_(logger), failure_threshold_(0.0),
      fetcher_settings_(PolitenessFetcher::DEFAULT_MAX_RETRIES, PolitenessFetcher::DEFAULT_MAX_CONCURRENT_REQUESTS,
                        PolitenessFetcher::DEFAULT_MAX_WAIT),
      knowledge_base_settings_(KnowledgeBaseClient::DEFAULT_MAX_RETRIES, KnowledgeBaseClient::DEFAULT_MAX_CONCURRENT_REQUESTS,
                               KnowledgeBaseClient::DEFAULT_MAX_WAIT),
      knowledge_base_endpoint_(KnowledgeBaseClient::DEFAULT_ENDPOINT)
{
}


LinkCheckerConfig::LinkCheckerConfig(const IniFile &ini_file, Logger * const logger): LinkCheckerConfig(logger) {
    const IniFile::Section * const section(ini_file.getSection(SECTION_NAME));
    if (unlikely(section == nullptr))
        throw std::runtime_error("in LinkCheckerConfig::LinkCheckerConfig: missing section \"" + SECTION_NAME + "\" in \""
                                 + ini_file.getFilename() + "\"!");

    wskey_ = StringUtil::TrimWhite(section->getString("wskey", ""));
    if (wskey_.empty())
        LOG_WARNING_TO(logger_, "no WSKey in \"" + ini_file.getFilename() + "\"!");
    user_agent_ = StringUtil::TrimWhite(section->getString("user_agent", ""));

    std::set<std::string> rejected_entries;
    ignorelist_ = ParseIgnorelist(section->getString("ignorelist", ""), &rejected_entries);
    for (const auto &rejected_entry : rejected_entries)
        LOG_WARNING_TO(logger_, "ignoring \"" + rejected_entry + "\" in the ignorelist because it is not a domain!");

    const std::string failure_threshold(StringUtil::TrimWhite(section->getString("failure_threshold", "0.0")));
    if (unlikely(not ParseFailureThreshold(failure_threshold, &failure_threshold_)))
        throw std::runtime_error("in LinkCheckerConfig::LinkCheckerConfig: \"failure_threshold\" must be between 0.0 and 1.0, found \""
                                 + failure_threshold + "\"!");

    fetcher_settings_ = ReadClientSettings(ini_file, "Fetcher", fetcher_settings_);
    knowledge_base_settings_ = ReadClientSettings(ini_file, "Knowledge Base", knowledge_base_settings_);

    const IniFile::Section * const knowledge_base_section(ini_file.getSection("Knowledge Base"));
    if (knowledge_base_section != nullptr)
        knowledge_base_endpoint_ = knowledge_base_section->getString("endpoint", knowledge_base_endpoint_);
}


std::string LinkCheckerConfig::update(const Candidate &candidate) {
    std::string errors;

    const std::string wskey(StringUtil::TrimWhite(candidate.wskey_));
    if (wskey.empty())
        errors += "WSKey must be a non-empty string. ";
    else
        wskey_ = wskey;

    const std::string user_agent(StringUtil::TrimWhite(candidate.user_agent_));
    if (not user_agent.empty())
        user_agent_ = user_agent;

    std::set<std::string> rejected_entries;
    ignorelist_ = ParseIgnorelist(candidate.ignorelist_, &rejected_entries);
    if (not rejected_entries.empty())
        errors += "Domain(s) " + StringUtil::Join(rejected_entries, ", ") + " not recognized as valid domains. ";

    double failure_threshold;
    if (ParseFailureThreshold(StringUtil::TrimWhite(candidate.failure_threshold_), &failure_threshold))
        failure_threshold_ = failure_threshold;
    else
        errors += "Fail threshold must be a numerical value between 0.0 and 1.0. ";

    LOG_DEBUG_TO(logger_, "updated settings: WSKey: " + wskey_ + ", User-Agent: " + user_agent_ + ", ignorelist: "
                 + StringUtil::Join(ignorelist_, ",") + ", failure threshold: " + StringUtil::ToString(failure_threshold_, 3));

    if (errors.empty())
        return "";
    StringUtil::TrimWhite(&errors);
    return "Failed to save all changes to config: " + errors;
}


std::string LinkCheckerConfig::toString() const {
    std::string ini_text;
    ini_text += "[" + SECTION_NAME + "]\n";
    ini_text += "wskey = " + wskey_ + "\n";
    ini_text += "user_agent = " + user_agent_ + "\n";
    ini_text += "ignorelist = " + StringUtil::Join(ignorelist_, ",") + "\n";
    ini_text += "failure_threshold = " + StringUtil::ToString(failure_threshold_, 3) + "\n";

    ini_text += "\n[Fetcher]\n";
    ini_text += "max_retries = " + std::to_string(fetcher_settings_.max_retries_) + "\n";
    ini_text += "max_concurrent_requests = " + std::to_string(fetcher_settings_.max_concurrent_requests_) + "\n";
    ini_text += "max_wait = " + std::to_string(fetcher_settings_.max_wait_) + "\n";

    ini_text += "\n[Knowledge Base]\n";
    ini_text += "endpoint = " + knowledge_base_endpoint_ + "\n";
    ini_text += "max_retries = " + std::to_string(knowledge_base_settings_.max_retries_) + "\n";
    ini_text += "max_concurrent_requests = " + std::to_string(knowledge_base_settings_.max_concurrent_requests_) + "\n";
    ini_text += "max_wait = " + std::to_string(knowledge_base_settings_.max_wait_) + "\n";

    return ini_text;
}


bool LinkCheckerConfig::IsIgnorableDomain(const std::string &domain) {
    return UrlUtil::IsDomain(domain) and UrlUtil::GetDomain("https://" + domain) == domain;
}


bool LinkCheckerConfig::ParseFailureThreshold(const std::string &s, double * const failure_threshold) {
    double threshold;
    if (not StringUtil::ToDouble(s, &threshold))
        return false;

    threshold = std::round(threshold * 1000.0) / 1000.0;
    if (not (threshold >= 0.0 and threshold <= 1.0)) // Also rejects NaN.
        return false;

    *failure_threshold = threshold;
    return true;
}


std::set<std::string> LinkCheckerConfig::ParseIgnorelist(const std::string &ignorelist, std::set<std::string> * const rejected_entries) {
    std::vector<std::string> entries;
    StringUtil::SplitThenTrimWhite(ignorelist, ',', &entries);

    std::set<std::string> domains;
    for (const auto &entry : entries) {
        if (IsIgnorableDomain(entry))
            domains.emplace(entry);
        else
            rejected_entries->emplace(entry);
    }

    return domains;
}


} // namespace LinkChecker
