/** \file    RobotsDotTxt.cc
 *  \brief   Implementation of the RobotsDotTxt class.
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#include "RobotsDotTxt.h"
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <strings.h>
#include "StringUtil.h"
#include "util.h"


namespace {


std::string CanonizePath(const std::string &non_canonical_path) {
    std::string canonical_path;
    canonical_path.reserve(non_canonical_path.length());

    for (auto ch(non_canonical_path.cbegin()); ch != non_canonical_path.cend(); ++ch) {
        if (unlikely(*ch == '%')) {
            ++ch;
            if (unlikely(ch == non_canonical_path.cend())) {
                canonical_path += '%';
                break;
            }

            char first_hex_char(*ch);
            if (unlikely(not std::isxdigit(static_cast<unsigned char>(first_hex_char)))) {
                canonical_path += '%';
                canonical_path += first_hex_char;
                continue;
            }

            ++ch;
            if (unlikely(ch == non_canonical_path.cend())) {
                canonical_path += '%';
                canonical_path += first_hex_char;
                break;
            }

            char second_hex_char(*ch);
            if (unlikely(not std::isxdigit(static_cast<unsigned char>(second_hex_char)))) {
                canonical_path += '%';
                canonical_path += first_hex_char;
                canonical_path += second_hex_char;
                continue;
            }

            first_hex_char  = static_cast<char>(std::toupper(first_hex_char));
            second_hex_char = static_cast<char>(std::toupper(second_hex_char));

            // Don't replace the escaped slash with an actual slash!
            if (unlikely(first_hex_char == '2' and second_hex_char == 'F'))
                canonical_path += "%2F";
            else
                canonical_path += static_cast<char>((StringUtil::FromHex(first_hex_char) << 4)
                                                    | StringUtil::FromHex(second_hex_char));
        } else
            canonical_path += *ch;
    }

    return canonical_path;
}


} // unnamed namespace


RobotsDotTxt::Rule::Rule(const RuleType rule_type, const std::string &path_prefix)
    : rule_type_(rule_type), path_prefix_(CanonizePath(path_prefix)) { }


bool RobotsDotTxt::Rule::match(const std::string &path) const {
    if (path_prefix_.empty())
        return true;

    const std::string canonical_path(CanonizePath(path));
    return ::strncasecmp(path_prefix_.c_str(), canonical_path.c_str(), path_prefix_.length()) == 0;
}


void RobotsDotTxt::UserAgentDescriptor::addRule(const RuleType rule_type, const std::string &value) {
    if (unlikely(value.empty())) {
        switch (rule_type) {
        case ALLOW:
            rules_.emplace_back(DISALLOW, "/");
            return;
        case DISALLOW:
            rules_.emplace_back(ALLOW, "/");
            return;
        }
    }

    rules_.emplace_back(rule_type, value);
}


bool RobotsDotTxt::UserAgentDescriptor::match(const std::string &user_agent_string) const {
    for (const auto &pattern : user_agent_patterns_) {
        if (pattern == "*" or ::strncasecmp(pattern.c_str(), user_agent_string.c_str(), pattern.length()) == 0)
            return true;
    }

    return false;
}


void RobotsDotTxt::UserAgentDescriptor::copyRules(const UserAgentDescriptor &from) {
    rules_.insert(rules_.end(), from.rules_.cbegin(), from.rules_.cend());
    if (from.crawl_delay_ != 0)
        crawl_delay_ = from.crawl_delay_;
}


bool RobotsDotTxt::accessAllowed(const std::string &user_agent, const std::string &path) const {
    // Always allow access to the robots.txt file:
    if (::strcasecmp("/robots.txt", path.c_str()) == 0)
        return true;

    for (const auto &user_agent_descriptor : user_agent_descriptors_) {
        if (user_agent_descriptor.match(user_agent)) {
            for (const auto &rule : user_agent_descriptor.getRules()) {
                if (rule.match(path))
                    return rule.getRuleType() == ALLOW;
            }

            // If we make it here it means we had a match on the user-agent string and must bail out!
            return true;
        }
    }

    // If we made it here we didn't match the wild card user agent descriptor.
    return true;
}


unsigned RobotsDotTxt::getCrawlDelay(const std::string &user_agent) const {
    for (const auto &user_agent_descriptor : user_agent_descriptors_) {
        if (user_agent_descriptor.match(user_agent))
            return user_agent_descriptor.getCrawlDelay();
    }

    return 0; // Default: no specified delay found.
}


namespace {


enum LineType { BLANK, COMMENT, GARBAGE, USER_AGENT, RULE, CRAWL_DELAY };


// ParseLine -- break a line from a robots.txt file into its components.  Please note that "rule_type" will only refer
//              to something meaningful if this function returns RULE!  "value" will only have meaning if USER_AGENT,
//              CRAWL_DELAY or RULE has been returned!
//
LineType ParseLine(std::string line, std::string * const rule_type, std::string * const value) {
    // Remove any comments:
    bool comment_found;
    const std::string::size_type hash_pos(line.find('#'));
    if (hash_pos == std::string::npos)
        comment_found = false;
    else {
        comment_found = true;
        line.resize(hash_pos);
    }

    StringUtil::TrimWhite(&line);
    if (line.empty())
        return comment_found ? COMMENT : BLANK;

    const std::string::size_type colon_pos(line.find(':'));
    if (colon_pos == std::string::npos or colon_pos == 0)
        return GARBAGE;

    const std::string field_name(StringUtil::TrimWhite(line.substr(0, colon_pos)));
    LineType line_type(RULE);
    if (::strcasecmp(field_name.c_str(), "User-agent") == 0)
        line_type = USER_AGENT;
    else if (::strcasecmp(field_name.c_str(), "Crawl-delay") == 0)
        line_type = CRAWL_DELAY;

    const std::string remainder(StringUtil::TrimWhite(line.substr(colon_pos + 1)));
    if (remainder.empty() and (line_type == USER_AGENT or line_type == CRAWL_DELAY))
        return GARBAGE;

    *value = remainder;

    if (line_type == RULE)
        *rule_type = field_name;

    return line_type;
}


} // unnamed namespace


void RobotsDotTxt::reinitialize(const std::string &robots_dot_txt) {
    user_agent_descriptors_.clear();

    std::string rules(robots_dot_txt);

    // Translate carriage returns to newlines and tabs to spaces:
    StringUtil::Map(&rules, "\r\t", "\n ");

    StringUtil::Collapse(&rules, '\n');
    StringUtil::Collapse(&rules, ' ');

    UserAgentDescriptor wild_card_user_agent;
    wild_card_user_agent.addUserAgent("*");
    bool wild_card_seen(false);

    UserAgentDescriptor temp_descriptor;
    enum State { LOOKING_FOR_USER_AGENT, PARSING_RULES } state(LOOKING_FOR_USER_AGENT);

    const auto add_rule([&temp_descriptor](const std::string &rule_type, const std::string &value) {
        if (::strcasecmp("Disallow", rule_type.c_str()) == 0)
            temp_descriptor.addRule(DISALLOW, value);
        else if (::strcasecmp("Allow", rule_type.c_str()) == 0)
            temp_descriptor.addRule(ALLOW, value);
    });

    // Now we process a line at a time:
    std::istringstream lines(rules);
    std::string line;
    while (std::getline(lines, line)) {
        std::string rule_type, value;
        const LineType line_type(ParseLine(line, &rule_type, &value));
        if (line_type == GARBAGE or line_type == COMMENT)
            continue;

        if (state == LOOKING_FOR_USER_AGENT) {
            if (line_type == USER_AGENT) {
                if (value == "*")
                    wild_card_seen = true;
                else
                    temp_descriptor.addUserAgent(value);
            } else if (line_type == RULE) {
                add_rule(rule_type, value);
                state = PARSING_RULES;
            } else if (line_type == CRAWL_DELAY) {
                unsigned crawl_delay;
                if (StringUtil::ToUnsigned(value, &crawl_delay))
                    temp_descriptor.setCrawlDelay(crawl_delay);
                state = PARSING_RULES;
            } else if (line_type == BLANK) {
                wild_card_seen = false;
                temp_descriptor.clear();
            }
        } else if (state == PARSING_RULES) {
            if (line_type == RULE)
                add_rule(rule_type, value);
            else if (line_type == CRAWL_DELAY) {
                unsigned crawl_delay;
                if (StringUtil::ToUnsigned(value, &crawl_delay))
                    temp_descriptor.setCrawlDelay(crawl_delay);
            } else {
                if (temp_descriptor.getNoOfUserAgentPatterns() > 0)
                    user_agent_descriptors_.push_back(temp_descriptor);
                if (wild_card_seen)
                    wild_card_user_agent.copyRules(temp_descriptor);
                wild_card_seen = false;
                temp_descriptor.clear();

                // A new group usually starts with a blank line but we want to be tolerant.
                if (line_type == USER_AGENT) {
                    if (value == "*")
                        wild_card_seen = true;
                    else
                        temp_descriptor.addUserAgent(value);
                }

                state = LOOKING_FOR_USER_AGENT;
            }
        }
    }

    if (temp_descriptor.getNoOfUserAgentPatterns() > 0)
        user_agent_descriptors_.push_back(temp_descriptor);
    if (wild_card_seen)
        wild_card_user_agent.copyRules(temp_descriptor);

    user_agent_descriptors_.push_back(wild_card_user_agent);
}
