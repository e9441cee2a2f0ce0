/** \file    RobotsDotTxt.h
 *  \brief   Declaration of the RobotsDotTxt class.
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
#pragma once


#include <string>
#include <vector>


/** \class  RobotsDotTxt
 *  \brief  Attempts to implement the behaviour as specified by http://www.robotstxt.org/wc/norobots-rfc.html.
 */
class RobotsDotTxt {
    enum RuleType { ALLOW, DISALLOW };

    class Rule {
        RuleType rule_type_;
        std::string path_prefix_;
    public:
        Rule(const RuleType rule_type, const std::string &path_prefix);
        bool match(const std::string &path) const;
        RuleType getRuleType() const { return rule_type_; }
    };

    class UserAgentDescriptor {
        std::vector<std::string> user_agent_patterns_;
        std::vector<Rule> rules_;
        unsigned crawl_delay_;
    public:
        UserAgentDescriptor(): crawl_delay_(0) { }
        void addUserAgent(const std::string &user_agent_pattern) { user_agent_patterns_.push_back(user_agent_pattern); }
        void addRule(const RuleType rule_type, const std::string &value);
        void setCrawlDelay(const unsigned new_crawl_delay) { crawl_delay_ = new_crawl_delay; }
        bool match(const std::string &user_agent_string) const;
        const std::vector<Rule> &getRules() const { return rules_; }
        unsigned getCrawlDelay() const { return crawl_delay_; }
        void copyRules(const UserAgentDescriptor &from);
        size_t getNoOfUserAgentPatterns() const { return user_agent_patterns_.size(); }
        void clear() { user_agent_patterns_.clear();  rules_.clear();  crawl_delay_ = 0; }
    };
    std::vector<UserAgentDescriptor> user_agent_descriptors_;
public:
    /** \brief  Constructs a RobotsDotTxt object.
     *  \param  robots_dot_txt  The contents of a Web server's "robots.txt" file.
     */
    explicit RobotsDotTxt(const std::string &robots_dot_txt) { reinitialize(robots_dot_txt); }

    /** \brief   Checks access rights for a given user-agent and path.
     *  \param   user_agent  A string used by the caller to identify itself to the Web server whose
     *                       robots.txt file the current object represents.
     *  \param   path        The path we'd like to access.
     *  \return  True if "user_agent" is allowed to access "path", else false.
     *  \note    The pattern matching for the user agent is case insensitive!
     */
    bool accessAllowed(const std::string &user_agent, const std::string &path) const;

    /** \brief  Returns the crawl delay specified in a robots.txt file or 0 for no specified crawl delay. */
    unsigned getCrawlDelay(const std::string &user_agent) const;

    /** \brief  Resets the access rules based on a new robots.txt document.
     *  \param  robots_dot_txt  The contents of a Web server's "robots.txt" file.
     */
    void reinitialize(const std::string &robots_dot_txt);
};
