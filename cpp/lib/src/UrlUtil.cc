/** \file    UrlUtil.cc
 *  \brief   URL-related utility functions.
 */

/*
 *  Copyright 2004-2008 Project iVia.
 *  Copyright 2004-2008 The Regents of The University of California.
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
#include "UrlUtil.h"
#include <algorithm>
#include <unordered_set>
#include <vector>
#include <cctype>
#include "StringUtil.h"


namespace UrlUtil {


bool ParseUrl(const std::string &url, std::string * const scheme, std::string * const host, std::string * const path) {
    const std::string trimmed_url(StringUtil::TrimWhite(url));
    const auto scheme_end(trimmed_url.find("://"));
    if (scheme_end == std::string::npos or scheme_end == 0)
        return false;
    *scheme = StringUtil::ToLower(trimmed_url.substr(0, scheme_end));
    if (not std::all_of(scheme->cbegin(), scheme->cend(),
                        [](const char ch) { return std::isalnum(static_cast<unsigned char>(ch)) or ch == '+' or ch == '-' or ch == '.'; }))
        return false;

    const auto authority_start(scheme_end + 3);
    auto authority_end(trimmed_url.find_first_of("/?#", authority_start));
    if (authority_end == std::string::npos)
        authority_end = trimmed_url.length();
    std::string authority(trimmed_url.substr(authority_start, authority_end - authority_start));

    const auto at_pos(authority.rfind('@'));
    if (at_pos != std::string::npos)
        authority = authority.substr(at_pos + 1);

    if (not authority.empty() and authority[0] == '[') { // IPv6 literal
        const auto closing_bracket_pos(authority.find(']'));
        if (closing_bracket_pos == std::string::npos)
            return false;
        authority = authority.substr(0, closing_bracket_pos + 1);
    } else {
        const auto colon_pos(authority.find(':'));
        if (colon_pos != std::string::npos)
            authority.resize(colon_pos);
    }
    if (authority.empty())
        return false;
    *host = StringUtil::ToLower(authority);
    if (host->back() == '.')
        host->pop_back();

    if (authority_end == trimmed_url.length() or trimmed_url[authority_end] != '/')
        *path = "/";
    else {
        const auto path_end(trimmed_url.find_first_of("?#", authority_end));
        *path = trimmed_url.substr(authority_end, path_end == std::string::npos ? std::string::npos : path_end - authority_end);
    }

    return true;
}


std::string GetHost(const std::string &url) {
    std::string scheme, host, path;
    if (not ParseUrl(url, &scheme, &host, &path))
        return "";
    return host;
}


std::string GetPath(const std::string &url) {
    std::string scheme, host, path;
    if (not ParseUrl(url, &scheme, &host, &path))
        return "/";
    return path;
}


namespace {


// Public suffixes that consist of more than one label.  Everything else is assumed to be a single-label suffix.
const std::unordered_set<std::string> MULTI_LABEL_PUBLIC_SUFFIXES{
    "ac.uk",    "co.uk",     "gov.uk",      "ltd.uk",      "me.uk",      "net.uk",      "org.uk",     "plc.uk",
    "sch.uk",   "nhs.uk",    "police.uk",   "ac.jp",       "co.jp",      "go.jp",       "ne.jp",      "or.jp",
    "com.au",   "edu.au",    "gov.au",      "net.au",      "org.au",     "asn.au",      "id.au",      "co.nz",
    "ac.nz",    "govt.nz",   "org.nz",      "net.nz",      "com.br",     "gov.br",      "org.br",     "edu.br",
    "com.cn",   "edu.cn",    "gov.cn",      "net.cn",      "org.cn",     "ac.cn",       "com.tw",     "edu.tw",
    "com.hk",   "edu.hk",    "org.hk",      "co.in",       "ac.in",      "gov.in",      "res.in",     "co.za",
    "ac.za",    "org.za",    "com.mx",      "edu.mx",      "com.ar",     "edu.ar",      "com.tr",     "edu.tr",
    "ac.kr",    "co.kr",     "or.kr",       "com.sg",      "edu.sg",     "ac.il",       "co.il",      "org.il",
    "ac.at",    "co.at",     "or.at",       "com.pl",      "edu.pl",     "com.es",      "edu.es",     "ac.be",
    "github.io", "gitlab.io", "blogspot.com", "herokuapp.com", "netlify.app", "pages.dev", "wordpress.com",
    "readthedocs.io", "azurewebsites.net", "cloudfront.net", "appspot.com", "s3.amazonaws.com",
};


bool IsIPv4Address(const std::string &host) {
    std::vector<std::string> octets;
    if (StringUtil::Split(host, '.', &octets, /* suppress_empty_components = */ false) != 4)
        return false;
    for (const auto &octet : octets) {
        unsigned value;
        if (not StringUtil::ToUnsigned(octet, &value) or value > 255)
            return false;
    }
    return true;
}


} // unnamed namespace


std::string GetDomain(const std::string &url) {
    const std::string host(GetHost(url));
    if (host.empty() or host[0] == '[' or IsIPv4Address(host))
        return host;

    std::vector<std::string> labels;
    if (StringUtil::Split(host, '.', &labels) < 2)
        return host;

    // Find the longest known suffix and keep exactly one more label:
    size_t suffix_label_count(1);
    for (size_t candidate_label_count(labels.size() - 1); candidate_label_count > 1; --candidate_label_count) {
        const std::vector<std::string> suffix_labels(labels.end() - candidate_label_count, labels.end());
        if (MULTI_LABEL_PUBLIC_SUFFIXES.find(StringUtil::Join(suffix_labels, ".")) != MULTI_LABEL_PUBLIC_SUFFIXES.end()) {
            suffix_label_count = candidate_label_count;
            break;
        }
    }

    if (suffix_label_count >= labels.size())
        return host;
    const std::vector<std::string> domain_labels(labels.end() - (suffix_label_count + 1), labels.end());
    return StringUtil::Join(domain_labels, ".");
}


bool IsDomain(const std::string &candidate) {
    std::vector<std::string> labels;
    if (StringUtil::Split(candidate, '.', &labels, /* suppress_empty_components = */ false) < 2)
        return false;

    for (const auto &label : labels) {
        if (label.empty() or label.length() > 63 or label.front() == '-' or label.back() == '-')
            return false;
        if (not std::all_of(label.cbegin(), label.cend(),
                            [](const char ch) { return std::isalnum(static_cast<unsigned char>(ch)) or ch == '-'; }))
            return false;
    }

    const std::string &top_level_domain(labels.back());
    return top_level_domain.length() >= 2
           and std::all_of(top_level_domain.cbegin(), top_level_domain.cend(),
                           [](const char ch) { return std::isalpha(static_cast<unsigned char>(ch)); });
}


} // namespace UrlUtil
