/** \file    UrlUtil.h
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
#pragma once


#include <string>


namespace UrlUtil {


/** \brief  Splits an absolute URL into its scheme, host and path.
 *  \param  host  Lowercased and stripped of any user info and port.
 *  \param  path  The path without query or fragment. "/" if the URL has no path.
 *  \return False if "url" has no scheme or no host.
 */
bool ParseUrl(const std::string &url, std::string * const scheme, std::string * const host, std::string * const path);


/** \return The lowercased host of "url" or the empty string if "url" can't be parsed. */
std::string GetHost(const std::string &url);


/** \return The path of "url" (without query or fragment), "/" if there is none or if "url" can't be parsed. */
std::string GetPath(const std::string &url);


/** \brief  Determines the registrable domain of the host of "url", e.g. "bbc.co.uk" for "https://www.bbc.co.uk/news".
 *  \return The domain or the empty string if "url" can't be parsed.
 *  \note   Hosts that are IP addresses or consist of a single label are returned unchanged.
 */
std::string GetDomain(const std::string &url);


/** \return True if "candidate" looks like a bare domain name, i.e. at least two dot-separated labels consisting of
 *          letters, digits and hyphens where the last label is alphabetic.
 */
bool IsDomain(const std::string &candidate);


inline std::string GetRobotsDotTxtUrl(const std::string &domain) { return "https://" + domain + "/robots.txt"; }


} // namespace UrlUtil
