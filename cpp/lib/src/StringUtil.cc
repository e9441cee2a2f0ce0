/** \file   StringUtil.cc
 *  \brief  Implementation of string helpers used throughout the link checker.
 *
 *  \copyright 2002-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "StringUtil.h"
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include "util.h"


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\f\r");


std::string Trim(const std::string &trim_set, std::string * const s) {
    const auto first(s->find_first_not_of(trim_set));
    if (first == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last(s->find_last_not_of(trim_set));
    *s = s->substr(first, last - first + 1);
    return *s;
}


std::string ToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return *s;
}


unsigned Split(const std::string &source, const char delimiter, std::vector<std::string> * const fields,
               const bool suppress_empty_components)
{
    fields->clear();
    if (source.empty())
        return 0;

    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find(delimiter, start));
        const std::string field(source.substr(start, next_delimiter == std::string::npos ? std::string::npos : next_delimiter - start));
        if (not suppress_empty_components or not field.empty())
            fields->emplace_back(field);
        if (next_delimiter == std::string::npos)
            break;
        start = next_delimiter + 1;
    }

    return static_cast<unsigned>(fields->size());
}


unsigned SplitThenTrimWhite(const std::string &source, const char delimiter, std::vector<std::string> * const fields,
                            const bool suppress_empty_components)
{
    std::vector<std::string> raw_fields;
    Split(source, delimiter, &raw_fields, /* suppress_empty_components = */ false);

    fields->clear();
    for (auto &raw_field : raw_fields) {
        TrimWhite(&raw_field);
        if (not suppress_empty_components or not raw_field.empty())
            fields->emplace_back(raw_field);
    }

    return static_cast<unsigned>(fields->size());
}


bool ToUnsigned(const std::string &s, unsigned * const n) {
    if (not IsUnsignedDecimalNumber(s))
        return false;

    errno = 0;
    char *endptr;
    const unsigned long value(std::strtoul(s.c_str(), &endptr, 10));
    if (errno != 0 or *endptr != '\0' or value > UINT_MAX) {
        errno = 0;
        return false;
    }

    *n = static_cast<unsigned>(value);
    return true;
}


bool ToInt(const std::string &s, int * const n) {
    const bool negative(not s.empty() and s[0] == '-');
    if (not IsUnsignedDecimalNumber(negative ? s.substr(1) : s))
        return false;

    errno = 0;
    char *endptr;
    const long value(std::strtol(s.c_str(), &endptr, 10));
    if (errno != 0 or *endptr != '\0' or value < INT_MIN or value > INT_MAX) {
        errno = 0;
        return false;
    }

    *n = static_cast<int>(value);
    return true;
}


bool ToDouble(const std::string &s, double * const n) {
    if (s.empty())
        return false;

    errno = 0;
    char *endptr;
    *n = std::strtod(s.c_str(), &endptr);
    if (errno != 0 or *endptr != '\0') {
        errno = 0;
        return false;
    }

    return true;
}


bool IsUnsignedDecimalNumber(const std::string &s) {
    if (s.empty())
        return false;
    return std::all_of(s.cbegin(), s.cend(), [](const char ch) { return std::isdigit(static_cast<unsigned char>(ch)); });
}


unsigned char FromHex(const char ch) {
    if (ch >= '0' and ch <= '9')
        return static_cast<unsigned char>(ch - '0');
    if (ch >= 'A' and ch <= 'F')
        return static_cast<unsigned char>(ch - 'A' + 10);
    if (ch >= 'a' and ch <= 'f')
        return static_cast<unsigned char>(ch - 'a' + 10);

    throw std::runtime_error("in StringUtil::FromHex: invalid hex character '" + std::string(1, ch) + "'!");
}


std::string &Map(std::string * const s, const std::string &old_set, const std::string &new_set) {
    if (unlikely(old_set.length() != new_set.length()))
        throw std::runtime_error("in StringUtil::Map: \"old_set\" and \"new_set\" must have the same length!");

    for (auto &ch : *s) {
        const auto pos(old_set.find(ch));
        if (pos != std::string::npos)
            ch = new_set[pos];
    }

    return *s;
}


std::string &Collapse(std::string * const s, const char scan_ch) {
    std::string collapsed;
    collapsed.reserve(s->length());
    bool last_was_scan_ch(false);
    for (const char ch : *s) {
        if (ch == scan_ch) {
            if (last_was_scan_ch)
                continue;
            last_was_scan_ch = true;
        } else
            last_was_scan_ch = false;
        collapsed += ch;
    }

    s->swap(collapsed);
    return *s;
}


std::string ToString(const double value, const unsigned precision) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", static_cast<int>(precision), value);
    return buffer;
}


} // namespace StringUtil
