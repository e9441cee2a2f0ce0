/** \file   StringUtil.h
 *  \brief  String helpers used throughout the link checker.
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
#pragma once


#include <string>
#include <vector>


namespace StringUtil {


extern const std::string WHITE_SPACE;


/** \brief   Remove all occurences of characters in "trim_set" from either end of "s".
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


std::string ToLower(std::string * const s);


inline std::string ToLower(const std::string &s) {
    std::string temp_s(s);
    return ToLower(&temp_s);
}


inline bool StartsWith(const std::string &s, const std::string &prefix) {
    return s.compare(0, prefix.length(), prefix) == 0;
}


inline bool EndsWith(const std::string &s, const std::string &suffix) {
    return s.length() >= suffix.length() and s.compare(s.length() - suffix.length(), suffix.length(), suffix) == 0;
}


/** \brief  Splits "source" around each occurrence of "delimiter".
 *  \param  suppress_empty_components  If true, empty fields will not be returned.
 *  \return The number of fields stored in "fields".
 *  \note   Unlike some other split functions, "a,,b" yields three fields if "suppress_empty_components" is false.
 */
unsigned Split(const std::string &source, const char delimiter, std::vector<std::string> * const fields,
               const bool suppress_empty_components = true);


/** \brief Like Split() but also trims whitespace from each field before empty fields are suppressed. */
unsigned SplitThenTrimWhite(const std::string &source, const char delimiter, std::vector<std::string> * const fields,
                            const bool suppress_empty_components = true);


template <typename StringContainer>
std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    for (auto element(source.begin()); element != source.end(); ++element) {
        if (element != source.begin())
            dest += separator;
        dest += *element;
    }

    return dest;
}


/** \brief  Converts a string to an unsigned number.
 *  \return True if "s" consisted of nothing but decimal digits and fits into an unsigned, else false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n);


/** \brief  Converts a string to a signed int.  An optional leading minus sign is allowed.
 *  \return True if the conversion succeeded, else false.
 */
bool ToInt(const std::string &s, int * const n);


/** \return True if "s" could be completely converted to a double, else false. */
bool ToDouble(const std::string &s, double * const n);


/** \return True if "s" is non-empty and consists only of the digits 0-9. */
bool IsUnsignedDecimalNumber(const std::string &s);


/** \brief Converts a hex digit to its numeric value.  Throws if "ch" is not a hex digit. */
unsigned char FromHex(const char ch);


/** \brief  Replaces each character found in "old_set" with the character at the same position in "new_set". */
std::string &Map(std::string * const s, const std::string &old_set, const std::string &new_set);


/** \brief  Replaces runs of "scan_ch" with a single occurrence of "scan_ch". */
std::string &Collapse(std::string * const s, const char scan_ch = ' ');


/** \brief  Renders "value" with exactly "precision" digits after the decimal point. */
std::string ToString(const double value, const unsigned precision);


} // namespace StringUtil
