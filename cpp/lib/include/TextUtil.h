/** \file    TextUtil.h
 *  \brief   Declarations of text related utility functions.
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen.
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


#include <istream>
#include <string>
#include <vector>
#include <cstdint>


namespace TextUtil {


/** \brief Escapes "value" as a comma-separated value.
 *  \param value       The UTF-8 character sequence to be encoded.
 *  \param add_quotes  If true, enclosing quotes are added about the escaped value.
 *  \return The converted (double quotes being replaced by two consecutive double quotes) value.
 */
std::string CSVEscape(const std::string &value, const bool add_quotes = true);

inline std::string CSVEscape(const int value, const bool add_quotes = true)
    { return CSVEscape(std::to_string(value), add_quotes); }


/** \brief  Joins "values" into a single CSV line, including the terminating CR/LF pair.
 *  \note   Every value is quoted.
 */
std::string CSVLine(const std::vector<std::string> &values, const char separator = ',');


/** \class CSVReader
 *  \brief Reads CSV records that follow the standard specified by RFC 4180 (when "separator," and "quote" have their
 *         default values) with the exception that line breaks may be be either carriage-return/linefeed pairs or just
 *         individual linefeed characters.
 *  \note  Quoted values may contain line breaks, so a single record can span several physical lines.
 */
class CSVReader {
    std::istream &input_;
    const char separator_;
    const char quote_;
    unsigned line_no_;
    enum TokenType { VALUE, SEPARATOR, LINE_END, END_OF_INPUT, SYNTAX_ERROR };
    std::string value_;
    std::string err_msg_;
public:
    explicit CSVReader(std::istream &input, const char separator = ',', const char quote = '"')
        : input_(input), separator_(separator), quote_(quote), line_no_(1) { }

    /** \brief  Reads the next non-empty record.
     *  \return False if we reached the end of our input.
     *  \note   Throws on malformed input.
     */
    bool readRecord(std::vector<std::string> * const values);

    inline unsigned getLineNo() const { return line_no_; }
private:
    TokenType getToken();
};


/** \return The Unicode replacement character U+FFFD encoded as UTF-8. */
const std::string &GetUTF8ReplacementCharacter();


std::string UTF32ToUTF8(const uint32_t code_point);


bool IsValidUTF8(const std::string &utf8_candidate);


/** \brief Replaces every byte sequence in "s" that is not valid UTF-8 with U+FFFD.
 *  \return The number of replacements that were made.
 */
unsigned ReplaceInvalidUTF8Sequences(std::string * const s);


} // namespace TextUtil
