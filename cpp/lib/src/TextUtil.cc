/** \file    TextUtil.cc
 *  \brief   Implementation of text related utility functions.
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
#include "TextUtil.h"
#include <stdexcept>
#include "util.h"


namespace TextUtil {


std::string CSVEscape(const std::string &value, const bool add_quotes) {
    std::string escaped_value;
    escaped_value.reserve(value.length() + 2 /* for the quotes */);

    if (add_quotes)
        escaped_value += '"';

    for (const char ch : value) {
        if (not add_quotes and unlikely(ch == ','))
            escaped_value += "\",\"";
        else {
            if (unlikely(ch == '"'))
                escaped_value += '"';
            escaped_value += ch;
        }
    }

    if (add_quotes)
        escaped_value += '"';

    return escaped_value;
}


std::string CSVLine(const std::vector<std::string> &values, const char separator) {
    std::string line;
    for (auto value(values.cbegin()); value != values.cend(); ++value) {
        if (value != values.cbegin())
            line += separator;
        line += CSVEscape(*value);
    }
    line += "\r\n";

    return line;
}


CSVReader::TokenType CSVReader::getToken() {
    int ch(input_.get());
    if (unlikely(ch == EOF))
        return END_OF_INPUT;
    if (ch == separator_)
        return SEPARATOR;
    if (ch == '\n') {
        ++line_no_;
        return LINE_END;
    }
    if (ch == '\r') {
        ch = input_.get();
        if (unlikely(ch != '\n')) {
            err_msg_ = "unexpected carriage-return!";
            return SYNTAX_ERROR;
        }
        ++line_no_;
        return LINE_END;
    }

    value_.clear();
    if (ch == quote_) {
        const unsigned start_line_no(line_no_);
        for (;;) {
            ch = input_.get();
            if (ch == quote_) {
                if (likely(input_.peek() != quote_))
                    break;
                input_.get();
            }
            if (unlikely(ch == EOF)) {
                err_msg_ = "quoted value starting on line #" + std::to_string(start_line_no) + " was never terminated!";
                return SYNTAX_ERROR;
            }
            if (ch == '\n')
                ++line_no_;
            value_ += static_cast<char>(ch);
        }

        ch = input_.peek();
        if (unlikely(ch != EOF and ch != separator_ and ch != '\r' and ch != '\n')) {
            err_msg_ = "unexpected character after closing quote!";
            return SYNTAX_ERROR;
        }
    } else { // Unquoted value.
        value_ += static_cast<char>(ch);
        for (;;) {
            ch = input_.get();
            if (ch == EOF or ch == '\r' or ch == '\n' or ch == separator_) {
                if (likely(ch != EOF))
                    input_.putback(static_cast<char>(ch));
                break;
            }
            if (unlikely(ch == quote_)) {
                err_msg_ = "unexpected quote in value!";
                return SYNTAX_ERROR;
            }
            value_ += static_cast<char>(ch);
        }
    }

    return VALUE;
}


bool CSVReader::readRecord(std::vector<std::string> * const values) {
    values->clear();

    bool seen_anything(false);
    TokenType last_token(SEPARATOR); // A separator at the start of a line implies a leading empty value.
    for (;;) {
        const TokenType token(getToken());
        switch (token) {
        case SYNTAX_ERROR:
            throw std::runtime_error("in TextUtil::CSVReader::readRecord: on line #" + std::to_string(line_no_) + ": " + err_msg_);
        case END_OF_INPUT:
            if (not seen_anything)
                return false;
            if (last_token == SEPARATOR)
                values->emplace_back("");
            return true;
        case LINE_END:
            if (not seen_anything)
                continue; // Skip blank lines.
            if (last_token == SEPARATOR)
                values->emplace_back("");
            return true;
        case VALUE:
            values->emplace_back(value_);
            break;
        case SEPARATOR:
            if (last_token == SEPARATOR)
                values->emplace_back("");
            break;
        }
        seen_anything = true;
        last_token = token;
    }
}


const std::string &GetUTF8ReplacementCharacter() {
    static const std::string replacement_character(UTF32ToUTF8(0xFFFDu));
    return replacement_character;
}


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFF) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0x10FFFF) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point " + std::to_string(code_point) + "!");

    return utf8;
}


namespace {


// \return The length of the valid UTF-8 sequence starting at "start" or 0 if there is no valid sequence.
size_t ValidSequenceLength(const std::string &s, const size_t start) {
    const unsigned char uch(static_cast<unsigned char>(s[start]));
    size_t sequence_length;
    uint32_t min_code_point;
    if ((uch & 0b10000000) == 0b00000000)
        return 1;
    else if ((uch & 0b11100000) == 0b11000000)
        sequence_length = 2, min_code_point = 0x80;
    else if ((uch & 0b11110000) == 0b11100000)
        sequence_length = 3, min_code_point = 0x800;
    else if ((uch & 0b11111000) == 0b11110000)
        sequence_length = 4, min_code_point = 0x10000;
    else
        return 0;

    if (start + sequence_length > s.length())
        return 0;

    uint32_t code_point(uch & (0b01111111u >> sequence_length));
    for (size_t i(1); i < sequence_length; ++i) {
        const unsigned char continuation_byte(static_cast<unsigned char>(s[start + i]));
        if (unlikely((continuation_byte & 0b11000000) != 0b10000000))
            return 0;
        code_point = (code_point << 6u) | (continuation_byte & 0b00111111u);
    }

    // Reject overlong encodings, surrogates and values beyond the Unicode range:
    if (code_point < min_code_point or (code_point >= 0xD800 and code_point <= 0xDFFF) or code_point > 0x10FFFF)
        return 0;

    return sequence_length;
}


} // unnamed namespace


bool IsValidUTF8(const std::string &utf8_candidate) {
    for (size_t i(0); i < utf8_candidate.length();) {
        const size_t sequence_length(ValidSequenceLength(utf8_candidate, i));
        if (sequence_length == 0)
            return false;
        i += sequence_length;
    }

    return true;
}


unsigned ReplaceInvalidUTF8Sequences(std::string * const s) {
    if (IsValidUTF8(*s))
        return 0;

    unsigned replacement_count(0);
    std::string cleaned_up;
    cleaned_up.reserve(s->length());
    for (size_t i(0); i < s->length();) {
        const size_t sequence_length(ValidSequenceLength(*s, i));
        if (sequence_length == 0) {
            cleaned_up += GetUTF8ReplacementCharacter();
            ++replacement_count;
            ++i;
        } else {
            cleaned_up.append(*s, i, sequence_length);
            i += sequence_length;
        }
    }

    s->swap(cleaned_up);
    return replacement_count;
}


} // namespace TextUtil
